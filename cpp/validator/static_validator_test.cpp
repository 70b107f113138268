#include "validator/static_validator.hpp"

#include <kj/exception.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::AllOf;
using ::testing::ElementsAre;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::Field;
using ::testing::IsEmpty;
using ::testing::Not;

using validator::StaticValidator;
using validator::SyntaxError;
using validator::ValidationPolicy;
using validator::ValidationReport;
using validator::Violation;
using validator::ViolationCategory;

::testing::Matcher<Violation> IsViolation(ViolationCategory category,
                                          const std::string& symbol) {
  return AllOf(Field(&Violation::category, category),
               Field(&Violation::symbol, symbol));
}

class StaticValidatorTest : public ::testing::Test {
 protected:
  StaticValidator validator_{ValidationPolicy::Default()};
};

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, AcceptsPlottingCode) {
  std::string source = R"(import matplotlib
matplotlib.use('Agg')
import matplotlib.pyplot as plt
import numpy as np
from math import sqrt, pi

distance = 480
speed1, speed2 = 60, 80
meeting_time = distance / (speed1 + speed2)

if __name__ == "__main__":
    xs = np.linspace(0, meeting_time, 100)

fig, ax = plt.subplots(figsize=(10, 6))
ax.plot(xs, speed1 * xs, label='first')
ax.legend()
plt.savefig(output_path, dpi=100, bbox_inches='tight')
plt.close()

result = {
    'meeting_time': meeting_time,
    'root': sqrt(pi),
}
)";
  ValidationReport report = validator_.Validate(source);
  EXPECT_TRUE(report.is_safe);
  EXPECT_THAT(report.violations, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsDeniedImport) {
  ValidationReport report = validator_.Validate("import os\n");
  EXPECT_FALSE(report.is_safe);
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::IMPORT, "os")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsModuleOutsideAllowList) {
  ValidationReport report = validator_.Validate("import pandas as pd\n");
  EXPECT_FALSE(report.is_safe);
  ASSERT_EQ(report.violations.size(), 1u);
  EXPECT_THAT(report.violations[0],
              IsViolation(ViolationCategory::IMPORT, "pandas"));
  EXPECT_EQ(report.violations[0].location.line, 1u);
  EXPECT_EQ(report.violations[0].location.column, 7u);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, ChecksEveryImportedModule) {
  ValidationReport report =
      validator_.Validate("import math, subprocess, numpy.linalg as la\n"
                          "from os.path import join\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::IMPORT, "subprocess")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::IMPORT, "os.path")));
  EXPECT_THAT(report.violations,
              Not(Contains(IsViolation(ViolationCategory::IMPORT, "math"))));
  EXPECT_THAT(report.violations, Not(Contains(IsViolation(
                                     ViolationCategory::IMPORT,
                                     "numpy.linalg"))));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsRelativeImport) {
  ValidationReport report = validator_.Validate("from ..secrets import key\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::IMPORT, "..secrets")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, ImportAfterCompoundHeader) {
  ValidationReport report =
      validator_.Validate("if True: import socket\nx = 1; from sys import argv\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::IMPORT, "socket")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::IMPORT, "sys")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsDeniedCallsAndReferences) {
  ValidationReport report =
      validator_.Validate("f = getattr\nx = eval('1+1')\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::CALL, "getattr")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::CALL, "eval")));
  // The textual pass reports the eval call independently.
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::PATTERN, "eval(")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, KeywordArgumentsAndDefinitionsAreNotReferences) {
  ValidationReport report =
      validator_.Validate("def type_of(x):\n    return x\n"
                          "d = dict(type=1, id=2)\n");
  EXPECT_TRUE(report.is_safe);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsDeniedAttributes) {
  ValidationReport report = validator_.Validate(
      "import time\ntime.sleep(10)\nx = (1).__class__\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "sleep")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "__class__")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsModulesReachedThroughBoundModules) {
  ValidationReport report = validator_.Validate(
      "matplotlib.os.execv('/bin/sh', ['sh', '-c', 'id'])\n"
      "mpl.shutil.copyfile('/etc/passwd', output_path)\n"
      "print(mpl.os.listdir('/'))\n"
      "names = mpl.sys.modules\n");
  EXPECT_FALSE(report.is_safe);
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "os")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "execv")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "shutil")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "copyfile")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "listdir")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "modules")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsPrivateAttributes) {
  ValidationReport report = validator_.Validate(
      "import random\nrandom._os.system\nx = random.__secret\n"
      "from random import _inst\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "_os")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "__secret")));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "_inst")));
  // Allowed dunders and plain names are unaffected.
  EXPECT_TRUE(validator_.Validate("import math
f = math.sqrt
"
                                  "name = f.__name__
_unused = 1
")
                  .is_safe);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsNonAsciiIdentifiers) {
  // U+FE4D normalizes to '_', so this reads ().__class__.
  ValidationReport report =
      validator_.Validate("x = ()._\xef\xb9\x8d" "class\xef\xb9\x8d_\n");
  EXPECT_FALSE(report.is_safe);
  EXPECT_THAT(report.violations, Contains(Field(&Violation::category,
                                                ViolationCategory::PATTERN)));
  // Non-ASCII text in strings and comments is fine.
  EXPECT_TRUE(
      validator_.Validate("label = 'caf\xc3\xa9'  # \xc3\xa9t\xc3\xa9\n")
          .is_safe);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, RejectsDeniedNamesInFromImport) {
  ValidationReport report = validator_.Validate("from time import sleep\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::ATTRIBUTE, "sleep")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, PatternsMatchObfuscatedText) {
  ValidationReport report =
      validator_.Validate("url = 'https://example.com'\ns = '__subclasses__'\n");
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::PATTERN, "https://")));
  EXPECT_THAT(report.violations, Contains(IsViolation(
                                     ViolationCategory::PATTERN,
                                     "__subclasses__")));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, PatternsRespectWordBoundaries) {
  ValidationReport report =
      validator_.Validate("import numpy as np\ny = np.polyval([1, 2], 3)\n");
  EXPECT_TRUE(report.is_safe);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, PatternLocation) {
  ValidationReport report = validator_.Validate("x = 1\n  # os.system('ls')\n");
  ASSERT_FALSE(report.is_safe);
  const Violation& v = report.violations[0];
  EXPECT_EQ(v.category, ViolationCategory::PATTERN);
  EXPECT_EQ(v.symbol, ".system(");
  EXPECT_EQ(v.location.line, 2u);
  EXPECT_EQ(v.location.column, 6u);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, SyntaxErrorKeepsPatternViolations) {
  ValidationReport report =
      validator_.Validate("import os\nos.system('ls'\n");
  EXPECT_FALSE(report.is_safe);
  EXPECT_THAT(report.violations,
              Contains(Field(&Violation::category, ViolationCategory::SYNTAX)));
  EXPECT_THAT(report.violations,
              Contains(IsViolation(ViolationCategory::PATTERN, ".system(")));
  // The structural pass does not run on unparsable source.
  EXPECT_THAT(report.violations,
              Not(Contains(IsViolation(ViolationCategory::IMPORT, "os"))));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, ReportsAllViolationsSortedAndUnique) {
  std::string source = "import sys\nimport os\nexec('x')\n";
  ValidationReport report = validator_.Validate(source);
  ASSERT_GE(report.violations.size(), 4u);
  for (size_t i = 1; i < report.violations.size(); i++) {
    EXPECT_FALSE(report.violations[i] < report.violations[i - 1]);
    EXPECT_FALSE(report.violations[i] == report.violations[i - 1]);
  }
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, Idempotent) {
  std::string source = "import os\nopen('/etc/passwd').read()\n";
  EXPECT_EQ(validator_.Validate(source), validator_.Validate(source));
}

// NOLINTNEXTLINE
TEST(StaticValidator, CustomPolicy) {
  ValidationPolicy policy = ValidationPolicy::Default();
  policy.allowed_modules.insert("pandas");
  policy.denied_patterns.push_back({"magic", "abracadabra"});
  StaticValidator validator(policy);
  EXPECT_TRUE(validator.Validate("import pandas\n").is_safe);
  EXPECT_THAT(validator.Validate("x = 'ABRACADABRA'\n").violations,
              Contains(IsViolation(ViolationCategory::PATTERN, "ABRACADABRA")));
}

// NOLINTNEXTLINE
TEST(StaticValidator, InvalidPatternThrows) {
  ValidationPolicy policy;
  policy.denied_patterns.push_back({"broken", "(unclosed"});
  EXPECT_THROW(StaticValidator{policy}, kj::Exception);  // NOLINT
}

// NOLINTNEXTLINE
TEST(StaticValidator, SyntaxCheckRejectsBeforeStructuralPass) {
  int calls = 0;
  StaticValidator validator(
      ValidationPolicy::Default(),
      [&calls](const std::string& source, SyntaxError* error) {
        calls++;
        if (source.find("= =") == std::string::npos) return true;
        error->message = "invalid syntax";
        error->text = "=";
        error->line = 1;
        error->column = 4;
        return false;
      });
  ValidationReport report = validator.Validate("import os\nx = = 1\n");
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(report.is_safe);
  ASSERT_EQ(report.violations.size(), 1u);
  EXPECT_EQ(report.violations[0].category, ViolationCategory::SYNTAX);
  EXPECT_THAT(report.violations[0].message, HasSubstr("invalid syntax"));
  EXPECT_EQ(report.violations[0].location.column, 4u);

  EXPECT_TRUE(validator.Validate("x = 1\n").is_safe);
  EXPECT_EQ(calls, 2);
  // Lexical errors never reach the check.
  EXPECT_FALSE(validator.Validate("s = 'unterminated\n").is_safe);
  EXPECT_EQ(calls, 2);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, WarningsDoNotAffectSafety) {
  ValidationReport report = validator_.Validate("x = 1\n");
  EXPECT_TRUE(report.is_safe);
  EXPECT_THAT(report.warnings,
              ElementsAre(HasSubstr("shorter than 100"),
                          "code does not use matplotlib",
                          "code does not save a figure",
                          "code does not define result",
                          "code does not select the Agg backend"));
  EXPECT_GE(report.validation_time_micros, 0);
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, WarnsAboutDeepNesting) {
  std::string source =
      "import matplotlib\nmatplotlib.use('Agg')\nresult = {}\n"
      "for a in range(2):\n"
      "    for b in range(2):\n"
      "        if a:\n"
      "            while b:\n"
      "                if a == b:\n"
      "                    b -= 1\n"
      "                b -= 1\n"
      "plt.savefig(output_path)\n";
  ValidationReport report = validator_.Validate(source);
  EXPECT_TRUE(report.is_safe);
  EXPECT_THAT(report.warnings,
              ElementsAre("loops and conditionals nested 5 levels deep"));

  // Four levels, plus a function body that does not count.
  std::string shallow =
      "import matplotlib\nmatplotlib.use('Agg')\nresult = {}\n"
      "def f(a, b):\n"
      "    for x in a:\n"
      "        if x:\n"
      "            while b:\n"
      "                if b:\n"
      "                    b -= 1\n"
      "plt.savefig(output_path)\n";
  EXPECT_THAT(validator_.Validate(shallow).warnings, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, WarnsAboutRepetitiveCode) {
  std::string source =
      "import matplotlib\nmatplotlib.use('Agg')\nresult = {}\n"
      "plt.savefig(output_path)\n";
  for (int i = 0; i < 60; i++) source += "x = 1\n";
  EXPECT_THAT(validator_.Validate(source).warnings,
              ElementsAre("code is highly repetitive"));
}

// NOLINTNEXTLINE
TEST_F(StaticValidatorTest, NoWarningsOnSyntaxError) {
  EXPECT_THAT(validator_.Validate("s = 'unterminated\n").warnings, IsEmpty());
}

}  // namespace
