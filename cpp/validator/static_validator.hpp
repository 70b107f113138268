#ifndef VALIDATOR_STATIC_VALIDATOR_HPP
#define VALIDATOR_STATIC_VALIDATOR_HPP

#include <cstdint>
#include <functional>
#include <regex>
#include <string>
#include <vector>

#include "validator/policy.hpp"
#include "validator/tokenizer.hpp"

namespace validator {

enum class ViolationCategory { SYNTAX, IMPORT, CALL, ATTRIBUTE, PATTERN };

const char* CategoryName(ViolationCategory category);

struct SourceLocation {
  uint32_t line = 0;    // 1-based
  uint32_t column = 0;  // 0-based
};

struct Violation {
  ViolationCategory category;
  std::string symbol;
  SourceLocation location;
  std::string message;

  bool operator==(const Violation& other) const {
    return category == other.category && symbol == other.symbol &&
           location.line == other.location.line &&
           location.column == other.location.column;
  }
  bool operator<(const Violation& other) const;
};

struct ValidationReport {
  bool is_safe = true;
  std::vector<Violation> violations;
  // Never affect is_safe.
  std::vector<std::string> warnings;
  int64_t validation_time_micros = 0;

  // Ignores the validation time.
  bool operator==(const ValidationReport& other) const {
    return is_safe == other.is_safe && violations == other.violations &&
           warnings == other.warnings;
  }
};

// Checks the grammar of a whole module. Returns false and fills error when
// the source does not parse.
using SyntaxCheck =
    std::function<bool(const std::string& source, SyntaxError* error)>;

// Decides whether a piece of Python source may be executed. The source is
// never executed nor imported: a structural pass over the token stream looks
// at imports, calls and attribute accesses, and a textual pass matches the
// policy's denied patterns. Malformed source yields a SYNTAX violation
// instead of an error. The tokenizer only catches lexical errors: a
// syntax_check, if given, rejects the rest of the grammar errors before the
// structural pass runs.
class StaticValidator {
 public:
  // Throws kj::Exception if one of the policy's patterns does not compile.
  explicit StaticValidator(ValidationPolicy policy,
                           SyntaxCheck syntax_check = nullptr);

  ValidationReport Validate(const std::string& source) const;

  const ValidationPolicy& Policy() const { return policy_; }

 private:
  void StructuralPass(const std::vector<Token>& tokens,
                      std::vector<Violation>* violations) const;
  void PatternPass(const std::string& source,
                   std::vector<Violation>* violations) const;
  // Quality remarks in the order they are checked.
  void WarningPass(const std::string& source, const std::vector<Token>& tokens,
                   std::vector<std::string>* warnings) const;

  // Parses the module list of an import statement starting after "import".
  size_t CheckImport(const std::vector<Token>& tokens, size_t pos,
                     std::vector<Violation>* violations) const;
  // Parses a "from ... import ..." statement starting after "from".
  size_t CheckFromImport(const std::vector<Token>& tokens, size_t pos,
                         std::vector<Violation>* violations) const;
  void CheckModule(const std::string& module, const Token& where,
                   std::vector<Violation>* violations) const;

  ValidationPolicy policy_;
  SyntaxCheck syntax_check_;
  std::vector<std::regex> patterns_;
};

}  // namespace validator

#endif
