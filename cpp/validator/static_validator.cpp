#include "validator/static_validator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <set>
#include <tuple>

#include <kj/debug.h>

#include "util/misc.hpp"

namespace validator {
namespace {

const constexpr size_t kMaxSourceLength = 10000;
const constexpr size_t kMinSourceLength = 100;
const constexpr int kMaxNestingDepth = 4;
const constexpr size_t kRepetitionMinLines = 50;
const constexpr double kMinUniqueLineRatio = 0.7;

bool IsOp(const Token& token, const char* op) {
  return token.type == TokenType::OP && token.text == op;
}

bool IsName(const Token& token, const char* name) {
  return token.type == TokenType::NAME && token.text == name;
}

// Dunder names that generated code legitimately uses.
bool IsDunder(const std::string& name) {
  if (name.size() <= 4 || name.compare(0, 2, "__") != 0 ||
      name.compare(name.size() - 2, 2, "__") != 0) {
    return false;
  }
  return name != "__name__" && name != "__main__" && name != "__init__";
}

// Python NFKC-normalizes identifiers before lookup, so the byte comparisons
// below only hold for ASCII names.
bool IsAscii(const std::string& name) {
  for (char c : name) {
    if (static_cast<unsigned char>(c) >= 0x80) return false;
  }
  return true;
}

// Module internals such as random._os and mangled names such as x.__secret.
// Allowed dunders are handled by IsDunder.
bool IsPrivate(const std::string& name) {
  if (name.size() < 2 || name[0] != '_') return false;
  bool dunder = name.size() > 4 && name.compare(0, 2, "__") == 0 &&
                name.compare(name.size() - 2, 2, "__") == 0;
  return !dunder;
}

Violation MakeViolation(ViolationCategory category, const std::string& symbol,
                        uint32_t line, uint32_t column,
                        const std::string& message) {
  Violation violation;
  violation.category = category;
  violation.symbol = symbol;
  violation.location.line = line;
  violation.location.column = column;
  violation.message = message;
  return violation;
}

Violation MakeViolation(ViolationCategory category, const Token& token,
                        const std::string& symbol, const std::string& message) {
  return MakeViolation(category, symbol, token.line, token.column, message);
}

}  // namespace

const char* CategoryName(ViolationCategory category) {
  switch (category) {
    case ViolationCategory::SYNTAX:
      return "SYNTAX";
    case ViolationCategory::IMPORT:
      return "IMPORT";
    case ViolationCategory::CALL:
      return "CALL";
    case ViolationCategory::ATTRIBUTE:
      return "ATTRIBUTE";
    case ViolationCategory::PATTERN:
      return "PATTERN";
  }
  return "UNKNOWN";
}

bool Violation::operator<(const Violation& other) const {
  return std::tie(location.line, location.column, category, symbol, message) <
         std::tie(other.location.line, other.location.column, other.category,
                  other.symbol, other.message);
}

StaticValidator::StaticValidator(ValidationPolicy policy,
                                 SyntaxCheck syntax_check)
    : policy_(std::move(policy)), syntax_check_(std::move(syntax_check)) {
  for (const auto& pattern : policy_.denied_patterns) {
    try {
      patterns_.emplace_back(pattern.regex,
                             std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
      KJ_FAIL_REQUIRE("Invalid denied pattern", pattern.name, pattern.regex,
                      e.what());
    }
  }
}

ValidationReport StaticValidator::Validate(const std::string& source) const {
  auto start = std::chrono::steady_clock::now();
  ValidationReport report;
  std::vector<Token> tokens;
  SyntaxError error;
  bool parsed = Tokenize(source, &tokens, &error);
  if (parsed && syntax_check_) parsed = syntax_check_(source, &error);
  if (parsed) {
    StructuralPass(tokens, &report.violations);
    WarningPass(source, tokens, &report.warnings);
  } else {
    report.violations.push_back(
        MakeViolation(ViolationCategory::SYNTAX, error.text, error.line,
                      error.column, "invalid syntax: " + error.message));
  }
  PatternPass(source, &report.violations);

  std::sort(report.violations.begin(), report.violations.end());
  report.violations.erase(
      std::unique(report.violations.begin(), report.violations.end()),
      report.violations.end());
  report.is_safe = report.violations.empty();
  report.validation_time_micros =
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  return report;
}

void StaticValidator::StructuralPass(const std::vector<Token>& tokens,
                                     std::vector<Violation>* violations) const {
  int depth = 0;
  bool statement_start = true;
  for (size_t i = 0; i + 1 < tokens.size(); i++) {
    const Token& token = tokens[i];
    bool at_start = statement_start;
    statement_start = false;

    if (token.type == TokenType::NEWLINE || token.type == TokenType::INDENT ||
        token.type == TokenType::DEDENT) {
      statement_start = true;
      continue;
    }
    if (token.type == TokenType::OP) {
      if (token.text == "(" || token.text == "[" || token.text == "{") {
        depth++;
      } else if (token.text == ")" || token.text == "]" || token.text == "}") {
        depth = std::max(depth - 1, 0);
      } else if (depth == 0 && (token.text == ";" || token.text == ":")) {
        // A compound statement header or a separator: a new simple statement
        // may follow on the same line.
        statement_start = true;
      }
      continue;
    }
    if (token.type != TokenType::NAME) continue;

    if (!IsAscii(token.text)) {
      violations->push_back(
          MakeViolation(ViolationCategory::PATTERN, token, token.text,
                        "non-ASCII identifier '" + token.text + "'"));
      continue;
    }
    if (token.text == "import") {
      i = CheckImport(tokens, i + 1, violations) - 1;
      continue;
    }
    if (token.text == "from" && at_start) {
      i = CheckFromImport(tokens, i + 1, violations) - 1;
      continue;
    }

    const Token* prev = i > 0 ? &tokens[i - 1] : nullptr;
    const Token& next = tokens[i + 1];
    if (prev != nullptr && IsOp(*prev, ".")) {
      if (IsDunder(token.text)) {
        violations->push_back(
            MakeViolation(ViolationCategory::ATTRIBUTE, token, token.text,
                          "access to dunder attribute '" + token.text + "'"));
      } else if (IsPrivate(token.text)) {
        violations->push_back(
            MakeViolation(ViolationCategory::ATTRIBUTE, token, token.text,
                          "access to private attribute '" + token.text + "'"));
      } else if (policy_.denied_attributes.count(token.text)) {
        violations->push_back(
            MakeViolation(ViolationCategory::ATTRIBUTE, token, token.text,
                          "access to denied attribute '" + token.text + "'"));
      }
      continue;
    }
    if (prev != nullptr && (IsName(*prev, "def") || IsName(*prev, "class"))) {
      continue;
    }
    // Keyword argument names are not references.
    if (depth > 0 && IsOp(next, "=")) continue;
    if (policy_.denied_calls.count(token.text)) {
      bool call = IsOp(next, "(");
      violations->push_back(MakeViolation(
          ViolationCategory::CALL, token, token.text,
          std::string(call ? "call to" : "reference to") +
              " denied builtin '" + token.text + "'"));
    }
  }
}

size_t StaticValidator::CheckImport(const std::vector<Token>& tokens,
                                    size_t pos,
                                    std::vector<Violation>* violations) const {
  auto at = [&tokens](size_t p) -> const Token& {
    return p < tokens.size() ? tokens[p] : tokens.back();
  };
  while (at(pos).type == TokenType::NAME) {
    const Token& first = at(pos);
    std::string module = first.text;
    pos++;
    while (IsOp(at(pos), ".") && at(pos + 1).type == TokenType::NAME) {
      module += "." + at(pos + 1).text;
      pos += 2;
    }
    CheckModule(module, first, violations);
    if (IsName(at(pos), "as")) pos += 2;
    if (!IsOp(at(pos), ",")) break;
    pos++;
  }
  return std::min(pos, tokens.size() - 1);
}

size_t StaticValidator::CheckFromImport(
    const std::vector<Token>& tokens, size_t pos,
    std::vector<Violation>* violations) const {
  auto at = [&tokens](size_t p) -> const Token& {
    return p < tokens.size() ? tokens[p] : tokens.back();
  };
  const Token& from = tokens[pos - 1];
  size_t dots = 0;
  while (IsOp(at(pos), ".") || IsOp(at(pos), "...")) {
    dots += at(pos).text.size();
    pos++;
  }
  std::string module;
  const Token& first = at(pos);
  if (first.type == TokenType::NAME && first.text != "import") {
    module = first.text;
    pos++;
    while (IsOp(at(pos), ".") && at(pos + 1).type == TokenType::NAME) {
      module += "." + at(pos + 1).text;
      pos += 2;
    }
  }
  if (dots > 0) {
    std::string symbol = std::string(dots, '.') + module;
    violations->push_back(
        MakeViolation(ViolationCategory::IMPORT, from, symbol,
                      "relative import '" + symbol + "' is not allowed"));
  } else if (!module.empty()) {
    CheckModule(module, first, violations);
  }

  if (!IsName(at(pos), "import")) return std::min(pos, tokens.size() - 1);
  pos++;
  bool parenthesized = IsOp(at(pos), "(");
  if (parenthesized) pos++;
  while (at(pos).type == TokenType::NAME) {
    const Token& name = at(pos);
    if (policy_.denied_calls.count(name.text)) {
      violations->push_back(
          MakeViolation(ViolationCategory::CALL, name, name.text,
                        "import of denied builtin '" + name.text + "'"));
    } else if (IsDunder(name.text) || IsPrivate(name.text) ||
               policy_.denied_attributes.count(name.text)) {
      violations->push_back(
          MakeViolation(ViolationCategory::ATTRIBUTE, name, name.text,
                        "import of denied attribute '" + name.text + "'"));
    }
    pos++;
    if (IsName(at(pos), "as")) pos += 2;
    if (!IsOp(at(pos), ",")) break;
    pos++;
  }
  if (IsOp(at(pos), "*")) pos++;
  if (parenthesized && IsOp(at(pos), ")")) pos++;
  return std::min(pos, tokens.size() - 1);
}

void StaticValidator::CheckModule(const std::string& module,
                                  const Token& where,
                                  std::vector<Violation>* violations) const {
  std::string top = module.substr(0, module.find('.'));
  if (policy_.denied_modules.count(module) ||
      policy_.denied_modules.count(top)) {
    violations->push_back(
        MakeViolation(ViolationCategory::IMPORT, where, module,
                      "import of denied module '" + module + "'"));
  } else if (!policy_.allowed_modules.count(module) &&
             !policy_.allowed_modules.count(top)) {
    violations->push_back(
        MakeViolation(ViolationCategory::IMPORT, where, module,
                      "module '" + module + "' is not in the allow-list"));
  }
}

void StaticValidator::PatternPass(const std::string& source,
                                  std::vector<Violation>* violations) const {
  std::vector<size_t> line_starts{0};
  for (size_t i = 0; i < source.size(); i++) {
    if (source[i] == '\n') line_starts.push_back(i + 1);
  }
  for (size_t p = 0; p < patterns_.size(); p++) {
    const std::string& name = policy_.denied_patterns[p].name;
    auto end = std::sregex_iterator();
    for (auto it = std::sregex_iterator(source.begin(), source.end(),
                                        patterns_[p]);
         it != end; ++it) {
      if (it->length(0) == 0) continue;
      size_t offset = it->position(0);
      size_t line = std::upper_bound(line_starts.begin(), line_starts.end(),
                                     offset) -
                    line_starts.begin();
      violations->push_back(MakeViolation(
          ViolationCategory::PATTERN, it->str(0), line,
          offset - line_starts[line - 1],
          "matches denied pattern '" + name + "'"));
    }
  }
}

void StaticValidator::WarningPass(const std::string& source,
                                  const std::vector<Token>& tokens,
                                  std::vector<std::string>* warnings) const {
  if (source.size() > kMaxSourceLength) {
    warnings->push_back("code is longer than " +
                        std::to_string(kMaxSourceLength) + " characters");
  } else if (source.size() < kMinSourceLength) {
    warnings->push_back("code is shorter than " +
                        std::to_string(kMinSourceLength) +
                        " characters and may be incomplete");
  }

  // Blocks opened by a loop or a conditional, one entry per INDENT.
  static const std::set<std::string> kNesting = {"for",  "while", "if",
                                                 "elif", "else",  "with"};
  std::vector<bool> blocks;
  int depth = 0;
  int max_depth = 0;
  bool header = false;
  bool statement_start = true;
  for (const Token& token : tokens) {
    if (token.type == TokenType::INDENT) {
      blocks.push_back(header);
      if (header) max_depth = std::max(max_depth, ++depth);
    } else if (token.type == TokenType::DEDENT && !blocks.empty()) {
      if (blocks.back()) depth--;
      blocks.pop_back();
    }
    if (token.type == TokenType::NEWLINE || token.type == TokenType::INDENT ||
        token.type == TokenType::DEDENT) {
      statement_start = true;
      continue;
    }
    if (statement_start) header = kNesting.count(token.text) > 0;
    statement_start = false;
  }
  if (max_depth > kMaxNestingDepth) {
    warnings->push_back("loops and conditionals nested " +
                        std::to_string(max_depth) + " levels deep");
  }

  size_t lines = std::count(source.begin(), source.end(), '\n') + 1;
  std::set<std::string> unique_lines;
  for (const std::string& line : util::split(source, '\n')) {
    std::string trimmed = util::trim(line);
    if (!trimmed.empty()) unique_lines.insert(trimmed);
  }
  if (lines > kRepetitionMinLines &&
      static_cast<double>(unique_lines.size()) / lines < kMinUniqueLineRatio) {
    warnings->push_back("code is highly repetitive");
  }

  std::string lower = source;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (source.find("matplotlib") == std::string::npos &&
      source.find("plt") == std::string::npos) {
    warnings->push_back("code does not use matplotlib");
  }
  if (lower.find("savefig") == std::string::npos) {
    warnings->push_back("code does not save a figure");
  }
  if (source.find("result") == std::string::npos) {
    warnings->push_back("code does not define result");
  }
  if (source.find("Agg") == std::string::npos) {
    warnings->push_back("code does not select the Agg backend");
  }
}

}  // namespace validator
