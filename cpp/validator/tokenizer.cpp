#include "validator/tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace validator {
namespace {

const char* const kThreeCharOps[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* const kTwoCharOps[] = {"**", "//", "==", "!=", "<=", ">=", "<<",
                                   ">>", "->", "+=", "-=", "*=", "/=", "%=",
                                   "&=", "|=", "^=", "@=", ":="};
const char* const kOneCharOps = "+-*/%@&|^~<>()[]{},:;.=";
const char* const kStringPrefixes[] = {"r",  "u",  "b",  "f",
                                       "br", "rb", "fr", "rf"};

bool IsNameStart(char c) {
  auto u = static_cast<unsigned char>(c);
  // Bytes of multi-byte UTF-8 sequences are accepted as identifier characters.
  return isalpha(u) || c == '_' || u >= 0x80;
}

bool IsNameChar(char c) {
  return IsNameStart(c) || isdigit(static_cast<unsigned char>(c));
}

bool IsStringPrefix(std::string word) {
  std::transform(word.begin(), word.end(), word.begin(),
                 [](char c) { return tolower(static_cast<unsigned char>(c)); });
  for (const char* prefix : kStringPrefixes) {
    if (word == prefix) return true;
  }
  return false;
}

bool IsClosing(char c) { return c == ')' || c == ']' || c == '}'; }

char Opening(char c) {
  switch (c) {
    case ')':
      return '(';
    case ']':
      return '[';
    default:
      return '{';
  }
}

class Lexer {
 public:
  Lexer(const std::string& source, std::vector<Token>* tokens,
        SyntaxError* error)
      : src_(source), tokens_(tokens), error_(error) {}

  bool Run() {
    size_t nul = src_.find('\0');
    if (nul != std::string::npos) {
      line_ += std::count(src_.begin(), src_.begin() + nul, '\n');
      return Fail("source code cannot contain null bytes", line_, 0);
    }
    if (src_.compare(0, 3, "\xEF\xBB\xBF") == 0) pos_ = line_start_ = 3;

    while (true) {
      if (at_line_start_) {
        bool blank = false;
        if (!Indentation(&blank)) return false;
        if (pos_ >= src_.size()) break;
        if (blank) continue;
      }
      if (pos_ >= src_.size()) break;
      char c = src_[pos_];
      if (c == ' ' || c == '\t' || c == '\f') {
        pos_++;
        continue;
      }
      if (c == '#') {
        while (pos_ < src_.size() && !AtLineBreak(pos_)) pos_++;
        continue;
      }
      if (AtLineBreak(pos_)) {
        if (brackets_.empty()) EndLogicalLine();
        ConsumeLineBreak();
        if (brackets_.empty()) at_line_start_ = true;
        continue;
      }
      if (c == '\\') {
        pos_++;
        if (pos_ >= src_.size()) {
          return Fail("unexpected EOF while parsing", line_, Column());
        }
        if (!AtLineBreak(pos_)) {
          return Fail("unexpected character after line continuation character",
                      line_, Column() - 1, "\\");
        }
        ConsumeLineBreak();
        continue;
      }

      uint32_t line = line_;
      uint32_t column = Column();
      if (IsNameStart(c)) {
        size_t start = pos_;
        while (pos_ < src_.size() && IsNameChar(src_[pos_])) pos_++;
        std::string word = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') &&
            IsStringPrefix(word)) {
          if (!String(start, line, column)) return false;
        } else {
          Emit(TokenType::NAME, word, line, column);
        }
        continue;
      }
      if (isdigit(static_cast<unsigned char>(c)) ||
          (c == '.' && pos_ + 1 < src_.size() &&
           isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
        Number(line, column);
        continue;
      }
      if (c == '"' || c == '\'') {
        if (!String(pos_, line, column)) return false;
        continue;
      }
      if (!Operator(line, column)) return false;
    }

    if (!brackets_.empty()) {
      const Bracket& b = brackets_.back();
      return Fail(std::string("'") + b.c + "' was never closed", b.line,
                  b.column, std::string(1, b.c));
    }
    EndLogicalLine();
    if (expect_block_) {
      return Fail("expected an indented block", line_, Column());
    }
    while (indents_.size() > 1) {
      indents_.pop_back();
      Emit(TokenType::DEDENT, "", line_, 0);
    }
    Emit(TokenType::END, "", line_, Column());
    return true;
  }

 private:
  struct Bracket {
    char c;
    uint32_t line;
    uint32_t column;
  };

  bool Fail(const std::string& message, uint32_t line, uint32_t column,
            const std::string& text = "") {
    error_->message = message;
    error_->text = text;
    error_->line = line;
    error_->column = column;
    return false;
  }

  uint32_t Column() const { return pos_ - line_start_; }

  bool AtLineBreak(size_t pos) const {
    return pos < src_.size() && (src_[pos] == '\n' || src_[pos] == '\r');
  }

  void ConsumeLineBreak() {
    if (src_[pos_] == '\r' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n')
      pos_++;
    pos_++;
    line_++;
    line_start_ = pos_;
  }

  void Emit(TokenType type, std::string text, uint32_t line, uint32_t column) {
    tokens_->push_back(Token{type, std::move(text), line, column});
  }

  void EndLogicalLine() {
    if (tokens_->empty()) return;
    const Token& last = tokens_->back();
    if (last.type == TokenType::NEWLINE || last.type == TokenType::INDENT ||
        last.type == TokenType::DEDENT) {
      return;
    }
    expect_block_ = last.type == TokenType::OP && last.text == ":";
    Emit(TokenType::NEWLINE, "", line_, Column());
  }

  // Measures the indentation of a new logical line and emits INDENT/DEDENT.
  // Lines holding only whitespace or a comment are consumed and flagged as
  // blank.
  bool Indentation(bool* blank) {
    uint32_t width = 0;
    while (pos_ < src_.size()) {
      char c = src_[pos_];
      if (c == ' ') {
        width++;
      } else if (c == '\t') {
        width = (width / 8 + 1) * 8;
      } else if (c == '\f') {
        width = 0;
      } else {
        break;
      }
      pos_++;
    }
    if (pos_ < src_.size() && src_[pos_] == '#') {
      while (pos_ < src_.size() && !AtLineBreak(pos_)) pos_++;
    }
    if (pos_ >= src_.size()) {
      *blank = true;
      return true;
    }
    if (AtLineBreak(pos_)) {
      ConsumeLineBreak();
      *blank = true;
      return true;
    }

    at_line_start_ = false;
    uint32_t column = Column();
    if (width > indents_.back()) {
      if (!expect_block_) return Fail("unexpected indent", line_, column);
      indents_.push_back(width);
      Emit(TokenType::INDENT, "", line_, column);
    } else {
      if (expect_block_) {
        return Fail("expected an indented block", line_, column);
      }
      while (width < indents_.back()) {
        indents_.pop_back();
        Emit(TokenType::DEDENT, "", line_, column);
      }
      if (width != indents_.back()) {
        return Fail("unindent does not match any outer indentation level",
                    line_, column);
      }
    }
    expect_block_ = false;
    return true;
  }

  // pos_ points at the opening quote, start at the first prefix character.
  bool String(size_t start, uint32_t line, uint32_t column) {
    char quote = src_[pos_];
    std::string closing(3, quote);
    bool triple = src_.compare(pos_, 3, closing) == 0;
    pos_ += triple ? 3 : 1;
    while (true) {
      if (pos_ >= src_.size()) {
        return Fail(triple ? "unterminated triple-quoted string literal"
                           : "unterminated string literal",
                    line, column, src_.substr(start, 16));
      }
      char c = src_[pos_];
      if (c == '\\') {
        pos_++;
        if (AtLineBreak(pos_)) {
          ConsumeLineBreak();
        } else if (pos_ < src_.size()) {
          pos_++;
        }
        continue;
      }
      if (AtLineBreak(pos_)) {
        if (!triple) {
          return Fail("unterminated string literal", line, column,
                      src_.substr(start, pos_ - start));
        }
        ConsumeLineBreak();
        continue;
      }
      if (c == quote) {
        if (!triple) {
          pos_++;
          break;
        }
        if (src_.compare(pos_, 3, closing) == 0) {
          pos_ += 3;
          break;
        }
      }
      pos_++;
    }
    Emit(TokenType::STRING, src_.substr(start, pos_ - start), line, column);
    return true;
  }

  void Number(uint32_t line, uint32_t column) {
    size_t start = pos_;
    bool hex = src_.compare(pos_, 2, "0x") == 0 ||
               src_.compare(pos_, 2, "0X") == 0;
    while (pos_ < src_.size()) {
      char c = src_[pos_];
      if (isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
        pos_++;
      } else if ((c == '+' || c == '-') && !hex &&
                 (src_[pos_ - 1] == 'e' || src_[pos_ - 1] == 'E')) {
        pos_++;
      } else {
        break;
      }
    }
    Emit(TokenType::NUMBER, src_.substr(start, pos_ - start), line, column);
  }

  bool Operator(uint32_t line, uint32_t column) {
    for (const char* op : kThreeCharOps) {
      if (src_.compare(pos_, 3, op) == 0) {
        pos_ += 3;
        Emit(TokenType::OP, op, line, column);
        return true;
      }
    }
    for (const char* op : kTwoCharOps) {
      if (src_.compare(pos_, 2, op) == 0) {
        pos_ += 2;
        Emit(TokenType::OP, op, line, column);
        return true;
      }
    }
    char c = src_[pos_];
    if (strchr(kOneCharOps, c) == nullptr) {
      return Fail(std::string("invalid character '") + c + "'", line, column,
                  std::string(1, c));
    }
    if (c == '(' || c == '[' || c == '{') {
      brackets_.push_back(Bracket{c, line, column});
    } else if (IsClosing(c)) {
      if (brackets_.empty()) {
        return Fail(std::string("unmatched '") + c + "'", line, column,
                    std::string(1, c));
      }
      if (brackets_.back().c != Opening(c)) {
        return Fail(std::string("closing parenthesis '") + c +
                        "' does not match opening parenthesis '" +
                        brackets_.back().c + "'",
                    line, column, std::string(1, c));
      }
      brackets_.pop_back();
    }
    pos_++;
    Emit(TokenType::OP, std::string(1, c), line, column);
    return true;
  }

  const std::string& src_;
  std::vector<Token>* tokens_;
  SyntaxError* error_;
  size_t pos_ = 0;
  size_t line_start_ = 0;
  uint32_t line_ = 1;
  bool at_line_start_ = true;
  bool expect_block_ = false;
  std::vector<uint32_t> indents_{0};
  std::vector<Bracket> brackets_;
};

}  // namespace

bool Tokenize(const std::string& source, std::vector<Token>* tokens,
              SyntaxError* error) {
  tokens->clear();
  Lexer lexer(source, tokens, error);
  return lexer.Run();
}

const char* TokenTypeName(TokenType type) {
  switch (type) {
    case TokenType::NAME:
      return "NAME";
    case TokenType::NUMBER:
      return "NUMBER";
    case TokenType::STRING:
      return "STRING";
    case TokenType::OP:
      return "OP";
    case TokenType::NEWLINE:
      return "NEWLINE";
    case TokenType::INDENT:
      return "INDENT";
    case TokenType::DEDENT:
      return "DEDENT";
    case TokenType::END:
      return "END";
  }
  return "UNKNOWN";
}

}  // namespace validator
