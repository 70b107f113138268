#ifndef VALIDATOR_TOKENIZER_HPP
#define VALIDATOR_TOKENIZER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace validator {

enum class TokenType { NAME, NUMBER, STRING, OP, NEWLINE, INDENT, DEDENT, END };

struct Token {
  TokenType type;
  std::string text;
  // 1-based line and 0-based byte column of the first character.
  uint32_t line = 0;
  uint32_t column = 0;
};

struct SyntaxError {
  std::string message;
  std::string text;
  uint32_t line = 0;
  uint32_t column = 0;
};

// Splits Python 3 source into tokens. Comments and blank lines produce no
// tokens, and NEWLINE is only emitted at the end of logical lines, so
// bracketed expressions spanning several lines do not interrupt a statement.
// Returns false and fills error at the first lexical or indentation error.
bool Tokenize(const std::string& source, std::vector<Token>* tokens,
              SyntaxError* error);

const char* TokenTypeName(TokenType type);

}  // namespace validator

#endif
