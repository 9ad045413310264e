#ifndef LOX_TOKEN_HPP
#define LOX_TOKEN_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace lox {

enum class TokenKind {
  Eof,
  LeftParen,     // (
  RightParen,    // )
  LeftBrace,     // {
  RightBrace,    // }
  Comma,
  Dot,
  Minus,
  Plus,
  Semicolon,
  Star,
  // One or two character operators, resolved by one character of lookahead
  Equal,         // =
  EqualEqual,    // ==
  Bang,          // !
  BangEqual,     // !=
  Less,          // <
  LessEqual,     // <=
  Greater,       // >
  GreaterEqual,  // >=
};

struct Token {
  TokenKind kind = TokenKind::Eof;
  std::string lexeme;                  // exact source text, empty for Eof
  std::optional<std::string> literal;  // decoded value for literal-bearing kinds
  size_t line = 0;
};

struct LexError {
  size_t line = 0;
  std::string message;
};

/** Upper snake case name of a kind, e.g. "LEFT_PAREN". */
const char* kind_name(TokenKind kind);

/* "<KIND> <lexeme> <literal|null>" */
std::string to_string(const Token& token);

/* "[line <N>] Error: <message>" */
std::string to_string(const LexError& error);

}  // namespace lox

#endif
