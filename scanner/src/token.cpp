#include "token.hpp"

namespace lox {

const char* kind_name(TokenKind kind) {
  switch (kind) {
    case TokenKind::Eof: return "EOF";
    case TokenKind::LeftParen: return "LEFT_PAREN";
    case TokenKind::RightParen: return "RIGHT_PAREN";
    case TokenKind::LeftBrace: return "LEFT_BRACE";
    case TokenKind::RightBrace: return "RIGHT_BRACE";
    case TokenKind::Comma: return "COMMA";
    case TokenKind::Dot: return "DOT";
    case TokenKind::Minus: return "MINUS";
    case TokenKind::Plus: return "PLUS";
    case TokenKind::Semicolon: return "SEMICOLON";
    case TokenKind::Star: return "STAR";
    case TokenKind::Equal: return "EQUAL";
    case TokenKind::EqualEqual: return "EQUAL_EQUAL";
    case TokenKind::Bang: return "BANG";
    case TokenKind::BangEqual: return "BANG_EQUAL";
    case TokenKind::Less: return "LESS";
    case TokenKind::LessEqual: return "LESS_EQUAL";
    case TokenKind::Greater: return "GREATER";
    case TokenKind::GreaterEqual: return "GREATER_EQUAL";
  }
  return "UNKNOWN";
}

std::string to_string(const Token& token) {
  std::string out = kind_name(token.kind);
  out += ' ';
  out += token.lexeme;
  out += ' ';
  out += token.literal ? *token.literal : "null";
  return out;
}

std::string to_string(const LexError& error) {
  return "[line " + std::to_string(error.line) + "] Error: " + error.message;
}

}  // namespace lox
