#include "scanner.hpp"
#include <utility>

#include <llvm/Support/ConvertUTF.h>

namespace lox {

Scanner::Scanner(std::string source) : source_(std::move(source)) {}

void Scanner::scan() {
  if (scanned_) return;
  scanned_ = true;

  while (!is_at_end()) {
    start_ = current_;
    Classified c = scan_token();
    switch (c.status) {
      case Classified::Status::Token:
        add_token(c.kind);
        break;
      case Classified::Status::Unexpected:
        report_unexpected();
        break;
      case Classified::Status::Skip:
        break;
    }
  }

  start_ = current_;
  tokens_.push_back({TokenKind::Eof, {}, std::nullopt, line_});
}

Scanner::Classified Scanner::scan_token() {
  using Status = Classified::Status;
  char c = advance();
  switch (c) {
    case '(': return {Status::Token, TokenKind::LeftParen};
    case ')': return {Status::Token, TokenKind::RightParen};
    case '{': return {Status::Token, TokenKind::LeftBrace};
    case '}': return {Status::Token, TokenKind::RightBrace};
    case ',': return {Status::Token, TokenKind::Comma};
    case '.': return {Status::Token, TokenKind::Dot};
    case '-': return {Status::Token, TokenKind::Minus};
    case '+': return {Status::Token, TokenKind::Plus};
    case ';': return {Status::Token, TokenKind::Semicolon};
    case '*': return {Status::Token, TokenKind::Star};
    case '=':
      return {Status::Token, match('=') ? TokenKind::EqualEqual : TokenKind::Equal};
    case '!':
      return {Status::Token, match('=') ? TokenKind::BangEqual : TokenKind::Bang};
    case '<':
      return {Status::Token, match('=') ? TokenKind::LessEqual : TokenKind::Less};
    case '>':
      return {Status::Token, match('=') ? TokenKind::GreaterEqual : TokenKind::Greater};
    case ' ':
    case '\r':
    case '\t':
      return {Status::Skip, TokenKind::Eof};
    case '\n':
      line_++;
      return {Status::Skip, TokenKind::Eof};
    default:
      break;
  }
  consume_codepoint();
  return {Status::Unexpected, TokenKind::Eof};
}

bool Scanner::is_at_end() const { return current_ >= source_.size(); }

char Scanner::advance() { return source_[current_++]; }

bool Scanner::match(char expected) {
  if (is_at_end() || source_[current_] != expected) return false;
  current_++;
  return true;
}

/* Extends [start_, current_) to the whole UTF-8 sequence starting at start_.
 * A malformed or truncated sequence leaves only the lead byte consumed. */
void Scanner::consume_codepoint() {
  const auto* lead = reinterpret_cast<const llvm::UTF8*>(source_.data() + start_);
  unsigned len = llvm::getNumBytesForUTF8(*lead);
  if (len <= 1 || start_ + len > source_.size()) return;
  if (!llvm::isLegalUTF8Sequence(lead, lead + len)) return;
  current_ = start_ + len;
}

void Scanner::add_token(TokenKind kind) {
  tokens_.push_back({kind, source_.substr(start_, current_ - start_), std::nullopt, line_});
}

void Scanner::report_unexpected() {
  errors_.push_back({line_, "Unexpected character: " + source_.substr(start_, current_ - start_)});
}

ScanResult lex(const std::string& source) {
  Scanner scanner(source);
  scanner.scan();
  return {scanner.tokens(), scanner.errors()};
}

}  // namespace lox
