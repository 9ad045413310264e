#ifndef LOX_SCANNER_HPP
#define LOX_SCANNER_HPP

#include "token.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace lox {

/* Single left-to-right pass over one source string. Lexical errors are
 * collected and never stop the scan. Call scan() once per instance. */
class Scanner {
 public:
  explicit Scanner(std::string source);

  void scan();

  bool has_errors() const { return !errors_.empty(); }
  const std::vector<Token>& tokens() const { return tokens_; }
  const std::vector<LexError>& errors() const { return errors_; }

 private:
  // Outcome of classifying the text in [start_, current_).
  struct Classified {
    enum class Status { Token, Skip, Unexpected };
    Status status = Status::Skip;
    TokenKind kind = TokenKind::Eof;
  };

  Classified scan_token();
  bool is_at_end() const;
  char advance();
  bool match(char expected);
  void consume_codepoint();
  void add_token(TokenKind kind);
  void report_unexpected();

  std::string source_;
  size_t start_ = 0;
  size_t current_ = 0;
  size_t line_ = 1;
  bool scanned_ = false;
  std::vector<Token> tokens_;
  std::vector<LexError> errors_;
};

struct ScanResult {
  std::vector<Token> tokens;
  std::vector<LexError> errors;
  bool ok() const { return errors.empty(); }
};

ScanResult lex(const std::string& source);

}  // namespace lox

#endif
