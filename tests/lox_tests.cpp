#include "scanner.hpp"
#include "token.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

static int failed = 0;

#define ASSERT(cond, msg) do { \
  if (!(cond)) { std::cerr << "FAIL: " << (msg) << "\n"; failed = 1; } \
  else { std::cout << "PASS: " << (msg) << "\n"; } \
} while(0)

static void test_paren_plus() {
  auto result = lox::lex("(+)");
  ASSERT(result.ok(), "(+) has no errors");
  ASSERT(result.tokens.size() == 4, "(+) token count");
  if (result.tokens.size() == 4) {
    ASSERT(lox::to_string(result.tokens[0]) == "LEFT_PAREN ( null", "(+) left paren");
    ASSERT(lox::to_string(result.tokens[1]) == "PLUS + null", "(+) plus");
    ASSERT(lox::to_string(result.tokens[2]) == "RIGHT_PAREN ) null", "(+) right paren");
    ASSERT(lox::to_string(result.tokens[3]) == "EOF  null", "(+) eof");
  }
}

static void test_unexpected_at() {
  lox::Scanner scanner("(!@)");
  scanner.scan();
  ASSERT(scanner.has_errors(), "(!@) has errors");
  ASSERT(scanner.tokens().size() == 4, "(!@) drops @");
  ASSERT(scanner.errors().size() == 1, "(!@) one error");
  if (!scanner.errors().empty()) {
    ASSERT(lox::to_string(scanner.errors()[0]) == "[line 1] Error: Unexpected character: @",
           "(!@) error text");
  }
}

static void test_equal_equal() {
  auto result = lox::lex("==");
  ASSERT(result.ok() && result.tokens.size() == 2, "== one token plus eof");
  if (result.tokens.size() == 2) {
    ASSERT(lox::to_string(result.tokens[0]) == "EQUAL_EQUAL == null", "== lexeme");
  }
}

static void test_empty() {
  auto result = lox::lex("");
  ASSERT(result.ok() && result.tokens.size() == 1, "empty source eof only");
  if (!result.tokens.empty()) {
    ASSERT(lox::to_string(result.tokens[0]) == "EOF  null", "empty source eof text");
  }
}

int main() {
  test_paren_plus();
  test_unexpected_at();
  test_equal_equal();
  test_empty();
  if (failed) {
    std::cerr << "Some tests failed.\n";
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed.\n";
  return EXIT_SUCCESS;
}
