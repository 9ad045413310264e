#include <iostream>
#include <string>
#include <vector>

#include "driver.hpp"

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  int code = lox::run_cli(args, std::cout, std::cerr);
  std::cout.flush();
  if (!std::cout) {
    std::cerr << "lox: failed to write output\n";
    return lox::kExitFailure;
  }
  return code;
}
