#include "driver.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <llvm/Config/llvm-config.h>

#include "scanner.hpp"
#include "token.hpp"

namespace lox {

static bool debug_enabled() {
  const char* v = getenv("LOX_DEBUG");
  return v && *v && std::string(v) != "0";
}

static void print_usage(std::ostream& os) {
  os << "Lox scanner – usage: lox <command> [args]\n";
  os << "  tokenize <file>  Print the tokens of a .lox file\n";
  os << "  --help, -h       Show this help\n";
  os << "  --version, -v    Show scanner and LLVM version\n";
}

int tokenize_source(const std::string& source, std::ostream& out, std::ostream& err) {
  Scanner scanner(source);
  scanner.scan();
  if (debug_enabled()) {
    err << "lox: scanned " << scanner.tokens().size() << " tokens, "
        << scanner.errors().size() << " errors\n";
  }

  for (const auto& e : scanner.errors()) err << to_string(e) << "\n";
  for (const auto& t : scanner.tokens()) out << to_string(t) << "\n";
  return scanner.has_errors() ? kExitLexError : kExitOk;
}

int tokenize_file(const std::string& path, std::ostream& out, std::ostream& err) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    err << "lox: cannot open '" << path << "'\n";
    return kExitNoInput;
  }
  std::stringstream buf;
  buf << f.rdbuf();
  std::string source = buf.str();
  if (debug_enabled()) {
    err << "lox: tokenizing " << path << " (" << source.size() << " bytes)\n";
  }
  return tokenize_source(source, out, err);
}

int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  if (args.empty()) {
    print_usage(out);
    return kExitOk;
  }
  const std::string& cmd = args[0];
  if (cmd == "--help" || cmd == "-h") {
    print_usage(out);
    return kExitOk;
  }
  if (cmd == "--version" || cmd == "-v") {
    out << "Lox scanner (LLVM " << LLVM_VERSION_STRING << ")\n";
    return kExitOk;
  }
  if (cmd == "tokenize") {
    if (args.size() < 2) {
      err << "lox: tokenize requires a file\n";
      print_usage(err);
      return kExitUsage;
    }
    return tokenize_file(args[1], out, err);
  }
  err << "lox: unknown command '" << cmd << "'\n";
  return kExitUsage;
}

}  // namespace lox
