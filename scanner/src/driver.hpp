#ifndef LOX_DRIVER_HPP
#define LOX_DRIVER_HPP

#include <ostream>
#include <string>
#include <vector>

namespace lox {

// Process exit codes (sysexits.h values where one applies).
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 64;
constexpr int kExitLexError = 65;
constexpr int kExitNoInput = 66;

/** Scan source, write errors to err and tokens to out. Returns kExitOk or kExitLexError. */
int tokenize_source(const std::string& source, std::ostream& out, std::ostream& err);

/** Read path then tokenize_source. Returns kExitNoInput if the file cannot be read. */
int tokenize_file(const std::string& path, std::ostream& out, std::ostream& err);

/** Dispatch command line arguments (argv without the program name). */
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

}  // namespace lox

#endif
