#ifndef LOX_TEST_UTILS_H
#define LOX_TEST_UTILS_H

#include <string>

namespace lox {
namespace test {

/** Path to the tests/data directory, injected by CMake as LOX_TEST_DATA_DIR. */
const char* test_data_dir();

/** test_data_dir() joined with name. */
std::string data_path(const std::string& name);

}  // namespace test
}  // namespace lox

#endif
