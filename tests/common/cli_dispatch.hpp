#ifndef MODEMSTAT_TESTS_COMMON_CLI_DISPATCH_HPP_
#define MODEMSTAT_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "modemstat/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace modemstat::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return modemstat::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

struct CapturedDispatch {
  int exit_code = 0;
  std::string out;
  std::string err;
};

// Runs the CLI with stdout/stderr redirected into strings.
inline CapturedDispatch DispatchCaptured(const std::vector<std::string>& argv_storage) {
  std::ostringstream captured_cout;
  std::ostringstream captured_cerr;
  std::streambuf* original_cout = std::cout.rdbuf(captured_cout.rdbuf());
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());
  const int exit_code = DispatchArgs(argv_storage);
  std::cout.rdbuf(original_cout);
  std::cerr.rdbuf(original_cerr);
  return CapturedDispatch{exit_code, captured_cout.str(), captured_cerr.str()};
}

} // namespace modemstat::tests::common

#endif // MODEMSTAT_TESTS_COMMON_CLI_DISPATCH_HPP_
