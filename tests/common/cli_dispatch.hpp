#ifndef JSONCHECK_TESTS_COMMON_CLI_DISPATCH_HPP_
#define JSONCHECK_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "jsoncheck/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace jsoncheck::tests::common {

struct DispatchResult {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
};

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return jsoncheck::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Runs one command with stdout/stderr captured. `stdin_text` feeds `-` inputs.
inline DispatchResult DispatchCaptured(const std::vector<std::string>& argv_storage,
                                       const std::string& stdin_text = "") {
  std::ostringstream captured_out;
  std::ostringstream captured_err;
  std::istringstream fake_in(stdin_text);
  std::streambuf* original_out = std::cout.rdbuf(captured_out.rdbuf());
  std::streambuf* original_err = std::cerr.rdbuf(captured_err.rdbuf());
  std::streambuf* original_in = std::cin.rdbuf(fake_in.rdbuf());

  DispatchResult result;
  result.exit_code = DispatchArgs(argv_storage);

  std::cin.rdbuf(original_in);
  std::cin.clear();
  std::cerr.rdbuf(original_err);
  std::cout.rdbuf(original_out);
  result.stdout_text = captured_out.str();
  result.stderr_text = captured_err.str();
  return result;
}

} // namespace jsoncheck::tests::common

#endif // JSONCHECK_TESTS_COMMON_CLI_DISPATCH_HPP_
