#ifndef CAMSNITCH_TESTS_COMMON_CLI_DISPATCH_HPP_
#define CAMSNITCH_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "camsnitch/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace camsnitch::tests::common {

struct DispatchResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

// Runs `Dispatch` with stdout/stderr redirected into the returned strings.
inline DispatchResult DispatchCaptured(std::vector<std::string> argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }

  std::ostringstream captured_stdout;
  std::ostringstream captured_stderr;
  std::streambuf* original_stdout = std::cout.rdbuf(captured_stdout.rdbuf());
  std::streambuf* original_stderr = std::cerr.rdbuf(captured_stderr.rdbuf());
  DispatchResult result;
  result.exit_code = camsnitch::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(original_stdout);
  std::cerr.rdbuf(original_stderr);

  result.stdout_text = captured_stdout.str();
  result.stderr_text = captured_stderr.str();
  return result;
}

} // namespace camsnitch::tests::common

#endif // CAMSNITCH_TESTS_COMMON_CLI_DISPATCH_HPP_
