#ifndef CAMSNITCH_TESTS_COMMON_ASSERTIONS_HPP_
#define CAMSNITCH_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

namespace camsnitch::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertTrue(bool condition, std::string_view message) {
  if (!condition) {
    Fail(message);
  }
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void WriteTextFile(const std::filesystem::path& path, std::string_view contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    Fail("failed to open file for write: " + path.string());
  }
  out << contents;
  if (!out) {
    Fail("failed to write file: " + path.string());
  }
}

} // namespace camsnitch::tests::common

#endif // CAMSNITCH_TESTS_COMMON_ASSERTIONS_HPP_
