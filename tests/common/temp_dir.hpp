#ifndef CAMSNITCH_TESTS_COMMON_TEMP_DIR_HPP_
#define CAMSNITCH_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace camsnitch::tests::common {

inline std::filesystem::path CreateUniqueTempDir(std::string_view prefix) {
  const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const std::filesystem::path root =
      std::filesystem::temp_directory_path() /
      (std::string(prefix) + "-" + std::to_string(getpid()) + "-" + std::to_string(now_ms));

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  if (ec) {
    Fail("failed to create temp root: " + root.string());
  }
  return root;
}

inline void RemovePathBestEffort(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

// Removes the directory when the test scope ends, even on early return.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) : path_(CreateUniqueTempDir(prefix)) {}
  ~ScopedTempDir() {
    RemovePathBestEffort(path_);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace camsnitch::tests::common

#endif // CAMSNITCH_TESTS_COMMON_TEMP_DIR_HPP_
