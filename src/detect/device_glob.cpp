#include "detect/device_glob.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

#include <glob.h>

namespace camsnitch::detect {

namespace {

std::optional<std::size_t> ParseTrailingIndex(std::string_view path) {
  std::size_t digits_begin = path.size();
  while (digits_begin > 0U &&
         std::isdigit(static_cast<unsigned char>(path[digits_begin - 1U])) != 0) {
    --digits_begin;
  }
  if (digits_begin == path.size()) {
    return std::nullopt;
  }

  std::size_t parsed = 0;
  const char* begin = path.data() + digits_begin;
  const char* end = path.data() + path.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

std::string_view StemWithoutIndex(std::string_view path) {
  std::size_t end = path.size();
  while (end > 0U && std::isdigit(static_cast<unsigned char>(path[end - 1U])) != 0) {
    --end;
  }
  return path.substr(0, end);
}

} // namespace

bool ExpandDevicePattern(const std::string& pattern, std::vector<std::string>& paths,
                         std::string& error) {
  paths.clear();
  error.clear();

  if (pattern.empty()) {
    error = "device glob pattern cannot be empty";
    return false;
  }

  glob_t matches{};
  const int status = glob(pattern.c_str(), GLOB_ERR, nullptr, &matches);
  if (status == GLOB_NOMATCH) {
    globfree(&matches);
    return true;
  }
  if (status != 0) {
    globfree(&matches);
    switch (status) {
    case GLOB_NOSPACE:
      error = "out of memory expanding device glob '" + pattern + "'";
      break;
    case GLOB_ABORTED:
      error = "read error expanding device glob '" + pattern + "'";
      break;
    default:
      error = "failed to expand device glob '" + pattern + "'";
      break;
    }
    return false;
  }

  paths.reserve(matches.gl_pathc);
  for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
    paths.emplace_back(matches.gl_pathv[i]);
  }
  globfree(&matches);

  std::sort(paths.begin(), paths.end(), [](const std::string& left, const std::string& right) {
    const std::string_view left_stem = StemWithoutIndex(left);
    const std::string_view right_stem = StemWithoutIndex(right);
    if (left_stem != right_stem) {
      return left_stem < right_stem;
    }
    const std::optional<std::size_t> left_index = ParseTrailingIndex(left);
    const std::optional<std::size_t> right_index = ParseTrailingIndex(right);
    if (left_index.has_value() && right_index.has_value() &&
        left_index.value() != right_index.value()) {
      return left_index.value() < right_index.value();
    }
    return left < right;
  });
  return true;
}

} // namespace camsnitch::detect
