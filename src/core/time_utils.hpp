#ifndef CAMSNITCH_CORE_TIME_UTILS_HPP_
#define CAMSNITCH_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace camsnitch::core {

// ISO-8601 UTC with millisecond precision, e.g. `2024-03-01T08:15:02.041Z`.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Whole milliseconds of a steady-clock span, for log fields.
inline std::string FormatMillis(std::chrono::steady_clock::duration span) {
  return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(span).count());
}

} // namespace camsnitch::core

#endif // CAMSNITCH_CORE_TIME_UTILS_HPP_
