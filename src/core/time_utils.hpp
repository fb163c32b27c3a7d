#ifndef MODEMSTAT_CORE_TIME_UTILS_HPP_
#define MODEMSTAT_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace modemstat::core {

// Canonical UTC timestamp used by log lines, snapshots and the metric surface.
// Millisecond precision, e.g. 2026-10-19T08:15:02.125Z.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Whole milliseconds between two steady-clock points, clamped at zero.
inline std::uint64_t ElapsedMillis(std::chrono::steady_clock::time_point begin,
                                   std::chrono::steady_clock::time_point end) {
  if (end <= begin) {
    return 0U;
  }
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count());
}

} // namespace modemstat::core

#endif // MODEMSTAT_CORE_TIME_UTILS_HPP_
