#pragma once

#include <chrono>
#include <cstdint>

namespace whalecopy {

using Timestamp = std::chrono::system_clock::time_point;

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerHour = 60 * 60 * kMsPerSecond;
constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// UTC day number since the epoch. Floors toward negative infinity so that
// pre-epoch simulated times still fall on the right day.
inline std::int64_t utc_day_index(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMsPerDay;
  if (epoch_ms % kMsPerDay < 0) {
    --day;
  }
  return day;
}

inline double ms_to_days(std::int64_t ms) {
  return static_cast<double>(ms) / static_cast<double>(kMsPerDay);
}

}  // namespace whalecopy
