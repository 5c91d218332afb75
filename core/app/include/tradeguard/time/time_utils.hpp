#pragma once

#include <cstdint>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Time utilities
// -----------------------------------------------------------------------------
// Free functions over epoch milliseconds. Stateless, safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;
constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

// -------------------------------------------------------------------------
// utc_day_start_ms
// -------------------------------------------------------------------------
// @brief  UTC midnight at or before `ms`.
//
// @details
// Floor division, so timestamps before the epoch still land on the
// preceding midnight instead of the following one.
// -------------------------------------------------------------------------
inline std::int64_t utc_day_start_ms(std::int64_t ms) {
  std::int64_t day = ms / kMsPerDay;
  if (ms % kMsPerDay < 0) {
    --day;
  }
  return day * kMsPerDay;
}

}  // namespace tradeguard
