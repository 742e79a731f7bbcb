#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------

using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// formatIso8601(ms)
// -------------------------------------------------------------------------
// @brief  Renders epoch milliseconds as UTC ISO-8601 with millisecond
//         precision, e.g. "2024-03-01T12:00:00.250Z". Used for every
//         timestamp that leaves the process as JSON.
// -------------------------------------------------------------------------
std::string formatIso8601(std::int64_t ms);

}  // namespace swaprouter
