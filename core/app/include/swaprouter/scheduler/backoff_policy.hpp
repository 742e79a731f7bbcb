#pragma once

#include <algorithm>
#include <chrono>

namespace swaprouter {

// -----------------------------------------------------------------------------
// backoffDelay(base, retry_count)
// -----------------------------------------------------------------------------
// Exponential backoff before retry number retry_count (1-based):
//   base * 2^(retry_count - 1)   →   1s, 2s, 4s for base = 1s.
// retry_count < 1 is treated as 1. The exponent is capped so the shift
// cannot overflow.
// -----------------------------------------------------------------------------
inline std::chrono::milliseconds backoffDelay(std::chrono::milliseconds base,
                                              int retry_count) {
  int exponent = std::clamp(retry_count - 1, 0, 30);
  return base * (1LL << exponent);
}

}  // namespace swaprouter
