#pragma once

#include <cstdint>

namespace swaprouter {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract wall-clock source
// -----------------------------------------------------------------------------
//
// @brief  Supplies "now" as milliseconds since the Unix epoch for every
//         timestamp the router records: order created_at/updated_at,
//         routing decision created_at, status and job event timestamps.
//
// @details
//   - LiveTimeProvider        system clock, used by the service binary.
//   - SimulationTimeProvider  set explicitly, used by tests that assert on
//                             timestamps or newest-first ordering.
//
// Only recorded timestamps go through this interface. Waiting (backoff,
// rate window, simulated latency) uses std::chrono::steady_clock, which is
// monotonic and unaffected by wall-clock adjustments.
//
// Thread-safety contract:
//   Implementations must tolerate concurrent now_ms() calls from every
//   worker thread.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace swaprouter
