#pragma once

#include "swaprouter/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace swaprouter {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: manually driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose time only moves when told to.
//
// @details
// Tests use it to make recorded timestamps deterministic: orders created
// after advance_by(10) are strictly newer, so newest-first listings have a
// known order regardless of how fast the test runs.
//
// Storage is a single std::atomic<int64_t>; readers on worker threads and a
// writer on the test thread need no further synchronisation.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is the caller's responsibility.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms and returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace swaprouter
