#pragma once

#include "swaprouter/time/i_time_provider.hpp"

namespace swaprouter {

// -----------------------------------------------------------------------------
// LiveTimeProvider: system_clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Stateless; safe to share between all components and threads.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace swaprouter
