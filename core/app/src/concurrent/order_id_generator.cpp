#include "swaprouter/concurrent/order_id_generator.hpp"

#include <cstdio>

namespace swaprouter {

OrderIdGenerator::OrderIdGenerator() : engine_(std::random_device{}()) {}

OrderIdGenerator::OrderIdGenerator(std::uint64_t seed) : engine_(seed) {}

// -----------------------------------------------------------------------------
// next_id(): two 64-bit draws, version/variant bits fixed, 8-4-4-4-12 layout
// -----------------------------------------------------------------------------
domain::OrderId OrderIdGenerator::next_id() {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  {
    std::lock_guard lock(mutex_);
    hi = engine_();
    lo = engine_();
  }

  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFFU),
                static_cast<unsigned>(hi & 0xFFFFU),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return domain::OrderId(buf);
}

}  // namespace swaprouter
