#pragma once

#include "swaprouter/domain/order.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace swaprouter {

// -----------------------------------------------------------------------------
// OrderIdGenerator: thread-safe source of random (version 4) UUID order ids
// -----------------------------------------------------------------------------
//
// @brief  Produces 36-character UUID strings such as
//         "3f2b8c1e-9d4a-4e6f-b1c2-7a8d9e0f1a2b".
//
// @details
// Ids must be unguessable and unique across process restarts, so a counter
// is not enough: 122 random bits come from a 64-bit Mersenne Twister seeded
// once from std::random_device (or from an explicit seed in tests, which
// makes the id sequence reproducible). The version nibble is forced to 4 and
// the variant bits to 10xx as RFC 4122 requires.
//
// Thread model:
//   next_id() is called concurrently by submitting threads; the engine is
//   guarded by a mutex.
//
// Ownership:
//   Owned by RouterEngine as a value member and lent to OrderService.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator();
  explicit OrderIdGenerator(std::uint64_t seed);

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id();

 private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace swaprouter
