#pragma once

#include "swaprouter/domain/router_config.hpp"
#include "swaprouter/execution/i_settlement.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// MockSettlement: simulated on-chain execution
// -----------------------------------------------------------------------------
//
// @brief  Stands in for a real venue: waits a confirmation latency, fails a
//         configurable fraction of the time, and otherwise fills with a
//         small random price drift bounded by the order's slippage.
//
// @details
// Per call:
//   1. Sleep U(latency_min, latency_max).
//   2. With probability failure_probability, throw SettlementFailure
//      "<Venue> network timeout - transaction failed to confirm".
//   3. executed_price = quoted_price * (1 + U(-slippage, +slippage))
//      actual_output  = amount * executed_price * (1 - fee)
//      settlement_ref = 88 random base58 characters (the length of an
//                       encoded ed25519 transaction signature).
//
// Thread model:
//   settle() may run concurrently. Random draws are serialized by a mutex;
//   the latency sleep happens outside it.
// -----------------------------------------------------------------------------
class MockSettlement final : public ISettlement {
 public:
  static constexpr std::size_t kSettlementRefLength = 88;

  // seed == 0 seeds from std::random_device.
  explicit MockSettlement(domain::MockSettlementConfig config,
                          std::uint64_t seed = 0);

  SettlementResult settle(const SettlementRequest& request) override;

 private:
  double uniform(double lo, double hi);
  std::string randomSettlementRef();

  domain::MockSettlementConfig config_;

  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
};

}  // namespace swaprouter
