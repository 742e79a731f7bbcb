#pragma once

#include "swaprouter/domain/router_config.hpp"
#include "swaprouter/venue/i_quote_source.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace swaprouter {

// -----------------------------------------------------------------------------
// MockQuoteSource: simulated venue pricing
// -----------------------------------------------------------------------------
//
// @brief  Produces plausible, randomized quotes around a shared reference
//         price so the routing logic has something real to choose between.
//
// @details
// Per call:
//   1. Sleep for the configured latency. If the latency exceeds the
//      configured timeout, sleep only for the timeout and throw
//      VenueUnavailable: this is how a hung venue looks to the caller.
//   2. With probability unavailable_probability, throw VenueUnavailable.
//   3. price     = reference_price * U(price_multiplier_min, _max)
//      liquidity = U(liquidity_min, liquidity_max)
//      estimated_output = amount * price * (1 - fee)
//
// The two default profiles differ only in numbers (see router_config.hpp):
// Raydium charges 0.3% and varies 0.98-1.02; Meteora charges 0.2% and
// varies 0.97-1.02 with a shallower liquidity range.
//
// Thread model:
//   quote() may run concurrently. Random draws are serialized by a mutex;
//   the latency sleep happens outside it.
// -----------------------------------------------------------------------------
class MockQuoteSource final : public IQuoteSource {
 public:
  // seed == 0 seeds from std::random_device.
  MockQuoteSource(domain::MockVenueConfig config, double reference_price,
                  std::uint64_t seed = 0);

  domain::VenueId venue() const override { return config_.venue; }

  domain::Quote quote(const std::string& asset_in,
                      const std::string& asset_out,
                      double amount) override;

 private:
  double uniform(double lo, double hi);

  domain::MockVenueConfig config_;
  double reference_price_;

  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
};

}  // namespace swaprouter
