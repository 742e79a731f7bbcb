#pragma once

#include "swaprouter/domain/venue.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace swaprouter {
namespace domain {

// -----------------------------------------------------------------------------
// Router configuration
// -----------------------------------------------------------------------------
//
// @brief  Plain value structs holding every tunable of the router. Each
//         field has an in-class default, so a default-constructed
//         RouterConfig is a complete, valid configuration.
//
// @details
// Components receive the sub-struct they need by value at construction and
// keep it for their whole lifetime. Nothing reads configuration from the
// environment or from globals. loadRouterConfig() (config/config_loader.hpp)
// can overlay a JSON file on top of these defaults.
//
// Thread model:
//   Copied into components at construction. No shared mutable state.
// -----------------------------------------------------------------------------

// Admission, concurrency and retry policy of the OrderScheduler.
struct SchedulerConfig {
  /// Worker threads, and therefore the ceiling on concurrently executing
  /// orders.
  std::size_t concurrency{10};

  /// At most this many admissions (first attempts and retries alike) per
  /// rolling rate_window. Excess jobs wait, they are never rejected.
  std::size_t max_admissions_per_window{100};
  std::chrono::milliseconds rate_window{60'000};

  /// An order fails terminally once retry_count reaches max_retries.
  int max_retries{3};

  /// Delay before retry n (n >= 1) is backoff_base * 2^(n-1), measured from
  /// the failure of the previous attempt.
  std::chrono::milliseconds backoff_base{1'000};

  /// Finished job records kept for observability before pruning.
  std::size_t retain_completed{100};
  std::size_t retain_failed{500};
};

// Timings and defaults of one execution attempt.
struct ExecutionConfig {
  /// Simulated transaction construction in the Building phase.
  std::chrono::milliseconds build_duration{500};

  /// Slippage stored when a submission does not name one.
  double default_slippage{0.01};

  /// Upper bound the state machine waits for a quote before reporting the
  /// venue unavailable. Adapters are expected to honour their own timeout
  /// first.
  std::chrono::milliseconds quote_timeout{5'000};
};

// One simulated venue. Prices are drawn as reference_price * U(min, max).
struct MockVenueConfig {
  VenueId venue{VenueId::Raydium};
  double fee{0.003};
  double price_multiplier_min{0.98};
  double price_multiplier_max{1.02};
  double liquidity_min{1'000'000.0};
  double liquidity_max{10'000'000.0};
  std::chrono::milliseconds latency{200};
  std::chrono::milliseconds timeout{5'000};

  /// Probability that a quote request fails outright. 0 in the default
  /// profile; raised in tests and soak runs to exercise re-routing.
  double unavailable_probability{0.0};
};

// Simulated settlement shared by both venues.
struct MockSettlementConfig {
  std::chrono::milliseconds latency_min{2'000};
  std::chrono::milliseconds latency_max{3'000};

  /// Intrinsic transient-failure rate of a settlement.
  double failure_probability{0.05};
};

// IPC transport endpoints. An empty endpoint disables the IPC server.
struct IpcConfig {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string status_endpoint{"tcp://127.0.0.1:5557"};
};

inline MockVenueConfig defaultRaydiumConfig() {
  MockVenueConfig c;
  c.venue = VenueId::Raydium;
  c.fee = 0.003;
  c.price_multiplier_min = 0.98;
  c.price_multiplier_max = 1.02;
  c.liquidity_min = 1'000'000.0;
  c.liquidity_max = 10'000'000.0;
  return c;
}

inline MockVenueConfig defaultMeteoraConfig() {
  MockVenueConfig c;
  c.venue = VenueId::Meteora;
  c.fee = 0.002;
  c.price_multiplier_min = 0.97;
  c.price_multiplier_max = 1.02;
  c.liquidity_min = 500'000.0;
  c.liquidity_max = 8'000'000.0;
  return c;
}

// -----------------------------------------------------------------------------
// RouterConfig: everything RouterEngine needs to assemble the pipeline
// -----------------------------------------------------------------------------
struct RouterConfig {
  SchedulerConfig scheduler;
  ExecutionConfig execution;
  MockVenueConfig raydium{defaultRaydiumConfig()};
  MockVenueConfig meteora{defaultMeteoraConfig()};
  MockSettlementConfig settlement;
  IpcConfig ipc;

  /// Shared reference price both mock venues vary around.
  double reference_price{50'000.0};

  /// Seed for the mock venues' random engines. 0 seeds from
  /// std::random_device.
  std::uint64_t seed{0};
};

}  // namespace domain
}  // namespace swaprouter
