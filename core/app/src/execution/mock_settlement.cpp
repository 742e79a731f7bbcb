#include "swaprouter/execution/mock_settlement.hpp"
#include "swaprouter/errors/router_error.hpp"

#include <chrono>
#include <thread>

namespace swaprouter {

namespace {

constexpr char kBase58Alphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr std::size_t kBase58Size = sizeof(kBase58Alphabet) - 1;

}  // namespace

MockSettlement::MockSettlement(domain::MockSettlementConfig config,
                               std::uint64_t seed)
    : config_(config), rng_(seed != 0 ? seed : std::random_device{}()) {}

// -----------------------------------------------------------------------------
// settle(): latency, possible failure, then a fill inside the tolerance band
// -----------------------------------------------------------------------------
SettlementResult MockSettlement::settle(const SettlementRequest& request) {
  auto latency_ms = static_cast<std::int64_t>(
      uniform(static_cast<double>(config_.latency_min.count()),
              static_cast<double>(config_.latency_max.count())));
  std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms));

  if (config_.failure_probability > 0.0 &&
      uniform(0.0, 1.0) < config_.failure_probability) {
    throw SettlementFailure(std::string(domain::displayName(request.venue)) +
                            " network timeout - transaction failed to confirm");
  }

  SettlementResult result;
  result.executed_price =
      request.quoted_price *
      (1.0 + uniform(-request.slippage, request.slippage));
  result.actual_output =
      request.amount * result.executed_price * (1.0 - request.fee);
  result.settlement_ref = randomSettlementRef();
  return result;
}

double MockSettlement::uniform(double lo, double hi) {
  if (hi <= lo) {
    return lo;
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  std::lock_guard lock(rng_mutex_);
  return dist(rng_);
}

std::string MockSettlement::randomSettlementRef() {
  std::uniform_int_distribution<std::size_t> pick(0, kBase58Size - 1);
  std::string ref;
  ref.reserve(kSettlementRefLength);

  std::lock_guard lock(rng_mutex_);
  for (std::size_t i = 0; i < kSettlementRefLength; ++i) {
    ref.push_back(kBase58Alphabet[pick(rng_)]);
  }
  return ref;
}

}  // namespace swaprouter
