#include "swaprouter/venue/mock_quote_source.hpp"
#include "swaprouter/errors/router_error.hpp"

#include <sstream>
#include <thread>

namespace swaprouter {

MockQuoteSource::MockQuoteSource(domain::MockVenueConfig config,
                                 double reference_price, std::uint64_t seed)
    : config_(config),
      reference_price_(reference_price),
      rng_(seed != 0 ? seed : std::random_device{}()) {}

// -----------------------------------------------------------------------------
// quote(): simulated round trip, then a randomized price inside the envelope
// -----------------------------------------------------------------------------
domain::Quote MockQuoteSource::quote(const std::string& asset_in,
                                     const std::string& asset_out,
                                     double amount) {
  if (config_.latency > config_.timeout) {
    std::this_thread::sleep_for(config_.timeout);
    std::ostringstream msg;
    msg << domain::displayName(config_.venue) << " quote for " << asset_in
        << "/" << asset_out << " timed out after " << config_.timeout.count()
        << "ms";
    throw VenueUnavailable(msg.str());
  }
  std::this_thread::sleep_for(config_.latency);

  if (config_.unavailable_probability > 0.0 &&
      uniform(0.0, 1.0) < config_.unavailable_probability) {
    throw VenueUnavailable(std::string(domain::displayName(config_.venue)) +
                           " quote service unavailable");
  }

  domain::Quote q;
  q.venue = config_.venue;
  q.price = reference_price_ *
            uniform(config_.price_multiplier_min, config_.price_multiplier_max);
  q.fee = config_.fee;
  q.estimated_output = domain::estimatedOutput(amount, q.price, q.fee);
  q.liquidity = uniform(config_.liquidity_min, config_.liquidity_max);
  return q;
}

double MockQuoteSource::uniform(double lo, double hi) {
  if (hi <= lo) {
    return lo;
  }
  std::uniform_real_distribution<double> dist(lo, hi);
  std::lock_guard lock(rng_mutex_);
  return dist(rng_);
}

}  // namespace swaprouter
