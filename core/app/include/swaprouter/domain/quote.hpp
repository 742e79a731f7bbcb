#pragma once

#include "swaprouter/domain/venue.hpp"

namespace swaprouter {
namespace domain {

// -----------------------------------------------------------------------------
// Quote
// -----------------------------------------------------------------------------
// Responsibility: What one venue offers for a requested swap at one moment.
// Quotes are ephemeral. They are never stored on their own, only embedded in
// a RoutingDecision.
//
// estimated_output is always amount * price * (1 - fee); use
// estimatedOutput() so every producer computes it the same way.
// -----------------------------------------------------------------------------
struct Quote {
  VenueId venue{VenueId::Raydium};
  double price{0.0};             // asset_out per unit of asset_in
  double fee{0.0};               // fraction, e.g. 0.003 = 0.3%
  double estimated_output{0.0};  // asset_out received after fees
  double liquidity{0.0};         // pool depth reported by the venue
};

inline double estimatedOutput(double amount, double price, double fee) {
  return amount * price * (1.0 - fee);
}

}  // namespace domain
}  // namespace swaprouter
