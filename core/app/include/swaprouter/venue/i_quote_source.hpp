#pragma once

#include "swaprouter/domain/quote.hpp"
#include "swaprouter/domain/venue.hpp"

#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// IQuoteSource: one liquidity venue's pricing endpoint
// -----------------------------------------------------------------------------
//
// @brief  Abstract capability the router needs from a venue: "what would you
//         give me for this swap right now?"
//
// @details
// quote() blocks for the round trip (about 200 ms for the simulated venues).
// An implementation must give up after its configured timeout and throw
// VenueUnavailable, and must report any other transport or venue error as
// VenueUnavailable too. It has no side effects beyond the remote call.
//
// The ExecutionStateMachine calls the two venues concurrently from helper
// threads, so implementations must be safe for concurrent quote() calls
// (two workers may route different orders through the same venue at once).
//
// Implementations:
//   - MockQuoteSource   randomized venue simulation (this library).
//   - test fakes        fixed or scripted quotes (tests/fakes).
//   A production adapter calling a real venue API implements the same
//   interface; nothing upstream changes.
// -----------------------------------------------------------------------------
class IQuoteSource {
 public:
  virtual ~IQuoteSource() = default;

  // Which venue this source prices for. Constant for the object's lifetime.
  virtual domain::VenueId venue() const = 0;

  // @throws VenueUnavailable on timeout or venue error.
  virtual domain::Quote quote(const std::string& asset_in,
                              const std::string& asset_out,
                              double amount) = 0;
};

}  // namespace swaprouter
