#pragma once

#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/venue.hpp"

#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// SettlementRequest / SettlementResult
// -----------------------------------------------------------------------------
// quoted_price and fee are what the selected venue quoted during routing;
// slippage is the order's tolerance. The executed price may move away from
// quoted_price by at most slippage in either direction.
// -----------------------------------------------------------------------------
struct SettlementRequest {
  domain::OrderId order_id;
  domain::VenueId venue{domain::VenueId::Raydium};
  double amount{0.0};
  double slippage{0.01};
  double quoted_price{0.0};
  double fee{0.0};
};

struct SettlementResult {
  std::string settlement_ref;
  double executed_price{0.0};
  double actual_output{0.0};
};

// -----------------------------------------------------------------------------
// ISettlement: submits a built swap to a venue and waits for confirmation
// -----------------------------------------------------------------------------
//
// @brief  Executes one swap on the venue chosen by routing.
//
// @details
// settle() blocks until the venue confirms or declines. On decline it
// throws SettlementFailure; the execution state machine treats that as a
// retryable attempt failure.
//
// Implementations:
//   - MockSettlement (randomized latency, price drift and failure rate).
//
// Thread model:
//   settle() is called concurrently from scheduler worker threads, one call
//   per active order.
// -----------------------------------------------------------------------------
class ISettlement {
 public:
  virtual ~ISettlement() = default;

  virtual SettlementResult settle(const SettlementRequest& request) = 0;
};

}  // namespace swaprouter
