#pragma once

#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/quote.hpp"

#include <cstdint>
#include <string>

namespace swaprouter {
namespace domain {

// -----------------------------------------------------------------------------
// RoutingDecision
// -----------------------------------------------------------------------------
// Responsibility: Append-only audit record of one routing phase: both quotes
// as they were seen, the venue chosen and why.
//
// One record is appended per successful routing phase. A retry that
// re-routes appends a new record; existing records are never updated.
// id and created_at_ms are assigned by the order store on append.
// -----------------------------------------------------------------------------
struct RoutingDecision {
  std::uint64_t id{0};
  OrderId order_id;
  Quote raydium_quote;
  Quote meteora_quote;
  VenueId selected_venue{VenueId::Raydium};
  std::string justification;
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace swaprouter
