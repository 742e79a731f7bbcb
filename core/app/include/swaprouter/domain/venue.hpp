#pragma once

#include <optional>
#include <string_view>

namespace swaprouter {
namespace domain {

// -----------------------------------------------------------------------------
// VenueId
// -----------------------------------------------------------------------------
// Responsibility: Names one of the two liquidity venues an order can be
// routed to. The router always compares exactly these two.
//
// Preference order: Raydium is the primary venue. When two quotes are
// indistinguishable on every routing criterion, the primary venue wins
// (see VenueSelector).
// -----------------------------------------------------------------------------
enum class VenueId {
  Raydium,
  Meteora,
};

// Wire names: "raydium", "meteora".
const char* toString(VenueId venue);
std::optional<VenueId> parseVenue(std::string_view text);

// Display names used in routing justifications: "Raydium", "Meteora".
const char* displayName(VenueId venue);

}  // namespace domain
}  // namespace swaprouter
