#pragma once

#include "swaprouter/domain/quote.hpp"
#include "swaprouter/domain/venue.hpp"

#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// VenueSelection
// -----------------------------------------------------------------------------
// Outcome of comparing two quotes. output_diff_pct is the symmetric
// difference of the two estimated outputs relative to their mean, in
// percent; it decides which rule applied.
// -----------------------------------------------------------------------------
struct VenueSelection {
  domain::VenueId venue{domain::VenueId::Raydium};
  std::string justification;
  double output_diff_pct{0.0};
};

// Below this symmetric output difference (percent) two quotes count as
// equally priced and liquidity decides.
inline constexpr double kSimilarOutputThresholdPct = 0.1;

// -----------------------------------------------------------------------------
// selectVenue(primary, secondary)
// -----------------------------------------------------------------------------
//
// @brief  Picks the venue to route to. Pure and deterministic: identical
//         inputs always yield the identical venue and justification string.
//
// @details
//   diff = |out_p - out_s| / ((out_p + out_s) / 2) * 100
//
//   diff <  0.1  → the venue with strictly greater liquidity wins.
//                  "Similar prices, <Venue> has higher liquidity
//                   ($5.00M vs $3.00M)"
//   diff >= 0.1  → the venue with strictly greater estimated output wins.
//                  "<Venue> offers 11.111% better output (100.00 vs 90.00)"
//                  where the percentage is |out_w - out_l| / out_l * 100,
//                  three decimals.
//
// Ties: when liquidity is exactly equal under the first rule, `primary`
// wins. The router always passes the Raydium quote as primary, so Raydium
// is the tie-break venue. Zero or negative outputs on both sides count as
// a zero difference.
// -----------------------------------------------------------------------------
VenueSelection selectVenue(const domain::Quote& primary,
                           const domain::Quote& secondary);

}  // namespace swaprouter
