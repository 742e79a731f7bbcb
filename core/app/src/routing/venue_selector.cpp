#include "swaprouter/routing/venue_selector.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace swaprouter {

namespace {

std::string formatMillions(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << "$" << value / 1'000'000.0
      << "M";
  return out.str();
}

VenueSelection byLiquidity(const domain::Quote& primary,
                           const domain::Quote& secondary, double diff_pct) {
  VenueSelection selection;
  selection.output_diff_pct = diff_pct;
  std::ostringstream why;

  if (primary.liquidity == secondary.liquidity) {
    selection.venue = primary.venue;
    why << "Similar prices and equal liquidity ("
        << formatMillions(primary.liquidity) << "), "
        << domain::displayName(primary.venue) << " preferred";
  } else {
    const domain::Quote& winner =
        secondary.liquidity > primary.liquidity ? secondary : primary;
    const domain::Quote& loser = &winner == &primary ? secondary : primary;
    selection.venue = winner.venue;
    why << "Similar prices, " << domain::displayName(winner.venue)
        << " has higher liquidity (" << formatMillions(winner.liquidity)
        << " vs " << formatMillions(loser.liquidity) << ")";
  }

  selection.justification = why.str();
  return selection;
}

VenueSelection byOutput(const domain::Quote& primary,
                        const domain::Quote& secondary, double diff_pct) {
  // diff >= threshold, so the outputs differ and "strictly greater" is
  // well defined.
  const domain::Quote& winner =
      secondary.estimated_output > primary.estimated_output ? secondary
                                                            : primary;
  const domain::Quote& loser = &winner == &primary ? secondary : primary;

  VenueSelection selection;
  selection.venue = winner.venue;
  selection.output_diff_pct = diff_pct;

  std::ostringstream why;
  why << std::fixed << domain::displayName(winner.venue) << " offers ";
  if (loser.estimated_output > 0.0) {
    double advantage = (winner.estimated_output - loser.estimated_output) /
                       loser.estimated_output * 100.0;
    why << std::setprecision(3) << advantage << "% ";
  }
  why << "better output (" << std::setprecision(2) << winner.estimated_output
      << " vs " << loser.estimated_output << ")";

  selection.justification = why.str();
  return selection;
}

}  // namespace

VenueSelection selectVenue(const domain::Quote& primary,
                           const domain::Quote& secondary) {
  double out_p = primary.estimated_output;
  double out_s = secondary.estimated_output;
  double mean = (out_p + out_s) / 2.0;
  double diff_pct = mean > 0.0 ? std::abs(out_p - out_s) / mean * 100.0 : 0.0;

  if (diff_pct < kSimilarOutputThresholdPct) {
    return byLiquidity(primary, secondary, diff_pct);
  }
  return byOutput(primary, secondary, diff_pct);
}

}  // namespace swaprouter
