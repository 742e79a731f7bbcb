#include "swaprouter/domain/venue.hpp"

namespace swaprouter {
namespace domain {

const char* toString(VenueId venue) {
  switch (venue) {
    case VenueId::Raydium: return "raydium";
    case VenueId::Meteora: return "meteora";
  }
  return "unknown";
}

std::optional<VenueId> parseVenue(std::string_view text) {
  if (text == "raydium") return VenueId::Raydium;
  if (text == "meteora") return VenueId::Meteora;
  return std::nullopt;
}

const char* displayName(VenueId venue) {
  switch (venue) {
    case VenueId::Raydium: return "Raydium";
    case VenueId::Meteora: return "Meteora";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace swaprouter
