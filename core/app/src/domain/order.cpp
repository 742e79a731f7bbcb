#include "swaprouter/domain/order.hpp"

namespace swaprouter {
namespace domain {

const char* toString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "market";
    case OrderKind::Limit:  return "limit";
    case OrderKind::Sniper: return "sniper";
  }
  return "unknown";
}

std::optional<OrderKind> parseOrderKind(std::string_view text) {
  if (text == "market") return OrderKind::Market;
  if (text == "limit")  return OrderKind::Limit;
  if (text == "sniper") return OrderKind::Sniper;
  return std::nullopt;
}

void applyPatch(Order& order, const OrderPatch& patch) {
  order.status = patch.status;

  if (patch.selected_venue) order.selected_venue = patch.selected_venue;
  if (patch.raydium_price) order.raydium_price = patch.raydium_price;
  if (patch.meteora_price) order.meteora_price = patch.meteora_price;
  if (patch.executed_price) order.executed_price = patch.executed_price;
  if (patch.settlement_ref) order.settlement_ref = patch.settlement_ref;
  if (patch.retry_count) order.retry_count = *patch.retry_count;

  if (patch.clear_error) {
    order.last_error.reset();
  } else if (patch.last_error) {
    order.last_error = patch.last_error;
  }
}

}  // namespace domain
}  // namespace swaprouter
