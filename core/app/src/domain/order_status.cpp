#include "swaprouter/domain/order_status.hpp"

namespace swaprouter {
namespace domain {

bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Confirmed || status == OrderStatus::Failed;
}

// -----------------------------------------------------------------------------
// canTransition(): the lifecycle graph as a switch over the current state
// -----------------------------------------------------------------------------
bool canTransition(OrderStatus current, OrderStatus next) {
  using S = OrderStatus;

  switch (current) {
    case S::Pending:
      return next == S::Pending ||
             next == S::Routing ||
             next == S::Failed;

    case S::Routing:
      return next == S::Routing ||
             next == S::Building ||
             next == S::Pending ||
             next == S::Failed;

    case S::Building:
      return next == S::Submitted ||
             next == S::Pending ||
             next == S::Failed;

    case S::Submitted:
      return next == S::Confirmed ||
             next == S::Pending ||
             next == S::Failed;

    case S::Confirmed:
    case S::Failed:
      return false;
  }

  return false;
}

const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Pending:   return "pending";
    case OrderStatus::Routing:   return "routing";
    case OrderStatus::Building:  return "building";
    case OrderStatus::Submitted: return "submitted";
    case OrderStatus::Confirmed: return "confirmed";
    case OrderStatus::Failed:    return "failed";
  }
  return "unknown";
}

std::optional<OrderStatus> parseOrderStatus(std::string_view text) {
  if (text == "pending")   return OrderStatus::Pending;
  if (text == "routing")   return OrderStatus::Routing;
  if (text == "building")  return OrderStatus::Building;
  if (text == "submitted") return OrderStatus::Submitted;
  if (text == "confirmed") return OrderStatus::Confirmed;
  if (text == "failed")    return OrderStatus::Failed;
  return std::nullopt;
}

}  // namespace domain
}  // namespace swaprouter
