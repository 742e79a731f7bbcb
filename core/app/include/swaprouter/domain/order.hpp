#pragma once

#include "swaprouter/domain/order_status.hpp"
#include "swaprouter/domain/venue.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace swaprouter {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Opaque unique identifier (UUID text form). Stable across retries: every
// execution attempt of the same order, every routing decision and every
// status event carries the same id.
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Only Market orders are executed. Limit and Sniper exist so a submission
// naming them can be recognised and rejected with a precise message.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Market,
  Limit,
  Sniper,
};

const char* toString(OrderKind kind);
std::optional<OrderKind> parseOrderKind(std::string_view text);

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  The authoritative record of one swap order: the client's intent
//         plus everything the execution pipeline has learned about it.
//
// @details
// Nullability follows the lifecycle:
//   selected_venue, *_price (quoted)  set once a routing phase completes;
//                                     overwritten when a retry re-routes.
//   executed_price, settlement_ref    set if and only if status == Confirmed.
//   last_error                        set after a failed attempt; always set
//                                     when status == Failed; cleared on
//                                     confirmation.
//   retry_count                       failed attempts so far, never above
//                                     the configured max_retries.
//
// Ownership:
//   The order store owns the record. The execution state machine works on a
//   copy for the duration of one attempt and writes every change back
//   through an OrderPatch. Orders are never deleted.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;
  std::string asset_in;
  std::string asset_out;
  double amount{0.0};
  double slippage{0.01};
  OrderKind kind{OrderKind::Market};
  OrderStatus status{OrderStatus::Pending};

  std::optional<VenueId> selected_venue;
  std::optional<double> raydium_price;
  std::optional<double> meteora_price;
  std::optional<double> executed_price;
  std::optional<std::string> settlement_ref;
  std::optional<std::string> last_error;
  int retry_count{0};

  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};

  std::optional<double> quotedPrice(VenueId venue) const {
    return venue == VenueId::Raydium ? raydium_price : meteora_price;
  }
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Validated client input, ready to become an Order. Produced by OrderService
// after all submission checks pass.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string asset_in;
  std::string asset_out;
  double amount{0.0};
  double slippage{0.01};
  OrderKind kind{OrderKind::Market};
};

// -----------------------------------------------------------------------------
// OrderPatch
// -----------------------------------------------------------------------------
//
// @brief  One write to an order record: a new status plus the fields that
//         change with it. Unset optionals leave the stored value untouched.
//
// @details
// A patch is applied atomically by the store, so a status and the fields it
// implies (e.g. Confirmed + executed_price + settlement_ref) are never
// observed half-written. clear_error drops last_error, which is how a
// successful retry removes the previous attempt's failure message.
// -----------------------------------------------------------------------------
struct OrderPatch {
  OrderStatus status{OrderStatus::Pending};
  std::optional<VenueId> selected_venue;
  std::optional<double> raydium_price;
  std::optional<double> meteora_price;
  std::optional<double> executed_price;
  std::optional<std::string> settlement_ref;
  std::optional<std::string> last_error;
  std::optional<int> retry_count;
  bool clear_error{false};
};

// Applies patch to order in place. Does not touch timestamps.
void applyPatch(Order& order, const OrderPatch& patch);

}  // namespace domain
}  // namespace swaprouter
