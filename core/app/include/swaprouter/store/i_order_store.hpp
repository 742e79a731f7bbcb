#pragma once

#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/routing_decision.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace swaprouter {

// -----------------------------------------------------------------------------
// IOrderStore: durable home of orders and their routing history
// -----------------------------------------------------------------------------
//
// @brief  CRUD record store for Order plus an append-only RoutingDecision
//         log per order.
//
// @details
// Every write is scoped to one order id and is atomic on its own; there are
// no cross-order transactions. The execution state machine is the only
// writer after creation, and within one order its writes are strictly
// sequential, so per-order write order equals transition order.
//
// Reads return copies. Callers never hold references into the store.
//
// Implementations:
//   - InMemoryOrderStore  (this library).
//   A relational or key-value backend implements the same interface.
// -----------------------------------------------------------------------------
class IOrderStore {
 public:
  virtual ~IOrderStore() = default;

  // Inserts a new order with status Pending, retry_count 0 and both
  // timestamps set to now.
  // @throws ValidationError if id is already taken.
  virtual domain::Order create(const domain::OrderId& id,
                               const domain::OrderRequest& request) = 0;

  virtual std::optional<domain::Order> get(const domain::OrderId& id) const = 0;

  // Applies patch and bumps updated_at. Returns the order as stored after
  // the write, or std::nullopt if id is unknown.
  virtual std::optional<domain::Order> update(const domain::OrderId& id,
                                              const domain::OrderPatch& patch) = 0;

  // Newest first by created_at; insertion order breaks ties (later first).
  virtual std::vector<domain::Order> list(std::size_t limit,
                                          std::size_t offset) const = 0;

  virtual std::size_t count() const = 0;

  // Assigns id and created_at, appends, and returns the stored record.
  virtual domain::RoutingDecision appendRoutingDecision(
      domain::RoutingDecision decision) = 0;

  // Newest first.
  virtual std::vector<domain::RoutingDecision> routingDecisions(
      const domain::OrderId& id) const = 0;
};

}  // namespace swaprouter
