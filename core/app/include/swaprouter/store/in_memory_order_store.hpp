#pragma once

#include "swaprouter/store/i_order_store.hpp"
#include "swaprouter/time/i_time_provider.hpp"

#include <cstdint>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace swaprouter {

// -----------------------------------------------------------------------------
// InMemoryOrderStore
// -----------------------------------------------------------------------------
//
// @brief  IOrderStore kept in process memory. History is retained for the
//         lifetime of the process; nothing is ever deleted.
//
// @details
// Layout:
//   orders_          order id → Order
//   creation_order_  order ids in insertion order (for listing)
//   routing_log_     order id → decisions in append order
//
// Thread model:
//   Reads (get, list, routingDecisions, count) take a shared lock and may
//   run concurrently with each other; writes take the exclusive lock. Reads
//   copy out before the lock is released.
// -----------------------------------------------------------------------------
class InMemoryOrderStore final : public IOrderStore {
 public:
  explicit InMemoryOrderStore(const ITimeProvider& clock);

  InMemoryOrderStore(const InMemoryOrderStore&) = delete;
  InMemoryOrderStore& operator=(const InMemoryOrderStore&) = delete;

  domain::Order create(const domain::OrderId& id,
                       const domain::OrderRequest& request) override;

  std::optional<domain::Order> get(const domain::OrderId& id) const override;

  std::optional<domain::Order> update(const domain::OrderId& id,
                                      const domain::OrderPatch& patch) override;

  std::vector<domain::Order> list(std::size_t limit,
                                  std::size_t offset) const override;

  std::size_t count() const override;

  domain::RoutingDecision appendRoutingDecision(
      domain::RoutingDecision decision) override;

  std::vector<domain::RoutingDecision> routingDecisions(
      const domain::OrderId& id) const override;

 private:
  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::vector<domain::OrderId> creation_order_;
  std::unordered_map<domain::OrderId, std::vector<domain::RoutingDecision>>
      routing_log_;
  std::uint64_t next_decision_id_{1};
};

}  // namespace swaprouter
