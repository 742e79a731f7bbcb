#include "swaprouter/store/in_memory_order_store.hpp"
#include "swaprouter/errors/router_error.hpp"

#include <algorithm>
#include <mutex>

namespace swaprouter {

InMemoryOrderStore::InMemoryOrderStore(const ITimeProvider& clock)
    : clock_(clock) {}

domain::Order InMemoryOrderStore::create(const domain::OrderId& id,
                                         const domain::OrderRequest& request) {
  domain::Order order;
  order.id = id;
  order.asset_in = request.asset_in;
  order.asset_out = request.asset_out;
  order.amount = request.amount;
  order.slippage = request.slippage;
  order.kind = request.kind;
  order.status = domain::OrderStatus::Pending;
  order.retry_count = 0;
  order.created_at_ms = clock_.now_ms();
  order.updated_at_ms = order.created_at_ms;

  std::unique_lock lock(mutex_);
  auto [it, inserted] = orders_.emplace(id, order);
  if (!inserted) {
    throw ValidationError("duplicate order id: " + id);
  }
  creation_order_.push_back(id);
  return it->second;
}

std::optional<domain::Order> InMemoryOrderStore::get(
    const domain::OrderId& id) const {
  std::shared_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Order> InMemoryOrderStore::update(
    const domain::OrderId& id, const domain::OrderPatch& patch) {
  std::int64_t now = clock_.now_ms();

  std::unique_lock lock(mutex_);
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  domain::applyPatch(it->second, patch);
  it->second.updated_at_ms = now;
  return it->second;
}

// -----------------------------------------------------------------------------
// list(): newest first
// -----------------------------------------------------------------------------
// Walks creation_order_ backwards (later insertions first), then a stable
// sort on created_at descending. With a monotonic clock the sort is a no-op;
// it only matters when timestamps were recorded out of insertion order.
// -----------------------------------------------------------------------------
std::vector<domain::Order> InMemoryOrderStore::list(std::size_t limit,
                                                    std::size_t offset) const {
  std::vector<domain::Order> all;
  {
    std::shared_lock lock(mutex_);
    all.reserve(creation_order_.size());
    for (auto it = creation_order_.rbegin(); it != creation_order_.rend();
         ++it) {
      all.push_back(orders_.at(*it));
    }
  }

  std::stable_sort(all.begin(), all.end(),
                   [](const domain::Order& a, const domain::Order& b) {
                     return a.created_at_ms > b.created_at_ms;
                   });

  if (offset >= all.size()) {
    return {};
  }
  auto first = all.begin() + static_cast<std::ptrdiff_t>(offset);
  auto last = all.size() - offset > limit
                  ? first + static_cast<std::ptrdiff_t>(limit)
                  : all.end();
  return std::vector<domain::Order>(std::make_move_iterator(first),
                                    std::make_move_iterator(last));
}

std::size_t InMemoryOrderStore::count() const {
  std::shared_lock lock(mutex_);
  return orders_.size();
}

domain::RoutingDecision InMemoryOrderStore::appendRoutingDecision(
    domain::RoutingDecision decision) {
  decision.created_at_ms = clock_.now_ms();

  std::unique_lock lock(mutex_);
  decision.id = next_decision_id_++;
  routing_log_[decision.order_id].push_back(decision);
  return decision;
}

std::vector<domain::RoutingDecision> InMemoryOrderStore::routingDecisions(
    const domain::OrderId& id) const {
  std::shared_lock lock(mutex_);
  auto it = routing_log_.find(id);
  if (it == routing_log_.end()) {
    return {};
  }
  return std::vector<domain::RoutingDecision>(it->second.rbegin(),
                                              it->second.rend());
}

}  // namespace swaprouter
