#include "swaprouter/broadcast/status_broadcaster.hpp"

#include <iostream>
#include <utility>

namespace swaprouter {

StatusBroadcaster::StatusBroadcaster(EventBus& bus) : bus_(bus) {
  bus_subscription_ = bus_.subscribe<OrderStatusEvent>(
      [this](const OrderStatusEvent& e) { deliver(e); });
}

StatusBroadcaster::~StatusBroadcaster() { bus_.unsubscribe(bus_subscription_); }

// -----------------------------------------------------------------------------
// attach(): last attach wins
// -----------------------------------------------------------------------------
StatusBroadcaster::SubscriptionId StatusBroadcaster::attach(
    const domain::OrderId& order_id,
    std::shared_ptr<ISubscriberChannel> channel) {
  auto subscription = std::make_shared<Subscription>();
  subscription->channel = std::move(channel);

  std::lock_guard lock(registry_mutex_);
  subscription->id = next_id_++;
  auto& slot = subscriptions_[order_id];
  if (slot) {
    std::cout << "[StatusBroadcaster] " << order_id
              << " subscriber replaced (" << slot->id << " -> "
              << subscription->id << ")\n";
  }
  slot = subscription;
  return subscription->id;
}

bool StatusBroadcaster::detach(const domain::OrderId& order_id,
                               SubscriptionId subscription) {
  std::lock_guard lock(registry_mutex_);
  auto it = subscriptions_.find(order_id);
  if (it == subscriptions_.end() || it->second->id != subscription) {
    return false;
  }
  subscriptions_.erase(it);
  return true;
}

bool StatusBroadcaster::detachAll(const domain::OrderId& order_id) {
  std::lock_guard lock(registry_mutex_);
  return subscriptions_.erase(order_id) != 0;
}

// -----------------------------------------------------------------------------
// deliver(): bus callback, runs on the publishing worker thread
// -----------------------------------------------------------------------------
void StatusBroadcaster::deliver(const OrderStatusEvent& event) {
  auto subscription = current(event.order_id);
  if (!subscription) {
    return;
  }
  bool keep = false;
  {
    std::lock_guard send_lock(subscription->send_mutex);
    keep = sendLocked(*subscription, event);
  }
  finish(event.order_id, subscription->id, keep, event.status);
}

void StatusBroadcaster::deliverSnapshot(const domain::OrderId& order_id,
                                        SubscriptionId subscription_id,
                                        const SnapshotFn& make_snapshot) {
  auto subscription = current(order_id);
  if (!subscription || subscription->id != subscription_id) {
    return;
  }
  bool keep = false;
  std::optional<OrderStatusEvent> snapshot;
  {
    std::lock_guard send_lock(subscription->send_mutex);
    snapshot = make_snapshot();
    if (!snapshot) {
      return;
    }
    keep = sendLocked(*subscription, *snapshot);
  }
  finish(order_id, subscription_id, keep, snapshot->status);
}

bool StatusBroadcaster::hasSubscriber(const domain::OrderId& order_id) const {
  std::lock_guard lock(registry_mutex_);
  return subscriptions_.count(order_id) != 0;
}

std::size_t StatusBroadcaster::subscriberCount() const {
  std::lock_guard lock(registry_mutex_);
  return subscriptions_.size();
}

std::shared_ptr<StatusBroadcaster::Subscription> StatusBroadcaster::current(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(registry_mutex_);
  auto it = subscriptions_.find(order_id);
  if (it == subscriptions_.end()) {
    return nullptr;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// sendLocked(): one send; false means the channel is gone
// -----------------------------------------------------------------------------
bool StatusBroadcaster::sendLocked(Subscription& subscription,
                                   const OrderStatusEvent& event) {
  if (!subscription.channel || !subscription.channel->isOpen()) {
    return false;
  }
  try {
    subscription.channel->send(event);
  } catch (const std::exception& e) {
    std::cerr << "[StatusBroadcaster] " << event.order_id
              << " send failed, detaching: " << e.what() << "\n";
    return false;
  }
  return true;
}

// A terminal status ends the stream.
void StatusBroadcaster::finish(const domain::OrderId& order_id,
                               SubscriptionId subscription, bool keep,
                               domain::OrderStatus status) {
  if (!keep || domain::isTerminal(status)) {
    detach(order_id, subscription);
  }
}

}  // namespace swaprouter
