#pragma once

#include "swaprouter/broadcast/i_subscriber_channel.hpp"
#include "swaprouter/domain/order.hpp"
#include "swaprouter/eventbus/event_bus.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace swaprouter {

// -----------------------------------------------------------------------------
// StatusBroadcaster: zero-or-one live subscriber per order
// -----------------------------------------------------------------------------
//
// @brief  Owns the registry of order id → subscriber channel and forwards
//         every OrderStatusEvent from the bus to the channel attached to
//         that order at the moment of the event.
//
// @details
// Attach semantics: last attach wins. Attaching to an order that already
// has a subscriber replaces it; the replaced channel receives nothing
// further. Every attach returns a fresh SubscriptionId so a stale detach
// from the replaced client cannot remove its successor.
//
// Delivery is best effort and not durable:
//   - no subscriber, or a closed channel → the event is dropped;
//   - a channel that throws from send() is detached;
//   - after delivering a terminal status the subscription is removed.
// A late subscriber is resynchronized by deliverSnapshot() with a snapshot (the
// caller builds it from the store); missed transitions are not replayed.
//
// Thread model:
//   The registry is guarded by registry_mutex_. Each subscription has its
//   own send mutex, held while send() runs, so one slow client never
//   blocks another order's delivery and sends to one channel never
//   interleave. Events for one order come from one worker at a time and
//   therefore reach the channel in transition order.
//
// Ownership:
//   Owned by RouterEngine. Shares ownership of channels with whoever
//   created them (the transport keeps its own handle to close them).
// -----------------------------------------------------------------------------
class StatusBroadcaster {
 public:
  using SubscriptionId = std::uint64_t;

  // Subscribes to OrderStatusEvent on bus.
  explicit StatusBroadcaster(EventBus& bus);
  ~StatusBroadcaster();

  StatusBroadcaster(const StatusBroadcaster&) = delete;
  StatusBroadcaster& operator=(const StatusBroadcaster&) = delete;

  // Attaches channel to order_id, replacing any current subscriber.
  SubscriptionId attach(const domain::OrderId& order_id,
                        std::shared_ptr<ISubscriberChannel> channel);

  // Removes the subscription if it is still the current one for order_id.
  // Returns true if something was removed.
  bool detach(const domain::OrderId& order_id, SubscriptionId subscription);

  // Removes whatever is attached to order_id.
  bool detachAll(const domain::OrderId& order_id);

  // Sends event to the current subscriber of event.order_id, if any.
  void deliver(const OrderStatusEvent& event);

  // Builds the attach-time snapshot and sends it if subscription is still
  // the order's current one. make_snapshot runs under the subscription's
  // send lock, so a transition persisted after the snapshot was read can
  // only reach the channel after it.
  using SnapshotFn = std::function<std::optional<OrderStatusEvent>()>;
  void deliverSnapshot(const domain::OrderId& order_id,
                       SubscriptionId subscription,
                       const SnapshotFn& make_snapshot);

  bool hasSubscriber(const domain::OrderId& order_id) const;
  std::size_t subscriberCount() const;

 private:
  struct Subscription {
    SubscriptionId id{0};
    std::shared_ptr<ISubscriberChannel> channel;
    std::mutex send_mutex;
  };

  std::shared_ptr<Subscription> current(const domain::OrderId& order_id) const;
  // Caller holds subscription->send_mutex. Returns false if the
  // subscription must be detached.
  bool sendLocked(Subscription& subscription, const OrderStatusEvent& event);
  void finish(const domain::OrderId& order_id, SubscriptionId subscription,
              bool keep, domain::OrderStatus status);

  EventBus& bus_;
  EventBus::SubscriptionId bus_subscription_{0};

  mutable std::mutex registry_mutex_;
  std::unordered_map<domain::OrderId, std::shared_ptr<Subscription>>
      subscriptions_;
  SubscriptionId next_id_{1};
};

}  // namespace swaprouter
