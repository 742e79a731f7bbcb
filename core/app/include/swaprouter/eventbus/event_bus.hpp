#pragma once

#include "swaprouter/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace swaprouter {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: In-process publish-subscribe channel for router events.
// The ExecutionStateMachine publishes OrderStatusEvent, the OrderScheduler
// publishes JobEvent; the StatusBroadcaster and logging subscribe.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Several worker threads publish concurrently. Callbacks run synchronously on
// the publishing thread, so events of one order (always published by the one
// worker running its attempt) reach each subscriber in publish order.
//
// A callback that throws does not abort the publish: the exception is logged
// and the remaining subscribers still run. A faulty listener can therefore
// never turn into a failed order.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // -------------------------------------------------------------------------
  // subscribe(GenericCallback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked for every published event.
  // Output: SubscriptionId for unsubscribe().
  // -------------------------------------------------------------------------
  SubscriptionId subscribe(GenericCallback callback);

  // -------------------------------------------------------------------------
  // subscribe<EventType>(callback)
  // -------------------------------------------------------------------------
  // What: Registers a callback invoked only when the event holds EventType.
  // Implemented as a generic callback filtering with std::get_if.
  // -------------------------------------------------------------------------
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Removes a subscription. Unknown ids are ignored. A publish already in
  // progress on another thread may still invoke the removed callback once.
  void unsubscribe(SubscriptionId id);

  // Delivers event to every subscriber registered when publish() begins.
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;    // Guards subscribers_ and next_id_
  SubscriptionId next_id_{1};   // 0 is never handed out
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(GenericCallback(
      [cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace swaprouter
