#pragma once

#include "swaprouter/broadcast/i_subscriber_channel.hpp"
#include "swaprouter/broadcast/status_broadcaster.hpp"
#include "swaprouter/concurrent/order_id_generator.hpp"
#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/router_config.hpp"
#include "swaprouter/domain/routing_decision.hpp"
#include "swaprouter/events/event_types.hpp"
#include "swaprouter/scheduler/job_record.hpp"
#include "swaprouter/scheduler/order_scheduler.hpp"
#include "swaprouter/store/i_order_store.hpp"
#include "swaprouter/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swaprouter {

// Raw client submission. Fields are optional so that "missing" and
// "invalid" can be told apart in the error message.
struct SubmitRequest {
  std::string asset_in;
  std::string asset_out;
  std::optional<double> amount;
  std::optional<double> slippage;
  std::optional<std::string> kind;
};

struct SubmitReceipt {
  domain::OrderId order_id;
  domain::OrderStatus status{domain::OrderStatus::Pending};
  std::string status_topic;
  std::optional<StatusBroadcaster::SubscriptionId> subscription;
};

struct SubscribeResult {
  StatusBroadcaster::SubscriptionId subscription{0};
  OrderStatusEvent snapshot;
};

struct HealthReport {
  std::string status{"healthy"};
  std::int64_t timestamp_ms{0};
  SchedulerMetrics queue;
};

// -----------------------------------------------------------------------------
// OrderService: the transport-agnostic front door
// -----------------------------------------------------------------------------
//
// @brief  Submission, subscription and query operations. A transport (the
//         ZeroMQ IpcServer, or a test) calls these and maps the results and
//         exceptions onto its own wire format.
//
// @details
// submit():
//   1. Validate (ValidationError on any problem; nothing is stored).
//   2. Create the order, status Pending, under a fresh id.
//   3. If a channel came with the submission, attach it and send it the
//      Pending snapshot.
//   4. Hand the id to the scheduler.
// The receipt is returned as soon as the job is queued; execution happens
// on scheduler workers.
//
// subscribe():
//   Attach (replacing any current subscriber), then send a snapshot of the
//   order's current status. Missed transitions are not replayed.
//
// Errors:
//   ValidationError  bad submission
//   NotFound         unknown order id on subscribe or any single-order query
//
// Thread model:
//   Stateless apart from borrowed collaborators; every method is safe from
//   any thread.
// -----------------------------------------------------------------------------
class OrderService {
 public:
  static constexpr std::size_t kDefaultListLimit = 100;

  OrderService(IOrderStore& store, OrderScheduler& scheduler,
               StatusBroadcaster& broadcaster, OrderIdGenerator& ids,
               const ITimeProvider& clock, domain::ExecutionConfig config);

  SubmitReceipt submit(const SubmitRequest& request,
                       std::shared_ptr<ISubscriberChannel> channel = nullptr);

  SubscribeResult subscribe(const domain::OrderId& order_id,
                            std::shared_ptr<ISubscriberChannel> channel);

  // Without a subscription id, removes whatever is attached.
  bool unsubscribe(const domain::OrderId& order_id,
                   std::optional<StatusBroadcaster::SubscriptionId>
                       subscription = std::nullopt);

  domain::Order getOrder(const domain::OrderId& order_id) const;

  std::vector<domain::Order> listOrders(std::size_t limit = kDefaultListLimit,
                                        std::size_t offset = 0) const;

  std::vector<domain::RoutingDecision> routingHistory(
      const domain::OrderId& order_id) const;

  SchedulerMetrics metrics() const;
  HealthReport health() const;

  // Current-status event for a subscriber that attaches late. The payload
  // mirrors what the last transition carried.
  OrderStatusEvent snapshotOf(const domain::Order& order) const;

  // Checks a submission and fills in defaults.
  // @throws ValidationError
  static domain::OrderRequest validate(const SubmitRequest& request,
                                       double default_slippage);

 private:
  IOrderStore& store_;
  OrderScheduler& scheduler_;
  StatusBroadcaster& broadcaster_;
  OrderIdGenerator& ids_;
  const ITimeProvider& clock_;
  domain::ExecutionConfig config_;
};

}  // namespace swaprouter
