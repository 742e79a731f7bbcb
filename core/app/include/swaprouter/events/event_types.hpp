#pragma once

#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/order_status.hpp"
#include "swaprouter/domain/venue.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace swaprouter {

// -----------------------------------------------------------------------------
// Status payloads
// -----------------------------------------------------------------------------
// Each lifecycle transition carries the data a client needs at that point.
// Transitions without data (Building, Submitted, the initial Pending) carry
// std::monostate.
// -----------------------------------------------------------------------------

// Routing finished: where the order goes and why.
struct RoutingPayload {
  domain::VenueId selected_venue{domain::VenueId::Raydium};
  double raydium_price{0.0};
  double meteora_price{0.0};
  std::string justification;
};

// Settlement succeeded.
struct ConfirmedPayload {
  std::string settlement_ref;
  double executed_price{0.0};
  double actual_output{0.0};
};

// Retries exhausted. retry_count is the count that exhausted them.
struct FailedPayload {
  std::string error;
  int retry_count{0};
};

// An attempt failed and the order went back to Pending for another try.
struct RetryPayload {
  std::string error;
  int retry_count{0};
};

using StatusPayload = std::variant<std::monostate, RoutingPayload,
                                   ConfirmedPayload, FailedPayload,
                                   RetryPayload>;

// -----------------------------------------------------------------------------
// OrderStatusEvent
// -----------------------------------------------------------------------------
//
// @brief  One lifecycle transition of one order, as delivered to the
//         order's subscriber.
//
// @details
// Published on the router EventBus by the ExecutionStateMachine on the
// worker thread running the attempt, after the transition is persisted.
// For a single order, events are published in transition order; there is
// no ordering across orders.
//
// snapshot is true only for the resynchronisation event a subscriber gets
// when it attaches: it describes the order's current state, not a
// transition.
// -----------------------------------------------------------------------------
struct OrderStatusEvent {
  domain::OrderId order_id;
  domain::OrderStatus status{domain::OrderStatus::Pending};
  std::int64_t timestamp_ms{0};
  StatusPayload payload;
  bool snapshot{false};
};

// -----------------------------------------------------------------------------
// JobEvent
// -----------------------------------------------------------------------------
// Scheduler bookkeeping, published for logging and monitoring. attempt is
// 1-based; delay_ms is only meaningful for RetryScheduled.
// -----------------------------------------------------------------------------
enum class JobEventKind {
  Enqueued,
  Admitted,
  RetryScheduled,
  Completed,
  Failed,
};

const char* toString(JobEventKind kind);

struct JobEvent {
  domain::OrderId order_id;
  JobEventKind kind{JobEventKind::Enqueued};
  int attempt{0};
  std::int64_t delay_ms{0};
  std::string detail;
  std::int64_t timestamp_ms{0};
};

}  // namespace swaprouter
