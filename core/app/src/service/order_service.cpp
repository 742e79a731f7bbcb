#include "swaprouter/service/order_service.hpp"
#include "swaprouter/errors/router_error.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace swaprouter {

OrderService::OrderService(IOrderStore& store, OrderScheduler& scheduler,
                           StatusBroadcaster& broadcaster,
                           OrderIdGenerator& ids, const ITimeProvider& clock,
                           domain::ExecutionConfig config)
    : store_(store),
      scheduler_(scheduler),
      broadcaster_(broadcaster),
      ids_(ids),
      clock_(clock),
      config_(config) {}

// -----------------------------------------------------------------------------
// validate(): reject before anything is stored
// -----------------------------------------------------------------------------
domain::OrderRequest OrderService::validate(const SubmitRequest& request,
                                            double default_slippage) {
  if (request.asset_in.empty()) {
    throw ValidationError("asset_in is required");
  }
  if (request.asset_out.empty()) {
    throw ValidationError("asset_out is required");
  }
  if (request.asset_in == request.asset_out) {
    throw ValidationError("asset_in and asset_out must differ");
  }
  if (!request.amount) {
    throw ValidationError("amount is required");
  }
  if (!std::isfinite(*request.amount) || *request.amount <= 0.0) {
    throw ValidationError("amount must be a positive number");
  }

  double slippage = request.slippage.value_or(default_slippage);
  if (!std::isfinite(slippage) || slippage <= 0.0 || slippage > 1.0) {
    throw ValidationError("slippage must be in (0, 1]");
  }

  domain::OrderKind kind = domain::OrderKind::Market;
  if (request.kind) {
    auto parsed = domain::parseOrderKind(*request.kind);
    if (!parsed) {
      throw ValidationError("unknown order kind: " + *request.kind);
    }
    if (*parsed != domain::OrderKind::Market) {
      throw ValidationError("only market orders are supported, got " +
                            *request.kind);
    }
    kind = *parsed;
  }

  domain::OrderRequest valid;
  valid.asset_in = request.asset_in;
  valid.asset_out = request.asset_out;
  valid.amount = *request.amount;
  valid.slippage = slippage;
  valid.kind = kind;
  return valid;
}

// -----------------------------------------------------------------------------
// submit(): validate, store, optionally attach, schedule
// -----------------------------------------------------------------------------
SubmitReceipt OrderService::submit(
    const SubmitRequest& request, std::shared_ptr<ISubscriberChannel> channel) {
  domain::OrderRequest valid = validate(request, config_.default_slippage);

  domain::Order order = store_.create(ids_.next_id(), valid);

  SubmitReceipt receipt;
  receipt.order_id = order.id;
  receipt.status = order.status;
  receipt.status_topic = order.id;

  if (channel) {
    auto subscription = broadcaster_.attach(order.id, std::move(channel));
    receipt.subscription = subscription;
    broadcaster_.deliverSnapshot(order.id, subscription, [&] {
      return std::optional<OrderStatusEvent>(snapshotOf(order));
    });
  }

  if (!scheduler_.submit(order.id)) {
    // Never left pending with no job behind it.
    const std::string error = "order " + order.id + " could not be scheduled";
    domain::OrderPatch failed;
    failed.status = domain::OrderStatus::Failed;
    failed.last_error = error;
    auto stored = store_.update(order.id, failed);
    if (stored && receipt.subscription) {
      broadcaster_.deliverSnapshot(order.id, *receipt.subscription, [&] {
        return std::optional<OrderStatusEvent>(snapshotOf(*stored));
      });
    }
    std::cerr << "[OrderService] " << order.id << " failed: " << error << "\n";
    throw RouterError(error);
  }

  std::cout << "[OrderService] " << order.id << " accepted: " << order.amount
            << " " << order.asset_in << " -> " << order.asset_out
            << " slippage=" << order.slippage << "\n";
  return receipt;
}

// -----------------------------------------------------------------------------
// subscribe(): attach, then resynchronize with the current status
// -----------------------------------------------------------------------------
SubscribeResult OrderService::subscribe(
    const domain::OrderId& order_id,
    std::shared_ptr<ISubscriberChannel> channel) {
  if (!store_.get(order_id)) {
    throw NotFound("order not found: " + order_id);
  }

  SubscribeResult result;
  result.subscription = broadcaster_.attach(order_id, std::move(channel));
  broadcaster_.deliverSnapshot(
      order_id, result.subscription, [&]() -> std::optional<OrderStatusEvent> {
        auto order = store_.get(order_id);
        if (!order) {
          return std::nullopt;
        }
        result.snapshot = snapshotOf(*order);
        return result.snapshot;
      });
  return result;
}

bool OrderService::unsubscribe(
    const domain::OrderId& order_id,
    std::optional<StatusBroadcaster::SubscriptionId> subscription) {
  if (subscription) {
    return broadcaster_.detach(order_id, *subscription);
  }
  return broadcaster_.detachAll(order_id);
}

domain::Order OrderService::getOrder(const domain::OrderId& order_id) const {
  auto order = store_.get(order_id);
  if (!order) {
    throw NotFound("order not found: " + order_id);
  }
  return *order;
}

std::vector<domain::Order> OrderService::listOrders(std::size_t limit,
                                                    std::size_t offset) const {
  return store_.list(limit, offset);
}

std::vector<domain::RoutingDecision> OrderService::routingHistory(
    const domain::OrderId& order_id) const {
  if (!store_.get(order_id)) {
    throw NotFound("order not found: " + order_id);
  }
  return store_.routingDecisions(order_id);
}

SchedulerMetrics OrderService::metrics() const { return scheduler_.metrics(); }

HealthReport OrderService::health() const {
  HealthReport report;
  report.status = "healthy";
  report.timestamp_ms = clock_.now_ms();
  report.queue = scheduler_.metrics();
  return report;
}

// -----------------------------------------------------------------------------
// snapshotOf(): the payload a subscriber would have seen last
// -----------------------------------------------------------------------------
OrderStatusEvent OrderService::snapshotOf(const domain::Order& order) const {
  OrderStatusEvent event;
  event.order_id = order.id;
  event.status = order.status;
  event.timestamp_ms = order.updated_at_ms;
  event.snapshot = true;

  using domain::OrderStatus;
  switch (order.status) {
    case OrderStatus::Confirmed: {
      ConfirmedPayload payload;
      payload.settlement_ref = order.settlement_ref.value_or("");
      payload.executed_price = order.executed_price.value_or(0.0);
      auto history = store_.routingDecisions(order.id);
      if (!history.empty()) {
        const auto& latest = history.front();
        double fee = latest.selected_venue == domain::VenueId::Raydium
                         ? latest.raydium_quote.fee
                         : latest.meteora_quote.fee;
        payload.actual_output =
            order.amount * payload.executed_price * (1.0 - fee);
      }
      event.payload = payload;
      break;
    }
    case OrderStatus::Failed:
      event.payload =
          FailedPayload{order.last_error.value_or(""), order.retry_count};
      break;
    case OrderStatus::Pending:
      if (order.last_error) {
        event.payload = RetryPayload{*order.last_error, order.retry_count};
      }
      break;
    case OrderStatus::Routing:
    case OrderStatus::Building:
    case OrderStatus::Submitted:
      if (order.selected_venue) {
        auto history = store_.routingDecisions(order.id);
        RoutingPayload payload;
        payload.selected_venue = *order.selected_venue;
        payload.raydium_price = order.raydium_price.value_or(0.0);
        payload.meteora_price = order.meteora_price.value_or(0.0);
        if (!history.empty()) {
          payload.justification = history.front().justification;
        }
        event.payload = payload;
      }
      break;
  }
  return event;
}

}  // namespace swaprouter
