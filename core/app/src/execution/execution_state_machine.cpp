#include "swaprouter/execution/execution_state_machine.hpp"
#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/routing/venue_selector.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace swaprouter {

const char* toString(AttemptResult result) {
  switch (result) {
    case AttemptResult::Confirmed:    return "confirmed";
    case AttemptResult::RetryPending: return "retry_pending";
    case AttemptResult::Failed:       return "failed";
    case AttemptResult::Skipped:      return "skipped";
  }
  return "unknown";
}

ExecutionStateMachine::ExecutionStateMachine(
    IOrderStore& store, IQuoteSource& raydium, IQuoteSource& meteora,
    ISettlement& settlement, EventBus& bus,
    domain::ExecutionConfig config, int max_retries)
    : store_(store),
      raydium_(raydium),
      meteora_(meteora),
      settlement_(settlement),
      bus_(bus),
      config_(config),
      max_retries_(max_retries) {
  if (raydium_.venue() != domain::VenueId::Raydium ||
      meteora_.venue() != domain::VenueId::Meteora) {
    throw ValidationError(
        "execution needs one raydium and one meteora quote source");
  }
  if (max_retries_ < 1) {
    throw ValidationError("max_retries must be at least 1");
  }
}

// -----------------------------------------------------------------------------
// runAttempt(): one pass from Pending to a terminal or retry-pending state
// -----------------------------------------------------------------------------
AttemptOutcome ExecutionStateMachine::runAttempt(
    const domain::OrderId& order_id) {
  auto current = store_.get(order_id);
  if (!current) {
    std::cerr << "[ExecutionStateMachine] " << order_id
              << " unknown order, attempt skipped\n";
    return {AttemptResult::Skipped, 0, {}};
  }
  if (current->status != domain::OrderStatus::Pending) {
    // Terminal orders stay as they are; a non-pending live order already
    // has an attempt in progress.
    return {AttemptResult::Skipped, current->retry_count, {}};
  }

  try {
    Routed routed = route(*current);
    build(*current);
    SettlementResult result = submit(*current, routed);
    confirm(*current, result);
    return {AttemptResult::Confirmed, current->retry_count, {}};
  } catch (const VenueUnavailable& e) {
    return handleFailure(order_id, e.what());
  } catch (const SettlementFailure& e) {
    return handleFailure(order_id, e.what());
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionStateMachine] " << order_id
              << " unexpected fault: " << e.what() << "\n";
    return handleFailure(order_id, e.what());
  }
}

// -----------------------------------------------------------------------------
// route(): concurrent quotes, selection, routing log
// -----------------------------------------------------------------------------
ExecutionStateMachine::Routed ExecutionStateMachine::route(
    const domain::Order& order) {
  domain::OrderPatch start;
  start.status = domain::OrderStatus::Routing;
  transition(order.id, start, std::monostate{}, false);

  std::string asset_in = order.asset_in;
  std::string asset_out = order.asset_out;
  double amount = order.amount;

  // Both futures block in their destructors until the call returns, so the
  // captured sources stay valid even when one side fails early. The two
  // quotes share one deadline.
  const auto deadline =
      std::chrono::steady_clock::now() + config_.quote_timeout;
  auto raydium_pending = std::async(std::launch::async, [&, asset_in,
                                                         asset_out, amount] {
    return raydium_.quote(asset_in, asset_out, amount);
  });
  auto meteora_pending = std::async(std::launch::async, [&, asset_in,
                                                         asset_out, amount] {
    return meteora_.quote(asset_in, asset_out, amount);
  });

  domain::Quote raydium =
      awaitQuote(raydium_pending, domain::VenueId::Raydium, deadline);
  domain::Quote meteora =
      awaitQuote(meteora_pending, domain::VenueId::Meteora, deadline);

  VenueSelection selection = selectVenue(raydium, meteora);

  domain::RoutingDecision decision;
  decision.order_id = order.id;
  decision.raydium_quote = raydium;
  decision.meteora_quote = meteora;
  decision.selected_venue = selection.venue;
  decision.justification = selection.justification;
  store_.appendRoutingDecision(decision);

  domain::OrderPatch routed;
  routed.status = domain::OrderStatus::Routing;
  routed.selected_venue = selection.venue;
  routed.raydium_price = raydium.price;
  routed.meteora_price = meteora.price;

  RoutingPayload payload;
  payload.selected_venue = selection.venue;
  payload.raydium_price = raydium.price;
  payload.meteora_price = meteora.price;
  payload.justification = selection.justification;
  transition(order.id, routed, payload);

  std::cout << "[ExecutionStateMachine] " << order.id << " routing: "
            << domain::toString(selection.venue) << " ("
            << selection.justification << ")\n";

  return {selection.venue == domain::VenueId::Raydium ? raydium : meteora};
}

domain::Quote ExecutionStateMachine::awaitQuote(
    std::future<domain::Quote>& pending, domain::VenueId venue,
    std::chrono::steady_clock::time_point deadline) const {
  if (pending.wait_until(deadline) == std::future_status::timeout) {
    throw VenueUnavailable(std::string(domain::displayName(venue)) +
                           " quote timed out after " +
                           std::to_string(config_.quote_timeout.count()) +
                           "ms");
  }
  return pending.get();
}

// -----------------------------------------------------------------------------
// build(): simulated transaction construction
// -----------------------------------------------------------------------------
void ExecutionStateMachine::build(const domain::Order& order) {
  domain::OrderPatch patch;
  patch.status = domain::OrderStatus::Building;
  transition(order.id, patch, std::monostate{});

  if (config_.build_duration.count() > 0) {
    std::this_thread::sleep_for(config_.build_duration);
  }
}

// -----------------------------------------------------------------------------
// submit(): hand the swap to the selected venue's settlement
// -----------------------------------------------------------------------------
SettlementResult ExecutionStateMachine::submit(const domain::Order& order,
                                               const Routed& routed) {
  domain::OrderPatch patch;
  patch.status = domain::OrderStatus::Submitted;
  transition(order.id, patch, std::monostate{});

  SettlementRequest request;
  request.order_id = order.id;
  request.venue = routed.selected.venue;
  request.amount = order.amount;
  request.slippage = order.slippage;
  request.quoted_price = routed.selected.price;
  request.fee = routed.selected.fee;
  return settlement_.settle(request);
}

void ExecutionStateMachine::confirm(const domain::Order& order,
                                    const SettlementResult& result) {
  domain::OrderPatch patch;
  patch.status = domain::OrderStatus::Confirmed;
  patch.executed_price = result.executed_price;
  patch.settlement_ref = result.settlement_ref;
  patch.clear_error = true;

  ConfirmedPayload payload;
  payload.settlement_ref = result.settlement_ref;
  payload.executed_price = result.executed_price;
  payload.actual_output = result.actual_output;
  transition(order.id, patch, payload);

  std::cout << "[ExecutionStateMachine] " << order.id << " confirmed: ref="
            << result.settlement_ref << " price=" << result.executed_price
            << "\n";
}

// -----------------------------------------------------------------------------
// transition(): validate, persist, publish
// -----------------------------------------------------------------------------
domain::Order ExecutionStateMachine::transition(
    const domain::OrderId& order_id, const domain::OrderPatch& patch,
    StatusPayload payload, bool publish) {
  auto before = store_.get(order_id);
  if (!before) {
    throw std::logic_error("order " + order_id + " vanished from the store");
  }
  if (!domain::canTransition(before->status, patch.status)) {
    throw std::logic_error(std::string("illegal transition ") +
                           domain::toString(before->status) + " -> " +
                           domain::toString(patch.status));
  }

  auto after = store_.update(order_id, patch);
  if (!after) {
    throw std::logic_error("order " + order_id + " vanished from the store");
  }

  if (publish) {
    OrderStatusEvent event;
    event.order_id = order_id;
    event.status = after->status;
    event.timestamp_ms = after->updated_at_ms;
    event.payload = std::move(payload);
    bus_.publish(event);
  }
  return *after;
}

// -----------------------------------------------------------------------------
// handleFailure(): the retry-or-fail decision
// -----------------------------------------------------------------------------
AttemptOutcome ExecutionStateMachine::handleFailure(
    const domain::OrderId& order_id, const std::string& error) {
  auto current = store_.get(order_id);
  if (!current) {
    return {AttemptResult::Skipped, 0, error};
  }

  int retry_count = current->retry_count + 1;
  bool exhausted = retry_count >= max_retries_;

  domain::OrderPatch patch;
  patch.status =
      exhausted ? domain::OrderStatus::Failed : domain::OrderStatus::Pending;
  patch.last_error = error;
  patch.retry_count = retry_count;

  auto after = store_.update(order_id, patch);
  if (!after) {
    return {AttemptResult::Skipped, retry_count, error};
  }

  OrderStatusEvent event;
  event.order_id = order_id;
  event.status = after->status;
  event.timestamp_ms = after->updated_at_ms;
  if (exhausted) {
    event.payload = FailedPayload{error, retry_count};
  } else {
    event.payload = RetryPayload{error, retry_count};
  }
  bus_.publish(event);

  if (exhausted) {
    std::cerr << "[ExecutionStateMachine] " << order_id << " failed after "
              << retry_count << " attempts: " << error << "\n";
    return {AttemptResult::Failed, retry_count, error};
  }

  std::cerr << "[ExecutionStateMachine] " << order_id << " attempt "
            << retry_count << " failed, back to pending: " << error << "\n";
  return {AttemptResult::RetryPending, retry_count, error};
}

}  // namespace swaprouter
