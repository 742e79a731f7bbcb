#pragma once

#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/quote.hpp"
#include "swaprouter/domain/router_config.hpp"
#include "swaprouter/eventbus/event_bus.hpp"
#include "swaprouter/events/event_types.hpp"
#include "swaprouter/execution/i_settlement.hpp"
#include "swaprouter/store/i_order_store.hpp"
#include "swaprouter/venue/i_quote_source.hpp"

#include <chrono>
#include <future>
#include <string>

namespace swaprouter {

// How one execution attempt ended.
enum class AttemptResult {
  Confirmed,     // Settled; terminal
  RetryPending,  // Failed, order back in Pending; schedule another attempt
  Failed,        // Failed with retries exhausted; terminal
  Skipped,       // Nothing to do: unknown, terminal or already running
};

const char* toString(AttemptResult result);

struct AttemptOutcome {
  AttemptResult result{AttemptResult::Skipped};
  int retry_count{0};
  std::string error;
};

// -----------------------------------------------------------------------------
// ExecutionStateMachine
// -----------------------------------------------------------------------------
//
// @brief  Drives one order through one execution attempt:
//         Pending → Routing → Building → Submitted → Confirmed, or back to
//         Pending / on to Failed when something in the attempt fails.
//
// @details
// Phases of runAttempt(id):
//
//   Routing    Persist status. Ask both quote sources concurrently and wait
//              for both (each bounded by quote_timeout). Select a venue,
//              append a RoutingDecision, persist venue + both prices, then
//              publish the routing event with venue, prices and
//              justification.
//   Building   Persist status, publish, sleep build_duration.
//   Submitted  Persist status, publish, settle on the selected venue.
//   Confirmed  Persist executed price + settlement ref (clearing any
//              previous error), publish the confirmation.
//
// Any exception inside the attempt ends it. retry_count is incremented; at
// max_retries the order becomes Failed, otherwise it goes back to Pending
// with the error recorded and the scheduler decides when to try again.
// The next attempt fetches fresh quotes.
//
// Every publish happens after the matching store write, so a subscriber
// that reacts to an event by reading the store sees at least that state.
//
// Thread model:
//   runAttempt() is called concurrently from scheduler workers, never twice
//   at once for the same order. Only the quote fan-out spawns threads.
//
// Ownership:
//   Borrows every collaborator; RouterEngine owns them and outlives this.
// -----------------------------------------------------------------------------
class ExecutionStateMachine {
 public:
  // @throws ValidationError if the sources are not one Raydium and one
  //         Meteora adapter, or max_retries < 1.
  ExecutionStateMachine(IOrderStore& store, IQuoteSource& raydium,
                        IQuoteSource& meteora, ISettlement& settlement,
                        EventBus& bus,
                        domain::ExecutionConfig config, int max_retries);

  ExecutionStateMachine(const ExecutionStateMachine&) = delete;
  ExecutionStateMachine& operator=(const ExecutionStateMachine&) = delete;

  // Runs one attempt for the order. Never throws for attempt failures;
  // those come back as RetryPending or Failed.
  AttemptOutcome runAttempt(const domain::OrderId& order_id);

  int maxRetries() const { return max_retries_; }

 private:
  struct Routed {
    domain::Quote selected;
  };

  Routed route(const domain::Order& order);
  void build(const domain::Order& order);
  SettlementResult submit(const domain::Order& order, const Routed& routed);
  void confirm(const domain::Order& order, const SettlementResult& result);

  domain::Quote awaitQuote(
      std::future<domain::Quote>& pending, domain::VenueId venue,
      std::chrono::steady_clock::time_point deadline) const;

  // Persists patch, then publishes the resulting status with payload.
  // @throws std::logic_error on an illegal transition or a vanished order.
  domain::Order transition(const domain::OrderId& order_id,
                           const domain::OrderPatch& patch,
                           StatusPayload payload, bool publish = true);

  AttemptOutcome handleFailure(const domain::OrderId& order_id,
                               const std::string& error);

  IOrderStore& store_;
  IQuoteSource& raydium_;
  IQuoteSource& meteora_;
  ISettlement& settlement_;
  EventBus& bus_;
  domain::ExecutionConfig config_;
  int max_retries_;
};

}  // namespace swaprouter
