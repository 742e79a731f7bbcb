// =============================================================================
// order_service_test.cpp
// =============================================================================
// End-to-end tests for swaprouter::OrderService, run through a RouterEngine
// wired with fake venues, a scripted settlement and no IPC endpoints.
//
// Validates:
//   - Invalid submissions are rejected before anything is stored
//   - A SOL -> USDC order streams pending (snapshot), routing, building,
//     submitted, confirmed to its subscriber, in that order
//   - Late subscribers get one snapshot of the current state
//   - Retries surface as pending events and end in failed once exhausted
//   - Lookups of unknown orders raise NotFound
//   - Listing is newest first
//   - An order the scheduler refuses is marked failed, not left pending
// =============================================================================

#include "swaprouter/broadcast/status_broadcaster.hpp"
#include "swaprouter/concurrent/order_id_generator.hpp"
#include "swaprouter/engine/router_engine.hpp"
#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/eventbus/event_bus.hpp"
#include "swaprouter/scheduler/order_scheduler.hpp"
#include "swaprouter/service/order_service.hpp"
#include "swaprouter/store/in_memory_order_store.hpp"
#include "swaprouter/time/live_time_provider.hpp"

#include "fakes/fake_quote_source.hpp"
#include "fakes/recording_channel.hpp"
#include "fakes/scripted_settlement.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <regex>
#include <string>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
namespace domain = swaprouter::domain;

class OrderServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    domain::RouterConfig config;
    config.scheduler.concurrency = 2;
    config.scheduler.backoff_base = 5ms;
    config.scheduler.max_retries = 3;
    config.execution.build_duration = 0ms;
    config.execution.quote_timeout = 500ms;
    config.ipc.command_endpoint.clear();
    config.ipc.status_endpoint.clear();

    auto r = std::make_unique<swaprouter::fakes::FakeQuoteSource>(
        domain::VenueId::Raydium, 100.0, 0.003, 5'000'000.0);
    auto m = std::make_unique<swaprouter::fakes::FakeQuoteSource>(
        domain::VenueId::Meteora, 99.0, 0.002, 3'000'000.0);
    auto s = std::make_unique<swaprouter::fakes::ScriptedSettlement>();
    raydium = r.get();
    meteora = m.get();
    settlement = s.get();

    engine = std::make_unique<swaprouter::RouterEngine>(
        config, clock, std::move(r), std::move(m), std::move(s));
    engine->start();
  }

  void TearDown() override { engine->stop(); }

  swaprouter::OrderService& service() { return engine->orders(); }

  static swaprouter::SubmitRequest solToUsdc(double amount = 1.5) {
    swaprouter::SubmitRequest request;
    request.asset_in = "SOL";
    request.asset_out = "USDC";
    request.amount = amount;
    return request;
  }

  swaprouter::LiveTimeProvider clock;
  swaprouter::fakes::FakeQuoteSource* raydium{nullptr};
  swaprouter::fakes::FakeQuoteSource* meteora{nullptr};
  swaprouter::fakes::ScriptedSettlement* settlement{nullptr};
  std::unique_ptr<swaprouter::RouterEngine> engine;
};

// -----------------------------------------------------------------------------
// 1. Validation
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTest, RejectsInvalidSubmissions) {
  auto expectRejected = [this](swaprouter::SubmitRequest request,
                               const std::string& message) {
    try {
      service().submit(request);
      ADD_FAILURE() << "accepted: " << message;
    } catch (const swaprouter::ValidationError& e) {
      EXPECT_EQ(std::string(e.what()), message);
    }
  };

  auto r = solToUsdc();
  r.asset_in.clear();
  expectRejected(r, "asset_in is required");

  r = solToUsdc();
  r.asset_out.clear();
  expectRejected(r, "asset_out is required");

  r = solToUsdc();
  r.asset_out = "SOL";
  expectRejected(r, "asset_in and asset_out must differ");

  r = solToUsdc();
  r.amount.reset();
  expectRejected(r, "amount is required");

  expectRejected(solToUsdc(0.0), "amount must be a positive number");
  expectRejected(solToUsdc(-2.0), "amount must be a positive number");

  r = solToUsdc();
  r.slippage = 0.0;
  expectRejected(r, "slippage must be in (0, 1]");
  r.slippage = 1.5;
  expectRejected(r, "slippage must be in (0, 1]");

  r = solToUsdc();
  r.kind = "limit";
  expectRejected(r, "only market orders are supported, got limit");
  r.kind = "iceberg";
  expectRejected(r, "unknown order kind: iceberg");

  EXPECT_TRUE(service().listOrders().empty());
}

TEST_F(OrderServiceTest, ValidateFillsDefaults) {
  auto valid = swaprouter::OrderService::validate(solToUsdc(), 0.01);
  EXPECT_DOUBLE_EQ(valid.slippage, 0.01);
  EXPECT_EQ(valid.kind, domain::OrderKind::Market);

  auto request = solToUsdc();
  request.slippage = 0.05;
  request.kind = "market";
  valid = swaprouter::OrderService::validate(request, 0.01);
  EXPECT_DOUBLE_EQ(valid.slippage, 0.05);
  EXPECT_DOUBLE_EQ(valid.amount, 1.5);
}

// -----------------------------------------------------------------------------
// 2. The full stream for one order
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTest, SolToUsdcStreamsFullLifecycle) {
  auto channel = std::make_shared<swaprouter::fakes::RecordingChannel>();
  auto receipt = service().submit(solToUsdc(), channel);

  EXPECT_EQ(receipt.status, domain::OrderStatus::Pending);
  EXPECT_EQ(receipt.status_topic, receipt.order_id);
  EXPECT_TRUE(receipt.subscription.has_value());
  EXPECT_TRUE(std::regex_match(
      receipt.order_id,
      std::regex("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-"
                 "[0-9a-f]{12}")));

  ASSERT_TRUE(channel->waitForTerminal());

  auto events = channel->events();
  using S = domain::OrderStatus;
  EXPECT_EQ(channel->statuses(),
            (std::vector<S>{S::Pending, S::Routing, S::Building, S::Submitted,
                            S::Confirmed}));
  EXPECT_TRUE(events.front().snapshot);
  for (std::size_t i = 1; i < events.size(); ++i) {
    EXPECT_FALSE(events[i].snapshot);
    EXPECT_EQ(events[i].order_id, receipt.order_id);
    EXPECT_GE(events[i].timestamp_ms, events[i - 1].timestamp_ms);
  }

  const auto* routed =
      std::get_if<swaprouter::RoutingPayload>(&events[1].payload);
  ASSERT_NE(routed, nullptr);
  EXPECT_EQ(routed->selected_venue, domain::VenueId::Raydium);

  const auto* confirmed =
      std::get_if<swaprouter::ConfirmedPayload>(&events.back().payload);
  ASSERT_NE(confirmed, nullptr);
  EXPECT_EQ(confirmed->settlement_ref, "REF-1");
  EXPECT_DOUBLE_EQ(confirmed->actual_output, 1.5 * 100.0 * (1.0 - 0.003));

  auto order = service().getOrder(receipt.order_id);
  EXPECT_EQ(order.status, S::Confirmed);
  EXPECT_DOUBLE_EQ(order.slippage, 0.01);
  EXPECT_EQ(order.selected_venue, domain::VenueId::Raydium);

  auto history = service().routingHistory(receipt.order_id);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].selected_venue, domain::VenueId::Raydium);

  // The stream ends with the terminal event.
  EXPECT_FALSE(service().unsubscribe(receipt.order_id));
}

// -----------------------------------------------------------------------------
// 3. Late subscription
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTest, LateSubscriberGetsOneSnapshot) {
  auto receipt = service().submit(solToUsdc());
  EXPECT_FALSE(receipt.subscription.has_value());
  ASSERT_TRUE(engine->waitForIdle(5s));

  auto channel = std::make_shared<swaprouter::fakes::RecordingChannel>();
  auto result = service().subscribe(receipt.order_id, channel);

  EXPECT_TRUE(result.snapshot.snapshot);
  EXPECT_EQ(result.snapshot.status, domain::OrderStatus::Confirmed);
  const auto* confirmed =
      std::get_if<swaprouter::ConfirmedPayload>(&result.snapshot.payload);
  ASSERT_NE(confirmed, nullptr);
  EXPECT_EQ(confirmed->settlement_ref, "REF-1");
  EXPECT_DOUBLE_EQ(confirmed->actual_output, 1.5 * 100.0 * (1.0 - 0.003));

  auto events = channel->events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_TRUE(events[0].snapshot);
  EXPECT_FALSE(service().unsubscribe(receipt.order_id));
}

TEST_F(OrderServiceTest, ResubscribeReplacesEarlierChannel) {
  raydium->setDelay(100ms);
  meteora->setDelay(100ms);

  auto first = std::make_shared<swaprouter::fakes::RecordingChannel>();
  auto receipt = service().submit(solToUsdc(), first);

  auto second = std::make_shared<swaprouter::fakes::RecordingChannel>();
  auto result = service().subscribe(receipt.order_id, second);
  EXPECT_NE(result.subscription, *receipt.subscription);

  ASSERT_TRUE(second->waitForTerminal());
  EXPECT_TRUE(second->events().front().snapshot);
  EXPECT_FALSE(first->statuses().empty());
  EXPECT_NE(first->statuses().back(), domain::OrderStatus::Confirmed);
}

// -----------------------------------------------------------------------------
// 4. Retries and exhaustion
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTest, RetryThenConfirm) {
  meteora->failNext("Meteora quote service unavailable");

  auto channel = std::make_shared<swaprouter::fakes::RecordingChannel>();
  auto receipt = service().submit(solToUsdc(), channel);
  ASSERT_TRUE(channel->waitForTerminal());

  using S = domain::OrderStatus;
  EXPECT_EQ(channel->statuses(),
            (std::vector<S>{S::Pending, S::Pending, S::Routing, S::Building,
                            S::Submitted, S::Confirmed}));
  auto events = channel->events();
  const auto* retry = std::get_if<swaprouter::RetryPayload>(&events[1].payload);
  ASSERT_NE(retry, nullptr);
  EXPECT_EQ(retry->retry_count, 1);
  EXPECT_EQ(retry->error, "Meteora quote service unavailable");

  auto order = service().getOrder(receipt.order_id);
  EXPECT_EQ(order.retry_count, 1);
  EXPECT_FALSE(order.last_error.has_value());
}

TEST_F(OrderServiceTest, ExhaustedRetriesEndFailed) {
  const std::string error =
      "Raydium network timeout - transaction failed to confirm";
  settlement->failNext(error, 3);

  auto channel = std::make_shared<swaprouter::fakes::RecordingChannel>();
  auto receipt = service().submit(solToUsdc(), channel);
  ASSERT_TRUE(channel->waitForTerminal());

  auto events = channel->events();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().status, domain::OrderStatus::Failed);
  const auto* failed =
      std::get_if<swaprouter::FailedPayload>(&events.back().payload);
  ASSERT_NE(failed, nullptr);
  EXPECT_EQ(failed->retry_count, 3);
  EXPECT_EQ(failed->error, error);

  int retries = 0;
  for (const auto& e : events) {
    if (std::holds_alternative<swaprouter::RetryPayload>(e.payload)) ++retries;
  }
  EXPECT_EQ(retries, 2);

  auto order = service().getOrder(receipt.order_id);
  EXPECT_EQ(order.status, domain::OrderStatus::Failed);
  EXPECT_EQ(order.retry_count, 3);
  EXPECT_EQ(order.last_error, error);
  EXPECT_EQ(service().routingHistory(receipt.order_id).size(), 3u);

  ASSERT_TRUE(engine->waitForIdle(2s));
  EXPECT_EQ(service().metrics().failed, 1u);
}

// -----------------------------------------------------------------------------
// 5. Lookups
// -----------------------------------------------------------------------------
TEST_F(OrderServiceTest, UnknownOrderIsNotFound) {
  auto channel = std::make_shared<swaprouter::fakes::RecordingChannel>();
  EXPECT_THROW(service().getOrder("nope"), swaprouter::NotFound);
  EXPECT_THROW(service().routingHistory("nope"), swaprouter::NotFound);
  EXPECT_THROW(service().subscribe("nope", channel), swaprouter::NotFound);
  EXPECT_TRUE(channel->events().empty());
}

TEST_F(OrderServiceTest, ListOrdersNewestFirst) {
  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.push_back(service().submit(solToUsdc(1.0 + i)).order_id);
  }
  ASSERT_TRUE(engine->waitForIdle(5s));

  auto orders = service().listOrders();
  ASSERT_EQ(orders.size(), 3u);
  EXPECT_EQ(orders[0].id, ids[2]);
  EXPECT_EQ(orders[1].id, ids[1]);
  EXPECT_EQ(orders[2].id, ids[0]);

  auto page = service().listOrders(1, 1);
  ASSERT_EQ(page.size(), 1u);
  EXPECT_EQ(page[0].id, ids[1]);
}

TEST_F(OrderServiceTest, HealthReportsQueue) {
  auto report = service().health();
  EXPECT_EQ(report.status, "healthy");
  EXPECT_GT(report.timestamp_ms, 0);
  EXPECT_EQ(report.queue.active, 0u);
}

// -----------------------------------------------------------------------------
// 6. Scheduling refused
// -----------------------------------------------------------------------------
// Why: the order is stored before the scheduler sees it. If the scheduler
// refuses the job, the record must end failed rather than sit pending.
TEST(OrderServiceSchedulingTest, RefusedJobLeavesOrderFailed) {
  swaprouter::LiveTimeProvider clock;
  swaprouter::EventBus bus;
  swaprouter::InMemoryOrderStore store(clock);
  swaprouter::StatusBroadcaster broadcaster(bus);
  swaprouter::OrderIdGenerator ids(42);
  swaprouter::OrderScheduler scheduler(
      domain::SchedulerConfig{},
      [](const domain::OrderId&) { return swaprouter::AttemptOutcome{}; },
      bus, clock);
  swaprouter::OrderService service(store, scheduler, broadcaster, ids, clock,
                                   domain::ExecutionConfig{});

  // Same seed, same first id: occupy it in the scheduler up front.
  swaprouter::OrderIdGenerator twin(42);
  const std::string id = twin.next_id();
  ASSERT_TRUE(scheduler.submit(id));

  auto channel = std::make_shared<swaprouter::fakes::RecordingChannel>();
  swaprouter::SubmitRequest request;
  request.asset_in = "SOL";
  request.asset_out = "USDC";
  request.amount = 1.0;
  EXPECT_THROW(service.submit(request, channel), swaprouter::RouterError);

  auto order = service.getOrder(id);
  EXPECT_EQ(order.status, domain::OrderStatus::Failed);
  ASSERT_TRUE(order.last_error.has_value());
  EXPECT_EQ(*order.last_error, "order " + id + " could not be scheduled");

  EXPECT_EQ(channel->statuses(),
            (std::vector<domain::OrderStatus>{domain::OrderStatus::Pending,
                                              domain::OrderStatus::Failed}));
  EXPECT_FALSE(broadcaster.hasSubscriber(id));
}
