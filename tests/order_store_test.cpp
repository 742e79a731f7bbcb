// =============================================================================
// order_store_test.cpp
// =============================================================================
// Unit tests for swaprouter::InMemoryOrderStore.
//
// Validates:
//   - create(): initial state, timestamps, duplicate ids rejected
//   - update(): patch semantics, updated_at bump, unknown ids
//   - list(): newest first, limit / offset paging
//   - routing log: append assigns id + created_at, read back newest first
// =============================================================================

#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/store/in_memory_order_store.hpp"
#include "swaprouter/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace domain = swaprouter::domain;

class OrderStoreTest : public ::testing::Test {
 protected:
  swaprouter::SimulationTimeProvider clock{1'700'000'000'000};
  swaprouter::InMemoryOrderStore store{clock};

  static domain::OrderRequest request(double amount = 1.5) {
    domain::OrderRequest r;
    r.asset_in = "SOL";
    r.asset_out = "USDC";
    r.amount = amount;
    r.slippage = 0.01;
    return r;
  }
};

TEST_F(OrderStoreTest, CreateStartsPendingWithNothingResolved) {
  auto order = store.create("o1", request());

  EXPECT_EQ(order.id, "o1");
  EXPECT_EQ(order.status, domain::OrderStatus::Pending);
  EXPECT_EQ(order.retry_count, 0);
  EXPECT_FALSE(order.selected_venue.has_value());
  EXPECT_FALSE(order.executed_price.has_value());
  EXPECT_FALSE(order.settlement_ref.has_value());
  EXPECT_FALSE(order.last_error.has_value());
  EXPECT_EQ(order.created_at_ms, 1'700'000'000'000);
  EXPECT_EQ(order.updated_at_ms, order.created_at_ms);

  auto stored = store.get("o1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->amount, 1.5);
}

TEST_F(OrderStoreTest, DuplicateIdIsRejected) {
  store.create("o1", request());
  EXPECT_THROW(store.create("o1", request()), swaprouter::ValidationError);
  EXPECT_EQ(store.count(), 1u);
}

TEST_F(OrderStoreTest, GetUnknownReturnsNullopt) {
  EXPECT_FALSE(store.get("missing").has_value());
}

TEST_F(OrderStoreTest, UpdateAppliesPatchAndBumpsUpdatedAt) {
  store.create("o1", request());
  clock.advance_by(250);

  domain::OrderPatch patch;
  patch.status = domain::OrderStatus::Routing;
  patch.selected_venue = domain::VenueId::Meteora;
  patch.raydium_price = 100.0;
  patch.meteora_price = 101.0;

  auto updated = store.update("o1", patch);
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->status, domain::OrderStatus::Routing);
  EXPECT_EQ(updated->selected_venue, domain::VenueId::Meteora);
  EXPECT_EQ(updated->quotedPrice(domain::VenueId::Meteora), 101.0);
  EXPECT_EQ(updated->updated_at_ms, updated->created_at_ms + 250);

  // Unset optionals leave stored values alone.
  domain::OrderPatch next;
  next.status = domain::OrderStatus::Building;
  updated = store.update("o1", next);
  ASSERT_TRUE(updated.has_value());
  EXPECT_EQ(updated->selected_venue, domain::VenueId::Meteora);
}

TEST_F(OrderStoreTest, ClearErrorDropsLastError) {
  store.create("o1", request());

  domain::OrderPatch failed;
  failed.status = domain::OrderStatus::Pending;
  failed.last_error = "Raydium quote service unavailable";
  failed.retry_count = 1;
  store.update("o1", failed);
  EXPECT_EQ(store.get("o1")->last_error, "Raydium quote service unavailable");

  domain::OrderPatch confirmed;
  confirmed.status = domain::OrderStatus::Confirmed;
  confirmed.clear_error = true;
  store.update("o1", confirmed);
  EXPECT_FALSE(store.get("o1")->last_error.has_value());
  EXPECT_EQ(store.get("o1")->retry_count, 1);
}

TEST_F(OrderStoreTest, UpdateUnknownReturnsNullopt) {
  domain::OrderPatch patch;
  EXPECT_FALSE(store.update("missing", patch).has_value());
}

// -----------------------------------------------------------------------------
// Listing is newest first by creation time; same-millisecond orders fall
// back to insertion order, later first.
// -----------------------------------------------------------------------------
TEST_F(OrderStoreTest, ListIsNewestFirstWithPaging) {
  store.create("a", request());
  clock.advance_by(10);
  store.create("b", request());
  store.create("c", request());  // Same ms as b
  clock.advance_by(10);
  store.create("d", request());

  auto all = store.list(100, 0);
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].id, "d");
  EXPECT_EQ(all[1].id, "c");
  EXPECT_EQ(all[2].id, "b");
  EXPECT_EQ(all[3].id, "a");

  auto page = store.list(2, 1);
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].id, "c");
  EXPECT_EQ(page[1].id, "b");

  EXPECT_TRUE(store.list(10, 4).empty());
  EXPECT_TRUE(store.list(0, 0).empty());
}

TEST_F(OrderStoreTest, RoutingLogIsAppendOnlyNewestFirst) {
  store.create("o1", request());

  domain::RoutingDecision first;
  first.order_id = "o1";
  first.selected_venue = domain::VenueId::Raydium;
  first.justification = "first";
  auto stored_first = store.appendRoutingDecision(first);

  clock.advance_by(5);
  domain::RoutingDecision second = first;
  second.selected_venue = domain::VenueId::Meteora;
  second.justification = "second";
  auto stored_second = store.appendRoutingDecision(second);

  EXPECT_NE(stored_first.id, stored_second.id);
  EXPECT_EQ(stored_second.created_at_ms, stored_first.created_at_ms + 5);

  auto history = store.routingDecisions("o1");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].justification, "second");
  EXPECT_EQ(history[1].justification, "first");
  EXPECT_TRUE(store.routingDecisions("other").empty());
}

TEST_F(OrderStoreTest, ConcurrentWritesToDistinctOrders) {
  constexpr int kOrders = 64;
  for (int i = 0; i < kOrders; ++i) {
    store.create("o" + std::to_string(i), request());
  }

  std::vector<std::thread> writers;
  for (int i = 0; i < kOrders; ++i) {
    writers.emplace_back([this, i] {
      domain::OrderPatch patch;
      patch.status = domain::OrderStatus::Routing;
      patch.raydium_price = static_cast<double>(i);
      store.update("o" + std::to_string(i), patch);
    });
  }
  for (auto& w : writers) w.join();

  for (int i = 0; i < kOrders; ++i) {
    auto order = store.get("o" + std::to_string(i));
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->raydium_price, static_cast<double>(i));
  }
}
