// =============================================================================
// order_scheduler_test.cpp
// =============================================================================
// Unit tests for swaprouter::OrderScheduler with a stub attempt runner.
//
// Validates:
//   - Jobs run to completion and leave a retained record
//   - No more than `concurrency` attempts run at once
//   - The admission ceiling makes excess jobs wait, never rejects them
//   - RetryPending re-enters after backoff_base * 2^(n-1)
//   - Finished records are pruned to the retention limits
//   - A live order cannot be scheduled twice
//
// Timings are scaled down (tens of milliseconds); every wait is bounded.
// =============================================================================

#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/eventbus/event_bus.hpp"
#include "swaprouter/scheduler/order_scheduler.hpp"
#include "swaprouter/time/live_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
namespace domain = swaprouter::domain;

class OrderSchedulerTest : public ::testing::Test {
 protected:
  using Clock = std::chrono::steady_clock;

  void SetUp() override {
    config.concurrency = 4;
    config.max_admissions_per_window = 1000;
    config.rate_window = 1000ms;
    config.max_retries = 3;
    config.backoff_base = 20ms;

    bus.subscribe<swaprouter::JobEvent>([this](const swaprouter::JobEvent& e) {
      std::lock_guard lock(mutex);
      job_events.push_back(e);
    });
  }

  void TearDown() override {
    if (scheduler) scheduler->stop();
  }

  void makeScheduler(swaprouter::OrderScheduler::AttemptRunner runner) {
    scheduler = std::make_unique<swaprouter::OrderScheduler>(
        config, std::move(runner), bus, clock);
  }

  static swaprouter::AttemptOutcome confirmed() {
    return {swaprouter::AttemptResult::Confirmed, 0, {}};
  }

  std::vector<swaprouter::JobEvent> jobEvents(const std::string& id) {
    std::lock_guard lock(mutex);
    std::vector<swaprouter::JobEvent> out;
    for (const auto& e : job_events) {
      if (e.order_id == id) out.push_back(e);
    }
    return out;
  }

  domain::SchedulerConfig config;
  swaprouter::EventBus bus;
  swaprouter::LiveTimeProvider clock;

  std::mutex mutex;
  std::vector<swaprouter::JobEvent> job_events;

  // Declared last so workers are joined before anything they touch goes.
  std::unique_ptr<swaprouter::OrderScheduler> scheduler;
};

// -----------------------------------------------------------------------------
// 1. Basic lifecycle
// -----------------------------------------------------------------------------
TEST_F(OrderSchedulerTest, RunsJobToCompletion) {
  std::atomic<int> runs{0};
  makeScheduler([&](const domain::OrderId&) {
    ++runs;
    return confirmed();
  });
  scheduler->start();

  ASSERT_TRUE(scheduler->submit("o1"));
  ASSERT_TRUE(scheduler->waitForIdle(2s));

  EXPECT_EQ(runs.load(), 1);
  auto metrics = scheduler->metrics();
  EXPECT_EQ(metrics.completed, 1u);
  EXPECT_EQ(metrics.waiting + metrics.delayed + metrics.active, 0u);

  auto record = scheduler->jobRecord("o1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, swaprouter::JobState::Completed);
  EXPECT_EQ(record->attempts, 1);
  EXPECT_TRUE(record->finished_at_ms.has_value());

  // Enqueued is published after the job is visible to workers, so it may
  // land anywhere relative to the others.
  auto events = jobEvents("o1");
  ASSERT_EQ(events.size(), 3u);
  auto count = [&events](swaprouter::JobEventKind kind) {
    return std::count_if(
        events.begin(), events.end(),
        [kind](const swaprouter::JobEvent& e) { return e.kind == kind; });
  };
  EXPECT_EQ(count(swaprouter::JobEventKind::Enqueued), 1);
  EXPECT_EQ(count(swaprouter::JobEventKind::Admitted), 1);
  EXPECT_EQ(count(swaprouter::JobEventKind::Completed), 1);
}

TEST_F(OrderSchedulerTest, SubmitBeforeStartWaitsForWorkers) {
  std::atomic<int> runs{0};
  makeScheduler([&](const domain::OrderId&) {
    ++runs;
    return confirmed();
  });

  ASSERT_TRUE(scheduler->submit("o1"));
  EXPECT_EQ(scheduler->metrics().waiting, 1u);
  EXPECT_FALSE(scheduler->running());

  scheduler->start();
  ASSERT_TRUE(scheduler->waitForIdle(2s));
  EXPECT_EQ(runs.load(), 1);
}

TEST_F(OrderSchedulerTest, StartAndStopAreIdempotent) {
  makeScheduler([](const domain::OrderId&) { return confirmed(); });
  scheduler->start();
  scheduler->start();
  EXPECT_TRUE(scheduler->running());
  scheduler->stop();
  scheduler->stop();
  EXPECT_FALSE(scheduler->running());
}

// -----------------------------------------------------------------------------
// 2. Concurrency ceiling
// -----------------------------------------------------------------------------
TEST_F(OrderSchedulerTest, NeverExceedsConcurrency) {
  config.concurrency = 2;
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  std::atomic<int> runs{0};

  makeScheduler([&](const domain::OrderId&) {
    int now = ++in_flight;
    int seen = peak.load();
    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(20ms);
    --in_flight;
    ++runs;
    return confirmed();
  });
  scheduler->start();

  for (int i = 0; i < 8; ++i) {
    ASSERT_TRUE(scheduler->submit("o" + std::to_string(i)));
  }
  ASSERT_TRUE(scheduler->waitForIdle(5s));

  EXPECT_EQ(runs.load(), 8);
  EXPECT_LE(peak.load(), 2);
  EXPECT_GE(peak.load(), 1);
}

// -----------------------------------------------------------------------------
// 3. Admission ceiling
// -----------------------------------------------------------------------------
// Why: with 2 admissions per 200ms, the third job must wait for the first
// admission to leave the window instead of being turned away.
// -----------------------------------------------------------------------------
TEST_F(OrderSchedulerTest, AdmissionCeilingDelaysExcessJobs) {
  config.max_admissions_per_window = 2;
  config.rate_window = 200ms;

  std::mutex times_mutex;
  std::vector<Clock::time_point> admitted_at;
  makeScheduler([&](const domain::OrderId&) {
    std::lock_guard lock(times_mutex);
    admitted_at.push_back(Clock::now());
    return confirmed();
  });

  auto begin = Clock::now();
  scheduler->start();
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(scheduler->submit("o" + std::to_string(i)));
  }
  ASSERT_TRUE(scheduler->waitForIdle(3s));

  std::lock_guard lock(times_mutex);
  ASSERT_EQ(admitted_at.size(), 4u);
  std::sort(admitted_at.begin(), admitted_at.end());
  EXPECT_LT(admitted_at[1] - begin, 150ms);
  EXPECT_GE(admitted_at[2] - admitted_at[0], 190ms);
  EXPECT_EQ(scheduler->metrics().completed, 4u);
}

// -----------------------------------------------------------------------------
// 4. Retry with exponential backoff
// -----------------------------------------------------------------------------
TEST_F(OrderSchedulerTest, RetryPendingReentersAfterBackoff) {
  std::mutex times_mutex;
  std::vector<Clock::time_point> attempts_at;
  makeScheduler([&](const domain::OrderId&) {
    std::lock_guard lock(times_mutex);
    attempts_at.push_back(Clock::now());
    int n = static_cast<int>(attempts_at.size());
    if (n < 3) {
      return swaprouter::AttemptOutcome{
          swaprouter::AttemptResult::RetryPending, n, "venue down"};
    }
    return swaprouter::AttemptOutcome{swaprouter::AttemptResult::Confirmed, 2,
                                      {}};
  });
  scheduler->start();

  ASSERT_TRUE(scheduler->submit("o1"));
  ASSERT_TRUE(scheduler->waitForIdle(3s));

  {
    std::lock_guard lock(times_mutex);
    ASSERT_EQ(attempts_at.size(), 3u);
    EXPECT_GE(attempts_at[1] - attempts_at[0], 20ms);
    EXPECT_GE(attempts_at[2] - attempts_at[1], 40ms);
  }

  std::vector<std::int64_t> delays;
  for (const auto& e : jobEvents("o1")) {
    if (e.kind == swaprouter::JobEventKind::RetryScheduled) {
      delays.push_back(e.delay_ms);
      EXPECT_EQ(e.detail, "venue down");
    }
  }
  EXPECT_EQ(delays, (std::vector<std::int64_t>{20, 40}));

  auto record = scheduler->jobRecord("o1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, swaprouter::JobState::Completed);
  EXPECT_EQ(record->attempts, 3);
  EXPECT_EQ(record->last_error, "venue down");
}

TEST_F(OrderSchedulerTest, DelayedJobIsVisibleInMetrics) {
  config.backoff_base = 300ms;
  std::atomic<int> runs{0};
  makeScheduler([&](const domain::OrderId&) {
    if (++runs == 1) {
      return swaprouter::AttemptOutcome{
          swaprouter::AttemptResult::RetryPending, 1, "busy"};
    }
    return confirmed();
  });
  scheduler->start();
  ASSERT_TRUE(scheduler->submit("o1"));

  auto deadline = Clock::now() + 2s;
  while (scheduler->metrics().delayed == 0 && Clock::now() < deadline) {
    std::this_thread::sleep_for(2ms);
  }
  EXPECT_EQ(scheduler->metrics().delayed, 1u);
  EXPECT_EQ(scheduler->jobRecord("o1")->state, swaprouter::JobState::Delayed);

  ASSERT_TRUE(scheduler->waitForIdle(3s));
  EXPECT_EQ(runs.load(), 2);
}

// -----------------------------------------------------------------------------
// 5. Terminal outcomes and retention
// -----------------------------------------------------------------------------
TEST_F(OrderSchedulerTest, FailedOutcomeIsRetainedAsFailed) {
  makeScheduler([](const domain::OrderId&) {
    return swaprouter::AttemptOutcome{swaprouter::AttemptResult::Failed, 3,
                                      "exhausted"};
  });
  scheduler->start();
  ASSERT_TRUE(scheduler->submit("o1"));
  ASSERT_TRUE(scheduler->waitForIdle(2s));

  auto record = scheduler->jobRecord("o1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, swaprouter::JobState::Failed);
  EXPECT_EQ(record->last_error, "exhausted");
  EXPECT_EQ(scheduler->metrics().failed, 1u);
}

TEST_F(OrderSchedulerTest, ThrowingRunnerFailsTheJob) {
  makeScheduler([](const domain::OrderId&) -> swaprouter::AttemptOutcome {
    throw std::runtime_error("runner exploded");
  });
  scheduler->start();
  ASSERT_TRUE(scheduler->submit("o1"));
  ASSERT_TRUE(scheduler->waitForIdle(2s));

  auto record = scheduler->jobRecord("o1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->state, swaprouter::JobState::Failed);
  EXPECT_EQ(record->last_error, "runner exploded");
}

TEST_F(OrderSchedulerTest, SkippedAttemptLeavesNoRecord) {
  makeScheduler([](const domain::OrderId&) {
    return swaprouter::AttemptOutcome{swaprouter::AttemptResult::Skipped, 0,
                                      {}};
  });
  scheduler->start();
  ASSERT_TRUE(scheduler->submit("o1"));
  ASSERT_TRUE(scheduler->waitForIdle(2s));

  EXPECT_FALSE(scheduler->jobRecord("o1").has_value());
  EXPECT_EQ(scheduler->metrics().completed, 0u);
}

TEST_F(OrderSchedulerTest, RetentionPrunesOldestRecords) {
  config.concurrency = 1;
  config.retain_completed = 2;
  makeScheduler([](const domain::OrderId&) { return confirmed(); });
  scheduler->start();

  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(scheduler->submit("o" + std::to_string(i)));
  }
  ASSERT_TRUE(scheduler->waitForIdle(2s));

  EXPECT_EQ(scheduler->metrics().completed, 2u);
  EXPECT_FALSE(scheduler->jobRecord("o0").has_value());
  EXPECT_FALSE(scheduler->jobRecord("o1").has_value());
  EXPECT_TRUE(scheduler->jobRecord("o2").has_value());
  EXPECT_TRUE(scheduler->jobRecord("o3").has_value());
}

// -----------------------------------------------------------------------------
// 6. Duplicate submission
// -----------------------------------------------------------------------------
TEST_F(OrderSchedulerTest, LiveOrderCannotBeSubmittedTwice) {
  std::promise<void> release;
  std::shared_future<void> gate = release.get_future().share();
  std::atomic<int> runs{0};

  makeScheduler([&, gate](const domain::OrderId&) {
    ++runs;
    gate.wait();
    return confirmed();
  });
  scheduler->start();

  ASSERT_TRUE(scheduler->submit("o1"));
  EXPECT_FALSE(scheduler->submit("o1"));

  release.set_value();
  ASSERT_TRUE(scheduler->waitForIdle(2s));
  EXPECT_EQ(runs.load(), 1);

  // Once finished the id is free again; the runner decides what that means.
  EXPECT_TRUE(scheduler->submit("o1"));
  ASSERT_TRUE(scheduler->waitForIdle(2s));
  EXPECT_EQ(runs.load(), 2);
}

// -----------------------------------------------------------------------------
// 7. Construction
// -----------------------------------------------------------------------------
TEST_F(OrderSchedulerTest, RejectsInvalidConfig) {
  auto runner = [](const domain::OrderId&) { return confirmed(); };

  config.concurrency = 0;
  EXPECT_THROW(makeScheduler(runner), swaprouter::ValidationError);

  config.concurrency = 1;
  config.max_admissions_per_window = 0;
  EXPECT_THROW(makeScheduler(runner), swaprouter::ValidationError);

  config.max_admissions_per_window = 1;
  EXPECT_THROW(makeScheduler(nullptr), swaprouter::ValidationError);
}
