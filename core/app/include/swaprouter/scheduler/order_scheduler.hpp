#pragma once

#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/router_config.hpp"
#include "swaprouter/eventbus/event_bus.hpp"
#include "swaprouter/execution/execution_state_machine.hpp"
#include "swaprouter/scheduler/job_record.hpp"
#include "swaprouter/scheduler/rate_limiter.hpp"
#include "swaprouter/time/i_time_provider.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace swaprouter {

// -----------------------------------------------------------------------------
// OrderScheduler: admission queue, worker pool and retry timer
// -----------------------------------------------------------------------------
//
// @brief  Runs execution attempts for submitted orders under three limits:
//         a concurrency ceiling, a rolling-window admission ceiling, and
//         exponential backoff between attempts of the same order.
//
// @details
// Jobs move through:
//
//   submit() ──► ready_ ──(rate limiter)──► worker runs attempt
//                  ▲                              │
//                  │   backoff elapsed            │ RetryPending
//                  └──────── delayed_ ◄───────────┘
//                                                 │ Confirmed / Failed
//                                                 ▼
//                                      completed_ / failed_ (bounded)
//
// - Exactly `concurrency` worker threads exist, and each runs one attempt
//   at a time, so no more than `concurrency` attempts are ever in flight.
// - Every admission, first attempt or retry, is charged to the rate
//   limiter. Jobs over the ceiling wait in ready_; nothing is rejected.
// - A retry is due backoff_base * 2^(retry_count - 1) after the attempt
//   failed, then re-enters ready_ behind the jobs already there.
//
// Events: publishes JobEvent (Enqueued, Admitted, RetryScheduled,
// Completed, Failed) on the bus, always outside the scheduler lock.
//
// Thread model:
//   submit(), metrics(), jobRecord() and waitForIdle() are safe from any
//   thread. start() and stop() belong to the owner. All queue, counter and
//   limiter state is guarded by one mutex, so admission and completion
//   update it atomically.
//
// Ownership:
//   Owned by RouterEngine. Holds the attempt runner by value and borrows
//   the bus and clock.
// -----------------------------------------------------------------------------
class OrderScheduler {
 public:
  using AttemptRunner = std::function<AttemptOutcome(const domain::OrderId&)>;
  using Clock = RateLimiter::Clock;

  // @throws ValidationError for a zero concurrency or admission ceiling.
  OrderScheduler(domain::SchedulerConfig config, AttemptRunner runner,
                 EventBus& bus, const ITimeProvider& clock);

  ~OrderScheduler();

  OrderScheduler(const OrderScheduler&) = delete;
  OrderScheduler& operator=(const OrderScheduler&) = delete;
  OrderScheduler(OrderScheduler&&) = delete;
  OrderScheduler& operator=(OrderScheduler&&) = delete;

  // Spawns the worker pool. Idempotent.
  void start();

  // Lets running attempts finish, then joins the workers. Jobs still
  // queued or delayed are left where they are. Idempotent.
  void stop();

  // Enqueues the first attempt of an order. Jobs submitted before start()
  // wait for it. Returns false if a job with this id is still live.
  bool submit(const domain::OrderId& order_id);

  SchedulerMetrics metrics() const;

  // Live record first, then the retained finished ones.
  std::optional<JobRecord> jobRecord(const domain::OrderId& order_id) const;

  // Blocks until nothing is waiting, delayed or active, or timeout passes.
  // Returns true if the scheduler went idle.
  bool waitForIdle(std::chrono::milliseconds timeout) const;

  bool running() const;

 private:
  void workerLoop(std::size_t worker_index);

  // Moves delayed jobs whose backoff has elapsed into ready_.
  void promoteDueLocked(Clock::time_point now);

  // Records the outcome and returns the job event to publish.
  JobEvent finishAttemptLocked(const domain::OrderId& order_id,
                               const AttemptOutcome& outcome);

  void retainLocked(JobRecord record);
  bool idleLocked() const;
  void publish(JobEvent event);

  domain::SchedulerConfig config_;
  AttemptRunner runner_;
  EventBus& bus_;
  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  mutable std::condition_variable idle_cv_;

  RateLimiter limiter_;
  std::deque<domain::OrderId> ready_;
  std::multimap<Clock::time_point, domain::OrderId> delayed_;
  std::unordered_map<domain::OrderId, JobRecord> live_;
  std::deque<JobRecord> completed_;
  std::deque<JobRecord> failed_;
  std::size_t active_{0};
  bool running_{false};
  bool stopping_{false};

  std::vector<std::thread> workers_;
};

}  // namespace swaprouter
