#include "swaprouter/scheduler/order_scheduler.hpp"
#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/scheduler/backoff_policy.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace swaprouter {

OrderScheduler::OrderScheduler(domain::SchedulerConfig config,
                               AttemptRunner runner, EventBus& bus,
                               const ITimeProvider& clock)
    : config_(config),
      runner_(std::move(runner)),
      bus_(bus),
      clock_(clock),
      limiter_(config.max_admissions_per_window, config.rate_window) {
  if (config_.concurrency == 0) {
    throw ValidationError("scheduler concurrency must be at least 1");
  }
  if (config_.max_admissions_per_window == 0) {
    throw ValidationError("scheduler admission ceiling must be at least 1");
  }
  if (!runner_) {
    throw ValidationError("scheduler needs an attempt runner");
  }
}

OrderScheduler::~OrderScheduler() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the worker pool
// -----------------------------------------------------------------------------
void OrderScheduler::start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
    stopping_ = false;
  }

  workers_.reserve(config_.concurrency);
  for (std::size_t i = 0; i < config_.concurrency; ++i) {
    workers_.emplace_back([this, i] { workerLoop(i); });
  }

  std::cout << "[OrderScheduler] started. concurrency=" << config_.concurrency
            << " rate=" << config_.max_admissions_per_window << "/"
            << config_.rate_window.count() << "ms max_retries="
            << config_.max_retries << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, wake and join
// -----------------------------------------------------------------------------
void OrderScheduler::stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      return;
    }
    stopping_ = true;
  }
  work_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();

  std::size_t left = 0;
  {
    std::lock_guard lock(mutex_);
    running_ = false;
    left = ready_.size() + delayed_.size();
  }
  std::cout << "[OrderScheduler] stopped. " << left
            << " job(s) left queued.\n";
}

bool OrderScheduler::running() const {
  std::lock_guard lock(mutex_);
  return running_ && !stopping_;
}

// -----------------------------------------------------------------------------
// submit(): enqueue first attempt
// -----------------------------------------------------------------------------
bool OrderScheduler::submit(const domain::OrderId& order_id) {
  JobEvent event;
  {
    std::lock_guard lock(mutex_);
    if (live_.count(order_id) != 0) {
      std::cerr << "[OrderScheduler] " << order_id
                << " already scheduled, duplicate submit ignored\n";
      return false;
    }

    JobRecord record;
    record.order_id = order_id;
    record.state = JobState::Waiting;
    record.enqueued_at_ms = clock_.now_ms();
    live_.emplace(order_id, record);
    ready_.push_back(order_id);

    event.order_id = order_id;
    event.kind = JobEventKind::Enqueued;
    event.attempt = 1;
    event.timestamp_ms = record.enqueued_at_ms;
  }
  work_cv_.notify_one();
  publish(std::move(event));
  return true;
}

// -----------------------------------------------------------------------------
// workerLoop(): admit, run, record, repeat
// -----------------------------------------------------------------------------
// A worker that finds nothing admissible sleeps until the earliest of: the
// next delayed job falling due, the rate window freeing a slot, or a
// notification (new submission, new delayed job, stop).
// -----------------------------------------------------------------------------
void OrderScheduler::workerLoop(std::size_t worker_index) {
  std::unique_lock lock(mutex_);

  while (!stopping_) {
    Clock::time_point now = Clock::now();
    promoteDueLocked(now);

    Clock::time_point wake = Clock::time_point::max();

    if (!ready_.empty()) {
      if (limiter_.tryAcquire(now)) {
        domain::OrderId order_id = ready_.front();
        ready_.pop_front();

        JobRecord& record = live_[order_id];
        record.state = JobState::Active;
        ++record.attempts;
        ++active_;

        JobEvent admitted;
        admitted.order_id = order_id;
        admitted.kind = JobEventKind::Admitted;
        admitted.attempt = record.attempts;
        admitted.timestamp_ms = clock_.now_ms();

        lock.unlock();
        publish(std::move(admitted));

        AttemptOutcome outcome;
        try {
          outcome = runner_(order_id);
        } catch (const std::exception& e) {
          std::cerr << "[OrderScheduler] worker " << worker_index
                    << " attempt runner threw for " << order_id << ": "
                    << e.what() << "\n";
          outcome.result = AttemptResult::Failed;
          outcome.error = e.what();
        }

        lock.lock();
        JobEvent finished = finishAttemptLocked(order_id, outcome);
        lock.unlock();
        publish(std::move(finished));

        // Active until its job event is out, so waitForIdle() callers see it.
        lock.lock();
        --active_;
        if (idleLocked()) {
          idle_cv_.notify_all();
        }
        continue;
      }
      wake = limiter_.nextAvailable(now);
    }

    if (!delayed_.empty()) {
      wake = std::min(wake, delayed_.begin()->first);
    }

    if (wake == Clock::time_point::max()) {
      work_cv_.wait(lock);
    } else {
      work_cv_.wait_until(lock, wake);
    }
  }
}

void OrderScheduler::promoteDueLocked(Clock::time_point now) {
  while (!delayed_.empty() && delayed_.begin()->first <= now) {
    domain::OrderId order_id = delayed_.begin()->second;
    delayed_.erase(delayed_.begin());

    auto it = live_.find(order_id);
    if (it != live_.end()) {
      it->second.state = JobState::Waiting;
      ready_.push_back(order_id);
    }
  }
}

// -----------------------------------------------------------------------------
// finishAttemptLocked(): retry, retain or drop
// -----------------------------------------------------------------------------
JobEvent OrderScheduler::finishAttemptLocked(const domain::OrderId& order_id,
                                             const AttemptOutcome& outcome) {
  JobEvent event;
  event.order_id = order_id;
  event.timestamp_ms = clock_.now_ms();

  auto it = live_.find(order_id);
  if (it == live_.end()) {
    event.kind = JobEventKind::Failed;
    event.detail = "job record lost";
    return event;
  }
  JobRecord& record = it->second;
  event.attempt = record.attempts;
  if (!outcome.error.empty()) {
    record.last_error = outcome.error;
  }

  switch (outcome.result) {
    case AttemptResult::RetryPending: {
      auto delay = backoffDelay(config_.backoff_base, outcome.retry_count);
      record.state = JobState::Delayed;
      delayed_.emplace(Clock::now() + delay, order_id);
      work_cv_.notify_all();

      event.kind = JobEventKind::RetryScheduled;
      event.delay_ms = delay.count();
      event.detail = outcome.error;
      std::cout << "[OrderScheduler] " << order_id << " retry "
                << outcome.retry_count << " in " << delay.count() << "ms\n";
      return event;
    }

    case AttemptResult::Confirmed:
      record.state = JobState::Completed;
      event.kind = JobEventKind::Completed;
      break;

    case AttemptResult::Failed:
      record.state = JobState::Failed;
      event.kind = JobEventKind::Failed;
      event.detail = outcome.error;
      break;

    case AttemptResult::Skipped:
      // Nothing ran; the order is unknown or already terminal.
      event.kind = JobEventKind::Completed;
      event.detail = "skipped";
      live_.erase(it);
      return event;
  }

  record.finished_at_ms = event.timestamp_ms;
  JobRecord finished = std::move(record);
  live_.erase(it);
  retainLocked(std::move(finished));
  return event;
}

void OrderScheduler::retainLocked(JobRecord record) {
  bool failed = record.state == JobState::Failed;
  auto& list = failed ? failed_ : completed_;
  std::size_t limit = failed ? config_.retain_failed : config_.retain_completed;

  list.push_back(std::move(record));
  std::size_t pruned = 0;
  while (list.size() > limit) {
    list.pop_front();
    ++pruned;
  }
  if (pruned > 0) {
    std::cout << "[OrderScheduler] pruned " << pruned << " "
              << (failed ? "failed" : "completed") << " job record(s)\n";
  }
}

bool OrderScheduler::idleLocked() const {
  return ready_.empty() && delayed_.empty() && active_ == 0;
}

void OrderScheduler::publish(JobEvent event) { bus_.publish(event); }

// -----------------------------------------------------------------------------
// Observability
// -----------------------------------------------------------------------------
SchedulerMetrics OrderScheduler::metrics() const {
  std::lock_guard lock(mutex_);
  SchedulerMetrics m;
  m.waiting = ready_.size();
  m.delayed = delayed_.size();
  m.active = active_;
  m.completed = completed_.size();
  m.failed = failed_.size();
  return m;
}

std::optional<JobRecord> OrderScheduler::jobRecord(
    const domain::OrderId& order_id) const {
  std::lock_guard lock(mutex_);
  if (auto it = live_.find(order_id); it != live_.end()) {
    return it->second;
  }
  auto match = [&](const JobRecord& r) { return r.order_id == order_id; };
  if (auto it = std::find_if(completed_.rbegin(), completed_.rend(), match);
      it != completed_.rend()) {
    return *it;
  }
  if (auto it = std::find_if(failed_.rbegin(), failed_.rend(), match);
      it != failed_.rend()) {
    return *it;
  }
  return std::nullopt;
}

bool OrderScheduler::waitForIdle(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return idleLocked(); });
}

}  // namespace swaprouter
