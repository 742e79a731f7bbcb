#pragma once

#include <chrono>
#include <cstddef>
#include <deque>

namespace swaprouter {

// -----------------------------------------------------------------------------
// RateLimiter: rolling-window admission ceiling
// -----------------------------------------------------------------------------
// Responsibility: Allows at most max_per_window acquisitions in any window of
// the configured length. Keeps the time of every acquisition still inside
// the window (a sliding log), so the ceiling holds for every window, not
// just aligned buckets.
//
// Time is passed in by the caller: the scheduler reads the monotonic clock
// once per decision, and tests drive the limiter with synthetic points.
//
// Thread model: not synchronized. OrderScheduler calls it under its mutex.
// -----------------------------------------------------------------------------
class RateLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  RateLimiter(std::size_t max_per_window, Clock::duration window);

  // Records an acquisition at now and returns true if the ceiling allows
  // it; returns false and records nothing otherwise.
  bool tryAcquire(Clock::time_point now);

  // Earliest point at which tryAcquire() would succeed. Returns now when a
  // slot is free already.
  Clock::time_point nextAvailable(Clock::time_point now) const;

  // Acquisitions still inside the window ending at now.
  std::size_t inWindow(Clock::time_point now) const;

  std::size_t maxPerWindow() const { return max_per_window_; }
  Clock::duration window() const { return window_; }

 private:
  void evictExpired(Clock::time_point now);

  std::size_t max_per_window_;
  Clock::duration window_;
  std::deque<Clock::time_point> admissions_;  // Oldest first
};

}  // namespace swaprouter
