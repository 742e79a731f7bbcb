#include "swaprouter/scheduler/rate_limiter.hpp"

namespace swaprouter {

RateLimiter::RateLimiter(std::size_t max_per_window, Clock::duration window)
    : max_per_window_(max_per_window), window_(window) {}

bool RateLimiter::tryAcquire(Clock::time_point now) {
  evictExpired(now);
  if (admissions_.size() >= max_per_window_) {
    return false;
  }
  admissions_.push_back(now);
  return true;
}

// -----------------------------------------------------------------------------
// nextAvailable(): when the oldest admission that blocks us leaves the window
// -----------------------------------------------------------------------------
// With k admissions inside the window and a ceiling of m, k - m + 1 of them
// must expire first; the last of those is admissions_[k - m].
// -----------------------------------------------------------------------------
RateLimiter::Clock::time_point RateLimiter::nextAvailable(
    Clock::time_point now) const {
  if (max_per_window_ == 0) {
    return Clock::time_point::max();
  }
  std::size_t live = inWindow(now);
  if (live < max_per_window_) {
    return now;
  }
  std::size_t first_live = admissions_.size() - live;
  std::size_t blocking = first_live + (live - max_per_window_);
  return admissions_[blocking] + window_;
}

std::size_t RateLimiter::inWindow(Clock::time_point now) const {
  std::size_t expired = 0;
  for (const auto& at : admissions_) {
    if (at + window_ > now) {
      break;
    }
    ++expired;
  }
  return admissions_.size() - expired;
}

void RateLimiter::evictExpired(Clock::time_point now) {
  while (!admissions_.empty() && admissions_.front() + window_ <= now) {
    admissions_.pop_front();
  }
}

}  // namespace swaprouter
