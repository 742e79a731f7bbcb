#pragma once

#include "swaprouter/domain/order.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// JobState / JobRecord
// -----------------------------------------------------------------------------
// Scheduler-side view of one order's execution job. The job id is the order
// id and stays the same across retries.
//
//   Waiting    queued for admission (first attempt or a retry whose
//              backoff has elapsed)
//   Delayed    waiting out a retry backoff
//   Active     an attempt is running on a worker
//   Completed  attempt confirmed the order
//   Failed     retries exhausted, or the attempt runner itself faulted
//
// Completed and Failed records are kept in bounded FIFO lists and pruned
// oldest-first.
// -----------------------------------------------------------------------------
enum class JobState {
  Waiting,
  Delayed,
  Active,
  Completed,
  Failed,
};

const char* toString(JobState state);

struct JobRecord {
  domain::OrderId order_id;
  JobState state{JobState::Waiting};
  int attempts{0};
  std::optional<std::string> last_error;
  std::int64_t enqueued_at_ms{0};
  std::optional<std::int64_t> finished_at_ms;
};

// Point-in-time job counts, as exposed by the metrics and health queries.
struct SchedulerMetrics {
  std::size_t waiting{0};
  std::size_t delayed{0};
  std::size_t active{0};
  std::size_t completed{0};
  std::size_t failed{0};
};

}  // namespace swaprouter
