#include "swaprouter/events/event_types.hpp"

namespace swaprouter {

const char* toString(JobEventKind kind) {
  switch (kind) {
    case JobEventKind::Enqueued:       return "enqueued";
    case JobEventKind::Admitted:       return "admitted";
    case JobEventKind::RetryScheduled: return "retry_scheduled";
    case JobEventKind::Completed:      return "completed";
    case JobEventKind::Failed:         return "failed";
  }
  return "unknown";
}

}  // namespace swaprouter
