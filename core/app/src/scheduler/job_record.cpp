#include "swaprouter/scheduler/job_record.hpp"

namespace swaprouter {

const char* toString(JobState state) {
  switch (state) {
    case JobState::Waiting:   return "waiting";
    case JobState::Delayed:   return "delayed";
    case JobState::Active:    return "active";
    case JobState::Completed: return "completed";
    case JobState::Failed:    return "failed";
  }
  return "unknown";
}

}  // namespace swaprouter
