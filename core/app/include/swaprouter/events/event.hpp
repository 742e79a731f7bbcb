#pragma once

#include "event_types.hpp"

#include <variant>

namespace swaprouter {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by the router EventBus. Adding an event kind
// means adding it here; typed subscribers (EventBus::subscribe<T>) ignore
// every alternative but their own.
// -----------------------------------------------------------------------------
using Event = std::variant<OrderStatusEvent, JobEvent>;

}  // namespace swaprouter
