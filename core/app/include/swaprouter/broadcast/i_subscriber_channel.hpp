#pragma once

#include "swaprouter/events/event_types.hpp"

namespace swaprouter {

// -----------------------------------------------------------------------------
// ISubscriberChannel: one client's status stream for one order
// -----------------------------------------------------------------------------
// The transport-facing half of a subscription. The broadcaster only ever
// asks two things of it: is the client still there, and deliver this event.
//
// send() may be called from any scheduler worker thread; the broadcaster
// serializes calls per subscription, so an implementation need not. A
// channel that has gone away reports isOpen() == false or throws from
// send(); either way the broadcaster detaches it.
//
// Implementations:
//   - IpcServer's topic channel (publishes on the ZeroMQ PUB socket).
//   - RecordingChannel in tests.
// -----------------------------------------------------------------------------
class ISubscriberChannel {
 public:
  virtual ~ISubscriberChannel() = default;

  virtual bool isOpen() const = 0;
  virtual void send(const OrderStatusEvent& event) = 0;
};

}  // namespace swaprouter
