#pragma once

#include <stdexcept>
#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exceptions raised by the router. All derive from RouterError so a
//         transport boundary can catch the family in one place.
//
// @details
//   ValidationError    malformed submission or configuration. Raised
//                      synchronously; the order never enters execution.
//   NotFound           unknown order id on query or subscribe.
//   VenueUnavailable   a quote source timed out or errored. Retryable.
//   SettlementFailure  settlement declined by the venue. Retryable.
//
// VenueUnavailable and SettlementFailure never leave the execution state
// machine: it converts them into the retry-or-fail decision. Running out of
// retries is an order outcome (status Failed), not an exception.
//
// kind() returns the stable wire name used in IPC error replies.
// -----------------------------------------------------------------------------
class RouterError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
  virtual const char* kind() const noexcept { return "internal"; }
};

class ValidationError : public RouterError {
 public:
  using RouterError::RouterError;
  const char* kind() const noexcept override { return "validation"; }
};

class NotFound : public RouterError {
 public:
  using RouterError::RouterError;
  const char* kind() const noexcept override { return "not_found"; }
};

class VenueUnavailable : public RouterError {
 public:
  using RouterError::RouterError;
  const char* kind() const noexcept override { return "venue_unavailable"; }
};

class SettlementFailure : public RouterError {
 public:
  using RouterError::RouterError;
  const char* kind() const noexcept override { return "settlement_failure"; }
};

}  // namespace swaprouter
