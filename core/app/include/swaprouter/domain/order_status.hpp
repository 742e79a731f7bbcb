#pragma once

#include <optional>
#include <string_view>

namespace swaprouter {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: swap order lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Every state a swap order can occupy between submission and its
//         terminal outcome.
//
// @details
// One execution attempt walks the happy path left to right. Any failure
// inside an attempt sends the order back to Pending (retry scheduled) or on
// to Failed (retries exhausted):
//
//   Pending ──> Routing ──> Building ──> Submitted ──> Confirmed
//      ▲           │            │             │
//      └───────────┴────────────┴─────────────┘   (retryable failure)
//      │           │            │             │
//      └───────────┴────────────┴─────────────┴──> Failed
//
// Terminal states: Confirmed, Failed. A terminal order is never mutated
// again; repeated scheduling of a terminal order is a no-op.
//
// Thread model:
//   Plain enum, value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,    // Accepted and waiting for (or between) execution attempts
  Routing,    // Fetching quotes and selecting a venue
  Building,   // Constructing the settlement transaction
  Submitted,  // Handed to the selected venue for settlement
  Confirmed,  // Settled; terminal success
  Failed,     // Retries exhausted; terminal failure
};

// -----------------------------------------------------------------------------
// isTerminal(status)
// -----------------------------------------------------------------------------
// @return true for Confirmed and Failed.
// -----------------------------------------------------------------------------
bool isTerminal(OrderStatus status);

// -----------------------------------------------------------------------------
// canTransition(current, next)
// -----------------------------------------------------------------------------
// @brief  Validates one edge of the lifecycle graph above.
//
// @details
// Re-persisting the same non-terminal status (e.g. Routing → Routing when
// the venue selection is written after the status) is allowed. Terminal
// states accept nothing, including themselves.
// -----------------------------------------------------------------------------
bool canTransition(OrderStatus current, OrderStatus next);

// Wire names: "pending", "routing", "building", "submitted", "confirmed",
// "failed".
const char* toString(OrderStatus status);
std::optional<OrderStatus> parseOrderStatus(std::string_view text);

}  // namespace domain
}  // namespace swaprouter
