#pragma once

#include "swaprouter/domain/order.hpp"
#include "swaprouter/domain/quote.hpp"
#include "swaprouter/domain/routing_decision.hpp"
#include "swaprouter/events/event_types.hpp"
#include "swaprouter/scheduler/job_record.hpp"
#include "swaprouter/service/order_service.hpp"

#include <nlohmann/json.hpp>

namespace swaprouter {

// -----------------------------------------------------------------------------
// JSON codec
// -----------------------------------------------------------------------------
// Wire shapes for everything the IPC layer sends or receives. Field names
// are snake_case. Nullable order fields are written as JSON null, never
// omitted, so clients can rely on the key set. Timestamps are ISO-8601 UTC
// strings with millisecond precision.
//
// Status events:
//   {"order_id", "status", "timestamp", "snapshot", ...payload fields}
//   routing   → selected_venue, raydium_price, meteora_price, justification
//   confirmed → settlement_ref, executed_price, actual_output
//   failed    → error, retry_count
//   pending after a failed attempt → error, retry_count, "retrying": true
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::Quote& quote);
nlohmann::json toJson(const domain::RoutingDecision& decision);
nlohmann::json toJson(const OrderStatusEvent& event);
nlohmann::json toJson(const JobEvent& event);
nlohmann::json toJson(const JobRecord& record);
nlohmann::json toJson(const SchedulerMetrics& metrics);
nlohmann::json toJson(const SubmitReceipt& receipt);
nlohmann::json toJson(const HealthReport& report);

// Reads {asset_in, asset_out, amount, slippage?, kind?}. Only checks JSON
// types; value checks belong to OrderService::validate().
// @throws ValidationError if j is not an object or a field has the wrong
//         type.
SubmitRequest parseSubmitRequest(const nlohmann::json& j);

}  // namespace swaprouter
