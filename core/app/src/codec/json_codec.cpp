#include "swaprouter/codec/json_codec.hpp"
#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/time/time_utils.hpp"

#include <string>

namespace swaprouter {

namespace {

template <typename T>
nlohmann::json nullable(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return nlohmann::json(*value);
}

nlohmann::json nullable(const std::optional<domain::VenueId>& venue) {
  if (!venue) {
    return nullptr;
  }
  return domain::toString(*venue);
}

// Adds the payload's fields to an event object.
struct PayloadWriter {
  nlohmann::json& j;

  void operator()(const std::monostate&) const {}

  void operator()(const RoutingPayload& p) const {
    j["selected_venue"] = domain::toString(p.selected_venue);
    j["raydium_price"] = p.raydium_price;
    j["meteora_price"] = p.meteora_price;
    j["justification"] = p.justification;
  }

  void operator()(const ConfirmedPayload& p) const {
    j["settlement_ref"] = p.settlement_ref;
    j["executed_price"] = p.executed_price;
    j["actual_output"] = p.actual_output;
  }

  void operator()(const FailedPayload& p) const {
    j["error"] = p.error;
    j["retry_count"] = p.retry_count;
  }

  void operator()(const RetryPayload& p) const {
    j["error"] = p.error;
    j["retry_count"] = p.retry_count;
    j["retrying"] = true;
  }
};

std::string readString(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw ValidationError(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::optional<double> readNumber(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_number()) {
    throw ValidationError(std::string(key) + " must be a number");
  }
  return it->get<double>();
}

}  // namespace

nlohmann::json toJson(const domain::Order& order) {
  nlohmann::json j;
  j["id"] = order.id;
  j["asset_in"] = order.asset_in;
  j["asset_out"] = order.asset_out;
  j["amount"] = order.amount;
  j["slippage"] = order.slippage;
  j["kind"] = domain::toString(order.kind);
  j["status"] = domain::toString(order.status);
  j["selected_venue"] = nullable(order.selected_venue);
  j["raydium_price"] = nullable(order.raydium_price);
  j["meteora_price"] = nullable(order.meteora_price);
  j["executed_price"] = nullable(order.executed_price);
  j["settlement_ref"] = nullable(order.settlement_ref);
  j["last_error"] = nullable(order.last_error);
  j["retry_count"] = order.retry_count;
  j["created_at"] = formatIso8601(order.created_at_ms);
  j["updated_at"] = formatIso8601(order.updated_at_ms);
  return j;
}

nlohmann::json toJson(const domain::Quote& quote) {
  nlohmann::json j;
  j["venue"] = domain::toString(quote.venue);
  j["price"] = quote.price;
  j["fee"] = quote.fee;
  j["estimated_output"] = quote.estimated_output;
  j["liquidity"] = quote.liquidity;
  return j;
}

nlohmann::json toJson(const domain::RoutingDecision& decision) {
  nlohmann::json j;
  j["id"] = decision.id;
  j["order_id"] = decision.order_id;
  j["raydium"] = toJson(decision.raydium_quote);
  j["meteora"] = toJson(decision.meteora_quote);
  j["selected_venue"] = domain::toString(decision.selected_venue);
  j["justification"] = decision.justification;
  j["created_at"] = formatIso8601(decision.created_at_ms);
  return j;
}

nlohmann::json toJson(const OrderStatusEvent& event) {
  nlohmann::json j;
  j["order_id"] = event.order_id;
  j["status"] = domain::toString(event.status);
  j["timestamp"] = formatIso8601(event.timestamp_ms);
  j["snapshot"] = event.snapshot;
  std::visit(PayloadWriter{j}, event.payload);
  return j;
}

nlohmann::json toJson(const JobEvent& event) {
  nlohmann::json j;
  j["order_id"] = event.order_id;
  j["kind"] = toString(event.kind);
  j["attempt"] = event.attempt;
  j["delay_ms"] = event.delay_ms;
  j["detail"] = event.detail;
  j["timestamp"] = formatIso8601(event.timestamp_ms);
  return j;
}

nlohmann::json toJson(const JobRecord& record) {
  nlohmann::json j;
  j["order_id"] = record.order_id;
  j["state"] = toString(record.state);
  j["attempts"] = record.attempts;
  j["last_error"] = nullable(record.last_error);
  j["enqueued_at"] = formatIso8601(record.enqueued_at_ms);
  j["finished_at"] = record.finished_at_ms
                         ? nlohmann::json(formatIso8601(*record.finished_at_ms))
                         : nlohmann::json(nullptr);
  return j;
}

nlohmann::json toJson(const SchedulerMetrics& metrics) {
  nlohmann::json j;
  j["waiting"] = metrics.waiting;
  j["delayed"] = metrics.delayed;
  j["active"] = metrics.active;
  j["completed"] = metrics.completed;
  j["failed"] = metrics.failed;
  return j;
}

nlohmann::json toJson(const SubmitReceipt& receipt) {
  nlohmann::json j;
  j["order_id"] = receipt.order_id;
  j["order_status"] = domain::toString(receipt.status);
  j["status_topic"] = receipt.status_topic;
  return j;
}

nlohmann::json toJson(const HealthReport& report) {
  nlohmann::json j;
  j["status"] = report.status;
  j["timestamp"] = formatIso8601(report.timestamp_ms);
  j["queue"] = toJson(report.queue);
  return j;
}

// -----------------------------------------------------------------------------
// parseSubmitRequest()
// -----------------------------------------------------------------------------
SubmitRequest parseSubmitRequest(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ValidationError("order must be a JSON object");
  }

  SubmitRequest request;
  request.asset_in = readString(j, "asset_in");
  request.asset_out = readString(j, "asset_out");
  request.amount = readNumber(j, "amount");
  request.slippage = readNumber(j, "slippage");

  std::string kind = readString(j, "kind");
  if (!kind.empty()) {
    request.kind = kind;
  }
  return request;
}

}  // namespace swaprouter
