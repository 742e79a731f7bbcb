#include "swaprouter/config/config_loader.hpp"
#include "swaprouter/errors/router_error.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <type_traits>

namespace swaprouter {

namespace {

using nlohmann::json;

// Assigns j[key] to target if present. Type mismatches surface as
// json::type_error and are converted by parseRouterConfig(). Unsigned
// targets take only non-negative integers; get<size_t>() would wrap -1.
template <typename T>
void readField(const json& j, const char* key, T& target) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
      if (!it->is_number_unsigned()) {
        throw ValidationError(std::string("invalid config: '") + key +
                              "' must be a non-negative integer");
      }
    }
    target = it->get<T>();
  }
}

void readMs(const json& j, const char* key, std::chrono::milliseconds& target) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    target = std::chrono::milliseconds(it->get<std::int64_t>());
  }
}

const json* section(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ValidationError(std::string("config section '") + key +
                          "' must be an object");
  }
  return &*it;
}

void readVenue(const json& j, domain::MockVenueConfig& venue) {
  readField(j, "fee", venue.fee);
  readField(j, "price_multiplier_min", venue.price_multiplier_min);
  readField(j, "price_multiplier_max", venue.price_multiplier_max);
  readField(j, "liquidity_min", venue.liquidity_min);
  readField(j, "liquidity_max", venue.liquidity_max);
  readMs(j, "latency_ms", venue.latency);
  readMs(j, "timeout_ms", venue.timeout);
  readField(j, "unavailable_probability", venue.unavailable_probability);
}

void require(bool ok, const std::string& message) {
  if (!ok) {
    throw ValidationError("invalid config: " + message);
  }
}

bool isProbability(double p) { return std::isfinite(p) && p >= 0.0 && p <= 1.0; }

void validateVenue(const domain::MockVenueConfig& v, const std::string& name) {
  require(std::isfinite(v.fee) && v.fee >= 0.0 && v.fee < 1.0,
          name + ".fee must be in [0, 1)");
  require(v.price_multiplier_min > 0.0 &&
              v.price_multiplier_min <= v.price_multiplier_max,
          name + " price multiplier envelope is empty or inverted");
  require(v.liquidity_min >= 0.0 && v.liquidity_min <= v.liquidity_max,
          name + " liquidity envelope is inverted");
  require(v.latency.count() >= 0 && v.timeout.count() > 0,
          name + " latency must be >= 0 and timeout > 0");
  require(isProbability(v.unavailable_probability),
          name + ".unavailable_probability must be in [0, 1]");
}

}  // namespace

domain::RouterConfig parseRouterConfig(const json& j) {
  if (!j.is_object()) {
    throw ValidationError("config root must be a JSON object");
  }

  domain::RouterConfig config;
  try {
    readField(j, "reference_price", config.reference_price);
    readField(j, "seed", config.seed);

    if (const json* s = section(j, "scheduler")) {
      readField(*s, "concurrency", config.scheduler.concurrency);
      readField(*s, "max_admissions_per_window",
           config.scheduler.max_admissions_per_window);
      readMs(*s, "rate_window_ms", config.scheduler.rate_window);
      readField(*s, "max_retries", config.scheduler.max_retries);
      readMs(*s, "backoff_base_ms", config.scheduler.backoff_base);
      readField(*s, "retain_completed", config.scheduler.retain_completed);
      readField(*s, "retain_failed", config.scheduler.retain_failed);
    }

    if (const json* e = section(j, "execution")) {
      readMs(*e, "build_duration_ms", config.execution.build_duration);
      readField(*e, "default_slippage", config.execution.default_slippage);
      readMs(*e, "quote_timeout_ms", config.execution.quote_timeout);
    }

    if (const json* venues = section(j, "venues")) {
      if (const json* r = section(*venues, "raydium")) {
        readVenue(*r, config.raydium);
      }
      if (const json* m = section(*venues, "meteora")) {
        readVenue(*m, config.meteora);
      }
    }

    if (const json* s = section(j, "settlement")) {
      readMs(*s, "latency_min_ms", config.settlement.latency_min);
      readMs(*s, "latency_max_ms", config.settlement.latency_max);
      readField(*s, "failure_probability", config.settlement.failure_probability);
    }

    if (const json* ipc = section(j, "ipc")) {
      readField(*ipc, "command_endpoint", config.ipc.command_endpoint);
      readField(*ipc, "status_endpoint", config.ipc.status_endpoint);
    }
  } catch (const json::exception& e) {
    throw ValidationError(std::string("invalid config: ") + e.what());
  }

  validateRouterConfig(config);
  return config;
}

domain::RouterConfig loadRouterConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ValidationError("cannot open config file: " + path);
  }

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ValidationError("malformed config file " + path + ": " + e.what());
  }
  return parseRouterConfig(j);
}

void validateRouterConfig(const domain::RouterConfig& config) {
  const auto& s = config.scheduler;
  require(s.concurrency >= 1, "scheduler.concurrency must be >= 1");
  require(s.max_admissions_per_window >= 1,
          "scheduler.max_admissions_per_window must be >= 1");
  require(s.rate_window.count() > 0, "scheduler.rate_window_ms must be > 0");
  require(s.max_retries >= 1, "scheduler.max_retries must be >= 1");
  require(s.backoff_base.count() >= 0,
          "scheduler.backoff_base_ms must be >= 0");

  const auto& e = config.execution;
  require(e.build_duration.count() >= 0,
          "execution.build_duration_ms must be >= 0");
  require(std::isfinite(e.default_slippage) && e.default_slippage > 0.0 &&
              e.default_slippage <= 1.0,
          "execution.default_slippage must be in (0, 1]");
  require(e.quote_timeout.count() > 0,
          "execution.quote_timeout_ms must be > 0");

  require(config.raydium.venue == domain::VenueId::Raydium &&
              config.meteora.venue == domain::VenueId::Meteora,
          "venue profiles are swapped");
  validateVenue(config.raydium, "venues.raydium");
  validateVenue(config.meteora, "venues.meteora");

  const auto& st = config.settlement;
  require(st.latency_min.count() >= 0 && st.latency_min <= st.latency_max,
          "settlement latency envelope is inverted");
  require(isProbability(st.failure_probability),
          "settlement.failure_probability must be in [0, 1]");

  require(std::isfinite(config.reference_price) && config.reference_price > 0.0,
          "reference_price must be > 0");
}

}  // namespace swaprouter
