#pragma once

#include "swaprouter/domain/router_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Overlays a JSON document on the compiled-in RouterConfig defaults.
//
// @details
// Every key is optional. Durations are given in milliseconds and carry an
// _ms suffix. Shape:
//
//   {
//     "reference_price": 50000, "seed": 0,
//     "scheduler":  { "concurrency", "max_admissions_per_window",
//                     "rate_window_ms", "max_retries", "backoff_base_ms",
//                     "retain_completed", "retain_failed" },
//     "execution":  { "build_duration_ms", "default_slippage",
//                     "quote_timeout_ms" },
//     "venues": {
//       "raydium":  { "fee", "price_multiplier_min", "price_multiplier_max",
//                     "liquidity_min", "liquidity_max", "latency_ms",
//                     "timeout_ms", "unavailable_probability" },
//       "meteora":  { ...same keys... }
//     },
//     "settlement": { "latency_min_ms", "latency_max_ms",
//                     "failure_probability" },
//     "ipc":        { "command_endpoint", "status_endpoint" }
//   }
//
// Unknown keys are ignored. A key of the wrong JSON type, or a value that
// fails validateRouterConfig(), raises ValidationError.
// -----------------------------------------------------------------------------

// @throws ValidationError
domain::RouterConfig parseRouterConfig(const nlohmann::json& j);

// Reads and parses a file.
// @throws ValidationError if the file cannot be opened or is not valid JSON.
domain::RouterConfig loadRouterConfig(const std::string& path);

// Range checks shared by the loader and RouterEngine.
// @throws ValidationError naming the first offending field.
void validateRouterConfig(const domain::RouterConfig& config);

}  // namespace swaprouter
