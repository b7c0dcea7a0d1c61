#pragma once
#include <nlohmann/json.hpp>
#include "types.h"

namespace rota {

using json = nlohmann::json;

// ---- settings file ----
// {"OPTIMIZATION_MODE": "ratio", "MIN_DAILY_STAFF": 0, "DEFAULT_DAYS_ON_BASE": 11, "DEFAULT_DAYS_AT_HOME": 3,
//  "REPAIR_MAX_PASSES": 200, "RATIO_EXIT_DAY_AS_HOME": false, "NO_TRANSITION_WEEKDAY": -1,
//  "SA_ITERATIONS": 20000, "SA_T0": 100.0, "SA_ALPHA": 0.9995, "RNG_SEED": 42,
//  "LOG_PROGRESS": false, "LOG_EVERY": 2000}
EngineOptions parse_engine_options(const json& j);
OptimizationMode parse_default_mode(const json& j);

// ---- request ----
// `fallback_mode` applies when the request has no "mode" key.
RosterRequest parse_request(const json& j, OptimizationMode fallback_mode = OptimizationMode::Ratio);

Person parse_person(const json& j);
TaskTemplate parse_task(const json& j);

// ---- result ----
json result_to_json(const RosterResult& r);

} // namespace rota
