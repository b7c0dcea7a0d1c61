// roster_generator.h
#pragma once
#include "schedule_state.h"

namespace rota {

// Validates nothing; assumes validate_request() passed. Inactive people are dropped here.
SchedulingContext build_context(const RosterRequest& req, const EngineOptions& opts);

// Floor for the run: the request's custom_min_staff if present, else the organization default.
int requested_floor(const RosterRequest& req, const EngineOptions& opts);

// Full pipeline: validate -> compile -> strategy -> transition rules -> format.
// Throws ConfigError on configuration problems; everything else lands in warnings.
RosterResult generate_roster(const RosterRequest& req, const EngineOptions& opts = EngineOptions{});

} // namespace rota
