// validation.h
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace rota {

[[noreturn]] void fail(const std::string& msg);

// Primary validator; throws ConfigError on the first fatal problem.
void validate_request(const RosterRequest& req, const EngineOptions& opts);

// ---- individual checks ----
void validate_horizon(const std::string& start_date, const std::string& end_date);
void validate_people(const std::vector<Person>& people);
void validate_staffing(const RosterRequest& req, const EngineOptions& opts);
void validate_tasks(const RosterRequest& req);
void validate_engine_options(const EngineOptions& opts);

// ---- advisory ----
// Warning text when the rotations cannot carry `floor` people per day on average.
std::optional<std::string> capacity_warning(double theoretical_capacity, int floor);

} // namespace rota
