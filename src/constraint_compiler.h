// constraint_compiler.h
#pragma once
#include "types.h"
#include <set>
#include <vector>

namespace rota {

// Per-person set of day indices on which Base is forbidden, aligned with `people`.
// A day is forbidden by:
//  - a NeverAssign constraint covering it,
//  - an approved or pending absence covering it,
//  - a manual (non-algorithm) override marking the person unavailable,
//  - a full-day (00:00-23:59) hourly blockage.
// Ranges are clamped to [0, total_days-1]; out-of-range parts are dropped silently.
std::vector<std::set<int>> compile_hard_constraints(const std::vector<Person>& people,
                                                    const std::vector<SchedulingConstraint>& constraints,
                                                    const std::vector<Absence>& absences,
                                                    const std::vector<HourlyBlockage>& blockages,
                                                    const std::string& start_date,
                                                    int total_days);

bool is_full_day_blockage(const HourlyBlockage& b);

} // namespace rota
