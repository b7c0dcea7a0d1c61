// transition_rules.h
#pragma once
#include "schedule_state.h"
#include <string>
#include <vector>

namespace rota {

// Moves exits (Base -> Home) and entries (Home -> Base) off ctx.opts.no_transition_weekday.
//  exit on W:  leave the day before if the floor allows (return one day earlier),
//              otherwise stay through W and return one day later if the floor allows.
//  entry on W: arrive the day before, or the day after if the day before is a hard day.
// Never sets Base on a hard day and never takes a day below `floor`.
// Returns a warning for every transition that had to stay on W.
std::vector<std::string> apply_transition_rules(ScheduleGrid& grid, const SchedulingContext& ctx, int floor);

} // namespace rota
