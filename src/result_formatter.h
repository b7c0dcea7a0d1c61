#pragma once
#include "schedule_state.h"

namespace rota {

extern const char* const kConstraintNotGrantedReason;

// Grid + hard sets -> statuses, stats and compliance diagnostics. Pure.
// Home on a hard day is reported as Unavailable; Base on a hard day stays Base and
// shows up in unfulfilled_constraints.
RosterResult format_result(const ScheduleGrid& grid, const SchedulingContext& ctx);

} // namespace rota
