#include "result_formatter.h"
#include <algorithm>
#include <cmath>

namespace rota {

const char* const kConstraintNotGrantedReason =
    "Leave request not granted due to minimum headcount requirements";

RosterResult format_result(const ScheduleGrid& grid, const SchedulingContext& ctx) {
  RosterResult res;
  const size_t n = ctx.people.size();
  res.roster.reserve(n * static_cast<size_t>(std::max(0, ctx.total_days)));
  res.min_staff = ctx.min_staff;

  long long total_presence = 0;
  for (int d = 0; d < ctx.total_days; ++d) {
    const std::string key = ctx.date_key(d);
    auto& day = res.person_statuses[key];
    for (size_t p = 0; p < n; ++p) {
      const bool base = grid.at(p, d);
      DayStatus s = base ? DayStatus::Base
                         : (ctx.is_hard(p, d) ? DayStatus::Unavailable : DayStatus::Home);
      day[ctx.people[p].id] = s;
      res.roster.push_back(DailyPresence{key, ctx.people[p].id, s, OverrideSource::Algorithm});
      if (base) total_presence++;
    }
  }

  // constraint compliance
  ConstraintStats& cs = res.stats.constraint_stats;
  for (size_t p = 0; p < n; ++p) {
    for (int d : ctx.hard[p]) {
      if (d < 0 || d >= ctx.total_days) continue;
      cs.total++;
      if (!grid.at(p, d)) {
        cs.met++;
        continue;
      }
      res.unfulfilled_constraints.push_back(UnfulfilledConstraint{
          ctx.people[p].id, ctx.people[p].name, ctx.date_key(d), kConstraintNotGrantedReason});
    }
  }
  cs.percentage = cs.total > 0
      ? static_cast<int>(std::lround(100.0 * cs.met / cs.total))
      : 100;

  res.stats.total_days = ctx.total_days;
  res.stats.avg_staff_per_day = ctx.total_days > 0
      ? static_cast<double>(total_presence) / ctx.total_days
      : 0.0;
  return res;
}

} // namespace rota
