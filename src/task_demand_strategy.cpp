#include "strategies.h"
#include "utils.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace rota {

static bool overlaps_horizon(const TaskTemplate& t, int start, int end) {
  if (!t.start_date.empty() && parse_ymd(t.start_date) > end) return false;
  if (!t.end_date.empty() && parse_ymd(t.end_date) < start) return false;
  return true;
}

TaskFloor compute_task_floor(const std::vector<TaskTemplate>& tasks,
                             const std::string& start_date,
                             int total_days) {
  TaskFloor out;
  const int start = parse_ymd(start_date);
  const int end = start + std::max(0, total_days - 1);

  for (const auto& t : tasks) {
    if (!overlaps_horizon(t, start, end)) continue;
    for (const auto& s : t.segments) {
      // only round-the-clock segments impose a rotation-wide floor
      if (s.frequency != SegmentFrequency::Daily && !s.is_repeat) continue;
      if (s.required_people <= 0) continue;
      if (!(s.duration_hours > 0.0)) {
        out.warnings.push_back("Task " + t.name + ": segment " + s.name +
                               " has no duration and was skipped in the headcount calculation");
        continue;
      }
      const double rest = std::max(0.0, s.min_rest_hours_after);
      const double need = (s.duration_hours + rest) / s.duration_hours * s.required_people;
      out.floor += static_cast<int>(std::ceil(need - 1e-9));
    }
  }
  return out;
}

StrategyOutput task_demand_strategy(const SchedulingContext& ctx) {
  TaskFloor tf = compute_task_floor(ctx.tasks, ctx.start_date, ctx.total_days);

  SchedulingContext derived = ctx;
  derived.min_staff = std::max(tf.floor, ctx.min_staff);
  if (ctx.opts.verbose) {
    std::cout << "[tasks] templates=" << ctx.tasks.size()
              << " task_floor=" << tf.floor
              << " caller_floor=" << ctx.min_staff
              << " floor=" << derived.min_staff << "\n";
  }

  StrategyOutput out = min_staff_strategy(derived);
  out.warnings.insert(out.warnings.begin(), tf.warnings.begin(), tf.warnings.end());
  return out;
}

} // namespace rota
