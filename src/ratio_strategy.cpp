#include "strategies.h"
#include "rotation.h"

#include <algorithm>
#include <climits>
#include <iostream>
#include <numeric>

namespace rota {

RatioPlan plan_person(const RotationConfig& eff,
                      const std::set<int>& hard,
                      const std::vector<int>& load,
                      std::optional<int> history_offset,
                      const OffsetWeights& W) {
  RatioPlan plan;
  plan.score = LLONG_MIN;
  const int cycle = eff.cycle();
  for (int offset = 0; offset < cycle; ++offset) {
    const long long s = score_offset(eff, offset, hard, load, history_offset, W);
    if (s > plan.score) { plan.score = s; plan.offset = offset; }
  }

  const int days = static_cast<int>(load.size());
  plan.row.assign(days, false);
  for (int d = 0; d < days; ++d) plan.row[d] = is_base_day(eff, plan.offset, d);

  // Constraints always beat the cycle pattern.
  for (int d : hard)
    if (d >= 0 && d < days) plan.row[d] = false;
  return plan;
}

std::vector<int> commit_load(std::vector<int> load, const std::vector<bool>& row) {
  for (size_t d = 0; d < load.size() && d < row.size(); ++d)
    if (row[d]) load[d]++;
  return load;
}

StrategyOutput ratio_strategy(const SchedulingContext& ctx) {
  const size_t n = ctx.people.size();
  StrategyOutput out;
  out.grid = ScheduleGrid(n, ctx.total_days);
  out.min_staff = ctx.min_staff;

  // Most-constrained people commit first.
  std::vector<size_t> order(n);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return ctx.constraint_count(a) > ctx.constraint_count(b);
  });

  std::vector<int> load(std::max(0, ctx.total_days), 0);
  for (size_t p : order) {
    const RotationConfig eff = effective_split(ctx.rotations[p], ctx.opts.ratio_exit_day_as_home);
    std::optional<int> hist;
    if (ctx.history[p]) hist = history_offset(eff, *ctx.history[p]);

    RatioPlan plan = plan_person(eff, ctx.hard[p], load, hist);
    load = commit_load(std::move(load), plan.row);
    out.grid.base[p] = std::move(plan.row);

    if (ctx.opts.verbose) {
      std::cout << "[ratio] person=" << ctx.people[p].id
                << " cycle=" << eff.days_base << "/" << eff.days_home
                << " offset=" << plan.offset
                << " score=" << plan.score
                << (hist ? " (history)" : "") << "\n";
    }
  }
  out.grid.headcount = std::move(load);
  return out;
}

} // namespace rota
