#include "roster_generator.h"
#include "constraint_compiler.h"
#include "result_formatter.h"
#include "rotation.h"
#include "strategies.h"
#include "transition_rules.h"
#include "utils.h"
#include "validation.h"

#include <algorithm>
#include <iostream>

namespace rota {

int requested_floor(const RosterRequest& req, const EngineOptions& opts) {
  return req.custom_min_staff ? *req.custom_min_staff : opts.min_daily_staff;
}

SchedulingContext build_context(const RosterRequest& req, const EngineOptions& opts) {
  SchedulingContext ctx;
  ctx.opts = opts;
  ctx.start_date = req.start_date.substr(0, 10);
  ctx.start_serial = parse_ymd(req.start_date);
  ctx.total_days = parse_ymd(req.end_date) - ctx.start_serial + 1;

  for (const auto& p : req.people)
    if (p.active) ctx.people.push_back(p);

  ctx.hard = compile_hard_constraints(ctx.people, req.constraints, req.absences,
                                      req.hourly_blockages, ctx.start_date, ctx.total_days);
  ctx.rotations = resolve_rotations(ctx.people, req.team_rotations, req.custom_rotation,
                                    opts.default_rotation);

  ctx.history.resize(ctx.people.size());
  for (size_t i = 0; i < ctx.people.size(); ++i) {
    auto it = req.history.find(ctx.people[i].id);
    if (it != req.history.end()) ctx.history[i] = it->second;
  }

  ctx.tasks = req.tasks;
  ctx.min_staff = requested_floor(req, opts);
  return ctx;
}

RosterResult generate_roster(const RosterRequest& req, const EngineOptions& opts) {
  const long long t0 = NowMillis();
  validate_request(req, opts);
  register_default_strategies();

  const SchedulingContext ctx = build_context(req, opts);
  std::vector<std::string> warnings;

  // Advisory: can the rotations carry the floor at all?
  int floor = ctx.min_staff;
  if (req.mode == OptimizationMode::Tasks)
    floor = std::max(floor, compute_task_floor(ctx.tasks, ctx.start_date, ctx.total_days).floor);
  if (auto w = capacity_warning(theoretical_capacity(ctx.rotations), floor))
    warnings.push_back(*w);

  const StrategyFn strategy = StrategyRegistry::get(strategy_name(req.mode));
  StrategyOutput out = strategy(ctx);
  warnings.insert(warnings.end(), out.warnings.begin(), out.warnings.end());

  auto moved = apply_transition_rules(out.grid, ctx, out.min_staff);
  warnings.insert(warnings.end(), moved.begin(), moved.end());

  RosterResult res = format_result(out.grid, ctx);
  res.mode = req.mode;
  res.min_staff = out.min_staff;
  res.warnings = std::move(warnings);

  if (opts.verbose) {
    std::cout << "[roster] mode=" << to_string(req.mode)
              << " people=" << ctx.people.size()
              << " days=" << ctx.total_days
              << " floor=" << res.min_staff
              << " avg_staff=" << res.stats.avg_staff_per_day
              << " constraints_met=" << res.stats.constraint_stats.met << "/" << res.stats.constraint_stats.total
              << " warnings=" << res.warnings.size()
              << " elapsed=" << (NowMillis() - t0) << "ms\n";
  }
  return res;
}

} // namespace rota
