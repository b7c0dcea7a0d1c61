#pragma once
#include "strategy_registry.h"
#include "penalties.h"

namespace rota {

// Call once at startup to register built-ins ("ratio", "min_staff", "tasks", "anneal").
// Safe to call again.
void register_default_strategies();

// Offset search per person, most-constrained first, quadratic load balancing.
StrategyOutput ratio_strategy(const SchedulingContext& ctx);

// Staggered 8/6 seed + iterative repair + iron floor. Every day ends with headcount >= ctx.min_staff.
StrategyOutput min_staff_strategy(const SchedulingContext& ctx);

// Floor derived from continuous task segments, then min_staff_strategy.
StrategyOutput task_demand_strategy(const SchedulingContext& ctx);

// ---- ratio building blocks ----
struct RatioPlan {
  int offset = 0;
  long long score = 0;
  std::vector<bool> row;              // final row after the constraint flip
};

// Chooses the best offset for one person against the committed load. Pure.
RatioPlan plan_person(const RotationConfig& eff,
                      const std::set<int>& hard,
                      const std::vector<int>& load,
                      std::optional<int> history_offset,
                      const OffsetWeights& W = OffsetWeights{});

// Folds a committed row into the running load.
std::vector<int> commit_load(std::vector<int> load, const std::vector<bool>& row);

// ---- min-staff building blocks ----
struct RepairStats {
  int passes = 0;
  int changes = 0;
};

// Local repair until no change or max_passes. Never puts a person on Base on one of their hard days.
RepairStats repair_headcount(ScheduleGrid& grid, const SchedulingContext& ctx, int floor, int max_passes);

// Forces people onto Base until every day meets the floor; returns one warning per broken constraint.
std::vector<std::string> enforce_iron_floor(ScheduleGrid& grid, const SchedulingContext& ctx, int floor);

// ---- task demand ----
struct TaskFloor {
  int floor = 0;
  std::vector<std::string> warnings;
};

// Sum over daily/continuous segments of ceil((duration + rest) / duration * required).
// Templates whose validity window misses [start_date, start_date + total_days) are ignored.
TaskFloor compute_task_floor(const std::vector<TaskTemplate>& tasks,
                             const std::string& start_date,
                             int total_days);

} // namespace rota
