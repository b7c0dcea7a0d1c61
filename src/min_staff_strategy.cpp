#include "strategies.h"
#include "rotation.h"

#include <iostream>
#include <limits>
#include <sstream>

namespace rota {

// Seed pattern: 8 on / 6 off, phases spread evenly over the 14-day cycle.
static constexpr RotationConfig kSeedRotation{8, 6};

static std::vector<int> assigned_counts(const ScheduleGrid& grid) {
  std::vector<int> out(grid.base.size(), 0);
  for (size_t p = 0; p < grid.base.size(); ++p) out[p] = grid.assigned_days(p);
  return out;
}

static ScheduleGrid seed_staggered(const SchedulingContext& ctx) {
  const size_t n = ctx.people.size();
  const int cycle = kSeedRotation.cycle();
  ScheduleGrid grid(n, ctx.total_days);
  for (size_t p = 0; p < n; ++p) {
    int offset = static_cast<int>((p * cycle) / n) % cycle;
    if (ctx.history[p]) {
      if (auto h = history_offset(kSeedRotation, *ctx.history[p])) offset = *h;
    }
    for (int d = 0; d < ctx.total_days; ++d) grid.base[p][d] = is_base_day(kSeedRotation, offset, d);
    for (int d : ctx.hard[p])
      if (d >= 0 && d < ctx.total_days) grid.base[p][d] = false;
  }
  grid.recount();
  return grid;
}

RepairStats repair_headcount(ScheduleGrid& grid, const SchedulingContext& ctx, int floor, int max_passes) {
  RepairStats stats;
  const size_t n = ctx.people.size();
  std::vector<int> assigned = assigned_counts(grid);

  for (int pass = 0; pass < max_passes; ++pass) {
    int changes = 0;
    for (int d = 0; d < grid.days(); ++d) {
      if (grid.headcount[d] < floor) {
        // least-constrained, then least-burdened, free Home person
        size_t pick = n;
        for (size_t p = 0; p < n; ++p) {
          if (grid.at(p, d) || ctx.is_hard(p, d)) continue;
          if (pick == n ||
              ctx.constraint_count(p) < ctx.constraint_count(pick) ||
              (ctx.constraint_count(p) == ctx.constraint_count(pick) && assigned[p] < assigned[pick]))
            pick = p;
        }
        if (pick != n) {
          grid.set(pick, d, true);
          assigned[pick]++;
          changes++;
        }
      } else if (grid.headcount[d] > floor + 2) {
        // only people who asked for the day off are sent home
        size_t pick = n;
        for (size_t p = 0; p < n; ++p) {
          if (!grid.at(p, d) || !ctx.is_hard(p, d)) continue;
          if (pick == n || assigned[p] > assigned[pick]) pick = p;
        }
        if (pick != n) {
          grid.set(pick, d, false);
          assigned[pick]--;
          changes++;
        }
      }
    }
    stats.passes++;
    stats.changes += changes;
    if (ctx.opts.verbose)
      std::cout << "[repair] pass=" << pass << " changes=" << changes << "\n";
    if (changes == 0) break;
  }
  return stats;
}

std::vector<std::string> enforce_iron_floor(ScheduleGrid& grid, const SchedulingContext& ctx, int floor) {
  std::vector<std::string> warnings;
  const size_t n = ctx.people.size();
  std::vector<int> assigned = assigned_counts(grid);

  for (int d = 0; d < grid.days(); ++d) {
    while (grid.headcount[d] < floor) {
      // lowest cumulative assignment first; unconstrained wins ties
      size_t pick = n;
      for (size_t p = 0; p < n; ++p) {
        if (grid.at(p, d)) continue;
        if (pick == n || assigned[p] < assigned[pick] ||
            (assigned[p] == assigned[pick] && !ctx.is_hard(p, d) && ctx.is_hard(pick, d)))
          pick = p;
      }
      if (pick == n) break;

      grid.set(pick, d, true);
      assigned[pick]++;
      if (ctx.is_hard(pick, d)) {
        std::ostringstream w;
        w << "Iron floor: " << ctx.people[pick].name << " (" << ctx.people[pick].id
          << ") assigned to base on " << ctx.date_key(d)
          << " despite a hard constraint, to keep minimum headcount " << floor;
        warnings.push_back(w.str());
        if (ctx.opts.verbose) std::cout << "[iron] " << warnings.back() << "\n";
      }
    }
    if (grid.headcount[d] < floor) {
      std::ostringstream w;
      w << "Minimum headcount " << floor << " not reachable on " << ctx.date_key(d)
        << ": only " << n << " people in the roster";
      warnings.push_back(w.str());
    }
  }
  return warnings;
}

StrategyOutput min_staff_strategy(const SchedulingContext& ctx) {
  StrategyOutput out;
  out.min_staff = ctx.min_staff;
  out.grid = seed_staggered(ctx);

  const RepairStats rs = repair_headcount(out.grid, ctx, ctx.min_staff, ctx.opts.repair_max_passes);
  auto iron = enforce_iron_floor(out.grid, ctx, ctx.min_staff);
  out.warnings.insert(out.warnings.end(), iron.begin(), iron.end());

  if (ctx.opts.verbose) {
    std::cout << "[min_staff] floor=" << ctx.min_staff
              << " passes=" << rs.passes
              << " changes=" << rs.changes
              << " iron_warnings=" << iron.size() << "\n";
  }
  return out;
}

} // namespace rota
