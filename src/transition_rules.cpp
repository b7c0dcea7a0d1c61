#include "transition_rules.h"
#include <iostream>

namespace rota {

static int next_base_day(const ScheduleGrid& grid, size_t p, int from) {
  for (int r = from; r < grid.days(); ++r)
    if (grid.at(p, r)) return r;
  return -1;
}

static std::string stuck(const SchedulingContext& ctx, size_t p, int d, const char* what) {
  return std::string("Could not move ") + what + " of " + ctx.people[p].name + " (" +
         ctx.people[p].id + ") off restricted weekday " + ctx.date_key(d);
}

std::vector<std::string> apply_transition_rules(ScheduleGrid& grid, const SchedulingContext& ctx, int floor) {
  std::vector<std::string> warnings;
  const int W = ctx.opts.no_transition_weekday;
  if (W < 0 || W > 6) return warnings;

  int moved = 0;
  for (int d = 1; d < grid.days(); ++d) {
    if (ctx.weekday(d) != W) continue;
    for (size_t p = 0; p < grid.base.size(); ++p) {
      const bool prev = grid.at(p, d - 1);
      const bool cur = grid.at(p, d);

      if (prev && !cur) {
        // exit on W
        if (grid.headcount[d - 1] - 1 >= floor) {
          grid.set(p, d - 1, false);
          const int r = next_base_day(grid, p, d + 1);
          if (r > d + 1 && !ctx.is_hard(p, r - 1)) grid.set(p, r - 1, true);
          moved++;
        } else if (!ctx.is_hard(p, d)) {
          grid.set(p, d, true);
          const int r = next_base_day(grid, p, d + 1);
          if (r > d && grid.headcount[r] - 1 >= floor) grid.set(p, r, false);
          moved++;
        } else {
          warnings.push_back(stuck(ctx, p, d, "exit"));
        }
      } else if (!prev && cur) {
        // entry on W
        if (!ctx.is_hard(p, d - 1)) {
          grid.set(p, d - 1, true);
          moved++;
        } else if (grid.headcount[d] - 1 >= floor) {
          grid.set(p, d, false);
          if (d + 1 < grid.days() && !ctx.is_hard(p, d + 1)) grid.set(p, d + 1, true);
          moved++;
        } else {
          warnings.push_back(stuck(ctx, p, d, "entry"));
        }
      }
    }
  }

  if (ctx.opts.verbose)
    std::cout << "[transitions] weekday=" << W << " moved=" << moved << " stuck=" << warnings.size() << "\n";
  return warnings;
}

} // namespace rota
