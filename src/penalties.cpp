// penalties.cpp
#include "penalties.h"
#include "rotation.h"
#include <algorithm>

namespace rota {

long long score_offset(const RotationConfig& eff, int offset,
                       const std::set<int>& hard,
                       const std::vector<int>& load,
                       std::optional<int> history_offset,
                       const OffsetWeights& W) {
  long long score = 0;
  if (history_offset && *history_offset == offset) score += W.history_match;

  const int days = static_cast<int>(load.size());
  for (int d = 0; d < days; ++d) {
    const bool base = is_base_day(eff, offset, d);
    if (hard.count(d)) score += base ? -W.constraint_base : W.constraint_home;
    if (base) score -= static_cast<long long>(load[d]) * load[d];
  }
  return score;
}

double capacity_variance_cost(const std::vector<int>& headcount, int target, const PenaltyWeights& W) {
  double c = 0;
  for (int h : headcount) {
    const double diff = h - target;
    c += diff * diff * W.w_capacity;
  }
  return c;
}

void add_person_cost(const std::vector<bool>& row,
                     const std::set<int>& hard,
                     const RotationConfig& r,
                     const PenaltyWeights& W,
                     GlobalCost& gc) {
  const int days = static_cast<int>(row.size());
  int fatigue = 0;
  int home_block = 0;
  int home_days = 0;

  for (int i = 0; i < days; ++i) {
    if (row[i]) {
      if (hard.count(i)) gc.constraint += W.w_constraint;
      fatigue++;
      if (home_block > 0 && home_block < r.days_home) gc.fragmentation += W.w_fragment;
      home_block = 0;
      if (fatigue > r.days_base) gc.fatigue += W.w_fatigue;
    } else {
      home_days++;
      fatigue = std::max(0, fatigue - 1);
      home_block++;
      if (home_block >= r.days_home) fatigue = 0;
    }
  }
  // trailing block
  if (home_block > 0 && home_block < r.days_home) gc.fragmentation += W.w_fragment;

  if (r.cycle() > 0) {
    const double expected = static_cast<double>(days) * r.days_home / r.cycle();
    const double diff = home_days - expected;
    gc.equity += diff * diff * W.w_equity;
  }
}

} // namespace rota
