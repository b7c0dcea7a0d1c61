// penalties.h
#pragma once
#include <optional>
#include <set>
#include <vector>
#include "types.h"

namespace rota {

// Phase-offset scoring (ratio strategy). Higher is better.
struct OffsetWeights {
  long long history_match = 500;
  long long constraint_home = 1000;   // constrained day lands on Home
  long long constraint_base = 5000;   // constrained day lands on Base (subtracted)
};

// Pure: the running load is only read.
long long score_offset(const RotationConfig& eff, int offset,
                       const std::set<int>& hard,
                       const std::vector<int>& load,
                       std::optional<int> history_offset,
                       const OffsetWeights& W);

// Annealing cost (lower is better).
struct PenaltyWeights {
  double w_constraint = 1000000;
  double w_fatigue = 10000;           // per day beyond days_base without a full home block
  double w_fragment = 5000;           // per home block shorter than days_home
  double w_capacity = 100;            // (headcount - target)^2 per day
  double w_equity = 200;              // (home days - expected)^2 per person
};

struct GlobalCost {
  double constraint = 0;
  double fatigue = 0;
  double fragmentation = 0;
  double capacity = 0;
  double equity = 0;
  double total() const { return constraint + fatigue + fragmentation + capacity + equity; }
};

double capacity_variance_cost(const std::vector<int>& headcount, int target, const PenaltyWeights& W);

// Adds constraint, fatigue, fragmentation and equity terms for one person's row.
void add_person_cost(const std::vector<bool>& row,
                     const std::set<int>& hard,
                     const RotationConfig& r,
                     const PenaltyWeights& W,
                     GlobalCost& gc);

} // namespace rota
