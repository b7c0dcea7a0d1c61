// sa.h
#pragma once
#include "strategy_registry.h"
#include "penalties.h"
#include <random>

namespace rota {

struct SA_Config {
  double T0 = 100.0, alpha = 0.9995;
  int iters = 20000;
  int seed = 42;
  bool verbose = false;
  int log_every = 2000;       // print every N iters when verbose
  PenaltyWeights W;
};

struct SA_Result {
  ScheduleGrid best_state;
  GlobalCost best_cost;
  int target_capacity = 0;
  // optional stats:
  int accepted = 0, rejected = 0, invalid = 0;
};

SA_Result run_sa(const SchedulingContext& ctx, const SA_Config& cfg);

GlobalCost eval_global(const ScheduleGrid& S, const SchedulingContext& ctx,
                       int target_capacity, const PenaltyWeights& W);

// Alternate strategy: the annealer's best grid. Not equivalent to ratio_strategy output.
StrategyOutput anneal_strategy(const SchedulingContext& ctx);

} // namespace rota
