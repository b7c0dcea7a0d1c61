#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "schedule_state.h"

namespace rota {

// What every strategy hands back to the generator. Warnings travel with the grid
// instead of being written into the context.
struct StrategyOutput {
  ScheduleGrid grid;
  std::vector<std::string> warnings;
  int min_staff = 0;                  // floor the strategy worked against
};

using StrategyFn = std::function<StrategyOutput(const SchedulingContext& ctx)>;

// Registry (singleton-style accessors).
struct StrategyRegistry {
  static void register_strategy(const std::string& name, StrategyFn fn);
  static bool has(const std::string& name);
  static StrategyFn get(const std::string& name);
  static std::vector<std::string> names();
};

// Name under which the strategy for `mode` is registered.
std::string strategy_name(OptimizationMode mode);

} // namespace rota
