#include "strategies.h"
#include "sa.h"
#include <mutex>

namespace rota {

void register_default_strategies() {
  static std::once_flag once;
  std::call_once(once, [] {
    StrategyRegistry::register_strategy(strategy_name(OptimizationMode::Ratio), ratio_strategy);
    StrategyRegistry::register_strategy(strategy_name(OptimizationMode::MinStaff), min_staff_strategy);
    StrategyRegistry::register_strategy(strategy_name(OptimizationMode::Tasks), task_demand_strategy);
    StrategyRegistry::register_strategy(strategy_name(OptimizationMode::Anneal), anneal_strategy);
  });
}

} // namespace rota
