#include "strategy_registry.h"
#include <algorithm>
#include <mutex>

namespace rota {

static std::mutex& REGISTRY_MU() {
  static std::mutex mu;
  return mu;
}

static std::unordered_map<std::string, StrategyFn>& REGISTRY() {
  static std::unordered_map<std::string, StrategyFn> r;
  return r;
}

void StrategyRegistry::register_strategy(const std::string& name, StrategyFn fn) {
  std::lock_guard<std::mutex> lk(REGISTRY_MU());
  REGISTRY()[name] = std::move(fn);
}
bool StrategyRegistry::has(const std::string& name) {
  std::lock_guard<std::mutex> lk(REGISTRY_MU());
  return REGISTRY().count(name) > 0;
}
StrategyFn StrategyRegistry::get(const std::string& name) {
  std::lock_guard<std::mutex> lk(REGISTRY_MU());
  auto it = REGISTRY().find(name);
  if (it == REGISTRY().end()) throw ConfigError("Unknown strategy: " + name);
  return it->second;
}
std::vector<std::string> StrategyRegistry::names() {
  std::lock_guard<std::mutex> lk(REGISTRY_MU());
  std::vector<std::string> out; out.reserve(REGISTRY().size());
  for (auto& kv : REGISTRY()) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

std::string strategy_name(OptimizationMode mode) { return to_string(mode); }

} // namespace rota
