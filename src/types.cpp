#include "types.h"

namespace rota {

const char* to_string(DayStatus s) {
  switch (s) {
    case DayStatus::Base: return "base";
    case DayStatus::Home: return "home";
    case DayStatus::Unavailable: return "unavailable";
  }
  return "home";
}

const char* to_string(OptimizationMode m) {
  switch (m) {
    case OptimizationMode::Ratio: return "ratio";
    case OptimizationMode::MinStaff: return "min_staff";
    case OptimizationMode::Tasks: return "tasks";
    case OptimizationMode::Anneal: return "anneal";
  }
  return "ratio";
}

DayStatus status_from_string(const std::string& s) {
  if (s == "base") return DayStatus::Base;
  if (s == "home") return DayStatus::Home;
  if (s == "unavailable") return DayStatus::Unavailable;
  throw ConfigError("Unknown day status: " + s);
}

OptimizationMode mode_from_string(const std::string& s) {
  if (s == "ratio") return OptimizationMode::Ratio;
  if (s == "min_staff") return OptimizationMode::MinStaff;
  if (s == "tasks") return OptimizationMode::Tasks;
  if (s == "anneal") return OptimizationMode::Anneal;
  throw ConfigError("Unknown optimization mode: " + s);
}

} // namespace rota
