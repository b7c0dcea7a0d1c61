#include "rotation.h"
#include <string>

namespace rota {

bool valid_rotation(const RotationConfig& r) {
  return r.days_base >= 0 && r.days_home >= 0 && r.cycle() > 0;
}

static std::string describe(const RotationConfig& r) {
  return std::to_string(r.days_base) + "/" + std::to_string(r.days_home);
}

std::vector<RotationConfig> resolve_rotations(const std::vector<Person>& people,
                                              const std::vector<TeamRotation>& team_rotations,
                                              const std::optional<RotationConfig>& custom,
                                              const RotationConfig& fallback) {
  std::vector<RotationConfig> out;
  out.reserve(people.size());

  if (custom) {
    if (!valid_rotation(*custom))
      throw ConfigError("Invalid custom rotation " + describe(*custom));
    out.assign(people.size(), *custom);
    return out;
  }

  for (const auto& p : people) {
    const TeamRotation* team = nullptr;
    if (!p.team_id.empty()) {
      for (const auto& tr : team_rotations) {
        if (tr.team_id == p.team_id) { team = &tr; break; }
      }
    }
    if (team) {
      RotationConfig r{team->days_on_base, team->days_at_home};
      if (!valid_rotation(r))
        throw ConfigError("Invalid rotation " + describe(r) + " for team " + team->team_id);
      out.push_back(r);
      continue;
    }
    if (!valid_rotation(fallback))
      throw ConfigError("No rotation resolvable for person " + p.id +
                        ": default rotation " + describe(fallback) + " is invalid");
    out.push_back(fallback);
  }
  return out;
}

RotationConfig effective_split(const RotationConfig& r, bool exit_day_as_home) {
  if (!exit_day_as_home || r.days_home == 0 || r.days_base == 0) return r;
  return RotationConfig{r.days_base - 1, r.days_home + 1};
}

std::optional<int> history_offset(const RotationConfig& r, const PersonHistory& h) {
  const int cycle = r.cycle();
  if (cycle <= 0 || h.consecutive_days <= 0) return std::nullopt;

  int yesterday = 0;
  if (h.last_status == DayStatus::Base) {
    if (r.days_base <= 0) return std::nullopt;
    yesterday = (h.consecutive_days - 1) % r.days_base;
  } else {
    if (r.days_home <= 0) return std::nullopt;
    yesterday = r.days_base + (h.consecutive_days - 1) % r.days_home;
  }
  return (yesterday + 1) % cycle;
}

double theoretical_capacity(const std::vector<RotationConfig>& rotations) {
  double cap = 0.0;
  for (const auto& r : rotations)
    if (r.cycle() > 0) cap += static_cast<double>(r.days_base) / r.cycle();
  return cap;
}

} // namespace rota
