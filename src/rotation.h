// rotation.h
#pragma once
#include "types.h"
#include <optional>
#include <vector>

namespace rota {

// Cycle position p in [0, days_base) is Base, [days_base, cycle) is Home.
// Day d of the horizon sits at position (d + offset) % cycle.

bool valid_rotation(const RotationConfig& r);

// custom > team policy > default. Throws ConfigError when nothing valid applies.
std::vector<RotationConfig> resolve_rotations(const std::vector<Person>& people,
                                              const std::vector<TeamRotation>& team_rotations,
                                              const std::optional<RotationConfig>& custom,
                                              const RotationConfig& fallback);

// Optionally models the exit day: one base day becomes a home day when the home segment is non-empty.
RotationConfig effective_split(const RotationConfig& r, bool exit_day_as_home);

// Offset that makes day 0 continue the streak described by `h`; nullopt when the
// streak cannot be expressed in this cycle.
std::optional<int> history_offset(const RotationConfig& r, const PersonHistory& h);

inline bool is_base_day(const RotationConfig& r, int offset, int day) {
  const int c = r.cycle();
  return c > 0 && ((day + offset) % c) < r.days_base;
}

// Expected headcount per day if everybody follows their cycle.
double theoretical_capacity(const std::vector<RotationConfig>& rotations);

} // namespace rota
