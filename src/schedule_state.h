#pragma once
#include "types.h"
#include <set>
#include <vector>

namespace rota {

// Everything a strategy needs for one run. Built once by build_context(), then read-only.
struct SchedulingContext {
  std::string start_date;                             // "YYYY-MM-DD", day index 0
  int start_serial = 0;
  int total_days = 0;
  std::vector<Person> people;                         // active people only
  std::vector<std::set<int>> hard;                    // [person] -> forbidden day indices
  std::vector<RotationConfig> rotations;              // [person]
  std::vector<std::optional<PersonHistory>> history;  // [person]
  std::vector<TaskTemplate> tasks;
  int min_staff = 0;
  EngineOptions opts;

  std::string date_key(int day) const;
  int weekday(int day) const;                         // 0=Sun..6=Sat
  bool is_hard(size_t p, int day) const { return hard[p].count(day) > 0; }
  int constraint_count(size_t p) const { return static_cast<int>(hard[p].size()); }
};

// true = Base, false = Home. Headcount is kept in sync by set().
struct ScheduleGrid {
  std::vector<std::vector<bool>> base;                // [person][day]
  std::vector<int> headcount;                         // [day]

  ScheduleGrid() = default;
  ScheduleGrid(size_t people, int days);

  bool at(size_t p, int day) const { return base[p][day]; }
  void set(size_t p, int day, bool on);
  int assigned_days(size_t p) const;
  int days() const { return static_cast<int>(headcount.size()); }

  // Rebuild headcount from base after bulk edits
  void recount();
};

} // namespace rota
