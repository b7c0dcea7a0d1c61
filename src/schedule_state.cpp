#include "schedule_state.h"
#include "utils.h"
#include <algorithm>

namespace rota {

std::string SchedulingContext::date_key(int day) const {
  return ymd_from_serial(start_serial + day);
}

int SchedulingContext::weekday(int day) const {
  return weekday_from_serial(start_serial + day);
}

ScheduleGrid::ScheduleGrid(size_t people, int days)
    : base(people, std::vector<bool>(std::max(0, days), false)),
      headcount(std::max(0, days), 0) {}

void ScheduleGrid::set(size_t p, int day, bool on) {
  if (base[p][day] == on) return;
  base[p][day] = on;
  headcount[day] += on ? 1 : -1;
}

int ScheduleGrid::assigned_days(size_t p) const {
  return static_cast<int>(std::count(base[p].begin(), base[p].end(), true));
}

void ScheduleGrid::recount() {
  std::fill(headcount.begin(), headcount.end(), 0);
  for (const auto& row : base)
    for (size_t d = 0; d < row.size(); ++d)
      if (row[d]) headcount[d]++;
}

} // namespace rota
