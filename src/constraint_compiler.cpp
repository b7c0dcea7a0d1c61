#include "constraint_compiler.h"
#include "utils.h"
#include <algorithm>
#include <unordered_map>

namespace rota {

bool is_full_day_blockage(const HourlyBlockage& b) {
  return b.start_time == "00:00" && b.end_time == "23:59";
}

static void add_range(std::set<int>& out, int s, int e, int total_days) {
  s = std::max(0, s);
  e = std::min(total_days - 1, e);
  for (int i = s; i <= e; ++i) out.insert(i);
}

std::vector<std::set<int>> compile_hard_constraints(const std::vector<Person>& people,
                                                    const std::vector<SchedulingConstraint>& constraints,
                                                    const std::vector<Absence>& absences,
                                                    const std::vector<HourlyBlockage>& blockages,
                                                    const std::string& start_date,
                                                    int total_days) {
  std::vector<std::set<int>> hard(people.size());
  if (total_days <= 0) return hard;

  const int start = parse_ymd(start_date);
  std::unordered_map<std::string, size_t> index;
  index.reserve(people.size() * 2);
  for (size_t i = 0; i < people.size(); ++i) index.emplace(people[i].id, i);

  // 1) manual overrides; algorithm-written ones must not feed back into the next run
  for (size_t i = 0; i < people.size(); ++i) {
    for (const auto& [date, ov] : people[i].daily_availability) {
      if (!ov.marks_unavailable() || ov.source == OverrideSource::Algorithm) continue;
      const int day = parse_ymd(date) - start;
      if (day >= 0 && day < total_days) hard[i].insert(day);
    }
  }

  // 2) scheduling constraints
  for (const auto& c : constraints) {
    if (c.kind != ConstraintKind::NeverAssign) continue;
    auto it = index.find(c.person_id);
    if (it == index.end()) continue;
    add_range(hard[it->second], parse_ymd(c.start) - start, parse_ymd(c.end) - start, total_days);
  }

  // 3) absences (approved and pending both block)
  for (const auto& a : absences) {
    if (a.status == AbsenceStatus::Rejected) continue;
    auto it = index.find(a.person_id);
    if (it == index.end()) continue;
    add_range(hard[it->second], parse_ymd(a.start_date) - start, parse_ymd(a.end_date) - start, total_days);
  }

  // 4) full-day hourly blockages
  for (const auto& b : blockages) {
    if (!is_full_day_blockage(b)) continue;
    auto it = index.find(b.person_id);
    if (it == index.end()) continue;
    const int day = parse_ymd(b.date) - start;
    if (day >= 0 && day < total_days) hard[it->second].insert(day);
  }

  return hard;
}

} // namespace rota
