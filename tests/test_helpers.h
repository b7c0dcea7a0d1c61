// test_helpers.h
#pragma once
#include <string>
#include <vector>

#include "roster_generator.h"
#include "types.h"

namespace rota::test {

inline Person MakePerson(const std::string& id, const std::string& team = "")
{
  Person p;
  p.id = id;
  p.name = "Person " + id;
  p.team_id = team;
  return p;
}

inline std::vector<Person> MakePeople(int n, const std::string& team = "")
{
  std::vector<Person> out;
  for (int i = 0; i < n; ++i)
    out.push_back(MakePerson("p" + std::to_string(i), team));
  return out;
}

inline RosterRequest MakeRequest(
    const std::string& start,
    const std::string& end,
    std::vector<Person> people,
    OptimizationMode mode = OptimizationMode::Ratio)
{
  RosterRequest r;
  r.start_date = start;
  r.end_date = end;
  r.people = std::move(people);
  r.mode = mode;
  return r;
}

inline SchedulingConstraint NeverAssign(const std::string& pid, const std::string& start, const std::string& end)
{
  return SchedulingConstraint{pid, start, end, ConstraintKind::NeverAssign};
}

inline int BaseCount(const RosterResult& res, const std::string& date)
{
  int n = 0;
  for (const auto& [pid, s] : res.person_statuses.at(date))
    if (s == DayStatus::Base)
      ++n;
  return n;
}

inline int HomeOrUnavailableCount(const RosterResult& res, const std::string& pid)
{
  int n = 0;
  for (const auto& e : res.roster)
    if (e.person_id == pid && e.status != DayStatus::Base)
      ++n;
  return n;
}

}  // namespace rota::test
