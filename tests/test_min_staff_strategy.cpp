#include <gtest/gtest.h>

#include <algorithm>

#include "strategies.h"
#include "test_helpers.h"
#include "utils.h"

using namespace rota;
using namespace rota::test;

namespace
{

RosterRequest MinStaffRequest(int people, const std::string& start, const std::string& end, int floor)
{
  auto req = MakeRequest(start, end, MakePeople(people), OptimizationMode::MinStaff);
  req.custom_min_staff = floor;
  return req;
}

bool AnyWarningMentions(const std::vector<std::string>& warnings, const std::string& needle)
{
  return std::any_of(warnings.begin(), warnings.end(),
                     [&](const std::string& w) { return w.find(needle) != std::string::npos; });
}

}  // namespace

TEST(MinStaffStrategy, TwoPeopleFloorTwoAreAlwaysOnBase)
{
  auto res = generate_roster(MinStaffRequest(2, "2026-01-05", "2026-01-09", 2));
  ASSERT_EQ(res.roster.size(), 10u);
  for (const auto& e : res.roster)
    EXPECT_EQ(e.status, DayStatus::Base) << e.person_id << " " << e.date;
  EXPECT_EQ(res.min_staff, 2);
}

TEST(MinStaffStrategy, FloorHoldsEveryDay)
{
  auto req = MinStaffRequest(8, "2026-02-01", "2026-02-28", 5);
  req.constraints = {
      NeverAssign("p0", "2026-02-02", "2026-02-12"),
      NeverAssign("p1", "2026-02-05", "2026-02-07"),
      NeverAssign("p2", "2026-02-05", "2026-02-07"),
      NeverAssign("p3", "2026-02-06", "2026-02-06")};

  auto res = generate_roster(req);
  for (int d = 0; d < 28; ++d)
    EXPECT_GE(BaseCount(res, ymd_add_days("2026-02-01", d)), 5) << "day " << d;
}

TEST(MinStaffStrategy, IronFloorOverridesConstraintsAndWarns)
{
  auto req = MinStaffRequest(10, "2026-01-05", "2026-01-11", 6);
  for (int i = 1; i <= 9; ++i)
    req.constraints.push_back(NeverAssign("p" + std::to_string(i), "2026-01-08", "2026-01-08"));

  auto res = generate_roster(req);
  EXPECT_GE(BaseCount(res, "2026-01-08"), 6);

  int forced = 0;
  for (int i = 1; i <= 9; ++i)
    if (res.person_statuses.at("2026-01-08").at("p" + std::to_string(i)) == DayStatus::Base)
      ++forced;
  EXPECT_GE(forced, 5);

  EXPECT_TRUE(AnyWarningMentions(res.warnings, "2026-01-08"));
  EXPECT_EQ(static_cast<int>(res.unfulfilled_constraints.size()), forced);
  EXPECT_LT(res.stats.constraint_stats.percentage, 100);
}

TEST(MinStaffStrategy, UnreachableFloorIsReportedPerDay)
{
  auto res = generate_roster(MinStaffRequest(2, "2026-01-05", "2026-01-07", 3));
  for (const auto& e : res.roster)
    EXPECT_EQ(e.status, DayStatus::Base);
  EXPECT_TRUE(AnyWarningMentions(res.warnings, "not reachable on 2026-01-06"));
}

TEST(MinStaffStrategy, Deterministic)
{
  auto req = MinStaffRequest(9, "2026-03-01", "2026-03-31", 4);
  req.constraints = {NeverAssign("p4", "2026-03-10", "2026-03-20")};
  req.history["p2"] = PersonHistory{DayStatus::Home, 2};

  auto a = generate_roster(req);
  auto b = generate_roster(req);
  EXPECT_EQ(a.person_statuses, b.person_statuses);
  EXPECT_EQ(a.warnings, b.warnings);
}

TEST(MinStaffStrategy, KeepsSeedShareWithoutConstraints)
{
  auto res = generate_roster(MinStaffRequest(20, "2026-01-05", "2026-02-01", 6));

  int lo = 20;
  int hi = 0;
  for (int d = 0; d < 28; ++d)
  {
    const int n = BaseCount(res, ymd_add_days("2026-01-05", d));
    lo = std::min(lo, n);
    hi = std::max(hi, n);
  }
  // 8 of every 14 days on base: about 11 of 20 people per day
  EXPECT_GE(lo, 10);
  EXPECT_LE(hi, 13);
  EXPECT_TRUE(res.warnings.empty());

  // no single-day home breaks inside the horizon
  for (int i = 0; i < 20; ++i)
  {
    const std::string pid = "p" + std::to_string(i);
    for (int d = 1; d + 1 < 28; ++d)
    {
      const auto& prev = res.person_statuses.at(ymd_add_days("2026-01-05", d - 1));
      const auto& cur = res.person_statuses.at(ymd_add_days("2026-01-05", d));
      const auto& next = res.person_statuses.at(ymd_add_days("2026-01-05", d + 1));
      const bool hole = prev.at(pid) == DayStatus::Base && cur.at(pid) == DayStatus::Home &&
                        next.at(pid) == DayStatus::Base;
      EXPECT_FALSE(hole) << pid << " day " << d;
    }
  }
}

TEST(MinStaffRepair, ReleasesOnlyConstrainedSurplus)
{
  auto req = MinStaffRequest(6, "2026-01-05", "2026-01-07", 1);
  req.constraints = {NeverAssign("p0", "2026-01-05", "2026-01-05")};
  const SchedulingContext ctx = build_context(req, EngineOptions{});

  ScheduleGrid grid(6, 3);
  for (size_t p = 0; p < 6; ++p)
    for (int d = 0; d < 3; ++d)
      grid.set(p, d, true);

  RepairStats rs = repair_headcount(grid, ctx, 1, 200);
  EXPECT_EQ(rs.changes, 1);
  EXPECT_FALSE(grid.at(0, 0));
  EXPECT_EQ(grid.headcount[0], 5);
  EXPECT_EQ(grid.headcount[1], 6);
  EXPECT_EQ(grid.headcount[2], 6);
}

TEST(MinStaffRepair, NeverPullsConstrainedPeople)
{
  auto req = MinStaffRequest(3, "2026-01-05", "2026-01-05", 3);
  req.constraints = {NeverAssign("p1", "2026-01-05", "2026-01-05")};
  const SchedulingContext ctx = build_context(req, EngineOptions{});

  ScheduleGrid grid(3, 1);
  repair_headcount(grid, ctx, 3, 10);
  EXPECT_TRUE(grid.at(0, 0));
  EXPECT_FALSE(grid.at(1, 0));
  EXPECT_TRUE(grid.at(2, 0));

  auto warnings = enforce_iron_floor(grid, ctx, 3);
  EXPECT_TRUE(grid.at(1, 0));
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("p1"), std::string::npos);
}
