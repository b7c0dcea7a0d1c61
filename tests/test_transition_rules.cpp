#include <gtest/gtest.h>

#include "test_helpers.h"
#include "transition_rules.h"

using namespace rota;
using namespace rota::test;

namespace
{

constexpr int kSaturday = 6;

// One person, Mon 2026-01-05 .. Sun 2026-01-11, Base Mon-Fri and Home Sat-Sun.
struct WeekFixture
{
  SchedulingContext ctx;
  ScheduleGrid grid{1, 7};

  explicit WeekFixture(std::vector<SchedulingConstraint> constraints = {})
  {
    auto req = MakeRequest("2026-01-05", "2026-01-11", MakePeople(1));
    req.constraints = std::move(constraints);
    EngineOptions opts;
    opts.no_transition_weekday = kSaturday;
    ctx = build_context(req, opts);
    for (int d = 0; d < 5; ++d)
      grid.set(0, d, true);
  }
};

}  // namespace

TEST(TransitionRules, FiveTwoFromMondayAvoidsSaturdayDeparture)
{
  auto req = MakeRequest("2026-01-05", "2026-01-18", MakePeople(1));
  req.custom_rotation = RotationConfig{5, 2};
  EngineOptions opts;
  opts.no_transition_weekday = kSaturday;

  auto res = generate_roster(req, opts);
  const auto& day = res.person_statuses;
  EXPECT_TRUE(day.at("2026-01-10").at("p0") == DayStatus::Base ||
              day.at("2026-01-09").at("p0") != DayStatus::Base);
  EXPECT_TRUE(day.at("2026-01-17").at("p0") == DayStatus::Base ||
              day.at("2026-01-16").at("p0") != DayStatus::Base);
}

TEST(TransitionRules, DisabledByDefault)
{
  auto req = MakeRequest("2026-01-05", "2026-01-11", MakePeople(1));
  req.custom_rotation = RotationConfig{5, 2};

  auto res = generate_roster(req);
  EXPECT_EQ(res.person_statuses.at("2026-01-09").at("p0"), DayStatus::Base);
  EXPECT_EQ(res.person_statuses.at("2026-01-10").at("p0"), DayStatus::Home);
}

TEST(TransitionRules, ExitMovesToDayBeforeWhenFloorAllows)
{
  WeekFixture f;
  auto warnings = apply_transition_rules(f.grid, f.ctx, 0);
  EXPECT_TRUE(warnings.empty());
  EXPECT_FALSE(f.grid.at(0, 4));  // Friday
  EXPECT_FALSE(f.grid.at(0, 5));  // Saturday
}

TEST(TransitionRules, ExitStaysThroughWeekdayWhenFloorBlocksEarlyLeave)
{
  WeekFixture f;
  auto warnings = apply_transition_rules(f.grid, f.ctx, 1);
  EXPECT_TRUE(warnings.empty());
  EXPECT_TRUE(f.grid.at(0, 4));
  EXPECT_TRUE(f.grid.at(0, 5));
}

TEST(TransitionRules, StuckExitIsWarned)
{
  WeekFixture f({NeverAssign("p0", "2026-01-10", "2026-01-10")});
  auto warnings = apply_transition_rules(f.grid, f.ctx, 1);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("2026-01-10"), std::string::npos);
  EXPECT_FALSE(f.grid.at(0, 5));
}

TEST(TransitionRules, EntryMovesToDayBefore)
{
  WeekFixture f;
  for (int d = 0; d < 7; ++d)
    f.grid.set(0, d, d >= 5);  // arrives Saturday

  auto warnings = apply_transition_rules(f.grid, f.ctx, 0);
  EXPECT_TRUE(warnings.empty());
  EXPECT_TRUE(f.grid.at(0, 4));
}

TEST(TransitionRules, EntryAfterHardDayMovesLater)
{
  WeekFixture f({NeverAssign("p0", "2026-01-09", "2026-01-09")});
  for (int d = 0; d < 7; ++d)
    f.grid.set(0, d, d >= 5);

  auto warnings = apply_transition_rules(f.grid, f.ctx, 0);
  EXPECT_TRUE(warnings.empty());
  EXPECT_FALSE(f.grid.at(0, 4));
  EXPECT_FALSE(f.grid.at(0, 5));
  EXPECT_TRUE(f.grid.at(0, 6));
}
