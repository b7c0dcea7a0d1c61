#include <gtest/gtest.h>

#include "strategies.h"
#include "test_helpers.h"
#include "utils.h"

using namespace rota;
using namespace rota::test;

namespace
{

TaskSegment Segment(double duration, double rest, int required,
                    SegmentFrequency freq = SegmentFrequency::Daily, bool repeat = false)
{
  TaskSegment s;
  s.id = "s";
  s.name = "guard";
  s.duration_hours = duration;
  s.min_rest_hours_after = rest;
  s.required_people = required;
  s.frequency = freq;
  s.is_repeat = repeat;
  return s;
}

TaskTemplate Template(std::vector<TaskSegment> segments, const std::string& start = "", const std::string& end = "")
{
  TaskTemplate t;
  t.id = "t";
  t.name = "gate";
  t.segments = std::move(segments);
  t.start_date = start;
  t.end_date = end;
  return t;
}

}  // namespace

TEST(TaskFloor, ContinuousSegmentWithRest)
{
  auto tf = compute_task_floor({Template({Segment(8, 8, 2)})}, "2026-01-01", 14);
  EXPECT_EQ(tf.floor, 4);
  EXPECT_TRUE(tf.warnings.empty());
}

TEST(TaskFloor, RoundsUpPartialPeople)
{
  EXPECT_EQ(compute_task_floor({Template({Segment(8, 0, 3)})}, "2026-01-01", 7).floor, 3);
  EXPECT_EQ(compute_task_floor({Template({Segment(8, 4, 1)})}, "2026-01-01", 7).floor, 2);
  EXPECT_EQ(compute_task_floor({Template({Segment(12, 12, 1), Segment(8, 16, 1)})}, "2026-01-01", 7).floor, 5);
}

TEST(TaskFloor, OnlyDailyOrRepeatingSegmentsCount)
{
  auto tf = compute_task_floor({Template({Segment(8, 8, 2, SegmentFrequency::Weekly),
                                          Segment(4, 0, 5, SegmentFrequency::Once),
                                          Segment(6, 6, 1, SegmentFrequency::Weekly, true)})},
                               "2026-01-01", 14);
  EXPECT_EQ(tf.floor, 2);
}

TEST(TaskFloor, ZeroDurationSegmentIsSkippedWithWarning)
{
  auto tf = compute_task_floor({Template({Segment(0, 8, 2), Segment(8, 8, 1)})}, "2026-01-01", 14);
  EXPECT_EQ(tf.floor, 2);
  ASSERT_EQ(tf.warnings.size(), 1u);
  EXPECT_NE(tf.warnings[0].find("gate"), std::string::npos);
}

TEST(TaskFloor, TemplatesOutsideHorizonAreIgnored)
{
  std::vector<TaskTemplate> tasks = {
      Template({Segment(8, 8, 2)}, "2025-01-01", "2025-12-31"),
      Template({Segment(8, 8, 1)}, "2026-01-10", ""),
      Template({Segment(8, 8, 1)}, "2026-02-01", "")};
  EXPECT_EQ(compute_task_floor(tasks, "2026-01-01", 14).floor, 2);
}

TEST(TaskDemandStrategy, UsesLargerOfTaskAndCallerFloor)
{
  auto req = MakeRequest("2026-01-01", "2026-01-14", MakePeople(8), OptimizationMode::Tasks);
  req.tasks = {Template({Segment(8, 8, 2)})};

  req.custom_min_staff = 0;
  auto ctx = build_context(req, EngineOptions{});
  StrategyOutput out = task_demand_strategy(ctx);
  EXPECT_EQ(out.min_staff, 4);
  for (int d = 0; d < out.grid.days(); ++d)
    EXPECT_GE(out.grid.headcount[d], 4);

  req.custom_min_staff = 6;
  ctx = build_context(req, EngineOptions{});
  out = task_demand_strategy(ctx);
  EXPECT_EQ(out.min_staff, 6);
  for (int d = 0; d < out.grid.days(); ++d)
    EXPECT_GE(out.grid.headcount[d], 6);
}

TEST(TaskDemandStrategy, ReportsAppliedFloor)
{
  auto req = MakeRequest("2026-01-01", "2026-01-14", MakePeople(6), OptimizationMode::Tasks);
  req.tasks = {Template({Segment(8, 8, 2)})};

  auto res = generate_roster(req);
  EXPECT_EQ(res.mode, OptimizationMode::Tasks);
  EXPECT_EQ(res.min_staff, 4);
  for (int d = 0; d < 14; ++d)
    EXPECT_GE(BaseCount(res, ymd_add_days("2026-01-01", d)), 4);
}

TEST(TaskDemandStrategy, TasksModeWithoutTemplatesIsConfigError)
{
  auto req = MakeRequest("2026-01-01", "2026-01-14", MakePeople(3), OptimizationMode::Tasks);
  EXPECT_THROW(generate_roster(req), ConfigError);
}
