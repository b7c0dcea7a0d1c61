#include <gtest/gtest.h>

#include "utils.h"

using namespace rota;

TEST(DateHelpers, ParsesPlainAndIsoDates)
{
  EXPECT_EQ(parse_ymd("1970-01-01"), 0);
  EXPECT_EQ(parse_ymd("2026-01-05"), parse_ymd("2026-01-05T08:30:00.000Z"));
  EXPECT_EQ(ymd_from_serial(parse_ymd("2024-02-29")), "2024-02-29");
}

TEST(DateHelpers, RejectsMalformedDates)
{
  EXPECT_THROW(parse_ymd("2026-1-05"), ConfigError);
  EXPECT_THROW(parse_ymd("2026-02-30"), ConfigError);
  EXPECT_THROW(parse_ymd("2026-13-01"), ConfigError);
  EXPECT_THROW(parse_ymd(""), ConfigError);
}

TEST(DateHelpers, AddsDaysAcrossMonthAndYear)
{
  EXPECT_EQ(ymd_add_days("2025-12-30", 3), "2026-01-02");
  EXPECT_EQ(ymd_add_days("2024-02-28", 1), "2024-02-29");
  EXPECT_EQ(ymd_add_days("2026-03-01", -1), "2026-02-28");
  EXPECT_EQ(ymd_days_between("2026-01-05", "2026-02-01"), 27);
}

TEST(DateHelpers, WeekdayIsSundayBased)
{
  EXPECT_EQ(weekday_from_serial(parse_ymd("1970-01-01")), 4);  // Thursday
  EXPECT_EQ(weekday_from_serial(parse_ymd("2026-01-05")), 1);  // Monday
  EXPECT_EQ(weekday_from_serial(parse_ymd("2026-01-10")), 6);  // Saturday
  EXPECT_EQ(weekday_from_serial(parse_ymd("1969-12-28")), 0);  // Sunday
}
