/**
 * @file test_game_time.cpp
 * @brief Unit tests for TimePoint, Duration and calendar conversion
 */

#include "orrery/config.hpp"
#include "orrery/game_time.hpp"
#include <gtest/gtest.h>

#include <stdexcept>

using namespace orrery;

/* ============================================================================
 * TimePoint and Duration Tests
 * ========================================================================= */

TEST(TimeTypesTest, TimePointComparison)
{
   TimePoint t1{100};
   TimePoint t2{200};
   TimePoint t3{100};

   EXPECT_TRUE(t1 < t2);
   EXPECT_TRUE(t1 <= t2);
   EXPECT_TRUE(t2 > t1);
   EXPECT_TRUE(t2 >= t1);
   EXPECT_TRUE(t1 == t3);
   EXPECT_TRUE(t1 != t2);
}

TEST(TimeTypesTest, DurationArithmetic)
{
   TimePoint t1{100};
   Duration d1{50};
   Duration d2{30};

   EXPECT_EQ((t1 + d1).value, 150);
   EXPECT_EQ((d1 + t1).value, 150);
   EXPECT_EQ((d1 + d2).value, 80u);
   EXPECT_EQ((d1 - d2).value, 20u);

   Duration d3{10};
   d3 += Duration{5};
   EXPECT_EQ(d3.value, 15u);
   d3 -= Duration{15};
   EXPECT_TRUE(d3.is_zero());
}

TEST(TimeTypesTest, DurationBetween)
{
   TimePoint t1{100};
   TimePoint t2{150};

   EXPECT_EQ(duration_between(t2, t1).value, 50u);

   // Reverse should give 0 (no negative durations)
   EXPECT_EQ(duration_between(t1, t2).value, 0u);
   EXPECT_EQ(duration_between(t1, t1).value, 0u);
}

TEST(TimeTypesTest, DurationHelpers)
{
   EXPECT_EQ(Duration::minutes(2).value, 120u);
   EXPECT_EQ(Duration::hours(1).value, 3600u);
   EXPECT_EQ(Duration::days(1).value, 86400u);
   EXPECT_EQ(Duration::max().value, UINT64_MAX);
   EXPECT_TRUE(Duration{12345} < Duration::max());
}

/* ============================================================================
 * Calendar Tests
 * ========================================================================= */

TEST(CalendarTest, EpochFormatsAsUnixEpoch)
{
   EXPECT_EQ(format_date(TimePoint{0}), "1970-01-01 00:00:00");
   EXPECT_EQ(format_date(TimePoint{86399}), "1970-01-01 23:59:59");
}

TEST(CalendarTest, DefaultStartDateIs2050)
{
   EXPECT_EQ(format_date(TimePoint{config::DEFAULT_START_DATE}), "2050-01-01 00:00:00");
   EXPECT_EQ(make_date(2050, 1, 1), TimePoint{config::DEFAULT_START_DATE});
}

TEST(CalendarTest, DatesBeforeEpoch)
{
   EXPECT_EQ(format_date(TimePoint{-1}), "1969-12-31 23:59:59");
   EXPECT_EQ(make_date(1969, 12, 31, 23, 59, 59), TimePoint{-1});
}

TEST(CalendarTest, LeapDay)
{
   TimePoint const leap = make_date(2048, 2, 29, 12, 30, 15);
   EXPECT_EQ(format_date(leap), "2048-02-29 12:30:15");
   EXPECT_EQ(format_date(leap + Duration::days(1)), "2048-03-01 12:30:15");

   EXPECT_THROW((void)make_date(2049, 2, 29), std::invalid_argument);
}

TEST(CalendarTest, ParseRoundTripsFormat)
{
   TimePoint const tp = make_date(2051, 7, 4, 8, 5, 3);
   EXPECT_EQ(parse_date(format_date(tp)), tp);

   EXPECT_EQ(parse_date("2050-01-01"), TimePoint{config::DEFAULT_START_DATE});
   EXPECT_EQ(parse_date("2050-01-01T00:00:05"), TimePoint{config::DEFAULT_START_DATE + 5});
}

TEST(CalendarTest, WideYearsRoundTrip)
{
   TimePoint const far_future = make_date(10000, 1, 1);
   EXPECT_EQ(format_date(far_future), "10000-01-01 00:00:00");
   EXPECT_EQ(parse_date(format_date(far_future)), far_future);
   EXPECT_EQ(parse_date("10000-01-01"), far_future);

   TimePoint const far_past = make_date(-1000, 3, 15, 6, 7, 8);
   EXPECT_EQ(format_date(far_past), "-1000-03-15 06:07:08");
   EXPECT_EQ(parse_date(format_date(far_past)), far_past);

   TimePoint const year_minus_one = make_date(-1, 12, 31);
   EXPECT_EQ(parse_date(format_date(year_minus_one)), year_minus_one);
}

TEST(CalendarTest, ParseRejectsMalformedInput)
{
   EXPECT_THROW((void)parse_date(""), std::invalid_argument);
   EXPECT_THROW((void)parse_date("2050/01/01"), std::invalid_argument);
   EXPECT_THROW((void)parse_date("2050-13-01"), std::invalid_argument);
   EXPECT_THROW((void)parse_date("2050-01-01 24:00:00"), std::invalid_argument);
   EXPECT_THROW((void)parse_date("2050-01-0x"), std::invalid_argument);
   EXPECT_THROW((void)parse_date("2050-01-01 12-00-00"), std::invalid_argument);
   EXPECT_THROW((void)parse_date("20-50-01-01"), std::invalid_argument);
   EXPECT_THROW((void)parse_date("+2050-01-01"), std::invalid_argument);
}

TEST(CalendarTest, InvalidTimeOfDayRejected)
{
   EXPECT_THROW((void)make_date(2050, 1, 1, 24), std::invalid_argument);
   EXPECT_THROW((void)make_date(2050, 1, 1, 0, 60), std::invalid_argument);
   EXPECT_THROW((void)make_date(2050, 1, 1, 0, 0, 60), std::invalid_argument);
}
