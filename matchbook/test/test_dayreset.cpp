#include "../src/dayreset.hpp"
#include <gtest/gtest.h>

#include <stdexcept>

using namespace matchbook;

namespace {

constexpr Timestamp kDay = 20003ULL * kNanosPerDay;
constexpr Timestamp kHour = 60ULL * kNanosPerMinute;

} // namespace

TEST(DayResetScheduleTest, DefaultsToEndOfSession)
{
    DayResetSchedule schedule;
    EXPECT_EQ(15, schedule.hour);
    EXPECT_EQ(59, schedule.minute);
    EXPECT_NO_THROW(schedule.validate());
}

TEST(DayResetScheduleTest, Validate)
{
    EXPECT_NO_THROW((DayResetSchedule{0, 0}.validate()));
    EXPECT_NO_THROW((DayResetSchedule{23, 59}.validate()));
    EXPECT_THROW((DayResetSchedule{24, 0}.validate()), std::invalid_argument);
    EXPECT_THROW((DayResetSchedule{-1, 0}.validate()), std::invalid_argument);
    EXPECT_THROW((DayResetSchedule{10, 60}.validate()), std::invalid_argument);
    EXPECT_THROW((DayResetSchedule{10, -5}.validate()), std::invalid_argument);
}

TEST(DayResetScheduleTest, LastBoundary)
{
    DayResetSchedule schedule{16, 30};
    Timestamp boundary = kDay + 16 * kHour + 30 * kNanosPerMinute;

    EXPECT_EQ(boundary - kNanosPerDay, schedule.lastBoundary(kDay + 9 * kHour));
    EXPECT_EQ(boundary, schedule.lastBoundary(boundary));
    EXPECT_EQ(boundary, schedule.lastBoundary(boundary + kHour));
}

TEST(DayResetScheduleTest, NextBoundary)
{
    DayResetSchedule schedule{16, 30};
    Timestamp boundary = kDay + 16 * kHour + 30 * kNanosPerMinute;

    EXPECT_EQ(boundary, schedule.nextBoundary(kDay + 9 * kHour));
    EXPECT_EQ(boundary + kNanosPerDay, schedule.nextBoundary(boundary));
    EXPECT_EQ(boundary + kNanosPerDay, schedule.nextBoundary(boundary + kHour));
}

TEST(DayResetScheduleTest, MidnightBoundary)
{
    DayResetSchedule schedule{0, 0};

    EXPECT_EQ(kDay, schedule.lastBoundary(kDay + kHour));
    EXPECT_EQ(kDay + kNanosPerDay, schedule.nextBoundary(kDay));
}

TEST(DayResetScheduleTest, BeforeFirstBoundarySinceEpoch)
{
    DayResetSchedule schedule{12, 0};
    EXPECT_EQ(0u, schedule.lastBoundary(kHour));
    EXPECT_EQ(12 * kHour, schedule.nextBoundary(kHour));
}

TEST(DayResetScheduleTest, ToStringPadsFields)
{
    EXPECT_EQ("16:00", toString(DayResetSchedule{16, 0}));
    EXPECT_EQ("09:05", toString(DayResetSchedule{9, 5}));
    EXPECT_EQ("15:59", toString(DayResetSchedule{}));
}
