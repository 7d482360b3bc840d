// File: tests/utils/TimeUtilsTest.cpp
#include "utils/TimeUtils.hpp"
#include "TestHelpers.hpp"
#include <gtest/gtest.h>

using namespace testing_helpers;

namespace {

// ============================================================================
// ISO-8601
// ============================================================================

TEST(TimeUtilsTest, IsoFormatIsUtcWithMilliseconds) {
    EXPECT_EQ("1970-01-01T00:00:00.000Z", TimeUtils::toIso(TimeUtils::fromEpochMillis(0)));
    EXPECT_EQ("2026-10-19T08:30:00.123Z", TimeUtils::toIso(TimeUtils::fromEpochMillis(1792398600123LL)));
    EXPECT_EQ("1969-12-31T23:59:59.500Z", TimeUtils::toIso(TimeUtils::fromEpochMillis(-500)));
}

TEST(TimeUtilsTest, ParsesUtcAndOffsets) {
    auto utc = TimeUtils::fromIso("2026-10-19T08:30:00.123Z");
    ASSERT_TRUE(utc.has_value());
    EXPECT_EQ(1792398600123LL, TimeUtils::toEpochMillis(*utc));

    auto offset = TimeUtils::fromIso("2026-10-19T08:30:00+02:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(1792391400000LL, TimeUtils::toEpochMillis(*offset));

    auto leap = TimeUtils::fromIso("2024-02-29T23:59:59Z");
    ASSERT_TRUE(leap.has_value());
    EXPECT_EQ(1709251199000LL, TimeUtils::toEpochMillis(*leap));

    auto shortFraction = TimeUtils::fromIso("2026-10-19T08:30:00.1Z");
    ASSERT_TRUE(shortFraction.has_value());
    EXPECT_EQ(1792398600100LL, TimeUtils::toEpochMillis(*shortFraction));
}

TEST(TimeUtilsTest, RejectsGarbage) {
    EXPECT_FALSE(TimeUtils::fromIso("").has_value());
    EXPECT_FALSE(TimeUtils::fromIso("yesterday").has_value());
    EXPECT_FALSE(TimeUtils::fromIso("2026-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(TimeUtils::fromIso("2026-10-19T08:30:00Zjunk").has_value());
    EXPECT_FALSE(TimeUtils::fromIso("2026-10-19T08:30:00.Z").has_value());
}

TEST(TimeUtilsTest, RejectsYearsTheClockCannotHold) {
    EXPECT_FALSE(TimeUtils::fromIso("0001-01-01T00:00:00.000Z").has_value());
    EXPECT_FALSE(TimeUtils::fromIso("9999-12-31T23:59:59.999Z").has_value());

    auto early = TimeUtils::fromIso("1700-01-01T00:00:00.000Z");
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ("1700-01-01T00:00:00.000Z", TimeUtils::toIso(*early));
}

TEST(TimeUtilsTest, IsoSurvivesEncoding) {
    const TimePoint t = TimeUtils::fromEpochMillis(1792398600123LL);
    auto back = TimeUtils::fromIso(TimeUtils::toIso(t));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(t, *back);
}

// ============================================================================
// Calendar arithmetic (local time)
// ============================================================================

TEST(TimeUtilsTest, AddDaysKeepsTimeOfDay) {
    const TimePoint start = referenceNow();

    EXPECT_EQ(TimeUtils::makeLocal(2026, 6, 22, 12, 0, 0), TimeUtils::addDays(start, 7));
    EXPECT_EQ(TimeUtils::makeLocal(2026, 7, 1, 12, 0, 0), TimeUtils::addDays(start, 16));
    EXPECT_EQ(TimeUtils::makeLocal(2026, 6, 10, 12, 0, 0), TimeUtils::addDays(start, -5));
    EXPECT_EQ(start, TimeUtils::addDays(start, 0));
}

TEST(TimeUtilsTest, AddMonthsNormalisesOverflow) {
    EXPECT_EQ("2026-03-03", TimeUtils::dateKey(TimeUtils::addMonths(TimeUtils::makeLocal(2026, 1, 31, 12), 1)));
    EXPECT_EQ("2027-01-15", TimeUtils::dateKey(TimeUtils::addMonths(TimeUtils::makeLocal(2026, 12, 15, 12), 1)));
    EXPECT_EQ("2026-05-15", TimeUtils::dateKey(TimeUtils::addMonths(referenceNow(), -1)));
}

TEST(TimeUtilsTest, EndOfDayIsLastLocalMillisecond) {
    const TimePoint eod = TimeUtils::endOfDay(referenceNow());

    EXPECT_EQ("2026-06-15", TimeUtils::dateKey(eod));
    EXPECT_EQ("2026-06-16", TimeUtils::dateKey(eod + std::chrono::milliseconds(1)));
    EXPECT_EQ(TimeUtils::makeLocal(2026, 6, 16) - std::chrono::milliseconds(1), eod);
}

TEST(TimeUtilsTest, DateKeyUsesLocalCalendar) {
    EXPECT_EQ("2026-06-15", TimeUtils::dateKey(TimeUtils::makeLocal(2026, 6, 15, 0, 0, 0)));
    EXPECT_EQ("2026-06-15", TimeUtils::dateKey(TimeUtils::makeLocal(2026, 6, 15, 23, 59, 59)));
}

}  // namespace
