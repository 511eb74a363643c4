/// @file tests/core/test_calendar.cpp
/// @brief Unit tests for ISO-8601 parsing and the UTC civil breakdown.
///
/// Test categories:
///   - Date-only, minute, second and fractional-second forms
///   - Z, ±HH:MM and ±HHMM offsets
///   - Rejection of impossible dates, hours and offsets
///   - Weekday, month-end and quarter-end derivation
///   - format_iso8601 output

#include <gtest/gtest.h>
#include "fras/calendar.hpp"

using namespace fras::calendar;
using namespace std::chrono;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static sys_seconds utc(int y, unsigned mo, unsigned d, int h = 0, int mi = 0, int s = 0) {
    return sys_days{year{y} / month{mo} / day{d}} + hours{h} + minutes{mi} + seconds{s};
}

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(Calendar_Parse, DateOnlyIsMidnightUtc) {
    const auto t = parse_iso8601("2025-03-31");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, utc(2025, 3, 31));
}

TEST(Calendar_Parse, MinutePrecision) {
    const auto t = parse_iso8601("2025-03-31T23:15");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, utc(2025, 3, 31, 23, 15));
}

TEST(Calendar_Parse, SecondsWithZulu) {
    const auto t = parse_iso8601("2025-01-02T10:00:00Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, utc(2025, 1, 2, 10));
}

TEST(Calendar_Parse, FractionalSecondsTruncated) {
    const auto t = parse_iso8601("2025-03-31T23:15:07.999Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, utc(2025, 3, 31, 23, 15, 7));
}

TEST(Calendar_Parse, SpaceSeparatorAccepted) {
    const auto t = parse_iso8601("2025-03-31 08:30:00");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, utc(2025, 3, 31, 8, 30));
}

TEST(Calendar_Parse, PositiveOffsetConvertedToUtc) {
    const auto t = parse_iso8601("2025-03-31T23:15:07+02:00");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, utc(2025, 3, 31, 21, 15, 7));
}

TEST(Calendar_Parse, NegativeCompactOffsetCrossesMidnight) {
    const auto t = parse_iso8601("2025-03-31T23:15:07-0500");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, utc(2025, 4, 1, 4, 15, 7));
}

TEST(Calendar_Parse, SurroundingWhitespaceIgnored) {
    EXPECT_TRUE(parse_iso8601("  2025-01-02T10:00:00Z \n").has_value());
}

TEST(Calendar_Parse, LeapDayAccepted) {
    EXPECT_TRUE(parse_iso8601("2024-02-29").has_value());
}

TEST(Calendar_Parse, RejectsMalformedInput) {
    EXPECT_FALSE(parse_iso8601("").has_value());
    EXPECT_FALSE(parse_iso8601("not a date").has_value());
    EXPECT_FALSE(parse_iso8601("2025/01/02").has_value());
    EXPECT_FALSE(parse_iso8601("2025-1-2").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T10").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02X10:00").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T10:00:00Zjunk").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T10:00:00.Z").has_value());
}

TEST(Calendar_Parse, RejectsOutOfRangeFields) {
    EXPECT_FALSE(parse_iso8601("2025-13-01").has_value());
    EXPECT_FALSE(parse_iso8601("2025-02-29").has_value());
    EXPECT_FALSE(parse_iso8601("2025-04-31").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T24:00").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T10:60").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T10:00:60").has_value());
}

TEST(Calendar_Parse, RejectsOffsetBeyondEighteenHours) {
    EXPECT_TRUE(parse_iso8601("2025-01-02T10:00:00+18:00").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T10:00:00+18:01").has_value());
    EXPECT_FALSE(parse_iso8601("2025-01-02T10:00:00+05:75").has_value());
}

// ─── Civil breakdown ─────────────────────────────────────────────────────────

TEST(Calendar_Civil, FieldsOfKnownInstant) {
    // 2025-03-31 is a Monday and the last day of Q1.
    const auto c = to_civil(utc(2025, 3, 31, 23, 15, 7));
    EXPECT_EQ(c.year, 2025);
    EXPECT_EQ(c.month, 3u);
    EXPECT_EQ(c.day, 31u);
    EXPECT_EQ(c.hour, 23);
    EXPECT_EQ(c.minute, 15);
    EXPECT_EQ(c.weekday, 1u);
    EXPECT_TRUE(c.is_month_end);
    EXPECT_TRUE(c.is_quarter_end);
}

TEST(Calendar_Civil, WeekendWeekdays) {
    EXPECT_EQ(to_civil(utc(2025, 1, 4)).weekday, 6u);   // Saturday
    EXPECT_EQ(to_civil(utc(2025, 1, 5)).weekday, 0u);   // Sunday
}

TEST(Calendar_Civil, LeapMonthEndIsNotQuarterEnd) {
    const auto c = to_civil(utc(2024, 2, 29, 12));
    EXPECT_TRUE(c.is_month_end);
    EXPECT_FALSE(c.is_quarter_end);
    EXPECT_FALSE(to_civil(utc(2025, 2, 28)).is_quarter_end);
    EXPECT_TRUE(to_civil(utc(2025, 2, 28)).is_month_end);
}

TEST(Calendar_Civil, MidMonthIsNeitherEnd) {
    const auto c = to_civil(utc(2025, 6, 15, 9));
    EXPECT_FALSE(c.is_month_end);
    EXPECT_FALSE(c.is_quarter_end);
}

TEST(Calendar_Civil, PreEpochInstant) {
    const auto c = to_civil(utc(1969, 12, 31, 23, 59, 59));
    EXPECT_EQ(c.year, 1969);
    EXPECT_EQ(c.hour, 23);
    EXPECT_TRUE(c.is_quarter_end);
}

// ─── Formatting ──────────────────────────────────────────────────────────────

TEST(Calendar_Format, CanonicalUtcForm) {
    EXPECT_EQ(format_iso8601(utc(2025, 1, 2, 3, 4, 5)), "2025-01-02T03:04:05Z");
}

TEST(Calendar_Format, ParsesBackToSameInstant) {
    const auto t = *parse_iso8601("2025-07-04T18:30:00+01:00");
    EXPECT_EQ(parse_iso8601(format_iso8601(t)), t);
}
