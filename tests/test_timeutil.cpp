///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "timeutil.hpp"


///////////////////////////
///     CLOCK TIMES     ///
///////////////////////////
TEST(ClockTime, ParsesZeroPaddedTimes) {
    EXPECT_EQ(parseClockTime("00:00"), 0);
    EXPECT_EQ(parseClockTime("09:30"), 570);
    EXPECT_EQ(parseClockTime("23:59"), 1439);
}

TEST(ClockTime, AcceptsEndOfDayMarker) {
    EXPECT_EQ(parseClockTime("24:00"), MINUTES_PER_DAY);
    EXPECT_FALSE(parseClockTime("24:01"));
}

TEST(ClockTime, RejectsMalformedInput) {
    EXPECT_FALSE(parseClockTime("9:30"));
    EXPECT_FALSE(parseClockTime("09-30"));
    EXPECT_FALSE(parseClockTime("25:00"));
    EXPECT_FALSE(parseClockTime("10:60"));
    EXPECT_FALSE(parseClockTime("ab:cd"));
    EXPECT_FALSE(parseClockTime(""));
}

TEST(ClockTime, FormatsWithPadding) {
    EXPECT_EQ(formatClockTime(0), "00:00");
    EXPECT_EQ(formatClockTime(545), "09:05");
    EXPECT_EQ(formatClockTime(MINUTES_PER_DAY), "24:00");
}


///////////////////////////
///        DATES        ///
///////////////////////////
TEST(IsoDate, ValidatesShape) {
    EXPECT_TRUE(isIsoDate("2024-01-10"));
    EXPECT_FALSE(isIsoDate("2024-1-10"));
    EXPECT_FALSE(isIsoDate("2024/01/10"));
    EXPECT_FALSE(isIsoDate("2024-13-01"));
    EXPECT_FALSE(isIsoDate("2024-00-10"));
    EXPECT_FALSE(isIsoDate("2024-01-32"));
    EXPECT_FALSE(isIsoDate(""));
}

TEST(IsoDate, KeyPreservesOrderAndRoundTrips) {
    EXPECT_EQ(dateKey("2024-01-10"), 20240110);
    EXPECT_EQ(dateKey("bad"), -1);
    EXPECT_LT(dateKey("2023-12-31"), dateKey("2024-01-01"));
    EXPECT_EQ(dateFromKey(20240108), "2024-01-08");
}

TEST(Timestamps, HaveExpectedShape) {
    std::string iso = nowIsoTimestamp();
    ASSERT_EQ(iso.size(), 19u);
    EXPECT_EQ(iso[10], 'T');

    std::string compact = nowCompactTimestamp();
    EXPECT_EQ(compact.size(), 14u);
}
