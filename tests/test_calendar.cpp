///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "calendar.hpp"
#include <cctype>
#include <set>


///////////////////////////
///     BOOKING IDS     ///
///////////////////////////
TEST(BookingIdGenerator, ProducesWellFormedIds) {
    BookingIdGenerator ids(42);
    std::string id = ids.next();

    ASSERT_EQ(id.size(), 2u + 14u + (size_t)BookingIdGenerator::SUFFIX_LENGTH);
    EXPECT_EQ(id.substr(0, 2), "BK");
    for (size_t i = 2; i < 16; ++i) {
        EXPECT_TRUE(std::isdigit((unsigned char)id[i])) << id;
    }
    for (size_t i = 16; i < id.size(); ++i) {
        char c = id[i];
        EXPECT_TRUE((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) << id;
    }
}

TEST(BookingIdGenerator, NeverRepeatsAnId) {
    BookingIdGenerator ids(7);
    std::set<std::string> seen;
    for (int i = 0; i < 2000; ++i) {
        EXPECT_TRUE(seen.insert(ids.next()).second);
    }
}

TEST(BookingIdGenerator, ReserveBlocksReuse) {
    BookingIdGenerator ids(1);
    EXPECT_TRUE(ids.reserve("BK-IMPORTED"));
    EXPECT_TRUE(ids.isIssued("BK-IMPORTED"));
    EXPECT_FALSE(ids.reserve("BK-IMPORTED"));

    std::string generated = ids.next();
    EXPECT_FALSE(ids.reserve(generated));
}


///////////////////////////
///      CALENDAR       ///
///////////////////////////
class BookingCalendarTest : public ::testing::Test {
protected:
    BookingIdGenerator ids{99};
    BookingCalendar calendar;

    void SetUp() override {
        calendar.book(ids, "2024-01-10", 9 * 60, 10 * 60, "Calculus", "Dr. Smith");
    }
};

TEST_F(BookingCalendarTest, BookStoresRecord) {
    ASSERT_EQ(calendar.size(), 1u);
    const Booking& b = calendar.bookings()[0];
    EXPECT_EQ(b.courseName, "Calculus");
    EXPECT_EQ(b.instructor, "Dr. Smith");
    EXPECT_EQ(b.date, "2024-01-10");
    EXPECT_FALSE(b.createdAt.empty());
    EXPECT_TRUE(ids.isIssued(b.bookingId));
}

TEST_F(BookingCalendarTest, OverlapMakesSlotUnavailable) {
    EXPECT_FALSE(calendar.isAvailable("2024-01-10", 9 * 60 + 30, 10 * 60 + 30));
    EXPECT_FALSE(calendar.isAvailable("2024-01-10", 8 * 60, 11 * 60));
    EXPECT_FALSE(calendar.isAvailable("2024-01-10", 9 * 60 + 15, 9 * 60 + 45));
}

TEST_F(BookingCalendarTest, TouchingIntervalsAreAvailable) {
    EXPECT_TRUE(calendar.isAvailable("2024-01-10", 10 * 60, 11 * 60));
    EXPECT_TRUE(calendar.isAvailable("2024-01-10", 8 * 60, 9 * 60));
}

TEST_F(BookingCalendarTest, OtherDatesAreIndependent) {
    EXPECT_TRUE(calendar.isAvailable("2024-01-11", 9 * 60, 10 * 60));
}

TEST_F(BookingCalendarTest, AppendAcceptsOverlapsAndSortsByDateThenStart) {
    Booking late{"BK-A", "2024-01-10", 9 * 60 + 30, 11 * 60, "Overlap", "", "2024-01-01T00:00:00"};
    Booking earlier{"BK-B", "2024-01-09", 14 * 60, 15 * 60, "Earlier day", "", "2024-01-01T00:00:00"};
    calendar.append(late);
    calendar.append(earlier);

    ASSERT_EQ(calendar.size(), 3u);
    auto sorted = calendar.sortedByStart();
    EXPECT_EQ(sorted[0].bookingId, "BK-B");
    EXPECT_EQ(sorted[1].courseName, "Calculus");
    EXPECT_EQ(sorted[2].bookingId, "BK-A");

    // Insertion order is untouched.
    EXPECT_EQ(calendar.bookings()[1].bookingId, "BK-A");
}
