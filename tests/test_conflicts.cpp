///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "engine.hpp"


///////////////////////////
///      FIXTURES       ///
///////////////////////////
/**
 * @brief Two unrelated rooms whose bookings are imported directly.
 */
class ConflictAuditorTest : public ::testing::Test {
protected:
    EngineConfig config = []() {
        EngineConfig c;
        c.dataset = DemoSize::EMPTY;
        c.idSeed = 17;
        return c;
    }();
    EngineState state{config};

    void SetUp() override {
        ASSERT_TRUE(state.registry.registerRoom("R1", "Main", 30, 1, {}));
        ASSERT_TRUE(state.registry.registerRoom("R2", "Arts", 300, 1, {}));
    }

    void import(const std::string& roomId, const std::string& id, const std::string& date,
                int start, int end) {
        Booking b;
        b.bookingId = id;
        b.date = date;
        b.startMinute = start;
        b.endMinute = end;
        b.courseName = "Course " + id;
        ASSERT_TRUE(state.importBooking(roomId, b));
    }
};


///////////////////////////
///       AUDITS        ///
///////////////////////////
TEST_F(ConflictAuditorTest, CleanCalendarsHaveNoConflicts) {
    import("R1", "A", "2024-01-10", 540, 600);
    import("R1", "B", "2024-01-10", 600, 660);
    import("R1", "C", "2024-01-11", 540, 600);
    import("R2", "D", "2024-01-10", 540, 600);

    EXPECT_TRUE(state.auditor.audit(state.registry).empty());
    EXPECT_EQ(state.auditor.countConflicts(state.registry), 0);
}

TEST_F(ConflictAuditorTest, ReportsOverlapOnceInStartOrder) {
    import("R1", "LATE", "2024-01-10", 570, 630);
    import("R1", "EARLY", "2024-01-10", 540, 600);

    auto conflicts = state.auditor.audit(state.registry);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].roomId, "R1");
    EXPECT_EQ(conflicts[0].first.bookingId, "EARLY");
    EXPECT_EQ(conflicts[0].second.bookingId, "LATE");
}

TEST_F(ConflictAuditorTest, ReportsNonNeighbouringPairs) {
    // LONG overlaps both SHORT1 and SHORT2; the shorts do not overlap each other.
    import("R1", "LONG", "2024-01-10", 480, 720);
    import("R1", "SHORT1", "2024-01-10", 540, 600);
    import("R1", "SHORT2", "2024-01-10", 630, 690);

    auto conflicts = state.auditor.audit(state.registry);
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].first.bookingId, "LONG");
    EXPECT_EQ(conflicts[0].second.bookingId, "SHORT1");
    EXPECT_EQ(conflicts[1].first.bookingId, "LONG");
    EXPECT_EQ(conflicts[1].second.bookingId, "SHORT2");
}

TEST_F(ConflictAuditorTest, SameSlotOnDifferentDatesOrRoomsIsFine) {
    import("R1", "A", "2024-01-10", 540, 600);
    import("R1", "B", "2024-01-11", 540, 600);
    import("R2", "C", "2024-01-10", 540, 600);

    EXPECT_EQ(state.auditor.countConflicts(state.registry), 0);
}

TEST_F(ConflictAuditorTest, RoomsAreReportedInRegistrationOrder) {
    import("R2", "X1", "2024-01-10", 540, 600);
    import("R2", "X2", "2024-01-10", 545, 600);
    import("R1", "Y1", "2024-01-12", 540, 600);
    import("R1", "Y2", "2024-01-12", 540, 600);

    auto conflicts = state.auditor.audit(state.registry);
    ASSERT_EQ(conflicts.size(), 2u);
    EXPECT_EQ(conflicts[0].roomId, "R1");
    EXPECT_EQ(conflicts[1].roomId, "R2");
    EXPECT_EQ(state.auditor.countConflicts(state.registry), 2);
}

TEST_F(ConflictAuditorTest, AllocatedBookingsNeverConflict) {
    int granted = 0;
    for (int i = 0; i < 20; ++i) {
        AllocationRequest req;
        req.courseName = "Busy " + std::to_string(i);
        req.date = "2024-01-10";
        req.startMinute = 540;
        req.endMinute = 600;
        req.capacity = 10;
        if (state.allocator.allocate(req)) granted++;
    }
    EXPECT_EQ(granted, 2);
    EXPECT_EQ(state.registry.find("R1")->calendar().size(), 1u);
    EXPECT_EQ(state.registry.find("R2")->calendar().size(), 1u);
    EXPECT_TRUE(state.auditor.audit(state.registry).empty());
}


///////////////////////////
///       IMPORTS       ///
///////////////////////////
TEST_F(ConflictAuditorTest, ImportRejectsBadRecords) {
    Booking b;
    b.date = "2024-01-10";
    b.startMinute = 600;
    b.endMinute = 540;
    b.courseName = "Backwards";
    EXPECT_EQ(state.importBooking("R1", b).error().kind, ErrorKind::INVALID_REQUEST);

    b.endMinute = 660;
    EXPECT_EQ(state.importBooking("R9", b).error().kind, ErrorKind::ROOM_NOT_FOUND);

    b.bookingId = "DUP";
    ASSERT_TRUE(state.importBooking("R1", b));
    EXPECT_EQ(state.importBooking("R2", b).error().kind, ErrorKind::INVALID_REQUEST);
}

TEST_F(ConflictAuditorTest, ImportGeneratesMissingIdAndTimestamp) {
    Booking b;
    b.date = "2024-01-10";
    b.startMinute = 540;
    b.endMinute = 600;
    b.courseName = "Feed";

    auto id = state.importBooking("R1", b);
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value().substr(0, 2), "BK");
    const Booking& stored = state.registry.find("R1")->calendar().bookings()[0];
    EXPECT_EQ(stored.bookingId, id.value());
    EXPECT_FALSE(stored.createdAt.empty());
}
