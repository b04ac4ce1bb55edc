///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "engine.hpp"
#include "demo_instances.hpp"


///////////////////////////
///     STATISTICS      ///
///////////////////////////
static EngineConfig emptyConfig() {
    EngineConfig c;
    c.dataset = DemoSize::EMPTY;
    c.idSeed = 31;
    return c;
}

TEST(StatisticsReporter, EmptyRegistry) {
    EngineState state(emptyConfig());
    Statistics stats = state.reporter.compute(state.registry);
    EXPECT_EQ(stats.totalRooms, 0);
    EXPECT_EQ(stats.totalBookings, 0);
    EXPECT_EQ(stats.utilizedRooms, 0);
    EXPECT_DOUBLE_EQ(stats.utilizationRate, 0.0);
    EXPECT_EQ(stats.conflicts, 0);
}

TEST(StatisticsReporter, RoundsUtilizationToTwoDecimals) {
    EngineState state(emptyConfig());
    ASSERT_TRUE(state.registry.registerRoom("A", "Main", 10, 1, {}));
    ASSERT_TRUE(state.registry.registerRoom("B", "Main", 10, 1, {}));
    ASSERT_TRUE(state.registry.registerRoom("C", "Main", 10, 1, {}));

    Booking b;
    b.date = "2024-01-10";
    b.startMinute = 540;
    b.endMinute = 600;
    b.courseName = "One";
    ASSERT_TRUE(state.importBooking("A", b));
    b.startMinute = 600;
    b.endMinute = 660;
    ASSERT_TRUE(state.importBooking("A", b));

    Statistics stats = state.reporter.compute(state.registry);
    EXPECT_EQ(stats.totalRooms, 3);
    EXPECT_EQ(stats.totalBookings, 2);
    EXPECT_EQ(stats.utilizedRooms, 1);
    EXPECT_DOUBLE_EQ(stats.utilizationRate, 33.33);
    EXPECT_EQ(stats.conflicts, 0);
}

TEST(StatisticsReporter, ConflictCountIsFresh) {
    EngineState state(emptyConfig());
    seedDemoInstance(state, DemoSize::SAMPLE);
    EXPECT_EQ(state.reporter.compute(state.registry).conflicts, 0);

    Booking b;
    b.date = "2024-01-10";
    b.startMinute = 540;
    b.endMinute = 600;
    b.courseName = "Twice";
    ASSERT_TRUE(state.importBooking("101", b));
    ASSERT_TRUE(state.importBooking("101", b));

    Statistics stats = state.reporter.compute(state.registry);
    EXPECT_EQ(stats.conflicts, 1);
    EXPECT_EQ(stats.totalRooms, 7);
    EXPECT_DOUBLE_EQ(stats.utilizationRate, 14.29);
}
