///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "activity_log.hpp"
#include <algorithm>
#include <sstream>
#include <string>


///////////////////////////
///    ACTIVITY LOG     ///
///////////////////////////
TEST(ActivityLog, ReadsMostRecentFirst) {
    ActivityLog log;
    log.record(LogCategory::INFO, "first");
    log.record(LogCategory::SUCCESS, "second");
    log.record(LogCategory::ERROR, "third");

    auto entries = log.readAll();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "third");
    EXPECT_EQ(entries[1].message, "second");
    EXPECT_EQ(entries[2].message, "first");
    EXPECT_EQ(entries[0].category, LogCategory::ERROR);
    EXPECT_FALSE(entries[0].timestamp.empty());
}

TEST(ActivityLog, EvictsOldestBeyondCapacity) {
    ActivityLog log;
    EXPECT_EQ(log.capacity(), ActivityLog::DEFAULT_CAPACITY);

    for (int i = 0; i < 150; ++i) {
        log.record(LogCategory::INFO, "event " + std::to_string(i));
    }

    auto entries = log.readAll();
    ASSERT_EQ(entries.size(), 100u);
    EXPECT_EQ(entries.front().message, "event 149");
    EXPECT_EQ(entries.back().message, "event 50");
}

TEST(ActivityLog, ZeroCapacityKeepsOneEntry) {
    ActivityLog log(0);
    log.record(LogCategory::INFO, "a");
    log.record(LogCategory::INFO, "b");
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.readAll()[0].message, "b");
}

TEST(ActivityLog, FiltersByCategory) {
    ActivityLog log;
    log.record(LogCategory::INFO, "i1");
    log.record(LogCategory::ERROR, "e1");
    log.record(LogCategory::INFO, "i2");

    auto infos = log.filter(LogCategory::INFO);
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_EQ(infos[0].message, "i2");
    EXPECT_EQ(infos[1].message, "i1");
    EXPECT_TRUE(log.filter(LogCategory::SUCCESS).empty());
}

TEST(ActivityLog, ExportsOneLinePerEntry) {
    ActivityLog log;
    log.record(LogCategory::SUCCESS, "Allocated Main 101");
    log.record(LogCategory::ERROR, "No suitable rooms for X");

    std::string text = log.exportText();
    size_t firstError = text.find("[ERROR] No suitable rooms for X");
    size_t firstSuccess = text.find("[SUCCESS] Allocated Main 101");
    ASSERT_NE(firstError, std::string::npos);
    ASSERT_NE(firstSuccess, std::string::npos);
    EXPECT_LT(firstError, firstSuccess);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);
}

TEST(ActivityLog, ClearLeavesMarkerEntry) {
    ActivityLog log;
    log.record(LogCategory::ERROR, "boom");
    log.clear();

    auto entries = log.readAll();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "Logs cleared by user");
    EXPECT_EQ(entries[0].category, LogCategory::INFO);
}

TEST(ActivityLog, EchoesToSink) {
    std::ostringstream sink;
    ActivityLog log;
    log.setEcho(&sink);
    log.record(LogCategory::SUCCESS, "done");
    log.setEcho(nullptr);
    log.record(LogCategory::INFO, "silent");

    EXPECT_EQ(sink.str(), "[SUCCESS] done\n");
}

TEST(ActivityLog, CategoryNamesRoundTrip) {
    for (LogCategory c : {LogCategory::INFO, LogCategory::SUCCESS, LogCategory::ERROR}) {
        EXPECT_EQ(parseLogCategory(logCategoryName(c)), c);
    }
    EXPECT_FALSE(parseLogCategory("warning"));
}
