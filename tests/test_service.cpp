///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "engine.hpp"
#include "demo_instances.hpp"
#include "formatting.hpp"
#include <atomic>
#include <sstream>
#include <thread>
#include <vector>


///////////////////////////
///      FIXTURES       ///
///////////////////////////
class AllocationServiceTest : public ::testing::Test {
protected:
    AllocationService service{[]() {
        EngineConfig c;
        c.dataset = DemoSize::SAMPLE;
        c.idSeed = 41;
        return c;
    }()};

    static AllocationRequest request(const std::string& course, int capacity,
                                     const std::string& date, int startMinute, int endMinute) {
        AllocationRequest req;
        req.courseName = course;
        req.date = date;
        req.startMinute = startMinute;
        req.endMinute = endMinute;
        req.capacity = capacity;
        return req;
    }
};


///////////////////////////
///   ROOMS AND LOGS    ///
///////////////////////////
TEST_F(AllocationServiceTest, StartsWithSampleData) {
    auto rooms = service.listRooms();
    ASSERT_EQ(rooms.size(), 7u);
    EXPECT_EQ(rooms.front().roomId, "101");
    EXPECT_EQ(rooms.back().roomId, "AUD-1");

    auto logs = service.logs();
    ASSERT_FALSE(logs.empty());
    EXPECT_EQ(logs.front().message, "System initialized with sample data");
}

TEST_F(AllocationServiceTest, RegisterAndGetRoom) {
    auto added = service.registerRoom("202", "Science", 45, 2, {Facility::LAB});
    ASSERT_TRUE(added);
    auto fetched = service.getRoom("202");
    ASSERT_TRUE(fetched);
    EXPECT_EQ(fetched.value().building, "Science");
    EXPECT_TRUE(service.getRoom("201").value().adjacentRooms.back() == "202");

    EXPECT_EQ(service.registerRoom("202", "Main", 10, 1, {}).error().kind, ErrorKind::DUPLICATE_ROOM);
    EXPECT_EQ(service.getRoom("missing").error().kind, ErrorKind::ROOM_NOT_FOUND);
}

TEST_F(AllocationServiceTest, LogFilterExportAndClear) {
    ASSERT_FALSE(service.allocate(request("Open Lecture", 500, "2024-01-10", 540, 600)));

    auto errors = service.logs(LogCategory::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].message, "No suitable rooms for Open Lecture");

    std::string text = service.exportLogs();
    EXPECT_NE(text.find("[ERROR] No suitable rooms for Open Lecture"), std::string::npos);

    service.clearLogs();
    auto remaining = service.logs();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].message, "Logs cleared by user");
}

TEST_F(AllocationServiceTest, RoomsCsvHasHeaderAndOneLinePerRoom) {
    std::string csv = service.exportRoomsCsv();
    std::istringstream lines(csv);
    std::string line;

    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line, "Room ID,Building,Capacity,Floor,Projector,Lab,Accessible,Whiteboard,Audio,Smart Board");
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line, "101,Main,50,1,true,false,true,true,true,false");

    int rows = 1;
    while (std::getline(lines, line)) rows++;
    EXPECT_EQ(rows, 7);
}

TEST_F(AllocationServiceTest, EdgesMatchGraph) {
    EXPECT_EQ(service.edges().size(), 7u);
}


///////////////////////////
///      SCHEDULES      ///
///////////////////////////
TEST_F(AllocationServiceTest, ScheduleFiltersAndRecentAllocations) {
    auto a = service.allocate(request("Calculus", 45, "2024-01-10", 540, 600));
    auto b = service.allocate(request("Physics", 40, "2024-01-11", 540, 600));
    auto c = service.allocate(request("Drama", 150, "2024-01-10", 600, 660));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    ASSERT_TRUE(c);
    EXPECT_EQ(a.value().room.roomId, "101");
    EXPECT_EQ(b.value().room.roomId, "201");
    EXPECT_EQ(c.value().room.roomId, "AUD-1");

    EXPECT_EQ(service.schedule().size(), 3u);

    ScheduleFilter byDate;
    byDate.date = std::string("2024-01-10");
    auto onTenth = service.schedule(byDate);
    ASSERT_EQ(onTenth.size(), 2u);
    EXPECT_EQ(onTenth[0].room.roomId, "101");
    EXPECT_EQ(onTenth[1].room.roomId, "AUD-1");

    ScheduleFilter byBuilding;
    byBuilding.building = std::string("Science");
    auto science = service.schedule(byBuilding);
    ASSERT_EQ(science.size(), 1u);
    EXPECT_EQ(science[0].booking.courseName, "Physics");

    ScheduleFilter byRoom;
    byRoom.roomId = std::string("nope");
    EXPECT_TRUE(service.schedule(byRoom).empty());

    auto recent = service.recentAllocations(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].booking.bookingId, c.value().bookingId);
    EXPECT_EQ(recent[1].booking.bookingId, b.value().bookingId);
    EXPECT_EQ(service.recentAllocations().size(), 3u);
}

TEST_F(AllocationServiceTest, AlternativesAndConflictsThroughFacade) {
    AllocationRequest lab = request("Lab", 40, "2024-01-10", 540, 600);
    lab.roomId = std::string("201");
    ASSERT_TRUE(service.allocate(lab));

    auto alternatives = service.findAlternatives("201", "2024-01-10", 540, 600);
    ASSERT_FALSE(alternatives.empty());
    EXPECT_EQ(alternatives.front().roomId, "101");

    Booking clash;
    clash.date = "2024-01-10";
    clash.startMinute = 570;
    clash.endMinute = 630;
    clash.courseName = "Legacy";
    ASSERT_TRUE(service.importBooking("201", clash));

    auto conflicts = service.conflicts();
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].roomId, "201");
    EXPECT_EQ(service.statistics().conflicts, 1);
}


///////////////////////////
///        RESET        ///
///////////////////////////
TEST_F(AllocationServiceTest, ResetRestoresSeedState) {
    ASSERT_TRUE(service.registerRoom("999", "Annex", 10, 0, {}));
    ASSERT_TRUE(service.allocate(request("Temp", 10, "2024-01-10", 540, 600)));

    service.reset();
    EXPECT_EQ(service.listRooms().size(), 7u);
    EXPECT_TRUE(service.schedule().empty());
    EXPECT_TRUE(service.recentAllocations().empty());

    service.reset(DemoSize::EMPTY);
    EXPECT_TRUE(service.listRooms().empty());
    EXPECT_EQ(service.statistics().totalRooms, 0);
}

TEST(AllocationServiceCampus, CampusDatasetCarriesConflicts) {
    EngineConfig config;
    config.dataset = DemoSize::CAMPUS;
    config.idSeed = 3;
    AllocationService service(config);

    Statistics stats = service.statistics();
    EXPECT_EQ(stats.totalRooms, 200);
    EXPECT_EQ(stats.totalBookings, 200 * CAMPUS_DAYS * 4);
    EXPECT_GT(stats.conflicts, 0);
    EXPECT_EQ(stats.conflicts, (int)service.conflicts().size());
}


///////////////////////////
///     CONCURRENCY     ///
///////////////////////////
TEST_F(AllocationServiceTest, ConcurrentAllocationsNeverDoubleBook) {
    const int clients = 8;
    const int perClient = 40;
    std::atomic<int> granted{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < clients; ++t) {
        workers.emplace_back([this, t, &granted]() {
            for (int i = 0; i < perClient; ++i) {
                // Only a handful of slots exist, so most requests collide.
                int slot = i % 4;
                AllocationRequest req = request("C" + std::to_string(t) + "-" + std::to_string(i), 20,
                                                "2024-01-10", 540 + slot * 60, 600 + slot * 60);
                if (service.allocate(req)) granted++;
                EXPECT_EQ(service.statistics().conflicts, 0);
            }
        });
    }
    for (auto& w : workers) w.join();

    // All seven sample rooms seat at least 20; each takes each slot once.
    EXPECT_EQ(granted.load(), 7 * 4);
    EXPECT_TRUE(service.conflicts().empty());
    EXPECT_EQ((int)service.schedule().size(), granted.load());
}


///////////////////////////
///     FORMATTING      ///
///////////////////////////
TEST_F(AllocationServiceTest, PrintAllocationNamesRoomOrError) {
    AllocationRequest req = request("Calculus", 45, "2024-01-10", 540, 600);
    std::ostringstream out;
    printAllocation(out, req, service.allocate(req));
    EXPECT_NE(out.str().find("101"), std::string::npos);

    std::ostringstream failed;
    req.capacity = 1000;
    printAllocation(failed, req, service.allocate(req));
    EXPECT_NE(failed.str().find("NoAvailableRoomError"), std::string::npos);
}
