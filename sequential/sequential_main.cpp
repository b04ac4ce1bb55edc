///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "engine.hpp"
#include "config.hpp"
#include "formatting.hpp"
#include "timeutil.hpp"
#include <chrono>
#include <iostream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Build a request from boundary-style "HH:MM" times.
 */
static AllocationRequest makeRequest(const std::string& course, const std::string& date,
                                     const std::string& start, const std::string& end,
                                     int capacity, const FacilitySet& facilities) {
    AllocationRequest req;
    req.courseName = course;
    req.date = date;
    req.startMinute = parseClockTime(start).value_or(-1);
    req.endMinute = parseClockTime(end).value_or(-1);
    req.capacity = capacity;
    req.facilities = facilities;
    return req;
}

static void section(const std::string& title) {
    std::cout << "----------------------------------------\n";
    std::cout << title << ":\n";
}


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Walkthrough of the engine on the sample dataset.
 *
 * Registers a room, runs a few allocations (including a rejected overlap and
 * a legal back-to-back booking), searches alternatives and prints the
 * schedule, conflicts, statistics and activity log.
 */
int main(int argc, char** argv) {
    EngineConfig defaults;
    defaults.dataset = DemoSize::SAMPLE;

    Result<EngineConfig> parsed = parseConfigArgs(argc, argv, defaults);
    if (!parsed) {
        std::cerr << errorKindName(parsed.error().kind) << ": " << parsed.error().message << "\n";
        return 2;
    }
    const EngineConfig& config = parsed.value();

    auto start = std::chrono::high_resolution_clock::now();
    AllocationService service(config);

    std::cout << "========================================\n";
    std::cout << "ROOM ALLOCATION ENGINE (SEQUENTIAL)\n";
    std::cout << "Dataset: " << demoSizeName(config.dataset) << "\n";
    std::cout << "Rooms: " << service.listRooms().size() << "\n";
    std::cout << "========================================\n";

    section("Register room 202");
    Result<FacilitySet> facilities = parseFacilityList("projector,whiteboard");
    Result<RoomSummary> added = facilities
        ? service.registerRoom("202", "Science", 45, 2, facilities.value())
        : Result<RoomSummary>::failure(facilities.error().kind, facilities.error().message);
    if (added) {
        std::cout << "  Added 202, adjacent to " << added.value().adjacentRooms.size() << " rooms\n";
    } else {
        std::cout << "  " << errorKindName(added.error().kind) << ": " << added.error().message << "\n";
    }

    section("Allocations");
    std::vector<AllocationRequest> requests;
    requests.push_back(makeRequest("Organic Chemistry", "2024-01-10", "09:00", "10:00", 40, {Facility::LAB}));
    requests.push_back(makeRequest("Calculus I", "2024-01-10", "09:00", "10:30", 45, {}));
    requests.push_back(makeRequest("Biochemistry", "2024-01-10", "09:30", "10:30", 20, {Facility::LAB}));

    AllocationRequest overlap = makeRequest("Lab Safety", "2024-01-10", "09:30", "10:30", 20, {});
    overlap.roomId = "201";
    requests.push_back(overlap);

    AllocationRequest backToBack = makeRequest("Lab Safety", "2024-01-10", "10:00", "11:00", 20, {});
    backToBack.roomId = "201";
    requests.push_back(backToBack);

    requests.push_back(makeRequest("Open Lecture", "2024-01-10", "12:00", "14:00", 500, {}));

    for (const AllocationRequest& req : requests) {
        printAllocation(std::cout, req, service.allocate(req));
    }

    section("Alternatives to 201 on 2024-01-10 09:00-10:00");
    printRooms(std::cout, service.findAlternatives("201", "2024-01-10", 9 * 60, 10 * 60));

    section("Rooms");
    printRooms(std::cout, service.listRooms());

    section("Similarity graph");
    printEdges(std::cout, service.edges());

    section("Schedule");
    printSchedule(std::cout, service.schedule());

    section("Conflicts");
    printConflicts(std::cout, service.conflicts());

    section("Statistics");
    printStatistics(std::cout, service.statistics());

    section("Activity log (most recent first)");
    printLogs(std::cout, service.logs());

    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "========================================\n";
    std::cout << "Time: " << ms << " ms\n";
    return 0;
}
