///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include "engine.hpp"
#include "timeutil.hpp"
#include <array>
#include <random>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Register a seed room; failures land in the activity log.
 */
static void addRoom(EngineState& state, const std::string& id, const std::string& building,
                    int capacity, int floor, const FacilitySet& facilities) {
    Result<RoomSummary> added = state.registry.registerRoom(id, building, capacity, floor, facilities);
    if (!added) {
        state.log.record(LogCategory::ERROR, "Seed room " + id + " rejected: " + added.error().message);
    }
}


///////////////////////////
///    DEMO: SAMPLE     ///
///////////////////////////
/**
 * @brief The seven reference rooms.
 *
 * Capacities are chosen so that the graph mixes same-building edges with
 * capacity-similarity edges across buildings.
 */
static void seedSample(EngineState& state) {
    using F = Facility;

    addRoom(state, "101", "Main", 50, 1, {F::PROJECTOR, F::ACCESSIBLE, F::WHITEBOARD, F::AUDIO});
    addRoom(state, "102", "Main", 30, 1, {F::PROJECTOR, F::ACCESSIBLE, F::WHITEBOARD, F::SMARTBOARD});
    addRoom(state, "201", "Science", 40, 2, {F::PROJECTOR, F::LAB, F::WHITEBOARD, F::AUDIO});
    addRoom(state, "301", "Engineering", 60, 3,
            {F::PROJECTOR, F::LAB, F::ACCESSIBLE, F::WHITEBOARD, F::AUDIO, F::SMARTBOARD});
    addRoom(state, "LAB-A", "Science", 25, 1, {F::PROJECTOR, F::LAB, F::ACCESSIBLE, F::SMARTBOARD});
    addRoom(state, "401", "Engineering", 100, 4,
            {F::PROJECTOR, F::ACCESSIBLE, F::WHITEBOARD, F::AUDIO, F::SMARTBOARD});
    addRoom(state, "AUD-1", "Arts", 200, 1, {F::PROJECTOR, F::ACCESSIBLE, F::AUDIO});

    state.log.record(LogCategory::INFO, "System initialized with sample data");
}


///////////////////////////
///    DEMO: CAMPUS     ///
///////////////////////////
/**
 * @brief Synthetic campus: 8 buildings x 25 rooms plus a week of bookings.
 *
 * Bookings are imported as an external feed, bypassing availability checks,
 * so a fraction of them overlap and show up as conflicts.
 */
static void seedCampus(EngineState& state) {
    static const std::array<const char*, 8> kBuildings = {
            "Main", "Science", "Engineering", "Arts",
            "Library", "Medical", "Law", "Business"
    };
    static const std::array<int, 10> kCapacities = {20, 25, 30, 40, 50, 60, 80, 100, 150, 200};
    static const std::array<const char*, 6> kCourses = {
            "Algorithms", "Databases", "Physics", "Chemistry", "History", "Economics"
    };
    const int roomsPerBuilding = 25;
    const int bookingsPerRoomDay = 4;

    // Fixed seed keeps the campus identical across runs and ranks.
    std::mt19937 rng(1234u);
    std::uniform_int_distribution<int> capacityPick(0, (int)kCapacities.size() - 1);
    std::uniform_int_distribution<int> floorPick(0, 5);
    std::uniform_int_distribution<int> coin(0, 1);
    std::uniform_int_distribution<int> halfHourPick(0, 19); // 08:00 .. 17:30
    std::uniform_int_distribution<int> lengthPick(2, 4); // 60 .. 120 minutes
    std::uniform_int_distribution<int> coursePick(0, (int)kCourses.size() - 1);

    for (int b = 0; b < (int)kBuildings.size(); ++b) {
        for (int r = 0; r < roomsPerBuilding; ++r) {
            std::string id = std::string(1, kBuildings[b][0]) + std::to_string(b) + "-" + std::to_string(100 + r);

            FacilitySet facilities;
            for (Facility f : allFacilities()) {
                facilities.set(f, coin(rng) == 1);
            }

            addRoom(state, id, kBuildings[b], kCapacities[capacityPick(rng)], floorPick(rng), facilities);
        }
    }

    int firstKey = dateKey(CAMPUS_FIRST_DATE);
    for (const auto& room : state.registry.rooms()) {
        for (int d = 0; d < CAMPUS_DAYS; ++d) {
            std::string date = dateFromKey(firstKey + d);
            for (int k = 0; k < bookingsPerRoomDay; ++k) {
                Booking booking;
                booking.date = date;
                booking.startMinute = 8 * 60 + 30 * halfHourPick(rng);
                booking.endMinute = booking.startMinute + 30 * lengthPick(rng);
                booking.courseName = kCourses[coursePick(rng)];
                Result<std::string> imported = state.importBooking(room->id(), booking);
                if (!imported) {
                    state.log.record(LogCategory::ERROR, "Seed booking rejected: " + imported.error().message);
                }
            }
        }
    }

    state.log.record(LogCategory::INFO, "System initialized with campus data");
}


///////////////////////////
///      DISPATCH       ///
///////////////////////////
void seedDemoInstance(EngineState& state, DemoSize size) {
    switch (size) {
        case DemoSize::EMPTY:  return;
        case DemoSize::SAMPLE: seedSample(state); return;
        case DemoSize::CAMPUS: seedCampus(state); return;
    }
}
