///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "allocator.hpp"
#include "timeutil.hpp"
#include <cstdlib>


///////////////////////////
///      ALLOCATOR      ///
///////////////////////////
AllocationEngine::AllocationEngine(RoomRegistry& registry, BookingIdGenerator& ids, ActivityLog& log)
        : registry_(registry),
          ids_(ids),
          log_(log) {}

std::optional<EngineError> AllocationEngine::validate(const AllocationRequest& request) {
    auto invalid = [](const std::string& message) {
        return std::optional<EngineError>(EngineError{ErrorKind::INVALID_REQUEST, message});
    };

    if (request.courseName.empty())
        return invalid("Course name is required");
    if (!isIsoDate(request.date))
        return invalid("Date must be YYYY-MM-DD: '" + request.date + "'");
    if (request.startMinute < 0 || request.endMinute > MINUTES_PER_DAY)
        return invalid("Times must lie within one day");
    if (request.startMinute >= request.endMinute)
        return invalid("End time must be after start time");
    if (request.capacity < 0)
        return invalid("Capacity must not be negative");
    if (request.building && request.building->empty())
        return invalid("Building filter must not be empty");
    return std::nullopt;
}

bool AllocationEngine::matchesStaticFilters(const Room& room, const AllocationRequest& request) {
    // Capacity is a lower bound.
    if (room.capacity() < request.capacity)
        return false;

    if (request.building && room.building() != *request.building)
        return false;

    // Only flags set in the request constrain the room.
    if (!room.facilities().covers(request.facilities))
        return false;

    if (request.roomId && room.id() != *request.roomId)
        return false;

    return true;
}

std::vector<const Room*> AllocationEngine::findCandidates(const AllocationRequest& request) const {
    std::vector<const Room*> candidates;
    for (const auto& room : registry_.rooms()) {
        if (!matchesStaticFilters(*room, request)) continue;
        if (!room->isAvailable(request.date, request.startMinute, request.endMinute)) continue;
        candidates.push_back(room.get());
    }
    return candidates;
}

const Room* AllocationEngine::selectBest(const std::vector<const Room*>& candidates, int requestedCapacity) {
    const Room* best = nullptr;
    int bestDiff = 0;
    for (const Room* room : candidates) {
        int diff = std::abs(room->capacity() - requestedCapacity);
        // Strict comparison keeps the earliest registered room on ties.
        if (!best || diff < bestDiff) {
            best = room;
            bestDiff = diff;
        }
    }
    return best;
}

Result<Allocation> AllocationEngine::allocate(const AllocationRequest& request) {
    if (auto error = validate(request)) {
        log_.record(LogCategory::ERROR, "Rejected request: " + error->message);
        return Result<Allocation>::failure(*error);
    }

    if (request.roomId && !registry_.contains(*request.roomId)) {
        log_.record(LogCategory::ERROR, "Unknown room " + *request.roomId + " for " + request.courseName);
        return Result<Allocation>::failure(ErrorKind::ROOM_NOT_FOUND, "Room not found: " + *request.roomId);
    }

    log_.record(LogCategory::INFO, "Processing allocation for " + request.courseName);

    std::vector<const Room*> candidates = findCandidates(request);
    if (candidates.empty()) {
        log_.record(LogCategory::ERROR, "No suitable rooms for " + request.courseName);
        return Result<Allocation>::failure(ErrorKind::NO_AVAILABLE_ROOM,
                                           "No rooms match requirements or are available");
    }

    const Room* chosen = selectBest(candidates, request.capacity);
    Room* winner = registry_.find(chosen->id());

    std::string bookingId = winner->calendar().book(ids_, request.date,
                                                    request.startMinute, request.endMinute,
                                                    request.courseName, request.instructor);

    log_.record(LogCategory::SUCCESS, "Allocated " + winner->building() + " " + winner->id() +
                                      " for " + request.courseName + " (ID: " + bookingId + ")");

    Allocation allocation;
    allocation.room = winner->summary();
    allocation.bookingId = bookingId;
    return Result<Allocation>::success(allocation);
}
