///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "registry.hpp"


///////////////////////////
///      REGISTRY       ///
///////////////////////////
RoomRegistry::RoomRegistry(AdjacencyRule rule, ActivityLog& log)
        : graph_(rule),
          log_(log) {}

Result<RoomSummary> RoomRegistry::registerRoom(const std::string& roomId,
                                               const std::string& building,
                                               int capacity,
                                               int floor,
                                               const FacilitySet& facilities) {
    if (roomId.empty())
        return Result<RoomSummary>::failure(ErrorKind::INVALID_REQUEST, "Room id is required");
    if (building.empty())
        return Result<RoomSummary>::failure(ErrorKind::INVALID_REQUEST, "Building is required");
    if (capacity <= 0)
        return Result<RoomSummary>::failure(ErrorKind::INVALID_REQUEST, "Capacity must be positive");
    if (contains(roomId))
        return Result<RoomSummary>::failure(ErrorKind::DUPLICATE_ROOM, "Room already exists");

    auto room = std::make_unique<Room>(roomId, building, capacity, floor, facilities, (int)rooms_.size());

    // Derive edges against every room registered so far, then publish the room.
    graph_.connect(*room, rooms_);

    index_[roomId] = rooms_.size();
    rooms_.push_back(std::move(room));

    log_.record(LogCategory::INFO, "Added room " + building + " " + roomId + " to system");
    return Result<RoomSummary>::success(rooms_.back()->summary());
}

Result<RoomSummary> RoomRegistry::lookup(const std::string& roomId) const {
    const Room* room = find(roomId);
    if (!room)
        return Result<RoomSummary>::failure(ErrorKind::ROOM_NOT_FOUND, "Room not found: " + roomId);
    return Result<RoomSummary>::success(room->summary());
}

Room* RoomRegistry::find(const std::string& roomId) {
    auto it = index_.find(roomId);
    if (it == index_.end()) return nullptr;
    return rooms_[it->second].get();
}

const Room* RoomRegistry::find(const std::string& roomId) const {
    auto it = index_.find(roomId);
    if (it == index_.end()) return nullptr;
    return rooms_[it->second].get();
}
