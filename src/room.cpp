///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "room.hpp"
#include <algorithm>
#include <utility>


///////////////////////////
///        ROOM         ///
///////////////////////////
Room::Room(std::string roomId, std::string building, int capacity, int floor,
           FacilitySet facilities, int ordinal)
        : roomId_(std::move(roomId)),
          building_(std::move(building)),
          capacity_(capacity),
          floor_(floor),
          facilities_(facilities),
          ordinal_(ordinal) {}

bool Room::isAdjacentTo(const std::string& otherId) const {
    return std::find(adjacent_.begin(), adjacent_.end(), otherId) != adjacent_.end();
}

bool Room::addAdjacent(const std::string& otherId) {
    if (otherId == roomId_ || isAdjacentTo(otherId)) return false;
    adjacent_.push_back(otherId);
    return true;
}

RoomSummary Room::summary() const {
    RoomSummary s;
    s.roomId = roomId_;
    s.building = building_;
    s.capacity = capacity_;
    s.floor = floor_;
    s.facilities = facilities_;
    s.adjacentRooms = adjacent_;
    s.bookingCount = (int)calendar_.size();
    return s;
}
