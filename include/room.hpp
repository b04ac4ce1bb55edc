#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "calendar.hpp"
#include <string>
#include <vector>


///////////////////////////
///        ROOM         ///
///////////////////////////
/**
 * @brief A registered teaching room: a node of the similarity graph.
 *
 * Identity and physical attributes are fixed at construction. After that the
 * room only grows: adjacency entries and bookings are appended.
 */
class Room {
public:
    /**
     * @brief Construct a room.
     *
     * @param ordinal Registration order (0 for the first room), used for
     *                deterministic tie-breaking.
     */
    Room(std::string roomId, std::string building, int capacity, int floor,
         FacilitySet facilities, int ordinal);

    const std::string& id() const { return roomId_; }
    const std::string& building() const { return building_; }
    int capacity() const { return capacity_; }
    int floor() const { return floor_; }
    const FacilitySet& facilities() const { return facilities_; }
    int ordinal() const { return ordinal_; }

    /// Ids of similarity-linked rooms in the order the edges were created.
    const std::vector<std::string>& adjacentRooms() const { return adjacent_; }
    bool isAdjacentTo(const std::string& otherId) const;

    /**
     * @brief Record one side of an edge.
     *
     * @return false if the entry already existed or names this room.
     */
    bool addAdjacent(const std::string& otherId);

    BookingCalendar& calendar() { return calendar_; }
    const BookingCalendar& calendar() const { return calendar_; }

    bool isAvailable(const std::string& date, int startMinute, int endMinute) const {
        return calendar_.isAvailable(date, startMinute, endMinute);
    }

    /// Boundary snapshot (attributes, adjacency, booking count).
    RoomSummary summary() const;

private:
    std::string roomId_;
    std::string building_;
    int capacity_;
    int floor_;
    FacilitySet facilities_;
    int ordinal_;

    std::vector<std::string> adjacent_;
    BookingCalendar calendar_;
};
