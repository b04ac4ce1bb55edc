#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "result.hpp"
#include <bitset>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///     FACILITIES      ///
///////////////////////////
static constexpr int NUM_FACILITIES = 6;

/**
 * @brief Fixed vocabulary of room capabilities.
 */
enum class Facility { PROJECTOR, LAB, ACCESSIBLE, WHITEBOARD, AUDIO, SMARTBOARD };

/**
 * @brief Fixed-shape set of boolean room capabilities.
 *
 * Used both for what a room offers and for what a request requires; a request
 * is satisfied when its required set is a subset of the offered one.
 */
struct FacilitySet {
    std::bitset<NUM_FACILITIES> flags; ///< One bit per Facility value.

    FacilitySet() = default;
    FacilitySet(std::initializer_list<Facility> list) {
        for (Facility f : list) set(f);
    }

    void set(Facility f, bool on = true) { flags.set((size_t)f, on); }
    bool has(Facility f) const { return flags.test((size_t)f); }
    bool empty() const { return flags.none(); }

    /// True if every facility in @p required is also present here.
    bool covers(const FacilitySet& required) const {
        return (required.flags & ~flags).none();
    }

    bool operator==(const FacilitySet& other) const { return flags == other.flags; }
    bool operator!=(const FacilitySet& other) const { return flags != other.flags; }
};

/// Lower-case vocabulary name ("projector", "lab", ...).
const char* facilityName(Facility f);

/// Reverse of facilityName(); std::nullopt for names outside the vocabulary.
std::optional<Facility> parseFacility(const std::string& name);

/// All facilities in declaration order.
const std::vector<Facility>& allFacilities();

/**
 * @brief Parse a comma-separated list of facility names ("lab,projector").
 *
 * An empty string is the empty set; any unknown name is INVALID_REQUEST.
 */
Result<FacilitySet> parseFacilityList(const std::string& csv);


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief One reserved interval on a room's calendar.
 *
 * Times are minutes since midnight, start < end, both on the same date.
 */
struct Booking {
    std::string bookingId; ///< Engine-wide unique id.
    std::string date; ///< ISO-8601 calendar date (YYYY-MM-DD).
    int startMinute; ///< Inclusive start, minutes since midnight.
    int endMinute; ///< Exclusive end, minutes since midnight.
    std::string courseName; ///< Course the room was booked for.
    std::string instructor; ///< Instructor name, empty when not given.
    std::string createdAt; ///< ISO-8601 creation timestamp.
};

/**
 * @brief Read-only snapshot of a room as exposed at the boundary.
 *
 * Carries the booking count only; full booking records are returned by
 * schedule queries.
 */
struct RoomSummary {
    std::string roomId; ///< Unique room identifier (e.g., "LAB-A").
    std::string building; ///< Building name.
    int capacity; ///< Seating capacity.
    int floor; ///< Floor number.
    FacilitySet facilities; ///< Offered capabilities.
    std::vector<std::string> adjacentRooms; ///< Similarity-linked room ids.
    int bookingCount; ///< Number of bookings on the calendar.
};

/**
 * @brief A course request to be matched against the registry.
 */
struct AllocationRequest {
    std::string courseName; ///< Required, non-empty.
    std::string instructor; ///< Optional, may be empty.
    std::string date; ///< ISO-8601 calendar date.
    int startMinute = 0; ///< Minutes since midnight.
    int endMinute = 0; ///< Minutes since midnight, > startMinute.
    int capacity = 0; ///< Minimum seating capacity.
    std::optional<std::string> building; ///< Restrict to one building.
    FacilitySet facilities; ///< Required capabilities.
    std::optional<std::string> roomId; ///< Only consider this room.
};

/**
 * @brief Successful allocation: the chosen room and the new booking id.
 */
struct Allocation {
    RoomSummary room;
    std::string bookingId;
};

/**
 * @brief Two overlapping bookings found on the same room and date.
 */
struct Conflict {
    std::string roomId;
    Booking first; ///< Earlier booking in (date, start) order.
    Booking second; ///< Later booking in (date, start) order.
};

/**
 * @brief One row of a schedule listing.
 */
struct ScheduleEntry {
    RoomSummary room;
    Booking booking;
};

/**
 * @brief Filters for schedule queries; unset fields match everything.
 */
struct ScheduleFilter {
    std::optional<std::string> roomId;
    std::optional<std::string> date;
    std::optional<std::string> building;
};

/**
 * @brief Aggregated registry/calendar figures.
 */
struct Statistics {
    int totalRooms = 0;
    int totalBookings = 0;
    int utilizedRooms = 0; ///< Rooms with at least one booking.
    double utilizationRate = 0.0; ///< Percentage, rounded to 2 decimals.
    int conflicts = 0;
};

/**
 * @brief Overlap test shared by availability checks and audits.
 *
 * Intervals are half-open, so touching intervals do not overlap.
 */
inline bool intervalsOverlap(int startA, int endA, int startB, int endB) {
    return !(endA <= startB || startA >= endB);
}
