#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "result.hpp"
#include "registry.hpp"
#include "calendar.hpp"
#include "activity_log.hpp"
#include <optional>
#include <vector>


///////////////////////////
///      ALLOCATOR      ///
///////////////////////////
/**
 * @brief Matches a course request to a single room and books it.
 *
 * Candidates must meet the capacity, building, facility, specific-room and
 * availability filters. Among them the room whose capacity is closest to the
 * requested one wins; ties go to the earliest registered room.
 *
 * Not synchronized: the availability check and the booking write must run in
 * one critical section, which the service facade provides.
 */
class AllocationEngine {
public:
    /**
     * @param registry Rooms to allocate from.
     * @param ids      Booking id source shared by the whole engine.
     * @param log      Receives processing, success and error events.
     */
    AllocationEngine(RoomRegistry& registry, BookingIdGenerator& ids, ActivityLog& log);

    /**
     * @brief Allocate and book a room for @p request.
     *
     * @return The chosen room (with the new booking counted) and booking id;
     *         INVALID_REQUEST for malformed requests, ROOM_NOT_FOUND for an
     *         unknown specific room, NO_AVAILABLE_ROOM when nothing fits.
     */
    Result<Allocation> allocate(const AllocationRequest& request);

    /**
     * @brief All rooms passing every filter, in registration order.
     *
     * Does not book or log anything.
     */
    std::vector<const Room*> findCandidates(const AllocationRequest& request) const;

    /**
     * @brief Check the request fields that do not depend on the registry.
     *
     * @return std::nullopt if valid, otherwise the INVALID_REQUEST error.
     */
    static std::optional<EngineError> validate(const AllocationRequest& request);

private:
    RoomRegistry& registry_;
    BookingIdGenerator& ids_;
    ActivityLog& log_;

    /// Capacity, building, facility and specific-room filters.
    static bool matchesStaticFilters(const Room& room, const AllocationRequest& request);

    /**
     * @brief Closest-capacity candidate; the first one wins ties.
     *
     * @p candidates must be in registration order.
     */
    static const Room* selectBest(const std::vector<const Room*>& candidates, int requestedCapacity);
};
