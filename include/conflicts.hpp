#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "registry.hpp"
#include <utility>
#include <vector>


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
/**
 * @brief Finds overlapping bookings on the same room and date.
 *
 * Each room is audited independently: bookings are sorted by (date, start)
 * and every booking is compared with the following ones while they share the
 * date and start before it ends. This reports every overlapping pair, not
 * only neighbours in sorted order. Nothing is cached; each call rescans.
 */
class ConflictAuditor {
public:
    /// All conflicts, rooms in registration order.
    std::vector<Conflict> audit(const RoomRegistry& registry) const;

    /// Conflicts of one room.
    std::vector<Conflict> auditRoom(const Room& room) const;

    /// Number of conflicts without materializing them.
    int countConflicts(const RoomRegistry& registry) const;

    /**
     * @brief Index pairs (i, j), i < j, of overlapping bookings.
     *
     * @param sorted Bookings of a single room, ordered by (date, start).
     */
    static std::vector<std::pair<int, int>> overlappingPairs(const std::vector<Booking>& sorted);
};
