#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "registry.hpp"
#include "conflicts.hpp"
#include <optional>
#include <vector>


///////////////////////////
///       AUDITORS      ///
///////////////////////////
/**
 * @brief Conflict audit partitioned across MPI ranks.
 *
 * Rank 0 owns the engine. It flattens every room's bookings, sorted by
 * (date, start), into an integer buffer and broadcasts it. Each rank audits
 * the rooms whose index is congruent to its rank and sends back
 * (room, i, j) triples; rank 0 gathers them and rebuilds the full conflict
 * list in the same order as the sequential ConflictAuditor.
 */
class MPIPartitionedAuditor {
public:
    /**
     * @brief Run the audit cooperatively; must be called on every rank.
     *
     * @param registry The engine's registry on rank 0, nullptr elsewhere.
     *                 Must stay unchanged for the duration of the call.
     * @return The conflicts on rank 0, std::nullopt on other ranks.
     */
    std::optional<std::vector<Conflict>> audit(const RoomRegistry* registry);

private:
    /**
     * @brief Flatten per-room sorted bookings into an integer buffer.
     *
     * Layout: numRooms, then for every room its booking count followed by
     * (dateKey, start, end) per booking.
     */
    static void serializeBookings(const std::vector<std::vector<Booking>>& sortedByRoom, std::vector<int>& buffer);

    /**
     * @brief Rebuild per-room interval lists from a serialized buffer.
     *
     * Only date and times are restored; that is all the sweep needs.
     */
    static void deserializeBookings(const std::vector<int>& buffer, std::vector<std::vector<Booking>>& sortedByRoom);

    /// Audit the rooms assigned to @p rank and append (room, i, j) triples.
    static void auditAssignedRooms(const std::vector<std::vector<Booking>>& sortedByRoom,
                                   int rank, int size, std::vector<int>& triples);
};
