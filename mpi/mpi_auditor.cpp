///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_auditor.hpp"
#include "timeutil.hpp"
#include <mpi.h>
#include <algorithm>
#include <array>


///////////////////////////
///       AUDITORS      ///
///////////////////////////
void MPIPartitionedAuditor::serializeBookings(const std::vector<std::vector<Booking>>& sortedByRoom,
                                              std::vector<int>& buffer) {
    buffer.clear();
    buffer.push_back((int)sortedByRoom.size());
    for (const auto& bookings : sortedByRoom) {
        buffer.push_back((int)bookings.size());
        for (const Booking& b : bookings) {
            buffer.push_back(dateKey(b.date));
            buffer.push_back(b.startMinute);
            buffer.push_back(b.endMinute);
        }
    }
}

void MPIPartitionedAuditor::deserializeBookings(const std::vector<int>& buffer,
                                                std::vector<std::vector<Booking>>& sortedByRoom) {
    sortedByRoom.clear();
    if (buffer.empty()) return;

    size_t pos = 0;
    int numRooms = buffer[pos++];
    sortedByRoom.resize(numRooms);
    for (int r = 0; r < numRooms; ++r) {
        int count = buffer[pos++];
        sortedByRoom[r].resize(count);
        for (int i = 0; i < count; ++i) {
            Booking& b = sortedByRoom[r][i];
            b.date = dateFromKey(buffer[pos + 0]);
            b.startMinute = buffer[pos + 1];
            b.endMinute = buffer[pos + 2];
            pos += 3;
        }
    }
}

void MPIPartitionedAuditor::auditAssignedRooms(const std::vector<std::vector<Booking>>& sortedByRoom,
                                               int rank, int size, std::vector<int>& triples) {
    for (int r = rank; r < (int)sortedByRoom.size(); r += size) {
        for (const auto& pair : ConflictAuditor::overlappingPairs(sortedByRoom[r])) {
            triples.push_back(r);
            triples.push_back(pair.first);
            triples.push_back(pair.second);
        }
    }
}

/**
 * @brief Broadcast the booking snapshot, audit round-robin, gather on rank 0.
 */
std::optional<std::vector<Conflict>> MPIPartitionedAuditor::audit(const RoomRegistry* registry) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Rank 0 keeps the full records to rebuild Conflict values at the end.
    std::vector<std::vector<Booking>> sortedByRoom;
    std::vector<const Room*> roomByIndex;
    std::vector<int> buffer;

    if (rank == 0 && registry) {
        for (const auto& room : registry->rooms()) {
            sortedByRoom.push_back(room->calendar().sortedByStart());
            roomByIndex.push_back(room.get());
        }
        serializeBookings(sortedByRoom, buffer);
    }

    int len = (int)buffer.size();
    MPI_Bcast(&len, 1, MPI_INT, 0, MPI_COMM_WORLD);
    if (rank != 0) buffer.resize(len);
    if (len > 0) {
        MPI_Bcast(buffer.data(), len, MPI_INT, 0, MPI_COMM_WORLD);
    }

    std::vector<std::vector<Booking>> localRooms;
    if (rank == 0) {
        localRooms = sortedByRoom;
    } else {
        deserializeBookings(buffer, localRooms);
    }

    std::vector<int> triples;
    auditAssignedRooms(localRooms, rank, size, triples);

    // Gather variable-length triple buffers on rank 0.
    int localLen = (int)triples.size();
    std::vector<int> lens(rank == 0 ? size : 0);
    MPI_Gather(&localLen, 1, MPI_INT, lens.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

    std::vector<int> displs;
    std::vector<int> all;
    if (rank == 0) {
        displs.resize(size);
        int total = 0;
        for (int i = 0; i < size; ++i) {
            displs[i] = total;
            total += lens[i];
        }
        all.resize(total);
    }
    MPI_Gatherv(triples.data(), localLen, MPI_INT,
                all.data(), lens.data(), displs.data(), MPI_INT,
                0, MPI_COMM_WORLD);

    if (rank != 0) return std::nullopt;

    // Restore the sequential order: by room index, then by pair.
    std::vector<std::array<int, 3>> ordered;
    ordered.reserve(all.size() / 3);
    for (size_t i = 0; i + 2 < all.size(); i += 3) {
        ordered.push_back({all[i], all[i + 1], all[i + 2]});
    }
    std::sort(ordered.begin(), ordered.end());

    std::vector<Conflict> conflicts;
    conflicts.reserve(ordered.size());
    for (const auto& t : ordered) {
        const std::vector<Booking>& bookings = sortedByRoom[t[0]];
        conflicts.push_back({roomByIndex[t[0]]->id(), bookings[t[1]], bookings[t[2]]});
    }
    return conflicts;
}
