///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_auditor.hpp"
#include "timeutil.hpp"
#include <algorithm>


///////////////////////////
///       AUDITORS      ///
///////////////////////////
OpenCLConflictAuditor::OpenCLConflictAuditor(int batchSize)
        : batchSize_(std::max(1, batchSize)) {}

/**
 * @brief Flatten one batch of rooms, run both kernels, rebuild conflicts.
 *
 * Pairs come back grouped by first index, and flat indices follow room
 * order, so appending them keeps the sequential auditor's ordering.
 */
void OpenCLConflictAuditor::flushBatchToGPU(const RoomRegistry& registry, int begin, int end,
                                            std::vector<Conflict>& out) {
    const auto& rooms = registry.rooms();

    std::vector<Booking> flat;
    std::vector<int> owner;
    std::vector<int> dateKeys, starts, ends, roomEnds;

    for (int r = begin; r < end; ++r) {
        std::vector<Booking> sorted = rooms[r]->calendar().sortedByStart();
        int last = (int)flat.size() + (int)sorted.size();
        for (const Booking& b : sorted) {
            dateKeys.push_back(dateKey(b.date));
            starts.push_back(b.startMinute);
            ends.push_back(b.endMinute);
            roomEnds.push_back(last);
            owner.push_back(r);
            flat.push_back(b);
        }
    }

    std::vector<int> firsts, seconds;
    clctx_.findOverlaps(dateKeys, starts, ends, roomEnds, firsts, seconds);

    for (int k = 0; k < (int)firsts.size(); ++k) {
        int i = firsts[k], j = seconds[k];
        out.push_back({rooms[owner[i]]->id(), flat[i], flat[j]});
    }
}

std::vector<Conflict> OpenCLConflictAuditor::audit(const RoomRegistry& registry) {
    std::vector<Conflict> conflicts;
    int numRooms = (int)registry.size();
    for (int begin = 0; begin < numRooms; begin += batchSize_) {
        int end = std::min(numRooms, begin + batchSize_);
        flushBatchToGPU(registry, begin, end, conflicts);
    }
    return conflicts;
}
