///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_auditor.hpp"
#include <algorithm>
#include <future>


///////////////////////////
///       AUDITORS      ///
///////////////////////////
ThreadedConflictAuditor::ThreadedConflictAuditor(int numThreads)
        : numThreads_(std::max(1, numThreads)) {}

std::vector<Conflict> ThreadedConflictAuditor::audit(const RoomRegistry& registry) const {
    const auto& rooms = registry.rooms();
    int numRooms = (int)rooms.size();
    if (numRooms == 0) return {};

    int workers = std::min(numThreads_, numRooms);

    // Balanced contiguous slices: the first `extra` slices get one more room.
    int base = numRooms / workers, extra = numRooms % workers;

    std::vector<std::future<std::vector<Conflict>>> tasks;
    int begin = 0;
    for (int w = 0; w < workers; ++w) {
        int end = begin + base + (w < extra ? 1 : 0);
        tasks.push_back(std::async(std::launch::async, [this, &rooms, begin, end]() {
            std::vector<Conflict> local;
            for (int r = begin; r < end; ++r) {
                std::vector<Conflict> roomConflicts = auditor_.auditRoom(*rooms[r]);
                local.insert(local.end(), roomConflicts.begin(), roomConflicts.end());
            }
            return local;
        }));
        begin = end;
    }

    // Merge in slice order to keep registration order.
    std::vector<Conflict> conflicts;
    for (auto& t : tasks) {
        std::vector<Conflict> part = t.get();
        conflicts.insert(conflicts.end(), part.begin(), part.end());
    }
    return conflicts;
}

int ThreadedConflictAuditor::countConflicts(const RoomRegistry& registry) const {
    return (int)audit(registry).size();
}
