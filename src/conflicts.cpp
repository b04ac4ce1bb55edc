///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "conflicts.hpp"


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
std::vector<std::pair<int, int>> ConflictAuditor::overlappingPairs(const std::vector<Booking>& sorted) {
    std::vector<std::pair<int, int>> pairs;
    int n = (int)sorted.size();
    for (int i = 0; i < n; ++i) {
        const Booking& a = sorted[i];
        for (int j = i + 1; j < n; ++j) {
            const Booking& b = sorted[j];
            // Later bookings start no earlier, so the first miss ends the scan.
            if (b.date != a.date) break;
            if (!intervalsOverlap(a.startMinute, a.endMinute, b.startMinute, b.endMinute)) break;
            pairs.emplace_back(i, j);
        }
    }
    return pairs;
}

std::vector<Conflict> ConflictAuditor::auditRoom(const Room& room) const {
    std::vector<Conflict> conflicts;
    std::vector<Booking> sorted = room.calendar().sortedByStart();
    for (const auto& pair : overlappingPairs(sorted)) {
        conflicts.push_back({room.id(), sorted[pair.first], sorted[pair.second]});
    }
    return conflicts;
}

std::vector<Conflict> ConflictAuditor::audit(const RoomRegistry& registry) const {
    std::vector<Conflict> conflicts;
    for (const auto& room : registry.rooms()) {
        std::vector<Conflict> roomConflicts = auditRoom(*room);
        conflicts.insert(conflicts.end(), roomConflicts.begin(), roomConflicts.end());
    }
    return conflicts;
}

int ConflictAuditor::countConflicts(const RoomRegistry& registry) const {
    int count = 0;
    for (const auto& room : registry.rooms()) {
        count += (int)overlappingPairs(room->calendar().sortedByStart()).size();
    }
    return count;
}
