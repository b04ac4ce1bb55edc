///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "alternatives.hpp"
#include <queue>
#include <unordered_set>


///////////////////////////
///    ALTERNATIVES     ///
///////////////////////////
std::vector<RoomSummary> AlternativeFinder::findAlternatives(const RoomRegistry& registry,
                                                             const std::string& startRoomId,
                                                             const std::string& date,
                                                             int startMinute,
                                                             int endMinute) const {
    std::vector<RoomSummary> alternatives;
    if (!registry.contains(startRoomId)) return alternatives;

    // Rooms are marked visited when queued.
    std::unordered_set<std::string> visited;
    std::queue<const Room*> frontier;

    visited.insert(startRoomId);
    frontier.push(registry.find(startRoomId));

    while (!frontier.empty()) {
        const Room* current = frontier.front();
        frontier.pop();

        if (current->isAvailable(date, startMinute, endMinute)) {
            alternatives.push_back(current->summary());
        }

        for (const std::string& nextId : current->adjacentRooms()) {
            if (!visited.insert(nextId).second) continue;
            const Room* next = registry.find(nextId);
            if (next) frontier.push(next);
        }
    }
    return alternatives;
}
