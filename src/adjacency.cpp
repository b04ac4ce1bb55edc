///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "adjacency.hpp"
#include "registry.hpp"
#include <algorithm>
#include <cstdlib>


///////////////////////////
///      ADJACENCY      ///
///////////////////////////
bool AdjacencyRule::linked(const Room& a, const Room& b) const {
    if (a.id() == b.id()) return false;

    if (linkSameBuilding && a.building() == b.building())
        return true;

    int maxCapacity = std::max(a.capacity(), b.capacity());
    if (maxCapacity <= 0) return false;

    double relativeDiff = (double)std::abs(a.capacity() - b.capacity()) / (double)maxCapacity;
    return relativeDiff <= capacityTolerance;
}

AdjacencyGraph::AdjacencyGraph(AdjacencyRule rule) : rule_(rule) {}

int AdjacencyGraph::connect(Room& room, const std::vector<std::unique_ptr<Room>>& existing) const {
    int created = 0;
    for (const auto& other : existing) {
        if (!rule_.linked(room, *other)) continue;

        bool fresh = room.addAdjacent(other->id());
        other->addAdjacent(room.id());
        if (fresh) ++created;
    }
    return created;
}

std::vector<std::pair<std::string, std::string>> AdjacencyGraph::edgeList(const RoomRegistry& registry) {
    std::vector<std::pair<std::string, std::string>> edges;
    for (const auto& room : registry.rooms()) {
        for (const std::string& otherId : room->adjacentRooms()) {
            const Room* other = registry.find(otherId);
            if (other && room->ordinal() < other->ordinal()) {
                edges.emplace_back(room->id(), otherId);
            }
        }
    }
    return edges;
}
