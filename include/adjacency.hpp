#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "room.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

class RoomRegistry;


///////////////////////////
///      ADJACENCY      ///
///////////////////////////
/**
 * @brief Similarity rule deciding whether two rooms are linked.
 *
 * Rooms are linked when they share a building, or when their relative
 * capacity difference |a - b| / max(a, b) does not exceed the tolerance.
 */
struct AdjacencyRule {
    double capacityTolerance = 0.25; ///< Maximum relative capacity difference.
    bool linkSameBuilding = true; ///< Link every pair in the same building.

    bool linked(const Room& a, const Room& b) const;
};

/**
 * @brief Derives the undirected similarity edges between rooms.
 *
 * The graph itself is the union of the rooms' adjacency lists; this class
 * only owns the rule and the derivation. Edges are never removed.
 */
class AdjacencyGraph {
public:
    explicit AdjacencyGraph(AdjacencyRule rule = AdjacencyRule());

    /**
     * @brief Link a newly registered room against all existing rooms.
     *
     * Adds both directions of every edge the rule allows; existing edges are
     * left as they are. O(existing.size()) per call.
     *
     * @param room     The room being registered (not yet in @p existing).
     * @param existing Rooms registered before, in registration order.
     * @return Number of undirected edges created.
     */
    int connect(Room& room, const std::vector<std::unique_ptr<Room>>& existing) const;

    const AdjacencyRule& rule() const { return rule_; }

    /**
     * @brief List every undirected edge once, as (earlier, later) room ids.
     *
     * Ordered by the registration order of the earlier endpoint, then by the
     * adjacency order of that room.
     */
    static std::vector<std::pair<std::string, std::string>> edgeList(const RoomRegistry& registry);

private:
    AdjacencyRule rule_;
};
