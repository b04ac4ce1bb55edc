#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "registry.hpp"
#include <string>
#include <vector>


///////////////////////////
///    ALTERNATIVES     ///
///////////////////////////
/**
 * @brief Breadth-first fallback search over the similarity graph.
 */
class AlternativeFinder {
public:
    /**
     * @brief Rooms reachable from @p startRoomId that are free for the slot.
     *
     * Visits every room of the start room's connected component once, in BFS
     * discovery order, and keeps those available on @p date for
     * [startMinute, endMinute). The start room is included when it is free.
     * An unknown start id yields an empty result.
     */
    std::vector<RoomSummary> findAlternatives(const RoomRegistry& registry,
                                              const std::string& startRoomId,
                                              const std::string& date,
                                              int startMinute,
                                              int endMinute) const;
};
