#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "result.hpp"
#include "room.hpp"
#include "adjacency.hpp"
#include "activity_log.hpp"
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>


///////////////////////////
///      REGISTRY       ///
///////////////////////////
/**
 * @brief Owner of all rooms, in registration order.
 *
 * Room ids are unique for the lifetime of the registry; rooms are never
 * removed. Every registration extends the adjacency graph and records an
 * activity log entry.
 */
class RoomRegistry {
public:
    using Storage = std::vector<std::unique_ptr<Room>>;

    /**
     * @brief Lazy view over the registry yielding RoomSummary values.
     *
     * Summaries are built on dereference. The view can be iterated any
     * number of times while the registry is alive and unchanged.
     */
    class SummaryRange {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = RoomSummary;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = RoomSummary;

            explicit iterator(Storage::const_iterator it) : it_(it) {}

            RoomSummary operator*() const { return (*it_)->summary(); }
            iterator& operator++() { ++it_; return *this; }
            iterator operator++(int) { iterator tmp = *this; ++it_; return tmp; }
            bool operator==(const iterator& other) const { return it_ == other.it_; }
            bool operator!=(const iterator& other) const { return it_ != other.it_; }

        private:
            Storage::const_iterator it_;
        };

        explicit SummaryRange(const Storage& rooms) : rooms_(&rooms) {}

        iterator begin() const { return iterator(rooms_->cbegin()); }
        iterator end() const { return iterator(rooms_->cend()); }
        size_t size() const { return rooms_->size(); }

    private:
        const Storage* rooms_;
    };

    /**
     * @param rule Edge rule applied on every registration.
     * @param log  Activity log receiving registration events; must outlive
     *             the registry.
     */
    RoomRegistry(AdjacencyRule rule, ActivityLog& log);

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    /**
     * @brief Register a new room and link it into the similarity graph.
     *
     * Fails with DUPLICATE_ROOM if the id exists, INVALID_REQUEST if the id
     * or building is empty or the capacity is not positive.
     */
    Result<RoomSummary> registerRoom(const std::string& roomId,
                                     const std::string& building,
                                     int capacity,
                                     int floor,
                                     const FacilitySet& facilities);

    /// Summary of one room, or ROOM_NOT_FOUND.
    Result<RoomSummary> lookup(const std::string& roomId) const;

    /// Direct access for engine components; nullptr if unknown.
    Room* find(const std::string& roomId);
    const Room* find(const std::string& roomId) const;

    bool contains(const std::string& roomId) const { return index_.count(roomId) > 0; }

    /// Lazy, restartable sequence of summaries in registration order.
    SummaryRange listAll() const { return SummaryRange(rooms_); }

    /// Rooms in registration order.
    const Storage& rooms() const { return rooms_; }

    size_t size() const { return rooms_.size(); }

    const AdjacencyGraph& graph() const { return graph_; }

private:
    AdjacencyGraph graph_;
    ActivityLog& log_;

    Storage rooms_;

    /// roomId -> position in rooms_.
    std::unordered_map<std::string, size_t> index_;
};
