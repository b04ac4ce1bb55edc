#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "result.hpp"
#include "config.hpp"
#include "activity_log.hpp"
#include "calendar.hpp"
#include "registry.hpp"
#include "allocator.hpp"
#include "conflicts.hpp"
#include "alternatives.hpp"
#include "statistics.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///    ENGINE STATE     ///
///////////////////////////
/**
 * @brief Complete state of one engine instance.
 *
 * Members are declared in dependency order; components hold references to
 * earlier members, so the state is neither copyable nor movable. Not
 * synchronized on its own; AllocationService guards access.
 */
struct EngineState {
    explicit EngineState(const EngineConfig& cfg);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    EngineConfig config;
    ActivityLog log;
    BookingIdGenerator ids;
    RoomRegistry registry;
    AllocationEngine allocator;
    ConflictAuditor auditor;
    AlternativeFinder finder;
    StatisticsReporter reporter;

    /// (roomId, bookingId) of every booking in creation order.
    std::vector<std::pair<std::string, std::string>> bookingOrder;

    /**
     * @brief Store an existing booking record on a room without checks
     *        against other bookings.
     *
     * An empty booking id is replaced by a generated one and a missing
     * timestamp by the current time. Fails with ROOM_NOT_FOUND for unknown
     * rooms and INVALID_REQUEST for malformed or already used ids.
     *
     * @return The stored booking id.
     */
    Result<std::string> importBooking(const std::string& roomId, Booking booking);
};


///////////////////////////
///       SERVICE       ///
///////////////////////////
/**
 * @brief Thread-safe facade over an EngineState.
 *
 * Writers (registration, allocation, imports, log clearing) hold the
 * exclusive lock, so an allocation's availability check and booking write
 * form one critical section. Readers share the lock and see the last
 * committed state. reset() builds a fresh state outside the lock and swaps
 * it in atomically.
 */
class AllocationService {
public:
    explicit AllocationService(EngineConfig config = EngineConfig());

    Result<RoomSummary> registerRoom(const std::string& roomId,
                                     const std::string& building,
                                     int capacity,
                                     int floor,
                                     const FacilitySet& facilities);

    Result<RoomSummary> getRoom(const std::string& roomId) const;
    std::vector<RoomSummary> listRooms() const;

    Result<Allocation> allocate(const AllocationRequest& request);

    /**
     * @brief Bookings matching @p filter, rooms in registration order and
     *        bookings in insertion order. An unknown room id matches nothing.
     */
    std::vector<ScheduleEntry> schedule(const ScheduleFilter& filter = ScheduleFilter()) const;

    /// Up to @p count most recently created bookings, newest first.
    std::vector<ScheduleEntry> recentAllocations(size_t count = 5) const;

    std::vector<RoomSummary> findAlternatives(const std::string& roomId,
                                              const std::string& date,
                                              int startMinute,
                                              int endMinute) const;

    std::vector<Conflict> conflicts() const;

    /// Activity log, most recent first, optionally one category only.
    std::vector<LogEntry> logs(std::optional<LogCategory> category = std::nullopt) const;
    void clearLogs();
    std::string exportLogs() const;

    /// Registry as CSV with a header row, one line per room.
    std::string exportRoomsCsv() const;

    /// Undirected similarity edges, each once.
    std::vector<std::pair<std::string, std::string>> edges() const;

    Statistics statistics() const;

    Result<std::string> importBooking(const std::string& roomId, const Booking& booking);

    /// Replace all state with a fresh instance seeded with the configured dataset.
    void reset();

    /// Replace all state with a fresh instance seeded with @p dataset.
    void reset(DemoSize dataset);

    /**
     * @brief Run @p fn against the current state under the shared lock.
     *
     * Lets read-only tools (parallel auditors, reports) work on one
     * consistent state without copying it.
     */
    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn(std::declval<const EngineState&>())) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return fn(*state_);
    }

    const EngineConfig& config() const { return config_; }

    /// Build and seed a standalone state.
    static std::unique_ptr<EngineState> makeState(const EngineConfig& config, DemoSize dataset);

private:
    EngineConfig config_;

    mutable std::shared_mutex mutex_;
    std::unique_ptr<EngineState> state_;
};
