///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "engine.hpp"
#include "demo_instances.hpp"
#include "timeutil.hpp"
#include <iostream>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static AdjacencyRule makeRule(const EngineConfig& cfg) {
    AdjacencyRule rule;
    rule.capacityTolerance = cfg.capacityTolerance;
    rule.linkSameBuilding = cfg.linkSameBuilding;
    return rule;
}

static const Booking* findBooking(const Room& room, const std::string& bookingId) {
    for (const Booking& b : room.calendar().bookings()) {
        if (b.bookingId == bookingId) return &b;
    }
    return nullptr;
}


///////////////////////////
///    ENGINE STATE     ///
///////////////////////////
EngineState::EngineState(const EngineConfig& cfg)
        : config(cfg),
          log(cfg.logCapacity),
          ids(cfg.idSeed),
          registry(makeRule(cfg), log),
          allocator(registry, ids, log),
          reporter(auditor) {
    if (cfg.echoActivity) {
        log.setEcho(&std::clog);
    }
}

Result<std::string> EngineState::importBooking(const std::string& roomId, Booking booking) {
    Room* room = registry.find(roomId);
    if (!room)
        return Result<std::string>::failure(ErrorKind::ROOM_NOT_FOUND, "Room not found: " + roomId);

    if (!isIsoDate(booking.date))
        return Result<std::string>::failure(ErrorKind::INVALID_REQUEST, "Date must be YYYY-MM-DD: '" + booking.date + "'");
    if (booking.startMinute < 0 || booking.endMinute > MINUTES_PER_DAY || booking.startMinute >= booking.endMinute)
        return Result<std::string>::failure(ErrorKind::INVALID_REQUEST, "Invalid booking interval");
    if (booking.courseName.empty())
        return Result<std::string>::failure(ErrorKind::INVALID_REQUEST, "Course name is required");

    if (booking.bookingId.empty()) {
        booking.bookingId = ids.next();
    } else if (!ids.reserve(booking.bookingId)) {
        return Result<std::string>::failure(ErrorKind::INVALID_REQUEST, "Booking id already in use: " + booking.bookingId);
    }
    if (booking.createdAt.empty()) {
        booking.createdAt = nowIsoTimestamp();
    }

    room->calendar().append(booking);
    bookingOrder.emplace_back(roomId, booking.bookingId);

    log.record(LogCategory::INFO, "Imported booking " + booking.bookingId + " for " + booking.courseName +
                                  " into " + room->building() + " " + roomId);
    return Result<std::string>::success(booking.bookingId);
}


///////////////////////////
///       SERVICE       ///
///////////////////////////
AllocationService::AllocationService(EngineConfig config)
        : config_(config),
          state_(makeState(config, config.dataset)) {}

std::unique_ptr<EngineState> AllocationService::makeState(const EngineConfig& config, DemoSize dataset) {
    auto state = std::make_unique<EngineState>(config);
    seedDemoInstance(*state, dataset);
    return state;
}

Result<RoomSummary> AllocationService::registerRoom(const std::string& roomId,
                                                    const std::string& building,
                                                    int capacity,
                                                    int floor,
                                                    const FacilitySet& facilities) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return state_->registry.registerRoom(roomId, building, capacity, floor, facilities);
}

Result<RoomSummary> AllocationService::getRoom(const std::string& roomId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_->registry.lookup(roomId);
}

std::vector<RoomSummary> AllocationService::listRooms() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    RoomRegistry::SummaryRange range = state_->registry.listAll();
    return std::vector<RoomSummary>(range.begin(), range.end());
}

Result<Allocation> AllocationService::allocate(const AllocationRequest& request) {
    // Check-then-book runs entirely under the writer lock.
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Result<Allocation> result = state_->allocator.allocate(request);
    if (result) {
        state_->bookingOrder.emplace_back(result.value().room.roomId, result.value().bookingId);
    }
    return result;
}

std::vector<ScheduleEntry> AllocationService::schedule(const ScheduleFilter& filter) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ScheduleEntry> entries;
    for (const auto& room : state_->registry.rooms()) {
        if (filter.roomId && room->id() != *filter.roomId) continue;
        if (filter.building && room->building() != *filter.building) continue;

        RoomSummary summary = room->summary();
        for (const Booking& b : room->calendar().bookings()) {
            if (filter.date && b.date != *filter.date) continue;
            entries.push_back({summary, b});
        }
    }
    return entries;
}

std::vector<ScheduleEntry> AllocationService::recentAllocations(size_t count) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ScheduleEntry> entries;
    const auto& order = state_->bookingOrder;
    for (auto it = order.rbegin(); it != order.rend() && entries.size() < count; ++it) {
        const Room* room = state_->registry.find(it->first);
        if (!room) continue;
        const Booking* booking = findBooking(*room, it->second);
        if (booking) entries.push_back({room->summary(), *booking});
    }
    return entries;
}

std::vector<RoomSummary> AllocationService::findAlternatives(const std::string& roomId,
                                                             const std::string& date,
                                                             int startMinute,
                                                             int endMinute) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_->finder.findAlternatives(state_->registry, roomId, date, startMinute, endMinute);
}

std::vector<Conflict> AllocationService::conflicts() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_->auditor.audit(state_->registry);
}

std::vector<LogEntry> AllocationService::logs(std::optional<LogCategory> category) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (category) return state_->log.filter(*category);
    return state_->log.readAll();
}

void AllocationService::clearLogs() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_->log.clear();
}

std::string AllocationService::exportLogs() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_->log.exportText();
}

std::string AllocationService::exportRoomsCsv() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::ostringstream csv;
    csv << "Room ID,Building,Capacity,Floor,Projector,Lab,Accessible,Whiteboard,Audio,Smart Board\n";
    for (const auto& room : state_->registry.rooms()) {
        csv << room->id() << "," << room->building() << "," << room->capacity() << "," << room->floor();
        for (Facility f : allFacilities()) {
            csv << "," << (room->facilities().has(f) ? "true" : "false");
        }
        csv << "\n";
    }
    return csv.str();
}

std::vector<std::pair<std::string, std::string>> AllocationService::edges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return AdjacencyGraph::edgeList(state_->registry);
}

Statistics AllocationService::statistics() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_->reporter.compute(state_->registry);
}

Result<std::string> AllocationService::importBooking(const std::string& roomId, const Booking& booking) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return state_->importBooking(roomId, booking);
}

void AllocationService::reset() {
    reset(config_.dataset);
}

void AllocationService::reset(DemoSize dataset) {
    // Seeding happens before taking the lock; only the swap is exclusive.
    std::unique_ptr<EngineState> fresh = makeState(config_, dataset);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_.swap(fresh);
    lock.unlock();

    // The previous state is destroyed here, outside the lock.
}
