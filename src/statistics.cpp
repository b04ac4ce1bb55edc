///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "statistics.hpp"
#include <cmath>


///////////////////////////
///     STATISTICS      ///
///////////////////////////
Statistics StatisticsReporter::compute(const RoomRegistry& registry) const {
    Statistics stats;
    stats.totalRooms = (int)registry.size();

    for (const auto& room : registry.rooms()) {
        int bookings = (int)room->calendar().size();
        stats.totalBookings += bookings;
        if (bookings > 0) stats.utilizedRooms++;
    }

    if (stats.totalRooms > 0) {
        double rate = (double)stats.utilizedRooms / (double)stats.totalRooms * 100.0;
        stats.utilizationRate = std::round(rate * 100.0) / 100.0;
    }

    stats.conflicts = auditor_.countConflicts(registry);
    return stats;
}
