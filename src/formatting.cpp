///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "timeutil.hpp"
#include <algorithm>
#include <iomanip>


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string formatFacilities(const FacilitySet& set) {
    std::string out;
    for (Facility f : allFacilities()) {
        if (!set.has(f)) continue;
        if (!out.empty()) out += ",";
        out += facilityName(f);
    }
    return out.empty() ? "-" : out;
}

static std::string formatInterval(int startMinute, int endMinute) {
    return formatClockTime(startMinute) + "-" + formatClockTime(endMinute);
}

/**
 * @brief Print a header row and a matching ASCII underline.
 *
 * @param columns (title, width) pairs.
 */
static void printTableHeader(std::ostream& out, const std::vector<std::pair<std::string, int>>& columns) {
    out << "    ";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out << " | ";
        out << std::left << std::setw(columns[i].second) << columns[i].first;
    }
    out << "\n    ";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out << "-+-";
        out << std::string(columns[i].second, '-');
    }
    out << "\n";
}


///////////////////////////
///       TABLES        ///
///////////////////////////
void printRooms(std::ostream& out, const std::vector<RoomSummary>& rooms) {
    if (rooms.empty()) {
        out << "  (no rooms)\n";
        return;
    }
    printTableHeader(out, {{"Room", 8}, {"Building", 12}, {"Cap", 4}, {"Floor", 5},
                           {"Bookings", 8}, {"Facilities", 40}});
    for (const RoomSummary& r : rooms) {
        out << "    "
            << std::left << std::setw(8) << r.roomId
            << " | " << std::left << std::setw(12) << r.building
            << " | " << std::right << std::setw(4) << r.capacity
            << " | " << std::right << std::setw(5) << r.floor
            << " | " << std::right << std::setw(8) << r.bookingCount
            << " | " << std::left << formatFacilities(r.facilities)
            << "\n";
    }
}

void printSchedule(std::ostream& out, const std::vector<ScheduleEntry>& entries) {
    if (entries.empty()) {
        out << "  (no bookings)\n";
        return;
    }

    // Sort by date, then by time, and print one small table per date.
    std::vector<ScheduleEntry> sorted = entries;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ScheduleEntry& a, const ScheduleEntry& b) {
                         if (a.booking.date != b.booking.date) return a.booking.date < b.booking.date;
                         return a.booking.startMinute < b.booking.startMinute;
                     });

    std::string currentDate;
    for (const ScheduleEntry& e : sorted) {
        if (e.booking.date != currentDate) {
            currentDate = e.booking.date;
            out << "\n  " << currentDate << ":\n";
            printTableHeader(out, {{"Time", 11}, {"Room", 8}, {"Course", 14}, {"Instructor", 12}, {"Booking", 22}});
        }
        out << "    "
            << std::left << std::setw(11) << formatInterval(e.booking.startMinute, e.booking.endMinute)
            << " | " << std::left << std::setw(8) << e.room.roomId
            << " | " << std::left << std::setw(14) << e.booking.courseName
            << " | " << std::left << std::setw(12) << (e.booking.instructor.empty() ? "-" : e.booking.instructor)
            << " | " << std::left << std::setw(22) << e.booking.bookingId
            << "\n";
    }
}

void printConflicts(std::ostream& out, const std::vector<Conflict>& conflicts) {
    if (conflicts.empty()) {
        out << "  (no conflicts)\n";
        return;
    }
    printTableHeader(out, {{"Room", 8}, {"Date", 10}, {"First", 11}, {"Second", 11}, {"Courses", 30}});
    for (const Conflict& c : conflicts) {
        out << "    "
            << std::left << std::setw(8) << c.roomId
            << " | " << std::left << std::setw(10) << c.first.date
            << " | " << std::left << std::setw(11) << formatInterval(c.first.startMinute, c.first.endMinute)
            << " | " << std::left << std::setw(11) << formatInterval(c.second.startMinute, c.second.endMinute)
            << " | " << c.first.courseName << " / " << c.second.courseName
            << "\n";
    }
}

void printStatistics(std::ostream& out, const Statistics& stats) {
    out << "  Total rooms:      " << stats.totalRooms << "\n"
        << "  Total bookings:   " << stats.totalBookings << "\n"
        << "  Utilized rooms:   " << stats.utilizedRooms << "\n"
        << "  Utilization rate: " << std::fixed << std::setprecision(2) << stats.utilizationRate << "%\n"
        << std::defaultfloat
        << "  Conflicts:        " << stats.conflicts << "\n";
}

void printLogs(std::ostream& out, const std::vector<LogEntry>& entries) {
    if (entries.empty()) {
        out << "  [SYSTEM] No logs available\n";
        return;
    }
    for (const LogEntry& e : entries) {
        out << "  [" << e.timestamp << "] "
            << std::left << std::setw(9) << ("[" + std::string(logCategoryName(e.category)) + "]")
            << " " << e.message << "\n";
    }
}

void printEdges(std::ostream& out, const std::vector<std::pair<std::string, std::string>>& edges) {
    out << "  " << edges.size() << " similarity edges\n";
    for (const auto& edge : edges) {
        out << "    " << edge.first << " -- " << edge.second << "\n";
    }
}

void printAllocation(std::ostream& out, const AllocationRequest& request, const Result<Allocation>& result) {
    out << "  Request: " << request.courseName
        << " on " << request.date << " " << formatInterval(request.startMinute, request.endMinute)
        << ", capacity >= " << request.capacity;
    if (request.building) out << ", building " << *request.building;
    if (request.roomId) out << ", room " << *request.roomId;
    if (!request.facilities.empty()) out << ", needs " << formatFacilities(request.facilities);
    out << "\n";

    if (!result) {
        out << "  -> " << errorKindName(result.error().kind) << ": " << result.error().message << "\n";
        return;
    }
    const Allocation& a = result.value();
    out << "  -> Allocated " << a.room.building << " " << a.room.roomId
        << " (capacity " << a.room.capacity << "), booking " << a.bookingId << "\n";
}
