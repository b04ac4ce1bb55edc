///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "calendar.hpp"
#include "timeutil.hpp"
#include <algorithm>


///////////////////////////
///     BOOKING IDS     ///
///////////////////////////
BookingIdGenerator::BookingIdGenerator(unsigned seed)
        : rng_(seed != 0 ? seed : std::random_device{}()) {}

std::string BookingIdGenerator::candidate() {
    static const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::uniform_int_distribution<int> pick(0, (int)sizeof(kAlphabet) - 2);

    std::string id = "BK" + nowCompactTimestamp();
    for (int i = 0; i < SUFFIX_LENGTH; ++i) {
        id.push_back(kAlphabet[pick(rng_)]);
    }
    return id;
}

std::string BookingIdGenerator::next() {
    std::string id = candidate();
    while (!issued_.insert(id).second) {
        ++collisions_;
        id = candidate();
    }
    return id;
}

bool BookingIdGenerator::reserve(const std::string& id) {
    return issued_.insert(id).second;
}


///////////////////////////
///      CALENDAR       ///
///////////////////////////
bool BookingCalendar::isAvailable(const std::string& date, int startMinute, int endMinute) const {
    for (const Booking& b : bookings_) {
        if (b.date != date) continue;
        if (intervalsOverlap(startMinute, endMinute, b.startMinute, b.endMinute))
            return false;
    }
    return true;
}

std::string BookingCalendar::book(BookingIdGenerator& ids,
                                  const std::string& date,
                                  int startMinute,
                                  int endMinute,
                                  const std::string& courseName,
                                  const std::string& instructor) {
    Booking b;
    b.bookingId = ids.next();
    b.date = date;
    b.startMinute = startMinute;
    b.endMinute = endMinute;
    b.courseName = courseName;
    b.instructor = instructor;
    b.createdAt = nowIsoTimestamp();
    bookings_.push_back(b);
    return b.bookingId;
}

void BookingCalendar::append(const Booking& booking) {
    bookings_.push_back(booking);
}

std::vector<Booking> BookingCalendar::sortedByStart() const {
    std::vector<Booking> sorted = bookings_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Booking& a, const Booking& b) {
                         if (a.date != b.date) return a.date < b.date;
                         return a.startMinute < b.startMinute;
                     });
    return sorted;
}
