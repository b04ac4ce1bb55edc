#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <random>
#include <string>
#include <unordered_set>
#include <vector>


///////////////////////////
///     BOOKING IDS     ///
///////////////////////////
/**
 * @brief Generator for engine-wide unique booking ids.
 *
 * Ids look like "BK" + YYYYMMDDHHMMSS + 6 random characters from [A-Z0-9].
 * A second-resolution timestamp plus random suffix can collide in theory,
 * so every issued (or imported) id is remembered and a colliding candidate
 * is regenerated.
 */
class BookingIdGenerator {
public:
    static constexpr int SUFFIX_LENGTH = 6;

    /**
     * @brief Create a generator.
     *
     * @param seed Seed for the suffix RNG; 0 draws one from std::random_device.
     */
    explicit BookingIdGenerator(unsigned seed = 0);

    /// Return a fresh id that was never issued or reserved before.
    std::string next();

    /**
     * @brief Mark an externally created id as taken.
     *
     * @return false if the id was already known.
     */
    bool reserve(const std::string& id);

    bool isIssued(const std::string& id) const { return issued_.count(id) > 0; }

    /// Number of candidates rejected because they were already taken.
    int collisions() const { return collisions_; }

private:
    std::mt19937 rng_;
    std::unordered_set<std::string> issued_;
    int collisions_ = 0;

    /// Build one candidate id from the current time and a random suffix.
    std::string candidate();
};


///////////////////////////
///      CALENDAR       ///
///////////////////////////
/**
 * @brief Per-room list of bookings in insertion order.
 *
 * Bookings are append-only. Availability uses the half-open overlap rule,
 * so back-to-back bookings are legal.
 */
class BookingCalendar {
public:
    /**
     * @brief Check that no booking on @p date overlaps [start, end).
     */
    bool isAvailable(const std::string& date, int startMinute, int endMinute) const;

    /**
     * @brief Append a new booking with a generated id and creation timestamp.
     *
     * Does not check availability; callers check first inside the same
     * critical section.
     *
     * @return The generated booking id.
     */
    std::string book(BookingIdGenerator& ids,
                     const std::string& date,
                     int startMinute,
                     int endMinute,
                     const std::string& courseName,
                     const std::string& instructor);

    /**
     * @brief Append an existing booking record verbatim.
     *
     * Used when restoring schedules; overlapping records are accepted and
     * show up later in conflict audits.
     */
    void append(const Booking& booking);

    const std::vector<Booking>& bookings() const { return bookings_; }
    size_t size() const { return bookings_.size(); }
    bool empty() const { return bookings_.empty(); }

    /// Copy of the bookings ordered by (date, start time).
    std::vector<Booking> sortedByStart() const;

private:
    std::vector<Booking> bookings_;
};
