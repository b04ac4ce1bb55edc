#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <optional>
#include <string>


///////////////////////////
///     TIME HELPERS    ///
///////////////////////////
/// Minutes in one day; the exclusive upper bound for booking times.
static constexpr int MINUTES_PER_DAY = 24 * 60;

/**
 * @brief Parse a zero-padded "HH:MM" clock time into minutes since midnight.
 *
 * Accepts 00:00..23:59 and the end-of-day marker 24:00.
 */
std::optional<int> parseClockTime(const std::string& text);

/**
 * @brief Format minutes since midnight as zero-padded "HH:MM".
 */
std::string formatClockTime(int minutes);

/**
 * @brief Check that a string is a plausible ISO-8601 date (YYYY-MM-DD).
 *
 * Month must be 1..12 and day 1..31; no per-month calendar validation.
 */
bool isIsoDate(const std::string& text);

/**
 * @brief Encode an ISO date as the integer YYYYMMDD, or -1 if malformed.
 *
 * Preserves ordering, so it can replace the string in flat numeric buffers.
 */
int dateKey(const std::string& isoDate);

/**
 * @brief Inverse of dateKey().
 */
std::string dateFromKey(int key);

/// Current local time as "YYYY-MM-DDTHH:MM:SS".
std::string nowIsoTimestamp();

/// Current local time as "YYYYMMDDHHMMSS".
std::string nowCompactTimestamp();
