///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "timeutil.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Parse exactly @p len decimal digits starting at @p pos.
 *
 * Returns -1 if any character is not a digit.
 */
static int parseDigits(const std::string& text, size_t pos, size_t len) {
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit((unsigned char)text[i])) return -1;
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

/**
 * @brief Format the current local time with a strftime pattern.
 */
static std::string formatNow(const char* pattern) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    char buf[32] = {0};
    std::strftime(buf, sizeof(buf), pattern, &local);
    return buf;
}


///////////////////////////
///     TIME HELPERS    ///
///////////////////////////
std::optional<int> parseClockTime(const std::string& text) {
    if (text.size() != 5 || text[2] != ':') return std::nullopt;

    int hours = parseDigits(text, 0, 2);
    int minutes = parseDigits(text, 3, 2);
    if (hours < 0 || minutes < 0 || minutes > 59) return std::nullopt;

    // 24:00 closes a booking that runs until midnight.
    if (hours == 24 && minutes == 0) return MINUTES_PER_DAY;
    if (hours > 23) return std::nullopt;

    return hours * 60 + minutes;
}

std::string formatClockTime(int minutes) {
    char buf[8] = {0};
    std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return buf;
}

bool isIsoDate(const std::string& text) {
    return dateKey(text) >= 0;
}

int dateKey(const std::string& isoDate) {
    if (isoDate.size() != 10 || isoDate[4] != '-' || isoDate[7] != '-') return -1;

    int year = parseDigits(isoDate, 0, 4);
    int month = parseDigits(isoDate, 5, 2);
    int day = parseDigits(isoDate, 8, 2);
    if (year < 0 || month < 1 || month > 12 || day < 1 || day > 31) return -1;

    return year * 10000 + month * 100 + day;
}

std::string dateFromKey(int key) {
    char buf[16] = {0};
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", key / 10000, (key / 100) % 100, key % 100);
    return buf;
}

std::string nowIsoTimestamp() {
    return formatNow("%Y-%m-%dT%H:%M:%S");
}

std::string nowCompactTimestamp() {
    return formatNow("%Y%m%d%H%M%S");
}
