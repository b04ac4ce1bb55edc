#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <vector>


///////////////////////////
///    ACTIVITY LOG     ///
///////////////////////////
/**
 * @brief Category of an activity log entry.
 */
enum class LogCategory { INFO, SUCCESS, ERROR };

/// Lower-case category name ("info", "success", "error").
const char* logCategoryName(LogCategory c);

/// Reverse of logCategoryName(); std::nullopt for unknown names.
std::optional<LogCategory> parseLogCategory(const std::string& name);

/**
 * @brief One recorded engine event.
 */
struct LogEntry {
    LogCategory category;
    std::string message;
    std::string timestamp; ///< ISO-8601 local time.
};

/**
 * @brief Bounded, append-only record of engine events.
 *
 * Holds at most capacity() entries; when full, the oldest entry is dropped.
 * Readers get entries most-recent-first. Not synchronized; the service
 * facade serializes writers.
 */
class ActivityLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 100;

    explicit ActivityLog(size_t capacity = DEFAULT_CAPACITY);

    /**
     * @brief Mirror every new entry to @p sink as "[CATEGORY] message".
     *
     * Pass nullptr to stop echoing. The stream must outlive the log.
     */
    void setEcho(std::ostream* sink) { echo_ = sink; }

    /// Append a timestamped entry, evicting the oldest ones beyond capacity.
    void record(LogCategory category, const std::string& message);

    /// All entries, most recent first.
    std::vector<LogEntry> readAll() const;

    /// Entries of one category, most recent first.
    std::vector<LogEntry> filter(LogCategory category) const;

    /// "[timestamp] [CATEGORY] message" lines, most recent first.
    std::string exportText() const;

    /// Drop every entry, then record that the log was cleared.
    void clear();

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;

    /// Oldest entry at the front, newest at the back.
    std::deque<LogEntry> entries_;

    std::ostream* echo_ = nullptr;
};
