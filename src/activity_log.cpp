///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "activity_log.hpp"
#include "timeutil.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
const char* logCategoryName(LogCategory c) {
    switch (c) {
        case LogCategory::INFO:    return "info";
        case LogCategory::SUCCESS: return "success";
        case LogCategory::ERROR:   return "error";
    }
    return "unknown";
}

std::optional<LogCategory> parseLogCategory(const std::string& name) {
    if (name == "info") return LogCategory::INFO;
    if (name == "success") return LogCategory::SUCCESS;
    if (name == "error") return LogCategory::ERROR;
    return std::nullopt;
}

static std::string upperName(LogCategory c) {
    std::string name = logCategoryName(c);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char ch) { return (char)std::toupper(ch); });
    return name;
}


///////////////////////////
///    ACTIVITY LOG     ///
///////////////////////////
ActivityLog::ActivityLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void ActivityLog::record(LogCategory category, const std::string& message) {
    entries_.push_back({category, message, nowIsoTimestamp()});

    // FIFO eviction keeps only the newest capacity_ entries.
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }

    if (echo_) {
        *echo_ << "[" << upperName(category) << "] " << message << "\n";
    }
}

std::vector<LogEntry> ActivityLog::readAll() const {
    return std::vector<LogEntry>(entries_.rbegin(), entries_.rend());
}

std::vector<LogEntry> ActivityLog::filter(LogCategory category) const {
    std::vector<LogEntry> out;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->category == category) out.push_back(*it);
    }
    return out;
}

std::string ActivityLog::exportText() const {
    std::ostringstream ss;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        ss << "[" << it->timestamp << "] [" << upperName(it->category) << "] " << it->message << "\n";
    }
    return ss.str();
}

void ActivityLog::clear() {
    entries_.clear();
    record(LogCategory::INFO, "Logs cleared by user");
}
