#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace trashy::util {

// Trash records carry local wall-clock time without a zone
static constexpr const auto* TRASH_DATETIME_FORMAT = "%Y-%m-%dT%H:%M:%S";

inline std::string localTimestamp(const std::time_t ts) {
    std::tm tm{};
    localtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, TRASH_DATETIME_FORMAT);
    return oss.str();
}

inline std::optional<std::time_t> parseLocalTimestamp(const std::string& str) {
    std::tm tm{};
    std::istringstream ss(str.substr(0, 19)); // ignore fractional seconds / zone suffixes
    ss >> std::get_time(&tm, TRASH_DATETIME_FORMAT);
    if (ss.fail()) return std::nullopt;
    tm.tm_isdst = -1;
    const auto t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return t;
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::time_t now() {
    return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
}

} // namespace trashy::util
