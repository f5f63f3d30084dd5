#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace lv::util {

// "2025-01-31 14:05:09.123456" in the machine's local zone, as printed by `az account get-access-token`
inline std::time_t parseLocalTimestamp(const std::string& timestampStr) {
    std::tm tm = {};
    std::istringstream ss(timestampStr.substr(0, 19)); // truncate to "YYYY-MM-DD HH:MM:SS"
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

inline std::string formatLocal(const std::optional<std::time_t>& ts, const std::string& fallback = "-") {
    if (!ts) return fallback;
    std::tm tm = {};
    localtime_r(&*ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

inline std::chrono::system_clock::time_point fromEpochSeconds(const long long seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

} // namespace lv::util
