#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace lv::config {

inline std::chrono::seconds parseDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");

    const auto number = [&str] {
        const auto digits = str.substr(0, str.size() - 1);
        if (digits.empty()) throw std::invalid_argument("Invalid duration: " + str);
        return std::stoull(digits);
    };

    switch (str.back()) {
        case 'd': case 'D': return std::chrono::hours(number() * 24);
        case 'h': case 'H': return std::chrono::hours(number());
        case 'm': case 'M': return std::chrono::minutes(number());
        case 's': case 'S': return std::chrono::seconds(number());
        default: break;
    }

    // Assume seconds if no suffix
    return std::chrono::seconds(std::stoull(str));
}

inline std::string durationToString(const std::chrono::seconds d) {
    const auto s = d.count();
    if (s % 86400 == 0) return std::to_string(s / 86400) + "d";
    if (s % 3600 == 0) return std::to_string(s / 3600) + "h";
    if (s % 60 == 0) return std::to_string(s / 60) + "m";
    return std::to_string(s) + "s";
}

}
