#pragma once

#include <chrono>

namespace lv::util {

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const { return std::chrono::system_clock::now(); }
};

// Shared default for components constructed without an explicit clock
inline const Clock& systemClock() {
    static const Clock clock;
    return clock;
}

}
