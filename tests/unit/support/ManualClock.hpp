#pragma once

#include "util/Clock.hpp"

#include <atomic>
#include <chrono>

namespace lv::test {

class ManualClock final : public util::Clock {
public:
    ManualClock() : now_(std::chrono::system_clock::from_time_t(1'700'000'000)) {}

    [[nodiscard]] util::TimePoint now() const override { return now_.load(); }

    void advance(const std::chrono::system_clock::duration d) { now_.store(now_.load() + d); }

private:
    std::atomic<util::TimePoint> now_;
};

}
