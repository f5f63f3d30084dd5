#pragma once

#include "util/Clock.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace lv::nav {

// Tracks the one revealed secret and hides it after a timeout
class RevealTimer {
public:
    explicit RevealTimer(std::chrono::seconds timeout, const util::Clock& clock = util::systemClock());

    void reveal(const std::string& key);
    void hide();

    [[nodiscard]] bool isRevealed(const std::string& key) const;
    [[nodiscard]] std::optional<std::string> revealedKey() const;

    // Hides an expired reveal; true when it did
    bool expire();

    [[nodiscard]] std::chrono::seconds timeout() const { return timeout_; }

private:
    std::chrono::seconds timeout_;
    const util::Clock& clock_;
    std::optional<std::string> key_;
    util::TimePoint hideAt_{};
};

}
