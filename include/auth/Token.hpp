#pragma once

#include "util/Clock.hpp"

#include <chrono>
#include <string>

namespace lv::auth {

struct Token {
    std::string accessToken;
    util::TimePoint expiresOn;

    // Usable when it outlives `now` by more than `margin`
    [[nodiscard]] bool isFresh(const util::TimePoint now, const std::chrono::minutes margin) const {
        return expiresOn - now > margin;
    }
};

}
