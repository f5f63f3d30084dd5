#include "nav/RevealTimer.hpp"

using namespace lv::nav;

RevealTimer::RevealTimer(const std::chrono::seconds timeout, const util::Clock& clock)
    : timeout_(timeout), clock_(clock) {}

void RevealTimer::reveal(const std::string& key) {
    key_ = key;
    hideAt_ = clock_.now() + timeout_;
}

void RevealTimer::hide() {
    key_.reset();
}

bool RevealTimer::isRevealed(const std::string& key) const {
    return key_ && *key_ == key && clock_.now() < hideAt_;
}

std::optional<std::string> RevealTimer::revealedKey() const {
    if (key_ && clock_.now() < hideAt_) return key_;
    return std::nullopt;
}

bool RevealTimer::expire() {
    if (!key_ || clock_.now() < hideAt_) return false;
    key_.reset();
    return true;
}
