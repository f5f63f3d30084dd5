#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace lv::concurrency {

// UI-thread dispatcher. Any thread may post; only the UI thread pumps.
class MainLoop {
public:
    void post(std::function<void()> fn);

    // Runs everything queued so far, returns how many ran
    size_t runPending();

    // Pumps until `done()` holds or `timeout` elapses; returns `done()`
    bool runUntil(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    [[nodiscard]] size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
};

}
