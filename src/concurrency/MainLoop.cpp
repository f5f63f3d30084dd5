#include "concurrency/MainLoop.hpp"
#include "logging/LogRegistry.hpp"

using namespace lv::concurrency;
using namespace lv::logging;

void MainLoop::post(std::function<void()> fn) {
    {
        std::scoped_lock lock(mutex_);
        queue_.push_back(std::move(fn));
    }
    cv_.notify_all();
}

size_t MainLoop::runPending() {
    std::deque<std::function<void()>> batch;
    {
        std::scoped_lock lock(mutex_);
        batch.swap(queue_);
    }

    for (auto& fn : batch) {
        try {
            fn();
        } catch (const std::exception& e) {
            LogRegistry::lazyvault()->error("[MainLoop] Posted callback threw: {}", e.what());
        }
    }
    return batch.size();
}

bool MainLoop::runUntil(const std::function<bool()>& done, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        runPending();
        if (done()) return true;

        std::unique_lock lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return !queue_.empty(); })) {
            lock.unlock();
            runPending();
            return done();
        }
    }
}

size_t MainLoop::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}
