#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lv::concurrency {

struct ProgressEvent {
    size_t completed{0};
    size_t total{0};
    std::string currentId;

    bool operator==(const ProgressEvent&) const = default;
};

// Single-consumer event stream of one bulk load. Closed by the producer when the load finishes.
class ProgressStream {
public:
    explicit ProgressStream(std::shared_ptr<std::atomic<bool>> cancelFlag);

    // Blocks until an event arrives; empty once the stream is closed and drained
    std::optional<ProgressEvent> next();
    std::optional<ProgressEvent> nextFor(std::chrono::milliseconds timeout);
    std::optional<ProgressEvent> tryNext();

    // Called on the producer thread after every event and once on close
    void setNotifier(std::function<void()> notifier);

    // Cancels the owning load
    void cancel();
    [[nodiscard]] bool isCancelled() const;
    [[nodiscard]] bool isClosed() const;

    void push(ProgressEvent event);
    void close();

private:
    void notify();

    std::shared_ptr<std::atomic<bool>> cancelFlag_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> events_;
    bool closed_{false};
    std::function<void()> notifier_;
};

}
