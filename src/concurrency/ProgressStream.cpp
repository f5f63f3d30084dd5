#include "concurrency/ProgressStream.hpp"

using namespace lv::concurrency;

ProgressStream::ProgressStream(std::shared_ptr<std::atomic<bool>> cancelFlag) : cancelFlag_(std::move(cancelFlag)) {}

std::optional<ProgressEvent> ProgressStream::next() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;
    auto ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

std::optional<ProgressEvent> ProgressStream::nextFor(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; })) return std::nullopt;
    if (events_.empty()) return std::nullopt;
    auto ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

std::optional<ProgressEvent> ProgressStream::tryNext() {
    std::scoped_lock lock(mutex_);
    if (events_.empty()) return std::nullopt;
    auto ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

void ProgressStream::setNotifier(std::function<void()> notifier) {
    bool pending;
    {
        std::scoped_lock lock(mutex_);
        notifier_ = std::move(notifier);
        pending = !events_.empty() || closed_;
    }
    // events published before registration still reach the consumer
    if (pending) notify();
}

void ProgressStream::cancel() {
    cancelFlag_->store(true);
}

bool ProgressStream::isCancelled() const {
    return cancelFlag_->load();
}

bool ProgressStream::isClosed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

void ProgressStream::push(ProgressEvent event) {
    {
        std::scoped_lock lock(mutex_);
        if (closed_) return;
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
    notify();
}

void ProgressStream::close() {
    {
        std::scoped_lock lock(mutex_);
        if (closed_) return;
        closed_ = true;
    }
    cv_.notify_all();
    notify();
}

void ProgressStream::notify() {
    std::function<void()> fn;
    {
        std::scoped_lock lock(mutex_);
        fn = notifier_;
    }
    if (fn) fn();
}
