#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace lv::concurrency;
using namespace lv::logging;

ThreadPool::ThreadPool(const unsigned int nThreads, std::string name) : name_(std::move(name)) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool '" + name_ + "' needs at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) {
        spawnWorker();
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task> > empty;
        std::swap(queue, empty);
        stopFlag.store(true);
    }
    cv.notify_all();

    for (auto& t : threads_) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
        else if (t.joinable()) t.detach(); // stop() called from one of our own tasks
    }

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool '" + name_ + "' is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

void ThreadPool::submit(std::function<void()> fn, std::string label) {
    submit(std::make_shared<FnTask>(std::move(fn), std::move(label)));
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (task) {
                ++busyCount_;
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    LogRegistry::lazyvault()->error("[ThreadPool:{}] Task '{}' threw: {}", name_, task->name(), e.what());
                }
                --busyCount_;
            }
        }
    });
}
