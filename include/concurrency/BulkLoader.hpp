#pragma once

#include "concurrency/ProgressStream.hpp"
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lv::concurrency {

// Handle for one bulk load
class BulkLoad {
public:
    BulkLoad(size_t total, std::shared_ptr<std::atomic<bool>> cancelFlag);

    [[nodiscard]] std::shared_ptr<ProgressStream> progress() const { return progress_; }

    // Items not yet started are skipped; running items finish
    void cancel();
    [[nodiscard]] bool isCancelled() const { return cancelFlag_->load(); }

    // Returns once every item has run or been skipped
    void wait();
    bool waitFor(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isDone() const;
    [[nodiscard]] size_t total() const { return total_; }
    [[nodiscard]] size_t completed() const;
    [[nodiscard]] size_t skipped() const;

private:
    friend class BulkLoader;

    void itemFinished(const std::string& id, bool ran);

    const size_t total_;
    std::shared_ptr<std::atomic<bool>> cancelFlag_;
    std::shared_ptr<ProgressStream> progress_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t completed_{0};
    size_t skipped_{0};
};

// Fetches many ids on a bounded pool of its own, skipping ids that are already cached.
// The pool bound caps in-flight fetches across every load started from one loader.
class BulkLoader {
public:
    using IsCached = std::function<bool(const std::string&)>;
    using FetchOne = std::function<void(const std::string&)>;

    explicit BulkLoader(unsigned int concurrency);

    BulkLoader(const BulkLoader&) = delete;
    BulkLoader& operator=(const BulkLoader&) = delete;

    std::shared_ptr<BulkLoad> load(const std::vector<std::string>& ids, const IsCached& isCached, FetchOne fetchOne);

    [[nodiscard]] unsigned int concurrency() const { return pool_.workerCount(); }

    void stop() { pool_.stop(); }

private:
    ThreadPool pool_;
};

}
