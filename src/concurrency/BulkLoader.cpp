#include "concurrency/BulkLoader.hpp"
#include "logging/LogRegistry.hpp"

#include <unordered_set>

using namespace lv::concurrency;
using namespace lv::logging;

BulkLoad::BulkLoad(const size_t total, std::shared_ptr<std::atomic<bool>> cancelFlag)
    : total_(total), cancelFlag_(std::move(cancelFlag)),
      progress_(std::make_shared<ProgressStream>(cancelFlag_)) {}

void BulkLoad::cancel() {
    cancelFlag_->store(true);
}

void BulkLoad::wait() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return completed_ + skipped_ >= total_; });
}

bool BulkLoad::waitFor(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return completed_ + skipped_ >= total_; });
}

bool BulkLoad::isDone() const {
    std::scoped_lock lock(mutex_);
    return completed_ + skipped_ >= total_;
}

size_t BulkLoad::completed() const {
    std::scoped_lock lock(mutex_);
    return completed_;
}

size_t BulkLoad::skipped() const {
    std::scoped_lock lock(mutex_);
    return skipped_;
}

void BulkLoad::itemFinished(const std::string& id, const bool ran) {
    bool done;
    {
        std::scoped_lock lock(mutex_);
        if (ran) {
            ++completed_;
            // pushed under the lock so consumers see `completed` in increasing order
            progress_->push({completed_, total_, id});
        } else {
            ++skipped_;
        }
        done = completed_ + skipped_ >= total_;
    }

    if (done) {
        progress_->close();
        cv_.notify_all();
    }
}

BulkLoader::BulkLoader(const unsigned int concurrency) : pool_(concurrency, "bulk") {}

std::shared_ptr<BulkLoad> BulkLoader::load(const std::vector<std::string>& ids, const IsCached& isCached,
                                           FetchOne fetchOne) {
    std::vector<std::string> pending;
    std::unordered_set<std::string> seen;
    for (const auto& id : ids)
        if (seen.insert(id).second && !(isCached && isCached(id))) pending.push_back(id);

    auto load = std::make_shared<BulkLoad>(pending.size(), std::make_shared<std::atomic<bool>>(false));

    if (pending.empty()) {
        load->progress_->push({0, 0, ""});
        load->progress_->close();
        return load;
    }

    LogRegistry::cache()->debug("[BulkLoader] Loading {} of {} ids", pending.size(), ids.size());

    const auto fetch = std::make_shared<FetchOne>(std::move(fetchOne));
    for (auto& id : pending) {
        pool_.submit([load, fetch, id] {
            if (load->isCancelled()) {
                load->itemFinished(id, false);
                return;
            }

            try {
                (*fetch)(id);
            } catch (const std::exception& e) {
                LogRegistry::cache()->error("[BulkLoader] Fetch of '{}' threw: {}", id, e.what());
            }
            load->itemFinished(id, true);
        }, "bulk:" + id);
    }

    return load;
}
