#include "cache/TTLCache.hpp"

#include <mutex>

using namespace lv::cache;

TTLCache::TTLCache(const Duration defaultTtl, const util::Clock& clock)
    : defaultTtl_(defaultTtl), clock_(clock) {}

void TTLCache::store(const std::string& key, std::shared_ptr<const std::any> value, const std::optional<Duration> ttl) {
    const auto expiresAt = clock_.now() + ttl.value_or(defaultTtl_);
    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(key, CacheEntry{std::move(value), expiresAt});
}

std::shared_ptr<const std::any> TTLCache::lookup(const std::string& key) {
    const auto now = clock_.now();

    {
        std::shared_lock lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end()) return nullptr;
        if (now < it->second.expiresAt) return it->second.value;
    }

    // Expired: purge, unless a writer replaced it with a fresh entry in between
    std::unique_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    if (now < it->second.expiresAt) return it->second.value;
    entries_.erase(it);
    return nullptr;
}

bool TTLCache::contains(const std::string& key) {
    return lookup(key) != nullptr;
}

void TTLCache::invalidate(const std::string& key) {
    std::unique_lock lock(mutex_);
    entries_.erase(key);
}

void TTLCache::invalidatePrefix(const std::string& prefix) {
    std::unique_lock lock(mutex_);
    std::erase_if(entries_, [&prefix](const auto& item) { return item.first.starts_with(prefix); });
}

void TTLCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

size_t TTLCache::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}
