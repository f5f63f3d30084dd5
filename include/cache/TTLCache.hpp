#pragma once

#include "util/Clock.hpp"

#include <any>
#include <chrono>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace lv::cache {

// Thread-safe key/value store with per-entry expiry. Entries are replaced whole, never merged,
// so a reader sees either the previous value, the new value, or a miss.
class TTLCache {
public:
    using Duration = std::chrono::system_clock::duration;

    static constexpr Duration DEFAULT_TTL = std::chrono::hours(24 * 365);

    explicit TTLCache(Duration defaultTtl = DEFAULT_TTL, const util::Clock& clock = util::systemClock());

    TTLCache(const TTLCache&) = delete;
    TTLCache& operator=(const TTLCache&) = delete;

    template <typename T>
    void set(const std::string& key, T value, std::optional<Duration> ttl = std::nullopt) {
        store(key, std::make_shared<const std::any>(std::move(value)), ttl);
    }

    // Absent when missing, expired, or stored under a different type
    template <typename T>
    [[nodiscard]] std::optional<T> get(const std::string& key) {
        const auto value = lookup(key);
        if (!value) return std::nullopt;
        if (const auto* typed = std::any_cast<T>(value.get())) return *typed;
        return std::nullopt;
    }

    [[nodiscard]] bool contains(const std::string& key);

    void invalidate(const std::string& key);
    void invalidatePrefix(const std::string& prefix);
    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] Duration defaultTtl() const { return defaultTtl_; }

private:
    struct CacheEntry {
        std::shared_ptr<const std::any> value;
        util::TimePoint expiresAt;
    };

    void store(const std::string& key, std::shared_ptr<const std::any> value, std::optional<Duration> ttl);
    std::shared_ptr<const std::any> lookup(const std::string& key);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
    Duration defaultTtl_;
    const util::Clock& clock_;
};

}
