#include "cloud/ResourceFetcher.hpp"
#include "cache/keys.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <iterator>

using namespace lv::cloud;
using namespace lv::logging;
using namespace lv::model;

namespace keys = lv::cache::keys;

namespace {

template <typename T, typename Fetch>
Result<T> cacheAside(lv::cache::TTLCache& cache, const std::string& key, Fetch&& fetch) {
    if (auto hit = cache.get<T>(key)) {
        LogRegistry::cache()->trace("[ResourceFetcher] hit {}", key);
        return Result<T>(std::move(*hit), true);
    }

    Result<T> fetched = [&]() -> Result<T> {
        try {
            return fetch();
        } catch (const std::exception& e) {
            LogRegistry::cloud()->error("[ResourceFetcher] Fetch for {} threw: {}", key, e.what());
            return Error{ErrorKind::Unknown, e.what()};
        }
    }();

    if (fetched) cache.set<T>(key, fetched.value());
    return fetched;
}

}

ResourceFetcher::ResourceFetcher(cache::TTLCache& cache, ResourceSource& source) : cache_(cache), source_(source) {}

Result<std::vector<Account>> ResourceFetcher::accounts() {
    return cacheAside<std::vector<Account>>(cache_, keys::ACCOUNTS, [&] { return source_.listAccounts(); });
}

std::shared_ptr<std::mutex> ResourceFetcher::subscriptionSlot(const std::string& subscriptionId) {
    std::scoped_lock lock(slotsMutex_);
    auto& slot = subscriptionSlots_[subscriptionId];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

Result<std::vector<Resource>> ResourceFetcher::resources(const Account& subscription) {
    // A caller that waited here finds the listings the first one cached
    const auto slot = subscriptionSlot(subscription.id);
    std::scoped_lock lock(*slot);

    const auto listKind = [&](const ResourceKind kind) {
        return cacheAside<std::vector<Resource>>(cache_, keys::resources(subscription.id, kind),
                                                 [&] { return source_.listResources(subscription, kind); });
    };

    auto vaults = listKind(ResourceKind::KeyVault);
    auto apps = listKind(ResourceKind::ContainerApp);

    if (!vaults && !apps) return vaults.error();

    std::vector<Resource> all;
    std::optional<Error> partial;
    if (vaults) all = std::move(vaults.value());
    else partial = Error{vaults.error().kind, fmt::format("Key Vault listing failed: {}", vaults.error().message)};
    if (apps) std::ranges::move(apps.value(), std::back_inserter(all));
    else partial = Error{apps.error().kind, fmt::format("Container App listing failed: {}", apps.error().message)};

    if (partial)
        LogRegistry::cloud()->warn("[ResourceFetcher] Partial resources for '{}': {}", subscription.name, partial->message);

    sortResources(all);
    const bool cached = vaults && apps && vaults.fromCache() && apps.fromCache();
    return Result<std::vector<Resource>>(std::move(all), cached, std::move(partial));
}

Result<std::vector<SecretMeta>> ResourceFetcher::secrets(const Resource& resource) {
    auto result = cacheAside<std::vector<SecretMeta>>(cache_, keys::secrets(resource),
                                                      [&] { return source_.listSecrets(resource); });

    // Container App listings carry values; cache each one so selection needs no second call
    if (result && !result.fromCache() && resource.isContainerApp())
        for (const auto& s : result.value())
            if (s.value)
                cache_.set<SecretValue>(keys::secretValue(resource, s.name),
                                        SecretValue{s.name, *s.value, s.contentType, s.enabled, s.created, s.updated, s.expires});

    return result;
}

Result<SecretValue> ResourceFetcher::secretValue(const Resource& resource, const std::string& name) {
    if (resource.isContainerApp()) {
        if (auto hit = cache_.get<SecretValue>(keys::secretValue(resource, name))) return Result(std::move(*hit), true);

        auto listing = secrets(resource);
        if (!listing) return listing.error();
        const auto it = std::ranges::find(listing.value(), name, &SecretMeta::name);
        if (it == listing.value().end() || !it->value)
            return Error{ErrorKind::NotFound, fmt::format("Secret '{}' not found in {}", name, resource.name)};
        return Result(SecretValue{it->name, *it->value, it->contentType, it->enabled, it->created, it->updated, it->expires},
                      listing.fromCache());
    }

    return cacheAside<SecretValue>(cache_, keys::secretValue(resource, name),
                                   [&] { return source_.getSecretValue(resource, name); });
}

bool ResourceFetcher::areAccountsCached() const {
    return cache_.contains(keys::ACCOUNTS);
}

bool ResourceFetcher::areResourcesCached(const std::string& subscriptionId) const {
    return cache_.contains(keys::resources(subscriptionId, ResourceKind::KeyVault)) &&
           cache_.contains(keys::resources(subscriptionId, ResourceKind::ContainerApp));
}

bool ResourceFetcher::areSecretsCached(const Resource& resource) const {
    return cache_.contains(keys::secrets(resource));
}

std::optional<std::vector<Account>> ResourceFetcher::cachedAccounts() const {
    return cache_.get<std::vector<Account>>(keys::ACCOUNTS);
}

std::optional<std::vector<Resource>> ResourceFetcher::cachedResources(const std::string& subscriptionId) const {
    auto vaults = cache_.get<std::vector<Resource>>(keys::resources(subscriptionId, ResourceKind::KeyVault));
    if (!vaults) return std::nullopt;
    auto apps = cache_.get<std::vector<Resource>>(keys::resources(subscriptionId, ResourceKind::ContainerApp));
    if (!apps) return std::nullopt;

    std::ranges::move(*apps, std::back_inserter(*vaults));
    sortResources(*vaults);
    return vaults;
}

std::optional<std::vector<SecretMeta>> ResourceFetcher::cachedSecrets(const Resource& resource) const {
    return cache_.get<std::vector<SecretMeta>>(keys::secrets(resource));
}

std::optional<SecretValue> ResourceFetcher::cachedSecretValue(const Resource& resource, const std::string& name) const {
    return cache_.get<SecretValue>(keys::secretValue(resource, name));
}

MutationResult ResourceFetcher::apply(const SecretMutation& mutation) {
    MutationResult result = [&] {
        try {
            switch (mutation.kind) {
                case SecretMutation::Kind::Set:
                case SecretMutation::Kind::Create:
                    return source_.setSecret(mutation.resource, mutation.name, mutation.value);
                case SecretMutation::Kind::Delete:
                    return source_.deleteSecret(mutation.resource, mutation.name);
            }
            return MutationResult::failed({ErrorKind::Unknown, "Unknown mutation"});
        } catch (const std::exception& e) {
            LogRegistry::cloud()->error("[ResourceFetcher] Mutation on {} threw: {}", mutation.resource.key(), e.what());
            return MutationResult::failed({ErrorKind::Unknown, e.what()});
        }
    }();

    if (result.success) invalidateSecrets(mutation.resource);
    return result;
}

void ResourceFetcher::invalidateAccounts() {
    cache_.invalidate(keys::ACCOUNTS);
}

void ResourceFetcher::invalidateResources(const std::string& subscriptionId) {
    cache_.invalidate(keys::resources(subscriptionId, ResourceKind::KeyVault));
    cache_.invalidate(keys::resources(subscriptionId, ResourceKind::ContainerApp));
}

void ResourceFetcher::invalidateSecrets(const Resource& resource) {
    cache_.invalidate(keys::secrets(resource));
    cache_.invalidatePrefix(keys::secretValuePrefix(resource));
}

void ResourceFetcher::clear() {
    cache_.clear();
}
