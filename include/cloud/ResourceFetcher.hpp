#pragma once

#include "cache/TTLCache.hpp"
#include "cloud/ResourceSource.hpp"
#include "model/Mutation.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lv::cloud {

// Cache-aside front for a ResourceSource. Successful fetches are cached with the default TTL,
// failures never are. The fetching calls may block on the network and belong on a worker thread;
// the cached* readers only touch the cache.
class ResourceFetcher {
public:
    ResourceFetcher(cache::TTLCache& cache, ResourceSource& source);

    ResourceFetcher(const ResourceFetcher&) = delete;
    ResourceFetcher& operator=(const ResourceFetcher&) = delete;

    Result<std::vector<model::Account>> accounts();

    // Key Vaults and Container Apps, each cached separately. One provider failing still returns the
    // other's resources, with the failure in partialError(). Concurrent calls for one subscription
    // share a single fetch.
    Result<std::vector<model::Resource>> resources(const model::Account& subscription);
    Result<std::vector<model::SecretMeta>> secrets(const model::Resource& resource);
    Result<model::SecretValue> secretValue(const model::Resource& resource, const std::string& name);

    [[nodiscard]] bool areAccountsCached() const;
    [[nodiscard]] bool areResourcesCached(const std::string& subscriptionId) const;
    [[nodiscard]] bool areSecretsCached(const model::Resource& resource) const;
    [[nodiscard]] std::optional<std::vector<model::Account>> cachedAccounts() const;
    // Present only when both providers' listings are cached
    [[nodiscard]] std::optional<std::vector<model::Resource>> cachedResources(const std::string& subscriptionId) const;
    [[nodiscard]] std::optional<std::vector<model::SecretMeta>> cachedSecrets(const model::Resource& resource) const;
    [[nodiscard]] std::optional<model::SecretValue> cachedSecretValue(const model::Resource& resource,
                                                                      const std::string& name) const;

    // Passes through to the source; on success drops the resource's listing and values
    MutationResult apply(const model::SecretMutation& mutation);

    void invalidateAccounts();
    void invalidateResources(const std::string& subscriptionId);
    void invalidateSecrets(const model::Resource& resource);
    void clear();

private:
    std::shared_ptr<std::mutex> subscriptionSlot(const std::string& subscriptionId);

    cache::TTLCache& cache_;
    ResourceSource& source_;

    std::mutex slotsMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> subscriptionSlots_;
};

}
