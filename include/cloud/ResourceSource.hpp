#pragma once

#include "cloud/Result.hpp"
#include "model/Account.hpp"
#include "model/Resource.hpp"
#include "model/Secret.hpp"

#include <string>
#include <vector>

namespace lv::cloud {

// Uncached access to the remote service. Implementations report failures as Error values.
class ResourceSource {
public:
    virtual ~ResourceSource() = default;

    virtual Result<std::vector<model::Account>> listAccounts() = 0;
    // One provider per call; a subscription's resources are the Key Vaults plus the Container Apps
    virtual Result<std::vector<model::Resource>> listResources(const model::Account& subscription,
                                                               model::ResourceKind kind) = 0;
    virtual Result<std::vector<model::SecretMeta>> listSecrets(const model::Resource& resource) = 0;
    virtual Result<model::SecretValue> getSecretValue(const model::Resource& resource, const std::string& name) = 0;

    virtual MutationResult setSecret(const model::Resource& resource, const std::string& name, const std::string& value) = 0;
    virtual MutationResult deleteSecret(const model::Resource& resource, const std::string& name) = 0;
};

}
