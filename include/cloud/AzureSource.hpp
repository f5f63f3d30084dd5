#pragma once

#include "cloud/AzureRestClient.hpp"
#include "cloud/ResourceSource.hpp"
#include "config/Config.hpp"

namespace lv::cli { class AzCli; }

namespace lv::cloud {

// ResourceSource backed by ARM, the Key Vault data plane, and `az` for Container App mutations
class AzureSource final : public ResourceSource {
public:
    AzureSource(cli::AzCli& az, AzureRestClient& rest, config::AzureConfig config);

    Result<std::vector<model::Account>> listAccounts() override;
    Result<std::vector<model::Resource>> listResources(const model::Account& subscription,
                                                       model::ResourceKind kind) override;
    Result<std::vector<model::SecretMeta>> listSecrets(const model::Resource& resource) override;
    Result<model::SecretValue> getSecretValue(const model::Resource& resource, const std::string& name) override;

    MutationResult setSecret(const model::Resource& resource, const std::string& name, const std::string& value) override;
    MutationResult deleteSecret(const model::Resource& resource, const std::string& name) override;

    [[nodiscard]] std::string vaultBaseUrl(const model::Resource& vault) const;

private:
    [[nodiscard]] std::string secretUrl(const model::Resource& vault, const std::string& name) const;

    cli::AzCli& az_;
    AzureRestClient& rest_;
    config::AzureConfig config_;
};

}
