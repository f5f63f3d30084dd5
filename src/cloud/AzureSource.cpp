#include "cloud/AzureSource.hpp"
#include "cli/AzCli.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace lv::cloud;
using namespace lv::logging;
using namespace lv::model;
using json = nlohmann::json;

AzureSource::AzureSource(cli::AzCli& az, AzureRestClient& rest, config::AzureConfig config)
    : az_(az), rest_(rest), config_(std::move(config)) {}

Result<std::vector<Account>> AzureSource::listAccounts() {
    return az_.listAccounts();
}

Result<std::vector<Resource>> AzureSource::listResources(const Account& subscription, const ResourceKind kind) {
    const auto url = kind == ResourceKind::KeyVault
        ? fmt::format("{}/subscriptions/{}/providers/Microsoft.KeyVault/vaults?api-version={}",
                      config_.management_endpoint, subscription.id, config_.keyvault_arm_api_version)
        : fmt::format("{}/subscriptions/{}/providers/Microsoft.App/containerApps?api-version={}",
                      config_.management_endpoint, subscription.id, config_.containerapps_api_version);

    auto rows = rest_.getPaged(url, subscription.tenantId, ARM_SCOPE);
    if (!rows) {
        LogRegistry::cloud()->warn("[AzureSource] {} listing failed for '{}': {}", to_string(kind), subscription.name,
                                   rows.error().describe());
        return rows.error();
    }

    std::vector<Resource> out;
    out.reserve(rows.value().size());
    for (const auto& row : rows.value()) {
        auto r = resource_from_json(row, kind, subscription.tenantId);
        if (r.subscriptionId.empty()) r.subscriptionId = subscription.id;
        out.push_back(std::move(r));
    }
    sortResources(out);
    return out;
}

std::string AzureSource::vaultBaseUrl(const Resource& vault) const {
    std::string base = vault.vaultUri.empty()
        ? fmt::format("https://{}.{}", vault.name, config_.keyvault_dns_suffix)
        : vault.vaultUri;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base;
}

std::string AzureSource::secretUrl(const Resource& vault, const std::string& name) const {
    return fmt::format("{}/secrets/{}?api-version={}", vaultBaseUrl(vault), name, config_.keyvault_api_version);
}

Result<std::vector<SecretMeta>> AzureSource::listSecrets(const Resource& resource) {
    std::vector<SecretMeta> secrets;

    if (resource.isKeyVault()) {
        const auto url = fmt::format("{}/secrets?api-version={}", vaultBaseUrl(resource), config_.keyvault_api_version);
        auto rows = rest_.getPaged(url, resource.tenantId, KEYVAULT_SCOPE);
        if (!rows) return rows.error();
        for (const auto& row : rows.value()) secrets.push_back(keyvault_secret_meta_from_json(row));
    } else {
        const auto url = fmt::format("{}{}/listSecrets?api-version={}",
                                     config_.management_endpoint, resource.id, config_.containerapps_api_version);
        auto body = rest_.post(url, resource.tenantId, ARM_SCOPE);
        if (!body) return body.error();
        if (body.value().contains("value") && body.value()["value"].is_array())
            for (const auto& row : body.value()["value"]) secrets.push_back(containerapp_secret_from_json(row));
    }

    sortSecrets(secrets);
    return secrets;
}

Result<SecretValue> AzureSource::getSecretValue(const Resource& resource, const std::string& name) {
    if (resource.isKeyVault()) {
        auto body = rest_.get(secretUrl(resource, name), resource.tenantId, KEYVAULT_SCOPE);
        if (!body) return body.error();
        auto value = keyvault_secret_value_from_json(body.value());
        if (value.name.empty()) value.name = name;
        return value;
    }

    auto listing = listSecrets(resource);
    if (!listing) return listing.error();
    const auto it = std::ranges::find(listing.value(), name, &SecretMeta::name);
    if (it == listing.value().end() || !it->value)
        return Error{ErrorKind::NotFound, fmt::format("Secret '{}' not found in {}", name, resource.name)};
    return SecretValue{it->name, *it->value, std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt};
}

MutationResult AzureSource::setSecret(const Resource& resource, const std::string& name, const std::string& value) {
    if (resource.isContainerApp()) return az_.setContainerAppSecret(resource, name, value);

    const json body = {{"value", value}};
    auto res = rest_.put(secretUrl(resource, name), resource.tenantId, KEYVAULT_SCOPE, body.dump());
    if (!res) return MutationResult::failed(res.error());
    return MutationResult::ok();
}

MutationResult AzureSource::deleteSecret(const Resource& resource, const std::string& name) {
    if (resource.isContainerApp()) return az_.removeContainerAppSecret(resource, name);

    auto res = rest_.del(secretUrl(resource, name), resource.tenantId, KEYVAULT_SCOPE);
    if (!res) return MutationResult::failed(res.error());
    return MutationResult::ok();
}
