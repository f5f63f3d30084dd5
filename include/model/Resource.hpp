#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace lv::model {

enum class ResourceKind { KeyVault, ContainerApp };

std::string to_string(ResourceKind kind);

// A secret-holding Azure resource: a Key Vault or a Container App
struct Resource {
    ResourceKind kind{ResourceKind::KeyVault};
    std::string id;             // ARM resource id
    std::string name;
    std::string location;
    std::string resourceGroup;
    std::string subscriptionId;
    std::string tenantId;
    std::string vaultUri;       // Key Vault only

    // "kv/<name>" or "ca/<name>"; the identifier segment of every cache key for this resource
    [[nodiscard]] std::string key() const;

    [[nodiscard]] bool isKeyVault() const { return kind == ResourceKind::KeyVault; }
    [[nodiscard]] bool isContainerApp() const { return kind == ResourceKind::ContainerApp; }

    bool operator==(const Resource& other) const { return kind == other.kind && name == other.name; }
};

// Parses an ARM resource JSON row; `kind` comes from the endpoint it was listed from
Resource resource_from_json(const nlohmann::json& j, ResourceKind kind, const std::string& tenantId);

// Extracts the resource group segment of an ARM id, empty when absent
std::string resourceGroupFromId(const std::string& armId);

// Key Vaults by name, then Container Apps by name
void sortResources(std::vector<Resource>& resources);

}
