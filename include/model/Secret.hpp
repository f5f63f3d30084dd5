#pragma once

#include <ctime>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace lv::model {

// Listing row. Container App listings carry the value, Key Vault listings never do.
struct SecretMeta {
    std::string name;
    std::optional<std::string> value;
    std::optional<std::string> contentType;
    std::optional<bool> enabled;
    std::optional<std::time_t> created, updated, expires;
};

struct SecretValue {
    std::string name;
    std::string value;
    std::optional<std::string> contentType;
    std::optional<bool> enabled;
    std::optional<std::time_t> created, updated, expires;
};

// Last path segment of a Key Vault secret id: https://v.vault.azure.net/secrets/<name>[/<version>]
std::string secretNameFromId(const std::string& id);

SecretMeta keyvault_secret_meta_from_json(const nlohmann::json& j);
SecretValue keyvault_secret_value_from_json(const nlohmann::json& j);
SecretMeta containerapp_secret_from_json(const nlohmann::json& j);

void sortSecrets(std::vector<SecretMeta>& secrets);

// Case-insensitive substring match on the name; an empty filter keeps everything
std::vector<SecretMeta> filterSecrets(const std::vector<SecretMeta>& secrets, const std::string& filter);

}
