#pragma once

#include "auth/TokenCache.hpp"
#include "cloud/Result.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lv::cloud {

inline constexpr auto ARM_SCOPE = "https://management.azure.com/.default";
inline constexpr auto KEYVAULT_SCOPE = "https://vault.azure.net/.default";

// Bearer-authenticated JSON calls against ARM and the Key Vault data plane
class AzureRestClient {
public:
    AzureRestClient(auth::TokenCache& tokens, unsigned int timeoutSeconds);

    Result<nlohmann::json> get(const std::string& url, const std::string& tenantId, const std::string& scope);
    Result<nlohmann::json> post(const std::string& url, const std::string& tenantId, const std::string& scope,
                                const std::string& body = "{}");
    Result<nlohmann::json> put(const std::string& url, const std::string& tenantId, const std::string& scope,
                               const std::string& body);
    Result<nlohmann::json> del(const std::string& url, const std::string& tenantId, const std::string& scope);

    // GETs `url` and every `nextLink` after it, concatenating the `value` arrays
    Result<std::vector<nlohmann::json>> getPaged(const std::string& url, const std::string& tenantId,
                                                 const std::string& scope);

    // `error.message` from an Azure error body, or the raw body
    static std::string errorMessage(long status, const std::string& body);

private:
    Result<nlohmann::json> request(const std::string& method, const std::string& url, const std::string& tenantId,
                                   const std::string& scope, const std::string* body);

    auth::TokenCache& tokens_;
    unsigned int timeoutSeconds_;
};

}
