#pragma once

#include "auth/Token.hpp"
#include "cli/CommandRunner.hpp"
#include "cloud/Result.hpp"
#include "model/Account.hpp"
#include "model/Resource.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lv::cli {

// Thin driver for the Azure CLI. Output is always requested as JSON.
class AzCli {
public:
    AzCli(CommandRunner& runner, std::string azPath);

    // `configured` when set, otherwise the first `az` on PATH
    static std::optional<std::string> locate(const std::string& configured = {});

    [[nodiscard]] const std::string& path() const { return azPath_; }

    cloud::Result<std::string> version();
    bool isLoggedIn();

    cloud::Result<std::vector<model::Account>> listAccounts();

    // Throws auth::TokenError. A scope ending in "/.default" is mapped to its resource.
    auth::Token getAccessToken(const std::string& scopeOrResource, const std::string& tenantId = {});

    cloud::MutationResult setContainerAppSecret(const model::Resource& app, const std::string& name, const std::string& value);
    cloud::MutationResult removeContainerAppSecret(const model::Resource& app, const std::string& name);

    static std::string resourceFromScope(const std::string& scope);

    // Parses the JSON printed by `az account get-access-token`
    static auth::Token parseAccessToken(const std::string& json);

private:
    CommandResult az(std::vector<std::string> args);

    CommandRunner& runner_;
    std::string azPath_;
};

}
