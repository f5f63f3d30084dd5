#include "cli/AzCli.hpp"
#include "auth/TokenError.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace lv::cli;
using namespace lv::logging;
using json = nlohmann::json;

namespace fs = std::filesystem;

AzCli::AzCli(CommandRunner& runner, std::string azPath) : runner_(runner), azPath_(std::move(azPath)) {}

std::optional<std::string> AzCli::locate(const std::string& configured) {
    if (!configured.empty()) {
        if (access(configured.c_str(), X_OK) == 0) return configured;
        return std::nullopt;
    }

    const char* path = std::getenv("PATH");
    if (!path) return std::nullopt;

    const std::string searchPath(path);
    std::vector<std::string> dirs;
    boost::algorithm::split(dirs, searchPath, [](const char c) { return c == ':'; });
    for (const auto& dir : dirs) {
        if (dir.empty()) continue;
        const auto candidate = fs::path(dir) / "az";
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) return candidate.string();
    }
    return std::nullopt;
}

CommandResult AzCli::az(std::vector<std::string> args) {
    args.insert(args.begin(), azPath_);
    return runner_.run(args);
}

lv::cloud::Result<std::string> AzCli::version() {
    const auto res = az({"--version"});
    if (!res.ok()) return cloud::fromCli(res.err.empty() ? "az --version failed" : res.err);
    std::string firstLine = res.out.substr(0, res.out.find('\n'));
    boost::algorithm::trim(firstLine);
    return firstLine;
}

bool AzCli::isLoggedIn() {
    const auto res = az({"account", "show", "--output", "json"});
    if (!res.ok()) LogRegistry::cli()->info("[AzCli] Not logged in: {}", boost::algorithm::trim_copy(res.err));
    return res.ok();
}

lv::cloud::Result<std::vector<lv::model::Account>> AzCli::listAccounts() {
    const auto res = az({"account", "list", "--all", "--output", "json"});
    if (!res.ok()) return cloud::fromCli(res.err);

    try {
        return model::accounts_from_json(json::parse(res.out));
    } catch (const std::exception& e) {
        LogRegistry::cli()->error("[AzCli] Unparsable account list: {}", e.what());
        return cloud::Error{cloud::ErrorKind::Unknown, std::string("Unparsable az account list output: ") + e.what()};
    }
}

std::string AzCli::resourceFromScope(const std::string& scope) {
    static const std::string suffix = "/.default";
    if (boost::algorithm::ends_with(scope, suffix)) return scope.substr(0, scope.size() - suffix.size());
    return scope;
}

lv::auth::Token AzCli::parseAccessToken(const std::string& text) {
    try {
        const auto j = json::parse(text);
        auth::Token token;
        token.accessToken = j.at("accessToken").get<std::string>();

        if (j.contains("expires_on") && !j["expires_on"].is_null()) {
            const auto& e = j["expires_on"];
            token.expiresOn = util::fromEpochSeconds(e.is_number() ? e.get<long long>() : std::stoll(e.get<std::string>()));
        } else {
            const auto t = util::parseLocalTimestamp(j.at("expiresOn").get<std::string>());
            token.expiresOn = std::chrono::system_clock::from_time_t(t);
        }
        return token;
    } catch (const std::exception& e) {
        throw auth::TokenError({cloud::ErrorKind::Unknown, std::string("Unparsable access token output: ") + e.what()});
    }
}

lv::auth::Token AzCli::getAccessToken(const std::string& scopeOrResource, const std::string& tenantId) {
    std::vector<std::string> args = {"account", "get-access-token", "--resource", resourceFromScope(scopeOrResource)};
    if (!tenantId.empty()) {
        args.emplace_back("--tenant");
        args.push_back(tenantId);
    }
    args.emplace_back("--output");
    args.emplace_back("json");

    const auto res = az(std::move(args));
    if (!res.ok()) throw auth::TokenError(cloud::fromCli(res.err.empty() ? "az account get-access-token failed" : res.err));
    return parseAccessToken(res.out);
}

lv::cloud::MutationResult AzCli::setContainerAppSecret(const model::Resource& app, const std::string& name,
                                                       const std::string& value) {
    // server-side merge of the named secret; other secrets on the app are untouched
    const auto res = az({"containerapp", "secret", "set",
                         "--name", app.name,
                         "--resource-group", app.resourceGroup,
                         "--subscription", app.subscriptionId,
                         "--secrets", name + "=" + value,
                         "--output", "none"});
    if (res.ok()) return cloud::MutationResult::ok();
    LogRegistry::cli()->warn("[AzCli] containerapp secret set failed for {}/{}", app.name, name);
    return cloud::MutationResult::failed(cloud::fromCli(res.err.empty() ? "Failed to set secret" : res.err));
}

lv::cloud::MutationResult AzCli::removeContainerAppSecret(const model::Resource& app, const std::string& name) {
    const auto res = az({"containerapp", "secret", "remove",
                         "--name", app.name,
                         "--resource-group", app.resourceGroup,
                         "--subscription", app.subscriptionId,
                         "--secret-names", name,
                         "--output", "none"});
    if (res.ok()) return cloud::MutationResult::ok();
    LogRegistry::cli()->warn("[AzCli] containerapp secret remove failed for {}/{}", app.name, name);
    return cloud::MutationResult::failed(cloud::fromCli(res.err.empty() ? "Failed to delete secret" : res.err));
}
