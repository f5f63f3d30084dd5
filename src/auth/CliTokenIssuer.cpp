#include "auth/CliTokenIssuer.hpp"
#include "cli/AzCli.hpp"

using namespace lv::auth;

Token CliTokenIssuer::issue(const std::string& tenantId, const std::string& scope) {
    return az_.getAccessToken(scope, tenantId);
}
