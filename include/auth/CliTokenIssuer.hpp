#pragma once

#include "auth/TokenIssuer.hpp"

namespace lv::cli { class AzCli; }

namespace lv::auth {

// Issues tokens from the signed-in `az` session
class CliTokenIssuer final : public TokenIssuer {
public:
    explicit CliTokenIssuer(cli::AzCli& az) : az_(az) {}

    Token issue(const std::string& tenantId, const std::string& scope) override;

private:
    cli::AzCli& az_;
};

}
