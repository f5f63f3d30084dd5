#pragma once

#include "auth/Token.hpp"

#include <string>

namespace lv::auth {

class TokenIssuer {
public:
    virtual ~TokenIssuer() = default;

    // Throws TokenError
    virtual Token issue(const std::string& tenantId, const std::string& scope) = 0;
};

}
