#pragma once

#include "auth/Token.hpp"
#include "auth/TokenIssuer.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lv::auth {

// Bearer tokens per tenant and scope. At most one issuance per tenant is in flight;
// callers that waited on it reuse the result.
class TokenCache {
public:
    static constexpr std::chrono::minutes DEFAULT_REFRESH_MARGIN{5};

    explicit TokenCache(TokenIssuer& issuer,
                        std::chrono::minutes refreshMargin = DEFAULT_REFRESH_MARGIN,
                        const util::Clock& clock = util::systemClock());

    TokenCache(const TokenCache&) = delete;
    TokenCache& operator=(const TokenCache&) = delete;

    // Throws TokenError when the issuer fails; nothing is cached then
    Token getToken(const std::string& tenantId, const std::string& scope);

    void clear();

    [[nodiscard]] size_t size() const;

private:
    struct TenantSlot {
        std::mutex mutex;
        std::map<std::string, Token> byScope;
    };

    std::shared_ptr<TenantSlot> slotFor(const std::string& tenantId);

    TokenIssuer& issuer_;
    std::chrono::minutes refreshMargin_;
    const util::Clock& clock_;

    mutable std::mutex slotsMutex_;
    std::unordered_map<std::string, std::shared_ptr<TenantSlot>> slots_;
};

}
