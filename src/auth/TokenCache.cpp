#include "auth/TokenCache.hpp"
#include "auth/TokenError.hpp"
#include "logging/LogRegistry.hpp"

using namespace lv::auth;
using namespace lv::logging;

TokenCache::TokenCache(TokenIssuer& issuer, const std::chrono::minutes refreshMargin, const util::Clock& clock)
    : issuer_(issuer), refreshMargin_(refreshMargin), clock_(clock) {}

std::shared_ptr<TokenCache::TenantSlot> TokenCache::slotFor(const std::string& tenantId) {
    std::scoped_lock lock(slotsMutex_);
    auto& slot = slots_[tenantId];
    if (!slot) slot = std::make_shared<TenantSlot>();
    return slot;
}

Token TokenCache::getToken(const std::string& tenantId, const std::string& scope) {
    const auto slot = slotFor(tenantId);
    std::scoped_lock lock(slot->mutex);

    if (const auto it = slot->byScope.find(scope);
        it != slot->byScope.end() && it->second.isFresh(clock_.now(), refreshMargin_))
        return it->second;

    try {
        auto token = issuer_.issue(tenantId, scope);
        LogRegistry::auth()->debug("[TokenCache] Issued token for tenant '{}' scope '{}'",
                                   tenantId.empty() ? "<default>" : tenantId, scope);
        slot->byScope.insert_or_assign(scope, token);
        return token;
    } catch (const TokenError& e) {
        slot->byScope.erase(scope);
        LogRegistry::auth()->warn("[TokenCache] Token issuance failed for tenant '{}': {}", tenantId, e.what());
        throw;
    }
}

void TokenCache::clear() {
    // Slots stay alive for callers that already hold one; a fresh map drops every token
    std::scoped_lock lock(slotsMutex_);
    slots_.clear();
}

size_t TokenCache::size() const {
    std::scoped_lock lock(slotsMutex_);
    size_t n = 0;
    for (const auto& [_, slot] : slots_) {
        std::scoped_lock slotLock(slot->mutex);
        n += slot->byScope.size();
    }
    return n;
}
