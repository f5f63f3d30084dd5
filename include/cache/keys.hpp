#pragma once

#include "model/Resource.hpp"

#include <string>

namespace lv::cache::keys {

inline const std::string ACCOUNTS = "accounts";

// Each provider's listing is cached on its own so one failing never hides the other
inline std::string resources(const std::string& subscriptionId, const model::ResourceKind kind) {
    return (kind == model::ResourceKind::KeyVault ? "vaults:" : "containerapps:") + subscriptionId;
}
inline std::string secrets(const model::Resource& r) { return "secrets:" + r.key(); }

// Every value key of one resource starts with this
inline std::string secretValuePrefix(const model::Resource& r) { return "secretvalue:" + r.key() + ":"; }
inline std::string secretValue(const model::Resource& r, const std::string& name) { return secretValuePrefix(r) + name; }

}
