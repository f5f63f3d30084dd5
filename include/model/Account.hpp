#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace lv::model {

struct AccountUser {
    std::string name;
    std::string type;
};

// One row of `az account list`: a subscription together with its tenant and signed-in identity
struct Account {
    std::string id;
    std::string name;
    bool isDefault{false};
    std::string state;
    std::string tenantId;
    AccountUser user;

    // The identity this subscription is reached through; the top navigation level groups by it
    [[nodiscard]] std::string owner() const { return user.name.empty() ? tenantId : user.name; }
};

void from_json(const nlohmann::json& j, AccountUser& u);
void from_json(const nlohmann::json& j, Account& a);

std::vector<Account> accounts_from_json(const nlohmann::json& j);

// Unique owners in first-seen order
std::vector<std::string> uniqueOwners(const std::vector<Account>& accounts);

// Subscriptions reached through `owner`, sorted by name
std::vector<Account> subscriptionsForOwner(const std::vector<Account>& accounts, const std::string& owner);

}
