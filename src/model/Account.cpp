#include "model/Account.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <unordered_set>

namespace lv::model {

void from_json(const nlohmann::json& j, AccountUser& u) {
    u.name = j.value("name", "");
    u.type = j.value("type", "");
}

void from_json(const nlohmann::json& j, Account& a) {
    a.id = j.value("id", "");
    a.name = j.value("name", "");
    a.isDefault = j.value("isDefault", false);
    a.state = j.value("state", "");
    a.tenantId = j.value("tenantId", "");
    if (j.contains("user") && j["user"].is_object()) j["user"].get_to(a.user);
}

std::vector<Account> accounts_from_json(const nlohmann::json& j) {
    if (!j.is_array()) throw std::runtime_error("Expected a JSON array of accounts");
    std::vector<Account> accounts;
    accounts.reserve(j.size());
    for (const auto& row : j) accounts.push_back(row.get<Account>());
    return accounts;
}

std::vector<std::string> uniqueOwners(const std::vector<Account>& accounts) {
    std::vector<std::string> owners;
    std::unordered_set<std::string> seen;
    for (const auto& a : accounts)
        if (seen.insert(a.owner()).second) owners.push_back(a.owner());
    return owners;
}

std::vector<Account> subscriptionsForOwner(const std::vector<Account>& accounts, const std::string& owner) {
    std::vector<Account> subs;
    std::ranges::copy_if(accounts, std::back_inserter(subs), [&](const Account& a) { return a.owner() == owner; });
    std::ranges::stable_sort(subs, {}, &Account::name);
    return subs;
}

}
