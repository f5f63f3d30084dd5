#pragma once

#include "model/Account.hpp"

#include <string>
#include <vector>

namespace lv::nav {

// Environment-agnostic base name: "dev-myapp", "myapp-prd" and "sub-myapp-stg" all give "myapp"
std::string normalizeBaseName(const std::string& subscriptionName);

struct SubscriptionEntry {
    bool isHeader{false};
    std::string label;                   // base name for a header, subscription name otherwise
    std::string baseName;
    bool grouped{false};                 // member shown under a header
    std::vector<model::Account> members; // every member for a header, the subscription itself otherwise
};

// Groups ordered by base name; groups with more than one member get a header followed by the
// members sorted by name
std::vector<SubscriptionEntry> buildSubscriptionEntries(const std::vector<model::Account>& subscriptions);

}
