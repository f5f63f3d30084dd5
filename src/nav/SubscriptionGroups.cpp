#include "nav/SubscriptionGroups.hpp"

#include <algorithm>
#include <array>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <map>

namespace lv::nav {

namespace {

constexpr std::array ENVIRONMENT_PATTERNS = {
    "dev", "tst", "test", "stg", "stage", "staging", "prd", "prod", "production", "sub", "liv", "live"
};

}

std::string normalizeBaseName(const std::string& subscriptionName) {
    using namespace boost::algorithm;

    auto name = to_lower_copy(subscriptionName);

    for (const std::string p : ENVIRONMENT_PATTERNS) {
        if (starts_with(name, p + "-")) name.erase(0, p.size() + 1);
        if (ends_with(name, "-" + p)) name.erase(name.size() - p.size() - 1);
        replace_all(name, "-" + p + "-", "-");
    }

    while (contains(name, "--")) replace_all(name, "--", "-");
    trim_if(name, is_any_of("-"));
    return name;
}

std::vector<SubscriptionEntry> buildSubscriptionEntries(const std::vector<model::Account>& subscriptions) {
    std::map<std::string, std::vector<model::Account>> groups;
    for (const auto& s : subscriptions) groups[normalizeBaseName(s.name)].push_back(s);

    std::vector<SubscriptionEntry> entries;
    for (auto& [base, members] : groups) {
        std::ranges::stable_sort(members, {}, &model::Account::name);

        if (members.size() == 1) {
            entries.push_back({false, members.front().name, base, false, members});
            continue;
        }

        entries.push_back({true, base, base, false, members});
        for (const auto& m : members) entries.push_back({false, m.name, base, true, {m}});
    }
    return entries;
}

}
