#include "model/Secret.hpp"

#include <algorithm>
#include <boost/algorithm/string/find.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lv::model {

namespace {

// Key Vault attributes carry Unix seconds
std::optional<std::time_t> epochField(const json& attrs, const char* key) {
    if (!attrs.contains(key) || !attrs[key].is_number()) return std::nullopt;
    return static_cast<std::time_t>(attrs[key].get<long long>());
}

template <typename T>
void readAttributes(const json& j, T& out) {
    if (j.contains("contentType") && j["contentType"].is_string()) out.contentType = j["contentType"].get<std::string>();
    if (!j.contains("attributes") || !j["attributes"].is_object()) return;
    const auto& attrs = j["attributes"];
    if (attrs.contains("enabled") && attrs["enabled"].is_boolean()) out.enabled = attrs["enabled"].get<bool>();
    out.created = epochField(attrs, "created");
    out.updated = epochField(attrs, "updated");
    out.expires = epochField(attrs, "exp");
}

}

std::string secretNameFromId(const std::string& id) {
    static const std::string marker = "/secrets/";
    const auto pos = id.find(marker);
    if (pos == std::string::npos) return id;
    const auto start = pos + marker.size();
    return id.substr(start, id.find('/', start) - start);
}

SecretMeta keyvault_secret_meta_from_json(const json& j) {
    SecretMeta s;
    s.name = secretNameFromId(j.value("id", ""));
    readAttributes(j, s);
    return s;
}

SecretValue keyvault_secret_value_from_json(const json& j) {
    SecretValue s;
    s.name = secretNameFromId(j.value("id", ""));
    s.value = j.value("value", "");
    readAttributes(j, s);
    return s;
}

SecretMeta containerapp_secret_from_json(const json& j) {
    SecretMeta s;
    s.name = j.value("name", "");
    if (j.contains("value") && j["value"].is_string()) s.value = j["value"].get<std::string>();
    return s;
}

void sortSecrets(std::vector<SecretMeta>& secrets) {
    std::ranges::stable_sort(secrets, {}, &SecretMeta::name);
}

std::vector<SecretMeta> filterSecrets(const std::vector<SecretMeta>& secrets, const std::string& filter) {
    if (filter.empty()) return secrets;
    std::vector<SecretMeta> out;
    std::ranges::copy_if(secrets, std::back_inserter(out), [&](const SecretMeta& s) {
        return !boost::algorithm::ifind_first(s.name, filter).empty();
    });
    return out;
}

}
