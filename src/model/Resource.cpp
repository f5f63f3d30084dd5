#include "model/Resource.hpp"

#include <algorithm>
#include <boost/algorithm/string/find.hpp>
#include <nlohmann/json.hpp>

namespace lv::model {

std::string to_string(const ResourceKind kind) {
    switch (kind) {
        case ResourceKind::KeyVault: return "Key Vault";
        case ResourceKind::ContainerApp: return "Container App";
    }
    return "Unknown";
}

std::string Resource::key() const {
    return (isKeyVault() ? "kv/" : "ca/") + name;
}

std::string resourceGroupFromId(const std::string& armId) {
    static const std::string marker = "/resourcegroups/";
    const auto pos = boost::algorithm::ifind_first(armId, marker);
    if (pos.empty()) return {};
    const auto start = static_cast<size_t>(pos.end() - armId.begin());
    const auto end = armId.find('/', start);
    return armId.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

Resource resource_from_json(const nlohmann::json& j, const ResourceKind kind, const std::string& tenantId) {
    Resource r;
    r.kind = kind;
    r.id = j.value("id", "");
    r.name = j.value("name", "");
    r.location = j.value("location", "");
    r.resourceGroup = resourceGroupFromId(r.id);
    r.tenantId = tenantId;

    if (const auto sub = r.id.find("/subscriptions/"); sub != std::string::npos) {
        const auto start = sub + std::string("/subscriptions/").size();
        r.subscriptionId = r.id.substr(start, r.id.find('/', start) - start);
    }

    if (kind == ResourceKind::KeyVault && j.contains("properties") && j["properties"].is_object()) {
        r.vaultUri = j["properties"].value("vaultUri", "");
        if (r.tenantId.empty()) r.tenantId = j["properties"].value("tenantId", "");
    }
    return r;
}

void sortResources(std::vector<Resource>& resources) {
    std::ranges::stable_sort(resources, [](const Resource& a, const Resource& b) {
        if (a.kind != b.kind) return a.kind == ResourceKind::KeyVault;
        return a.name < b.name;
    });
}

}
