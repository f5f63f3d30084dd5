#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace lv::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);
    if (!root.IsMap()) return cfg;

    if (auto node = root["azure"]) YAML::convert<AzureConfig>::decode(node, cfg.azure);
    if (auto node = root["cache"]) YAML::convert<CacheConfig>::decode(node, cfg.cache);
    if (auto node = root["auth"]) YAML::convert<AuthConfig>::decode(node, cfg.auth);
    if (auto node = root["ui"]) YAML::convert<UiConfig>::decode(node, cfg.ui);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

} // namespace lv::config
