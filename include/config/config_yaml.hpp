#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lv::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

inline std::string levelName(const spdlog::level::level_enum lvl) {
    return to_std_string(spdlog::level::to_string_view(lvl));
}

template<>
struct convert<AzureConfig> {
    static Node encode(const AzureConfig& rhs) {
        Node node;
        node["cli_path"] = rhs.cli_path;
        node["management_endpoint"] = rhs.management_endpoint;
        node["keyvault_dns_suffix"] = rhs.keyvault_dns_suffix;
        node["keyvault_api_version"] = rhs.keyvault_api_version;
        node["keyvault_arm_api_version"] = rhs.keyvault_arm_api_version;
        node["containerapps_api_version"] = rhs.containerapps_api_version;
        node["request_timeout_seconds"] = rhs.request_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, AzureConfig& rhs) {
        if (!node.IsMap()) return false;
        const AzureConfig def;
        rhs.cli_path = node["cli_path"].as<std::string>(def.cli_path);
        rhs.management_endpoint = node["management_endpoint"].as<std::string>(def.management_endpoint);
        rhs.keyvault_dns_suffix = node["keyvault_dns_suffix"].as<std::string>(def.keyvault_dns_suffix);
        rhs.keyvault_api_version = node["keyvault_api_version"].as<std::string>(def.keyvault_api_version);
        rhs.keyvault_arm_api_version = node["keyvault_arm_api_version"].as<std::string>(def.keyvault_arm_api_version);
        rhs.containerapps_api_version = node["containerapps_api_version"].as<std::string>(def.containerapps_api_version);
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(def.request_timeout_seconds);
        return true;
    }
};

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        node["default_ttl"] = durationToString(rhs.default_ttl);
        node["bulk_concurrency"] = rhs.bulk_concurrency;
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_ttl = parseDuration(node["default_ttl"].as<std::string>("365d"));
        rhs.bulk_concurrency = node["bulk_concurrency"].as<unsigned int>(5);
        if (rhs.bulk_concurrency == 0) throw std::invalid_argument("cache.bulk_concurrency must be at least 1");
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static Node encode(const AuthConfig& rhs) {
        Node node;
        node["token_refresh_margin_minutes"] = rhs.token_refresh_margin_minutes;
        return node;
    }

    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.token_refresh_margin_minutes = node["token_refresh_margin_minutes"].as<unsigned int>(5);
        return true;
    }
};

template<>
struct convert<UiConfig> {
    static Node encode(const UiConfig& rhs) {
        Node node;
        node["worker_threads"] = rhs.worker_threads;
        node["reveal_timeout_seconds"] = rhs.reveal_timeout_seconds;
        node["status_name_width"] = rhs.status_name_width;
        node["load_wait_seconds"] = rhs.load_wait_seconds;
        return node;
    }

    static bool decode(const Node& node, UiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(4);
        rhs.reveal_timeout_seconds = node["reveal_timeout_seconds"].as<unsigned int>(120);
        rhs.status_name_width = node["status_name_width"].as<unsigned int>(30);
        rhs.load_wait_seconds = node["load_wait_seconds"].as<unsigned int>(60);
        if (rhs.worker_threads == 0) throw std::invalid_argument("ui.worker_threads must be at least 1");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["lazyvault"] = levelName(rhs.lazyvault);
        node["cache"]     = levelName(rhs.cache);
        node["auth"]      = levelName(rhs.auth);
        node["cloud"]     = levelName(rhs.cloud);
        node["cli"]       = levelName(rhs.cli);
        node["nav"]       = levelName(rhs.nav);
        node["shell"]     = levelName(rhs.shell);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lazyvault = spdlog::level::from_str(node["lazyvault"].as<std::string>("info"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("info"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("info"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("info"));
        rhs.nav = spdlog::level::from_str(node["nav"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = levelName(rhs.console_log_level);
        node["file_log_level"]    = levelName(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
