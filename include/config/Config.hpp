#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace lv::config {

struct AzureConfig {
    std::string cli_path;                    // empty: search PATH for `az`
    std::string management_endpoint = "https://management.azure.com";
    std::string keyvault_dns_suffix = "vault.azure.net";
    std::string keyvault_api_version = "7.4";
    std::string keyvault_arm_api_version = "2023-07-01";
    std::string containerapps_api_version = "2024-03-01";
    unsigned int request_timeout_seconds = 30;
};

struct CacheConfig {
    std::chrono::seconds default_ttl = std::chrono::hours(24 * 365); // until refresh
    unsigned int bulk_concurrency = 5;
};

struct AuthConfig {
    unsigned int token_refresh_margin_minutes = 5;
};

struct UiConfig {
    unsigned int worker_threads = 4;
    unsigned int reveal_timeout_seconds = 120;
    unsigned int status_name_width = 30;
    unsigned int load_wait_seconds = 60;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum lazyvault = spdlog::level::info;  // Startup/shutdown, environment checks
    spdlog::level::level_enum cache     = spdlog::level::warn;
    spdlog::level::level_enum auth      = spdlog::level::info;  // Token issuance and failures
    spdlog::level::level_enum cloud     = spdlog::level::info;  // REST failures, throttling
    spdlog::level::level_enum cli       = spdlog::level::info;  // az invocations
    spdlog::level::level_enum nav       = spdlog::level::info;  // Selection loads, stale drops at debug
    spdlog::level::level_enum shell     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;           // empty: paths::getLogDir()
    LogLevelsConfig levels;
};

struct Config {
    AzureConfig azure;
    CacheConfig cache;
    AuthConfig auth;
    UiConfig ui;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);

}
