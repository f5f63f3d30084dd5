#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <filesystem>
#include <stdexcept>

namespace lv::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto log_file = logDir / "lazyvault.log";
    const auto audit_log_file = logDir / "audit.log";

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    const auto& cnf = config::ConfigRegistry::get().logging;

    // console goes to stderr so it never interleaves with shell output on stdout
    const auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(cnf.levels.console_log_level);
    consoleSink->set_color_mode(spdlog::color_mode::automatic);
    consoleSink->set_pattern(LOG_FORMAT);

    const auto rotatingSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file.string(), main_max_bytes_, main_max_files_);
    rotatingSink->set_level(cnf.levels.file_log_level);
    rotatingSink->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl = spdlog::level::debug) {
        const auto logger = std::make_shared<spdlog::logger>(name, spdlog::sinks_init_list{consoleSink, rotatingSink});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("lazyvault", sub_levels.lazyvault);
    makeLogger("cache",     sub_levels.cache);
    makeLogger("auth",      sub_levels.auth);
    makeLogger("cloud",     sub_levels.cloud);
    makeLogger("cli",       sub_levels.cli);
    makeLogger("nav",       sub_levels.nav);
    makeLogger("shell",     sub_levels.shell);

    // Audit logger (special: append-only file sink, no rotation)
    {
        const auto auditSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(audit_log_file.string(), /*truncate=*/false);
        auditSink->set_pattern(LOG_FORMAT);
        std::vector<spdlog::sink_ptr> sinks = { auditSink };
        const auto logger = std::make_shared<spdlog::logger>("audit", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    get("lazyvault")->debug("[LogRegistry] Initialized in {}", logDir.string());
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

} // namespace lv::logging
