#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/util.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace lv::config;
using namespace std::chrono_literals;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = fs::temp_directory_path() / ("lazyvault-config-" + std::to_string(::getpid()) + ".yaml");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& yaml) const {
        std::ofstream out(path);
        out << yaml;
    }

    fs::path path;
};

TEST_F(ConfigFileTest, EmptyFileKeepsDefaults) {
    write("");
    const auto cfg = loadConfig(path.string());
    EXPECT_EQ(cfg.cache.bulk_concurrency, 5u);
    EXPECT_EQ(cfg.auth.token_refresh_margin_minutes, 5u);
    EXPECT_EQ(cfg.ui.reveal_timeout_seconds, 120u);
    EXPECT_EQ(cfg.azure.management_endpoint, "https://management.azure.com");
}

TEST_F(ConfigFileTest, OverridesArePicked) {
    write(R"(
azure:
  cli_path: /opt/az/bin/az
  request_timeout_seconds: 10
cache:
  default_ttl: 30m
  bulk_concurrency: 8
ui:
  reveal_timeout_seconds: 15
logging:
  log_dir: /tmp/lv-logs
  log_levels:
    console_log_level: error
    subsystem_levels:
      nav: debug
)");
    const auto cfg = loadConfig(path.string());
    EXPECT_EQ(cfg.azure.cli_path, "/opt/az/bin/az");
    EXPECT_EQ(cfg.azure.request_timeout_seconds, 10u);
    EXPECT_EQ(cfg.azure.keyvault_api_version, "7.4");
    EXPECT_EQ(cfg.cache.default_ttl, 30min);
    EXPECT_EQ(cfg.cache.bulk_concurrency, 8u);
    EXPECT_EQ(cfg.ui.reveal_timeout_seconds, 15u);
    EXPECT_EQ(cfg.ui.worker_threads, 4u);
    EXPECT_EQ(cfg.logging.log_dir, fs::path("/tmp/lv-logs"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.nav, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cache, spdlog::level::warn);
}

TEST_F(ConfigFileTest, MissingFileThrows) {
    EXPECT_THROW(loadConfig((path.string() + ".missing")), std::exception);
}

TEST(ConfigDurationTest, ParsesSuffixes) {
    EXPECT_EQ(parseDuration("45s"), 45s);
    EXPECT_EQ(parseDuration("5m"), 5min);
    EXPECT_EQ(parseDuration("2h"), 2h);
    EXPECT_EQ(parseDuration("365d"), std::chrono::hours(365 * 24));
    EXPECT_EQ(parseDuration("90"), 90s);
    EXPECT_THROW(parseDuration(""), std::invalid_argument);
}

TEST(ConfigDurationTest, FormatsLargestUnit) {
    EXPECT_EQ(durationToString(std::chrono::hours(48)), "2d");
    EXPECT_EQ(durationToString(std::chrono::minutes(90)), "90m");
    EXPECT_EQ(durationToString(std::chrono::seconds(61)), "61s");
}
