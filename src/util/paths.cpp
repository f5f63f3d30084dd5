#include "util/paths.hpp"

#include <cstdlib>
#include <mutex>
#include <optional>
#include <unistd.h>

namespace fs = std::filesystem;

namespace lv::paths {

namespace {
std::mutex overrideMutex;
std::optional<fs::path> configOverride;
std::optional<fs::path> logDirOverride;

fs::path envPath(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return {};
    return {v};
}

fs::path homeDir() {
    if (auto home = envPath("HOME"); !home.empty()) return home;
    return fs::temp_directory_path();
}
}

fs::path getConfigPath() {
    {
        std::scoped_lock lock(overrideMutex);
        if (configOverride) return *configOverride;
    }
    if (auto explicitPath = envPath("LAZYVAULT_CONFIG"); !explicitPath.empty()) return explicitPath;
    if (auto xdg = envPath("XDG_CONFIG_HOME"); !xdg.empty()) return xdg / "lazyvault" / "config.yaml";
    return homeDir() / ".config" / "lazyvault" / "config.yaml";
}

fs::path getLogDir() {
    {
        std::scoped_lock lock(overrideMutex);
        if (logDirOverride) return *logDirOverride;
    }
    if (auto xdg = envPath("XDG_STATE_HOME"); !xdg.empty()) return xdg / "lazyvault";
    return homeDir() / ".local" / "state" / "lazyvault";
}

void setConfigPath(const fs::path& path) {
    std::scoped_lock lock(overrideMutex);
    configOverride = path;
}

void setLogDir(const fs::path& path) {
    std::scoped_lock lock(overrideMutex);
    logDirOverride = path;
}

void setLogPathForTesting() {
    setLogDir(fs::temp_directory_path() / ("lazyvault-test-" + std::to_string(::getpid())));
}

}
