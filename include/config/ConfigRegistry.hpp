#pragma once

#include "config/Config.hpp"
#include "util/paths.hpp"

#include <filesystem>
#include <mutex>

namespace lv::config {

class ConfigRegistry {
public:
    // Loads the file when it exists, otherwise keeps the built-in defaults
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void init(Config config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace lv::config
