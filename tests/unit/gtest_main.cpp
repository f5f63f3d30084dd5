#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/paths.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        lv::paths::setLogPathForTesting();
        lv::config::ConfigRegistry::init(lv::config::Config{});
        lv::logging::LogRegistry::init(lv::paths::getLogDir());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize lazyvault test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
