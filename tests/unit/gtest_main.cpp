#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ferry::paths::setLogPathForTesting();

        ferry::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        ferry::config::ConfigRegistry::init(cfg);

        ferry::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize ferry test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
