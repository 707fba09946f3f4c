#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        // Never pick up the developer's own config or home trash
        trashy::config::Config cfg;
        cfg.trash.use_topdir_trash = false;
        cfg.logging.levels.console_log_level = spdlog::level::err;
        trashy::config::ConfigRegistry::initWith(cfg);
        trashy::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize trashy test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
