#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        loft::config::Config cfg;
        cfg.api.base_url = "https://storage.test";
        cfg.logging.console_log_level = spdlog::level::warn;
        loft::config::ConfigRegistry::init(cfg);
        loft::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize loft test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
