#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ovdm::config::Config config;
        config.logging.log_dir = fs::temp_directory_path() / "ovdm-tests" / "log";
        config.logging.levels.console_log_level = spdlog::level::warn;
        ovdm::config::ConfigRegistry::init(std::move(config));
        ovdm::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize OpenVDM test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
