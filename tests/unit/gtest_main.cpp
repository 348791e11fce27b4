#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        sl::config::ConfigRegistry::init(fs::temp_directory_path() / "siteline_tests_no_config.yaml");
        sl::log::Registry::init(fs::temp_directory_path() / "siteline_test_logs");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize Siteline test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
