#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        // Built-in defaults only; a developer's ~/.config must not leak into tests.
        sw::config::ConfigRegistry::set(sw::config::Config{});
        sw::logging::LogRegistry::init(spdlog::level::err);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize savewarp test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    sw::logging::LogRegistry::shutdown();
    return rc;
}
