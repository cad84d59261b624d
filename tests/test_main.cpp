#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <iostream>

// Test categories can be run individually using:
// ./unit_tests --gtest_filter="OrchestratorTest*"
// ./unit_tests --gtest_filter="CorrelationBuffer*"
// etc.

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "Running Mimic-RT Test Suite" << std::endl;
    std::cout << "===========================" << std::endl;

    // Components that fall back to the default logger stay quiet.
    spdlog::set_level(spdlog::level::warn);

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "\nAll tests passed!" << std::endl;
    } else {
        std::cout << "\nTests failed!" << std::endl;
    }

    return result;
}
