/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * This file provides the main() function for running all GoogleTest tests.
 * Each test file registers its tests automatically via the TEST() macro.
 *
 * Build: cmake --build . --target agentcfg_tests
 * Run:   ./agentcfg_tests
 */

#include <gtest/gtest.h>

#include "agentcfg/Log.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    agentcfg::set_log_level("off");
    return RUN_ALL_TESTS();
}
