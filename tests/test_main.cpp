/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Provides main() for the strata_tests binary. Each test file registers
 * its tests automatically via the TEST() macro. The file-backed loader and
 * source tests live in the separate Catch2 binary strata_file_tests.
 *
 * Build: cmake --build . --target strata_tests
 * Run:   ./strata_tests
 */

#include <gtest/gtest.h>

#include "strata/Log.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Keep expected-failure paths quiet
    strata::set_log_level(strata::LogLevel::Error);
    return RUN_ALL_TESTS();
}
