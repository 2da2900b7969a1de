#include <gtest/gtest.h>
#include <scratchpad/core/logger.hpp>

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; SCRATCHPAD_TEST_LOG=debug turns logs back on
    const char* level = std::getenv("SCRATCHPAD_TEST_LOG");
    scratchpad::Logger::instance().set_level(
        scratchpad::parse_log_level(level ? level : "off", scratchpad::LogLevel::OFF));

    return RUN_ALL_TESTS();
}
