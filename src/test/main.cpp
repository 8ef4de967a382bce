// @src/test/main.cpp
#include "gtest/gtest.h"
#include "../../include/debug_utils.h"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Registry operations log at INFO; keep test output to warnings and up.
    schemata::setLogLevel(schemata::LogLevel::WARN);

    return RUN_ALL_TESTS();
}
