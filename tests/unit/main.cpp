#include <signal.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    // Explicitly initialize GoogleTest so --gtest_list_tests and filters work
    // reliably during CTest discovery.
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);
    minder::logging::Logger::init(minder::logging::Level::LVL_WARN, "tests");
    // Pipe tests write to peers that are gone; that must be EPIPE, not death
    signal(SIGPIPE, SIG_IGN);
    return RUN_ALL_TESTS();
}
