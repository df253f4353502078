#include "runtime/signal_handler.hpp"

#include <signal.h>

#include <gtest/gtest.h>

using namespace minder::runtime;

class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SignalHandler::install());
        SignalHandler::reset();
    }

    void TearDown() override {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        SignalHandler::reset();
    }
};

TEST_F(SignalHandlerTest, NoRequestInitially) {
    EXPECT_FALSE(SignalHandler::is_shutdown_requested());
    EXPECT_EQ(SignalHandler::last_signal(), 0);
}

TEST_F(SignalHandlerTest, SigtermRequestsShutdown) {
    ASSERT_EQ(raise(SIGTERM), 0);
    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
    EXPECT_EQ(SignalHandler::last_signal(), SIGTERM);
}

TEST_F(SignalHandlerTest, SigintRequestsShutdown) {
    ASSERT_EQ(raise(SIGINT), 0);
    EXPECT_EQ(SignalHandler::last_signal(), SIGINT);

    SignalHandler::reset();
    EXPECT_FALSE(SignalHandler::is_shutdown_requested());
}
