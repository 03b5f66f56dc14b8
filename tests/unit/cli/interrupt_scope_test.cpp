#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <thread>

#include <spindle/cli/interrupt_scope.h>
#include <spindle/cli/spindle_cli.h>

using namespace spindle::cli;
using namespace std::chrono_literals;

namespace {

bool waitForStop(const SpindleCLI& cli, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cli.getStopToken().stop_requested())
            return true;
        std::this_thread::sleep_for(5ms);
    }
    return cli.getStopToken().stop_requested();
}

} // namespace

TEST(InterruptScopeTest, SigintRequestsCooperativeStop) {
    SpindleCLI cli;
    InterruptScope scope(cli);
    EXPECT_FALSE(cli.getStopToken().stop_requested());

    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_TRUE(InterruptScope::interrupted());
    EXPECT_TRUE(waitForStop(cli, 2s));
}

TEST(InterruptScopeTest, SigtermRequestsCooperativeStop) {
    SpindleCLI cli;
    InterruptScope scope(cli);
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(waitForStop(cli, 2s));
}

TEST(InterruptScopeTest, NewScopeStartsUninterrupted) {
    {
        SpindleCLI first;
        InterruptScope scope(first);
        ASSERT_EQ(std::raise(SIGINT), 0);
        ASSERT_TRUE(waitForStop(first, 2s));
    }
    SpindleCLI second;
    InterruptScope scope(second);
    EXPECT_FALSE(InterruptScope::interrupted());
    std::this_thread::sleep_for(60ms);
    EXPECT_FALSE(second.getStopToken().stop_requested());
}
