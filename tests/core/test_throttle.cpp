#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "copy_ngin/core/throttle.hpp"

using namespace copy_ngin;
using namespace std::chrono_literals;

class ThrottleTest : public ::testing::Test {};

TEST_F(ThrottleTest, UnseenKeyMayAlwaysRun) {
    Throttle throttle(10s);
    EXPECT_TRUE(throttle.can_run("session:BTC"));
}

TEST_F(ThrottleTest, TouchBlocksKeyUntilIntervalElapses) {
    Throttle throttle(50ms);
    throttle.touch("session:BTC");

    EXPECT_FALSE(throttle.can_run("session:BTC"));
    EXPECT_TRUE(throttle.can_run("session:ETH"));

    std::this_thread::sleep_for(70ms);
    EXPECT_TRUE(throttle.can_run("session:BTC"));
}

TEST_F(ThrottleTest, WaitAndTouchSleepsForSecondCaller) {
    Throttle throttle(60ms);

    EXPECT_EQ(throttle.wait_and_touch("info"), 0ms);

    auto start = std::chrono::steady_clock::now();
    throttle.wait_and_touch("info");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 50ms);
}

TEST_F(ThrottleTest, ZeroIntervalNeverWaits) {
    Throttle throttle(0ms);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(throttle.wait_and_touch("info"), 0ms);
    }
}

TEST_F(ThrottleTest, NegativeIntervalClampedToZero) {
    Throttle throttle(-5ms);
    EXPECT_EQ(throttle.min_interval(), 0ms);
}

TEST_F(ThrottleTest, ConcurrentCallersAreSpacedOut) {
    Throttle throttle(40ms);
    auto start = std::chrono::steady_clock::now();

    std::thread a([&]() { throttle.wait_and_touch("info"); });
    std::thread b([&]() { throttle.wait_and_touch("info"); });
    std::thread c([&]() { throttle.wait_and_touch("info"); });
    a.join();
    b.join();
    c.join();

    // Three reservations need two full intervals
    EXPECT_GE(std::chrono::steady_clock::now() - start, 75ms);
}

TEST_F(ThrottleTest, ResetForgetsKeys) {
    Throttle throttle(10s);
    throttle.touch("a");
    ASSERT_FALSE(throttle.can_run("a"));
    throttle.reset();
    EXPECT_TRUE(throttle.can_run("a"));
}
