#include <gtest/gtest.h>
#include <thread>
#include "copy_ngin/live/address_backoff.hpp"

using namespace copy_ngin;
using namespace std::chrono_literals;

class AddressBackoffTest : public ::testing::Test {};

TEST_F(AddressBackoffTest, DelayDoublesUpToMax) {
    AddressBackoff backoff(1000ms, 60000ms);
    EXPECT_EQ(backoff.delay_for(0), 0ms);
    EXPECT_EQ(backoff.delay_for(1), 1000ms);
    EXPECT_EQ(backoff.delay_for(2), 2000ms);
    EXPECT_EQ(backoff.delay_for(3), 4000ms);
    EXPECT_EQ(backoff.delay_for(6), 32000ms);
    EXPECT_EQ(backoff.delay_for(7), 60000ms);
    EXPECT_EQ(backoff.delay_for(1000), 60000ms);
}

TEST_F(AddressBackoffTest, FailuresOpenGrowingWindows) {
    AddressBackoff backoff(1000ms, 60000ms);
    EXPECT_FALSE(backoff.is_backing_off("0xabc"));

    EXPECT_EQ(backoff.record_failure("0xabc"), 1000ms);
    EXPECT_EQ(backoff.record_failure("0xabc"), 2000ms);
    EXPECT_TRUE(backoff.is_backing_off("0xabc"));
    EXPECT_EQ(backoff.failure_count("0xabc"), 2);
    EXPECT_GT(backoff.remaining("0xabc"), 0ms);
    EXPECT_LE(backoff.remaining("0xabc"), 2000ms);

    // Other addresses are unaffected
    EXPECT_FALSE(backoff.is_backing_off("0xdef"));
    EXPECT_EQ(backoff.remaining("0xdef"), 0ms);
}

TEST_F(AddressBackoffTest, SuccessClearsImmediately) {
    AddressBackoff backoff(1000ms, 60000ms);
    backoff.record_failure("0xabc");
    backoff.record_success("0xabc");

    EXPECT_FALSE(backoff.is_backing_off("0xabc"));
    EXPECT_EQ(backoff.failure_count("0xabc"), 0);
    EXPECT_EQ(backoff.record_failure("0xabc"), 1000ms);
}

TEST_F(AddressBackoffTest, WindowExpiresButCountRemains) {
    AddressBackoff backoff(20ms, 1000ms);
    backoff.record_failure("0xabc");
    std::this_thread::sleep_for(40ms);

    EXPECT_FALSE(backoff.is_backing_off("0xabc"));
    EXPECT_EQ(backoff.failure_count("0xabc"), 1);
    EXPECT_EQ(backoff.record_failure("0xabc"), 40ms);
}

TEST_F(AddressBackoffTest, DegenerateBoundsAreRaised) {
    AddressBackoff backoff(0ms, 0ms);
    EXPECT_EQ(backoff.delay_for(1), 1ms);
    EXPECT_EQ(backoff.delay_for(5), 1ms);
}
