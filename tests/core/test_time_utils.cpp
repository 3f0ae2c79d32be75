#include <gtest/gtest.h>
#include <ctime>
#include <regex>
#include "copy_ngin/core/time_utils.hpp"

using namespace copy_ngin;
using namespace copy_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpoch) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
}

TEST_F(TimeUtilsTest, GetFormattedTimeMatchesFormat) {
    std::string formatted = get_formatted_time("%Y%m%d_%H%M%S");
    EXPECT_TRUE(std::regex_match(formatted, std::regex("\\d{8}_\\d{6}")));
}

TEST_F(TimeUtilsTest, EpochMillisecondConversions) {
    const int64_t ms = 1700000123456;
    Timestamp ts = from_epoch_ms(ms);
    EXPECT_EQ(to_epoch_ms(ts), ms);
    EXPECT_EQ(to_epoch_ms(from_epoch_ms(0)), 0);
}

TEST_F(TimeUtilsTest, FloorToStepTruncatesToBucketStart) {
    // 2023-11-14T22:23:23.456Z
    Timestamp ts = from_epoch_ms(1700000603456);

    EXPECT_EQ(to_epoch_ms(floor_to_minute(ts)), 1700000580000);
    EXPECT_EQ(to_epoch_ms(floor_to_step(ts, std::chrono::minutes(5))), 1700000400000);
    EXPECT_EQ(to_epoch_ms(floor_to_step(ts, std::chrono::minutes(15))), 1700000100000);

    // Already aligned timestamps are unchanged
    Timestamp aligned = from_epoch_ms(1700000100000);
    EXPECT_EQ(floor_to_step(aligned, std::chrono::minutes(15)), aligned);
}

TEST_F(TimeUtilsTest, FloorToStepBeforeEpoch) {
    Timestamp ts = from_epoch_ms(-30000);
    EXPECT_EQ(to_epoch_ms(floor_to_minute(ts)), -60000);
}

TEST_F(TimeUtilsTest, FormatTimestampUtc) {
    EXPECT_EQ(format_timestamp_utc(from_epoch_ms(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_timestamp_utc(from_epoch_ms(1700000603456)), "2023-11-14T22:23:23Z");
    EXPECT_EQ(format_timestamp_utc_ms(from_epoch_ms(1700000603456)), "2023-11-14T22:23:23.456Z");
    EXPECT_EQ(format_timestamp_utc_ms(from_epoch_ms(7)), "1970-01-01T00:00:00.007Z");
}
