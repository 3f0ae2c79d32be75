#include <gtest/gtest.h>
#include "copy_ngin/data/trade_classifier.hpp"

using namespace copy_ngin;

class TradeClassifierTest : public ::testing::Test {};

TEST_F(TradeClassifierTest, DirectionNamesRoundTrip) {
    const TradeDirection all[] = {TradeDirection::BUY,        TradeDirection::SELL,
                                  TradeDirection::DEPOSIT,    TradeDirection::WITHDRAW,
                                  TradeDirection::LONG,       TradeDirection::SHORT,
                                  TradeDirection::CLOSE_LONG, TradeDirection::CLOSE_SHORT};
    for (auto direction : all) {
        auto parsed = direction_from_string(direction_to_string(direction));
        ASSERT_TRUE(parsed.is_ok()) << direction_to_string(direction);
        EXPECT_EQ(parsed.value(), direction);
    }
}

TEST_F(TradeClassifierTest, ParsingIsLenient) {
    EXPECT_EQ(direction_from_string("Close Long").value(), TradeDirection::CLOSE_LONG);
    EXPECT_EQ(direction_from_string("close-short").value(), TradeDirection::CLOSE_SHORT);
    EXPECT_EQ(direction_from_string("  SHORT ").value(), TradeDirection::SHORT);
}

TEST_F(TradeClassifierTest, UnknownDirectionRejected) {
    auto result = direction_from_string("liquidation");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_DATA);
}

TEST_F(TradeClassifierTest, DirectionHintWins) {
    EXPECT_EQ(classify_fill("B", "Open Long"), TradeDirection::LONG);
    EXPECT_EQ(classify_fill("B", "Open Short"), TradeDirection::SHORT);
    EXPECT_EQ(classify_fill("A", "Close Long"), TradeDirection::CLOSE_LONG);
    EXPECT_EQ(classify_fill("B", "Close Short"), TradeDirection::CLOSE_SHORT);
}

TEST_F(TradeClassifierTest, SideCodeDecidesWithoutHint) {
    EXPECT_EQ(classify_fill("A", ""), TradeDirection::SHORT);
    EXPECT_EQ(classify_fill("ask", ""), TradeDirection::SHORT);
    EXPECT_EQ(classify_fill("SELL", "Spot Dust Conversion"), TradeDirection::SHORT);
    EXPECT_EQ(classify_fill("B", ""), TradeDirection::LONG);
    EXPECT_EQ(classify_fill("", ""), TradeDirection::LONG);
}

TEST_F(TradeClassifierTest, DirectionFamilies) {
    EXPECT_TRUE(is_entry(TradeDirection::BUY));
    EXPECT_TRUE(is_entry(TradeDirection::SHORT));
    EXPECT_FALSE(is_entry(TradeDirection::DEPOSIT));
    EXPECT_FALSE(is_entry(TradeDirection::CLOSE_LONG));

    EXPECT_TRUE(is_close(TradeDirection::WITHDRAW));
    EXPECT_TRUE(is_close(TradeDirection::SELL));
    EXPECT_FALSE(is_close(TradeDirection::DEPOSIT));

    EXPECT_TRUE(is_long_family(TradeDirection::LONG));
    EXPECT_FALSE(is_long_family(TradeDirection::SHORT));
}

TEST_F(TradeClassifierTest, OrderSideReplicatesDirection) {
    EXPECT_EQ(order_side(TradeDirection::LONG), Side::BUY);
    EXPECT_EQ(order_side(TradeDirection::CLOSE_SHORT), Side::BUY);
    EXPECT_EQ(order_side(TradeDirection::SHORT), Side::SELL);
    EXPECT_EQ(order_side(TradeDirection::CLOSE_LONG), Side::SELL);
    EXPECT_EQ(order_side(TradeDirection::DEPOSIT), Side::NONE);
    EXPECT_EQ(side_to_string(Side::SELL), "SELL");
}

TEST_F(TradeClassifierTest, NormalizeSymbol) {
    EXPECT_EQ(normalize_symbol(" btc "), "BTC");
    EXPECT_EQ(normalize_symbol("kPEPE"), "KPEPE");
}

TEST_F(TradeClassifierTest, NormalizeAccount) {
    EXPECT_EQ(normalize_account(" 0xAbCdEF01 "), "0xabcdef01");
    EXPECT_EQ(normalize_account("0xabc"), "0xabc");
}
