#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "../data/test_fakes.hpp"
#include "copy_ngin/backtest/backtest_coordinator.hpp"

using namespace copy_ngin;
using namespace copy_ngin::backtest;
using namespace copy_ngin::testing;

class BacktestCoordinatorTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        output_dir_ = std::filesystem::temp_directory_path() / "copy_ngin_coordinator_test";
        std::filesystem::remove_all(output_dir_);

        config_.output_directory = output_dir_.string();
        config_.run_name = "btc-1x";
        backtest_.position_size_pct = 100.0;
        backtest_.leverage = 1.0;
    }

    void TearDown() override {
        std::filesystem::remove_all(output_dir_);
        TestBase::TearDown();
    }

    std::vector<TradeEvent> round_trip() const {
        return {make_event(60000, "BTC", TradeDirection::LONG, 1.0, 100000.0),
                make_event(120000, "BTC", TradeDirection::CLOSE_LONG, 1.0, 105000.0)};
    }

    ComponentInfo component() const {
        auto info = StateManager::instance().get_state(config_.component_id);
        EXPECT_TRUE(info.is_ok());
        return info.is_ok() ? info.value() : ComponentInfo{};
    }

    std::filesystem::path output_dir_;
    BacktestCoordinatorConfig config_;
    CopyBacktestConfig backtest_;
};

TEST_F(BacktestCoordinatorTest, RunRequiresInitialize) {
    BacktestCoordinator coordinator(config_);
    auto result = coordinator.run(round_trip(), "0xwhale", backtest_, PriceResolver());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_INITIALIZED);
}

TEST_F(BacktestCoordinatorTest, SuccessfulRunStopsAndPublishesMetrics) {
    BacktestCoordinator coordinator(config_);
    ASSERT_TRUE(coordinator.initialize().is_ok());
    EXPECT_EQ(component().state, ComponentState::INITIALIZED);

    auto result = coordinator.run(round_trip(), "0xwhale", backtest_, PriceResolver());
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    auto info = component();
    EXPECT_EQ(info.state, ComponentState::STOPPED);
    EXPECT_DOUBLE_EQ(info.metrics.at("trades_copied"), 2.0);
    EXPECT_DOUBLE_EQ(info.metrics.at("net_pnl_usd"), result.value().summary.net_pnl_usd);
    EXPECT_TRUE(std::filesystem::exists(output_dir_ / "run.json"));
}

TEST_F(BacktestCoordinatorTest, InvalidConfigMovesToErrorState) {
    BacktestCoordinator coordinator(config_);
    ASSERT_TRUE(coordinator.initialize().is_ok());

    backtest_.initial_deposit_usd = -1.0;
    auto result = coordinator.run(round_trip(), "0xwhale", backtest_, PriceResolver());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(component().state, ComponentState::ERR_STATE);
}

TEST_F(BacktestCoordinatorTest, ExportFailureMovesToErrorState) {
    // A regular file where the output directory should be
    std::filesystem::create_directories(output_dir_);
    const auto blocker = output_dir_ / "blocker";
    {
        std::ofstream file(blocker);
        file << "x";
    }
    config_.output_directory = (blocker / "out").string();

    BacktestCoordinator coordinator(config_);
    ASSERT_TRUE(coordinator.initialize().is_ok());
    auto result = coordinator.run(round_trip(), "0xwhale", backtest_, PriceResolver());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);

    auto info = component();
    EXPECT_EQ(info.state, ComponentState::ERR_STATE);
    EXPECT_FALSE(info.error_message.empty());
    EXPECT_EQ(info.metrics.count("trades_copied"), 0u);
}

TEST_F(BacktestCoordinatorTest, DuplicateComponentRejected) {
    BacktestCoordinator first(config_);
    ASSERT_TRUE(first.initialize().is_ok());
    BacktestCoordinator second(config_);
    auto registered = second.initialize();
    ASSERT_TRUE(registered.is_error());
    EXPECT_EQ(registered.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(second.is_initialized());
}
