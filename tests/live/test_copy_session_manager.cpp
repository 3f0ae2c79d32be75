#include <gtest/gtest.h>
#include <thread>
#include "../core/test_base.hpp"
#include "../data/test_fakes.hpp"
#include "copy_ngin/live/copy_session_manager.hpp"

using namespace copy_ngin;
using namespace copy_ngin::testing;

namespace {

bool contains(const std::vector<std::string>& messages, const std::string& needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

class CopySessionManagerTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        info_ = std::make_shared<MockInfoClient>();
        trading_ = std::make_shared<MockTradingClient>();

        config_.poll_interval_ms = 10;
        config_.info_min_interval_ms = 0;
        config_.leverage_throttle_ms = 0;
        config_.account_cache_ttl_ms = 0;
        config_.backoff_base_ms = 60000;
        config_.backoff_max_ms = 60000;

        info_->states[whale_].account_value_usd = 100000.0;
        // One fill already on record when a session starts
        info_->fills[whale_] = {
            make_fill(1000, "BTC", TradeDirection::LONG, 1.0, 100000.0, "old-1")};
    }

    std::unique_ptr<CopySessionManager> make_manager() {
        return std::make_unique<CopySessionManager>(info_, trading_, config_);
    }

    CopySessionRequest request(bool execute = false) const {
        CopySessionRequest r;
        r.source_account = whale_;
        r.execute = execute;
        return r;
    }

    void add_fill(const Fill& fill) {
        std::lock_guard<std::mutex> lock(info_->mutex);
        info_->fills[whale_].push_back(fill);
    }

    CopySessionStatus status(CopySessionManager& manager, const std::string& id) {
        auto result = manager.get_status(id);
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value() : CopySessionStatus{};
    }

    std::shared_ptr<MockInfoClient> info_;
    std::shared_ptr<MockTradingClient> trading_;
    CopierConfig config_;
    const std::string whale_ = "0xwhale";
};

TEST_F(CopySessionManagerTest, ConstructionRequiresClients) {
    EXPECT_THROW(CopySessionManager(nullptr, trading_, config_), std::invalid_argument);
    EXPECT_THROW(CopySessionManager(info_, nullptr, config_), std::invalid_argument);

    CopierConfig bad = config_;
    bad.poll_interval_ms = 0;
    EXPECT_THROW(CopySessionManager(info_, trading_, bad), std::invalid_argument);

    bad = config_;
    bad.backoff_max_ms = 1000;
    EXPECT_THROW(CopySessionManager(info_, trading_, bad), std::invalid_argument);
}

TEST_F(CopySessionManagerTest, CreateSessionSkipsHistory) {
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());

    auto s = status(*manager, id.value());
    EXPECT_TRUE(s.active);
    EXPECT_FALSE(s.execute);
    EXPECT_EQ(s.source_account, whale_);
    EXPECT_TRUE(contains(s.notifications, "Skipping historical fills up to 1970-01-01T00:00:01Z"));

    // The historical fill is never copied
    manager->tick();
    EXPECT_EQ(status(*manager, id.value()).processed, 0);
    EXPECT_TRUE(trading_->orders.empty());
}

TEST_F(CopySessionManagerTest, EmptySourceAccountRejected) {
    auto manager = make_manager();
    CopySessionRequest r = request();
    r.source_account = "";
    auto id = manager->create_session(r);
    ASSERT_TRUE(id.is_error());
    EXPECT_EQ(id.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(CopySessionManagerTest, NewFillsAreCopiedOnce) {
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());

    // Same millisecond as the cursor but a new id, then a later fill
    add_fill(make_fill(1000, "BTC", TradeDirection::LONG, 0.01, 100000.0, "new-1"));
    add_fill(make_fill(2000, "ETH", TradeDirection::SHORT, 2.0, 2500.0, "new-2"));

    manager->tick();
    auto s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 2);
    EXPECT_TRUE(contains(s.notifications, "dry-run BUY 0.0100 BTC @ 101000"));
    EXPECT_TRUE(contains(s.notifications, "dry-run SELL 2.0000 ETH @ 2475"));
    EXPECT_FALSE(contains(s.notifications, "e+"));
    EXPECT_TRUE(trading_->orders.empty());

    // Replaying the same fills does nothing
    manager->tick();
    manager->tick();
    EXPECT_EQ(status(*manager, id.value()).processed, 2);
}

TEST_F(CopySessionManagerTest, FillsWithoutProviderIdAreDeduplicated) {
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());

    add_fill(make_fill(3000, "SOL", TradeDirection::LONG, 10.0, 150.0, ""));
    manager->tick();
    manager->tick();
    EXPECT_EQ(status(*manager, id.value()).processed, 1);
}

TEST_F(CopySessionManagerTest, PreSessionCloseIsSuppressed) {
    info_->states[whale_].open_positions.push_back(OpenPosition{"btc", 1.0, 90000.0, 100000.0, {}});
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());
    EXPECT_TRUE(contains(status(*manager, id.value()).notifications,
                         "Detected pre-session open positions: BTC"));

    add_fill(make_fill(2000, "BTC", TradeDirection::CLOSE_LONG, 0.4, 100000.0, "c1"));
    add_fill(make_fill(3000, "BTC", TradeDirection::CLOSE_LONG, 0.6, 100000.0, "c2"));
    manager->tick();

    auto s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 2);
    EXPECT_TRUE(contains(s.notifications, "Ignored close for pre-session position BTC"));
    EXPECT_FALSE(contains(s.notifications, "dry-run SELL"));

    // The pre-session size is used up; later closes are copied
    add_fill(make_fill(4000, "BTC", TradeDirection::CLOSE_LONG, 0.5, 100000.0, "c3"));
    manager->tick();
    s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 3);
    EXPECT_TRUE(contains(s.notifications, "dry-run SELL 0.5000 BTC @ 99000"));
}

TEST_F(CopySessionManagerTest, PreSessionShortUnwindsOnBuys) {
    info_->states[whale_].open_positions.push_back(OpenPosition{"ETH", -3.0, 2600.0, 2500.0, {}});
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());

    // Adding to the short is copied; buys shrink the remembered short
    add_fill(make_fill(2000, "ETH", TradeDirection::SHORT, 1.0, 2500.0, "e1"));
    add_fill(make_fill(3000, "ETH", TradeDirection::CLOSE_SHORT, 2.0, 2500.0, "e2"));
    add_fill(make_fill(4000, "ETH", TradeDirection::LONG, 1.0, 2500.0, "e3"));
    manager->tick();

    auto s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 3);
    EXPECT_TRUE(contains(s.notifications, "dry-run SELL 1.0000 ETH @ 2475"));
    EXPECT_FALSE(contains(s.notifications, "dry-run BUY"));

    // The remembered short is gone; the next buy is copied
    add_fill(make_fill(5000, "ETH", TradeDirection::LONG, 1.0, 2500.0, "e4"));
    manager->tick();
    s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 4);
    EXPECT_TRUE(contains(s.notifications, "dry-run BUY 1.0000 ETH @ 2525"));
}

TEST_F(CopySessionManagerTest, AssetFilterIgnoresOtherAssets) {
    auto manager = make_manager();
    CopySessionRequest r = request();
    r.asset_symbols = {"eth"};
    auto id = manager->create_session(r);
    ASSERT_TRUE(id.is_ok());

    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.01, 100000.0, "b1"));
    add_fill(make_fill(3000, "ETH", TradeDirection::LONG, 1.0, 2500.0, "e1"));
    manager->tick();

    auto s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 1);
    EXPECT_FALSE(contains(s.notifications, "BTC @"));
}

TEST_F(CopySessionManagerTest, ExecuteModeSubmitsScaledOrders) {
    auto manager = make_manager();
    CopySessionRequest r = request(true);
    r.leverage = CopyParameter::fixed(500.0);  // clamped to 100
    r.position_size_pct = CopyParameter::fixed(50.0);
    auto id = manager->create_session(r);
    ASSERT_TRUE(id.is_ok());

    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.02, 100000.0, "n1"));
    add_fill(make_fill(3000, "BTC", TradeDirection::CLOSE_LONG, 0.02, 100000.0, "n2"));
    manager->tick();

    ASSERT_EQ(trading_->orders.size(), 2u);
    EXPECT_EQ(trading_->orders[0].side, Side::BUY);
    EXPECT_DOUBLE_EQ(trading_->orders[0].size, 0.01);
    EXPECT_FALSE(trading_->orders[0].reduce_only);
    EXPECT_EQ(trading_->orders[0].session_tag, id.value());
    EXPECT_EQ(trading_->orders[1].side, Side::SELL);
    EXPECT_TRUE(trading_->orders[1].reduce_only);

    // Leverage is set once per asset while it does not change
    ASSERT_EQ(trading_->leverage_updates.size(), 1u);
    EXPECT_DOUBLE_EQ(trading_->leverage_updates[0].leverage, 100.0);
    EXPECT_TRUE(trading_->leverage_updates[0].is_cross);
    EXPECT_EQ(status(*manager, id.value()).processed, 2);

    // Sizing is resolved once per asset
    EXPECT_EQ(info_->sizing_calls, 1);
}

TEST_F(CopySessionManagerTest, AutoSizingFollowsAccountValue) {
    auto manager = make_manager();
    CopySessionRequest r = request(true);
    r.leverage = CopyParameter::auto_value();
    r.position_size_pct = CopyParameter::auto_value();
    r.user_deposit_usd = 10000.0;
    auto id = manager->create_session(r);
    ASSERT_TRUE(id.is_ok());

    // 50k notional on a 100k account: 0.5x; 10k deposit on 100k: 10%
    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.5, 100000.0, "a1"));
    manager->tick();

    ASSERT_EQ(trading_->orders.size(), 1u);
    EXPECT_DOUBLE_EQ(trading_->orders[0].size, 0.05);
    ASSERT_EQ(trading_->leverage_updates.size(), 1u);
    EXPECT_DOUBLE_EQ(trading_->leverage_updates[0].leverage, 0.5);
}

TEST_F(CopySessionManagerTest, AutoPositionSizeIsCapped) {
    info_->states[whale_].account_value_usd = 1000.0;
    auto manager = make_manager();
    CopySessionRequest r = request(true);
    r.position_size_pct = CopyParameter::auto_value();
    r.user_deposit_usd = 10000.0;
    auto id = manager->create_session(r);
    ASSERT_TRUE(id.is_ok());

    add_fill(make_fill(2000, "ETH", TradeDirection::LONG, 1.0, 2500.0, "a1"));
    manager->tick();

    // 1000% is capped at 200%
    ASSERT_EQ(trading_->orders.size(), 1u);
    EXPECT_DOUBLE_EQ(trading_->orders[0].size, 2.0);
}

TEST_F(CopySessionManagerTest, LeverageUpdatesAreThrottledPerAsset) {
    config_.leverage_throttle_ms = 60000;
    auto manager = make_manager();
    CopySessionRequest r = request(true);
    r.leverage = CopyParameter::auto_value();
    auto id = manager->create_session(r);
    ASSERT_TRUE(id.is_ok());

    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.5, 100000.0, "l1"));
    add_fill(make_fill(3000, "BTC", TradeDirection::LONG, 1.0, 100000.0, "l2"));
    add_fill(make_fill(4000, "ETH", TradeDirection::LONG, 10.0, 2500.0, "l3"));
    manager->tick();

    ASSERT_EQ(trading_->leverage_updates.size(), 2u);
    EXPECT_EQ(trading_->leverage_updates[0].asset, "BTC");
    EXPECT_EQ(trading_->leverage_updates[1].asset, "ETH");
    EXPECT_EQ(trading_->orders.size(), 3u);
}

TEST_F(CopySessionManagerTest, LeverageFailureDoesNotBlockOrder) {
    trading_->fail_leverage = true;
    auto manager = make_manager();
    auto id = manager->create_session(request(true));
    ASSERT_TRUE(id.is_ok());

    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.01, 100000.0, "f1"));
    manager->tick();

    auto s = status(*manager, id.value());
    EXPECT_EQ(trading_->orders.size(), 1u);
    EXPECT_EQ(s.processed, 1);
    EXPECT_TRUE(contains(s.errors, "leverage error (ignored): leverage rejected"));
}

TEST_F(CopySessionManagerTest, RejectedOrderIsRecorded) {
    trading_->reject_orders = true;
    auto manager = make_manager();
    auto id = manager->create_session(request(true));
    ASSERT_TRUE(id.is_ok());

    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.01, 100000.0, "r1"));
    manager->tick();

    auto s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 0);
    EXPECT_TRUE(contains(s.errors, "Order submission failed: insufficient margin"));
}

TEST_F(CopySessionManagerTest, FailingSourceIsBackedOff) {
    info_->fail_fills = true;
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());

    auto s = status(*manager, id.value());
    EXPECT_TRUE(s.active);
    EXPECT_TRUE(contains(s.errors, "Failed to seed cursor"));

    info_->fail_fills = false;
    const int calls = info_->fill_calls;
    manager->tick();
    EXPECT_EQ(info_->fill_calls, calls);
}

TEST_F(CopySessionManagerTest, HistoryNotReplayedAfterSeedFailure) {
    config_.backoff_base_ms = 1;
    config_.backoff_max_ms = 1;
    add_fill(make_fill(1500, "ETH", TradeDirection::SHORT, 2.0, 2500.0, "old-2"));
    info_->fail_fills = true;
    auto manager = make_manager();
    auto id = manager->create_session(request(true));
    ASSERT_TRUE(id.is_ok());

    info_->fail_fills = false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    manager->tick();
    EXPECT_EQ(status(*manager, id.value()).processed, 0);
    EXPECT_TRUE(trading_->orders.empty());

    // Fills after the session started are still copied
    const int64_t later = core::to_epoch_ms(std::chrono::system_clock::now()) + 1000;
    add_fill(make_fill(later, "BTC", TradeDirection::LONG, 0.01, 100000.0, "live-1"));
    manager->tick();
    EXPECT_EQ(status(*manager, id.value()).processed, 1);
    EXPECT_EQ(trading_->orders.size(), 1u);
}

TEST_F(CopySessionManagerTest, StopSession) {
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());
    EXPECT_EQ(manager->active_session_count(), 1u);

    ASSERT_TRUE(manager->stop_session(id.value()).is_ok());
    EXPECT_EQ(manager->active_session_count(), 0u);
    EXPECT_FALSE(status(*manager, id.value()).active);

    const int calls = info_->fill_calls;
    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.01, 100000.0, "s1"));
    manager->tick();
    EXPECT_EQ(info_->fill_calls, calls);
    EXPECT_EQ(status(*manager, id.value()).processed, 0);
}

TEST_F(CopySessionManagerTest, UnknownSession) {
    auto manager = make_manager();
    auto stopped = manager->stop_session("copy_missing");
    ASSERT_TRUE(stopped.is_error());
    EXPECT_EQ(stopped.error()->code(), ErrorCode::SESSION_NOT_FOUND);

    auto s = manager->get_status("copy_missing");
    ASSERT_TRUE(s.is_error());
    EXPECT_EQ(s.error()->code(), ErrorCode::SESSION_NOT_FOUND);
}

TEST_F(CopySessionManagerTest, ListSessionsSorted) {
    auto manager = make_manager();
    auto a = manager->create_session(request());
    auto b = manager->create_session(request());
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value(), b.value());

    auto sessions = manager->list_sessions();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_LT(sessions[0].session_id, sessions[1].session_id);

    auto j = sessions[0].to_json();
    EXPECT_TRUE(j.contains("sessionId"));
    EXPECT_TRUE(j.contains("sourceAccount"));
    EXPECT_EQ(j["processed"].get<int>(), 0);
}

TEST_F(CopySessionManagerTest, MessagesAreBounded) {
    config_.max_messages = 2;
    auto manager = make_manager();
    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());

    for (int i = 0; i < 5; ++i) {
        add_fill(make_fill(2000 + i, "ETH", TradeDirection::LONG, 1.0, 2500.0,
                           "m" + std::to_string(i)));
    }
    manager->tick();

    auto s = status(*manager, id.value());
    EXPECT_EQ(s.processed, 5);
    EXPECT_EQ(s.notifications.size(), 2u);
}

TEST_F(CopySessionManagerTest, LifecycleRegistersWithStateManager) {
    auto manager = make_manager();
    auto early = manager->start();
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error()->code(), ErrorCode::NOT_INITIALIZED);

    ASSERT_TRUE(manager->initialize().is_ok());
    auto state = StateManager::instance().get_state(manager->instance_id());
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, ComponentState::INITIALIZED);
    EXPECT_EQ(state.value().type, ComponentType::COPY_SESSION_MANAGER);

    auto id = manager->create_session(request());
    ASSERT_TRUE(id.is_ok());
    add_fill(make_fill(2000, "BTC", TradeDirection::LONG, 0.01, 100000.0, "bg1"));

    ASSERT_TRUE(manager->start().is_ok());
    EXPECT_TRUE(manager->is_running());
    EXPECT_EQ(StateManager::instance().get_state(manager->instance_id()).value().state,
              ComponentState::RUNNING);

    // The background loop picks the fill up
    for (int i = 0; i < 200 && status(*manager, id.value()).processed == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(status(*manager, id.value()).processed, 1);

    ASSERT_TRUE(manager->stop().is_ok());
    EXPECT_FALSE(manager->is_running());
    state = StateManager::instance().get_state(manager->instance_id());
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, ComponentState::STOPPED);
    EXPECT_DOUBLE_EQ(state.value().metrics.at("processed_fills"), 1.0);
    EXPECT_DOUBLE_EQ(state.value().metrics.at("active_sessions"), 1.0);
}

TEST_F(CopySessionManagerTest, SessionFromBacktestRun) {
    backtest::RunRecord run;
    run.whale_id = "whale-7";
    run.leverage = 3.0;
    run.position_size_pct = 40.0;
    run.asset_symbols = {"BTC"};
    run.initial_deposit_usd = 20000.0;

    auto r = CopySessionRequest::from_run(run, whale_, true);
    EXPECT_EQ(r.source_account, whale_);
    EXPECT_EQ(r.whale_id, "whale-7");
    EXPECT_FALSE(r.leverage.automatic);
    EXPECT_DOUBLE_EQ(r.leverage.value, 3.0);
    EXPECT_DOUBLE_EQ(r.position_size_pct.value, 40.0);
    EXPECT_DOUBLE_EQ(r.user_deposit_usd, 20000.0);
    EXPECT_TRUE(r.execute);

    auto overridden = CopySessionRequest::from_run(run, whale_, false, 5000.0, 25.0);
    EXPECT_DOUBLE_EQ(overridden.position_size_pct.value, 25.0);
    EXPECT_DOUBLE_EQ(overridden.user_deposit_usd, 5000.0);
    EXPECT_EQ(overridden.asset_symbols, std::vector<std::string>{"BTC"});
}

TEST_F(CopySessionManagerTest, ConfigJson) {
    CopierConfig loaded;
    loaded.from_json(nlohmann::json{{"poll_interval_ms", 250}, {"slippage_pct", 0.5}});
    EXPECT_EQ(loaded.poll_interval_ms, 250);
    EXPECT_DOUBLE_EQ(loaded.slippage_pct, 0.5);
    EXPECT_EQ(loaded.info_min_interval_ms, 334);
    EXPECT_EQ(loaded.to_json()["backoff_max_ms"].get<int>(), 60000);
}
