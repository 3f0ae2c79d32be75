//===== test_state_manager.cpp =====
#include <string>
#include <vector>
#include "test_base.hpp"

using namespace copy_ngin;
using namespace copy_ngin::testing;

class StateManagerTest : public TestBase {
protected:
    ComponentInfo make_info(const std::string& id,
                            ComponentState state = ComponentState::INITIALIZED) const {
        return ComponentInfo{ComponentType::COPY_SESSION_MANAGER,
                             state,
                             id,
                             "",
                             std::chrono::system_clock::now(),
                             {}};
    }
};

TEST_F(StateManagerTest, RegisterComponentSuccess) {
    auto result = StateManager::instance().register_component(make_info("copier"));
    EXPECT_TRUE(result.is_ok());
}

TEST_F(StateManagerTest, RegisterDuplicateComponent) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("copier")).is_ok());
    auto result = StateManager::instance().register_component(make_info("copier"));
    EXPECT_TRUE(result.is_error());
}

TEST_F(StateManagerTest, EmptyIdRejected) {
    auto result = StateManager::instance().register_component(make_info(""));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(StateManagerTest, StateTransitions) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("copier")).is_ok());

    EXPECT_TRUE(StateManager::instance().update_state("copier", ComponentState::RUNNING).is_ok());
    EXPECT_TRUE(
        StateManager::instance().update_state("copier", ComponentState::INITIALIZED).is_error());
    EXPECT_TRUE(StateManager::instance().update_state("copier", ComponentState::STOPPED).is_ok());

    auto state = StateManager::instance().get_state("copier");
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, ComponentState::STOPPED);
}

TEST_F(StateManagerTest, ErrorStateRecordsMessageAndFailsHealth) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("copier")).is_ok());
    EXPECT_TRUE(StateManager::instance().is_healthy());

    ASSERT_TRUE(StateManager::instance()
                    .update_state("copier", ComponentState::ERR_STATE, "poll loop died")
                    .is_ok());
    EXPECT_FALSE(StateManager::instance().is_healthy());
    EXPECT_EQ(StateManager::instance().get_state("copier").value().error_message,
              "poll loop died");
}

TEST_F(StateManagerTest, MetricsUpdate) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("copier")).is_ok());
    ASSERT_TRUE(StateManager::instance()
                    .update_metrics("copier", {{"active_sessions", 2.0}, {"processed_fills", 7.0}})
                    .is_ok());

    auto state = StateManager::instance().get_state("copier");
    ASSERT_TRUE(state.is_ok());
    EXPECT_DOUBLE_EQ(state.value().metrics.at("active_sessions"), 2.0);
    auto missing = StateManager::instance().update_metrics("missing", {});
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(StateManagerTest, MetricsMergeByKey) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("bt")).is_ok());
    ASSERT_TRUE(StateManager::instance().update_metrics("bt", {{"trades_copied", 4.0}}).is_ok());
    ASSERT_TRUE(StateManager::instance().update_metrics("bt", {{"net_pnl_usd", -12.5}}).is_ok());

    auto metrics = StateManager::instance().get_state("bt").value().metrics;
    EXPECT_DOUBLE_EQ(metrics.at("trades_copied"), 4.0);
    EXPECT_DOUBLE_EQ(metrics.at("net_pnl_usd"), -12.5);
}

TEST_F(StateManagerTest, InvalidTransitionNamesStates) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("copier")).is_ok());
    ASSERT_TRUE(StateManager::instance().update_state("copier", ComponentState::RUNNING).is_ok());

    auto result = StateManager::instance().update_state("copier", ComponentState::INITIALIZED);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_NE(std::string(result.error()->what()).find("RUNNING -> INITIALIZED"),
              std::string::npos);
    EXPECT_STREQ(state_to_string(ComponentState::ERR_STATE), "ERR_STATE");
}

TEST_F(StateManagerTest, UnregisterAndList) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("a")).is_ok());
    ASSERT_TRUE(StateManager::instance().register_component(make_info("b")).is_ok());
    EXPECT_EQ(StateManager::instance().get_all_components(), (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(StateManager::instance().unregister_component("a").is_ok());
    EXPECT_TRUE(StateManager::instance().unregister_component("a").is_error());
    EXPECT_EQ(StateManager::instance().get_all_components().size(), 1u);
    auto gone = StateManager::instance().get_state("a");
    ASSERT_TRUE(gone.is_error());
    EXPECT_EQ(gone.error()->code(), ErrorCode::DATA_NOT_FOUND);
}
