// src/backtest/backtest_coordinator.cpp
#include "copy_ngin/backtest/backtest_coordinator.hpp"
#include <chrono>
#include <utility>
#include "copy_ngin/backtest/backtest_csv_exporter.hpp"
#include "copy_ngin/core/logger.hpp"

namespace copy_ngin {
namespace backtest {

BacktestCoordinator::BacktestCoordinator(BacktestCoordinatorConfig config)
    : config_(std::move(config)) {}

Result<void> BacktestCoordinator::initialize() {
    if (is_initialized_) {
        return Result<void>();
    }

    auto registered = StateManager::instance().register_component(
        ComponentInfo{ComponentType::BACKTEST_ENGINE, ComponentState::INITIALIZED,
                      config_.component_id, "", std::chrono::system_clock::now(), {}});
    if (registered.is_error()) {
        return registered;
    }

    is_initialized_ = true;
    INFO("Backtest coordinator " << config_.component_id << " initialized");
    return Result<void>();
}

Result<BacktestResult> BacktestCoordinator::run(const std::vector<TradeEvent>& events,
                                                const std::string& account,
                                                const CopyBacktestConfig& config,
                                                const PriceResolver& prices) {
    if (!is_initialized_) {
        return make_error<BacktestResult>(ErrorCode::NOT_INITIALIZED,
                                          "Backtest coordinator not initialized",
                                          "BacktestCoordinator");
    }

    set_state(ComponentState::RUNNING);
    auto result = engine_.run(events, config, prices);
    if (result.is_error()) {
        ERROR("Backtest failed: " << result.error()->to_string());
        set_state(ComponentState::ERR_STATE, result.error()->what());
        return make_error<BacktestResult>(result.error()->code(), result.error()->what(),
                                          "BacktestCoordinator");
    }

    if (config_.store_results) {
        BacktestCSVExporter exporter(config_.output_directory);
        auto run = RunRecord::from_result(config_.run_name, account, result.value());
        auto saved = exporter.export_all(result.value(), run);
        if (saved.is_error()) {
            ERROR("Failed to save results: " << saved.error()->to_string());
            set_state(ComponentState::ERR_STATE, saved.error()->what());
            return make_error<BacktestResult>(saved.error()->code(), saved.error()->what(),
                                              "BacktestCoordinator");
        }
        INFO("Results written to " << config_.output_directory);
    }

    const auto& summary = result.value().summary;
    auto metrics = StateManager::instance().update_metrics(
        config_.component_id, {{"trades_copied", static_cast<double>(summary.trades_copied)},
                               {"net_pnl_usd", summary.net_pnl_usd}});
    if (metrics.is_error()) {
        WARN("Failed to publish backtest metrics: " << metrics.error()->to_string());
    }
    set_state(ComponentState::STOPPED);
    return result;
}

void BacktestCoordinator::set_state(ComponentState new_state, const std::string& message) {
    auto result = StateManager::instance().update_state(config_.component_id, new_state, message);
    if (result.is_error()) {
        WARN("Failed to update backtest state: " << result.error()->to_string());
    }
}

}  // namespace backtest
}  // namespace copy_ngin
