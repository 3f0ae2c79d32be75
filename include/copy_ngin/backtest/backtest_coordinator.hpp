// include/copy_ngin/backtest/backtest_coordinator.hpp
#pragma once

#include <string>
#include <vector>
#include "copy_ngin/backtest/backtest_results.hpp"
#include "copy_ngin/backtest/copy_backtest_engine.hpp"
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/state_manager.hpp"
#include "copy_ngin/core/types.hpp"
#include "copy_ngin/data/price_resolver.hpp"

namespace copy_ngin {
namespace backtest {

/**
 * @brief Configuration for BacktestCoordinator
 */
struct BacktestCoordinatorConfig {
    std::string component_id = "BT_COPIER";
    std::string output_directory = "apps/backtest/results";
    std::string run_name = "copy_backtest";
    bool store_results = true;
};

/**
 * @brief Runs one copy backtest as a StateManager component
 *
 * The component moves to RUNNING for the simulation, ERR_STATE when the
 * simulation or the export fails, and STOPPED once results are stored.
 * trades_copied and net_pnl_usd are published as metrics.
 */
class BacktestCoordinator {
public:
    explicit BacktestCoordinator(BacktestCoordinatorConfig config);

    /**
     * @brief Register the component with the StateManager
     * @return INVALID_ARGUMENT if the component id is empty or already taken
     */
    Result<void> initialize();

    /**
     * @brief Simulate an account's events and store the result
     * @param events Account history, entries and closes
     * @param account Account the run is recorded for
     * @param config Simulation parameters
     * @param prices Preloaded mark prices, may be empty
     * @return The backtest result, or the simulation or export error
     */
    Result<BacktestResult> run(const std::vector<TradeEvent>& events, const std::string& account,
                               const CopyBacktestConfig& config, const PriceResolver& prices);

    bool is_initialized() const {
        return is_initialized_;
    }

    const BacktestCoordinatorConfig& config() const {
        return config_;
    }

private:
    void set_state(ComponentState new_state, const std::string& message = "");

    BacktestCoordinatorConfig config_;
    CopyBacktestEngine engine_;
    bool is_initialized_ = false;
};

}  // namespace backtest
}  // namespace copy_ngin
