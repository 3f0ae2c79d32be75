// include/copy_ngin/backtest/signal_aggregator.hpp
#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "copy_ngin/backtest/copy_backtest_engine.hpp"
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {
namespace backtest {

/**
 * @brief Consensus entry of several tracked accounts
 */
struct Signal {
    Timestamp timestamp;  // First contributing entry
    std::string asset;
    TradeDirection direction{TradeDirection::LONG};  // LONG or SHORT
    double notional_usd{0.0};                        // Mean over contributors
    std::vector<std::string> accounts;               // In order of first entry
};

struct SignalAggregatorConfig {
    std::chrono::milliseconds window{std::chrono::minutes(5)};
    size_t min_accounts{2};
};

/**
 * @brief Correlates entries of several accounts into consensus signals
 *
 * Only entry directions take part; buy and long count as the long family,
 * short as the short family.
 */
class SignalAggregator {
public:
    explicit SignalAggregator(SignalAggregatorConfig config);

    /**
     * @brief Build signals from the entries of several accounts
     *
     * Each entry contributes to at most one signal. After a signal fires,
     * the same asset and direction stay quiet until the window has elapsed.
     * @return Signals ordered by timestamp
     */
    std::vector<Signal> aggregate(const std::vector<TradeEvent>& events) const;

    /**
     * @brief Convert signals into entries the simulator replays
     *
     * Synthetic events carry no base quantity, so their prices come from the
     * price series only.
     */
    static std::vector<TradeEvent> to_trade_events(const std::vector<Signal>& signals,
                                                   const std::string& account = "consensus");

    /**
     * @brief Aggregate and simulate in one step
     */
    Result<BacktestResult> run_backtest(const std::vector<TradeEvent>& events,
                                        const CopyBacktestConfig& config,
                                        const PriceResolver& prices) const;

    const SignalAggregatorConfig& config() const {
        return config_;
    }

private:
    SignalAggregatorConfig config_;
};

}  // namespace backtest
}  // namespace copy_ngin
