// include/copy_ngin/backtest/copy_backtest_engine.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "copy_ngin/backtest/backtest_metrics_calculator.hpp"
#include "copy_ngin/backtest/backtest_results.hpp"
#include "copy_ngin/backtest/position_ledger.hpp"
#include "copy_ngin/core/config_base.hpp"
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"
#include "copy_ngin/data/exchange_interfaces.hpp"
#include "copy_ngin/data/price_resolver.hpp"

namespace copy_ngin {
namespace backtest {

/**
 * @brief Parameters of one copy backtest
 */
struct CopyBacktestConfig : public ConfigBase {
    double initial_deposit_usd{10000.0};
    std::optional<double> leverage;           // Absent = 1x
    std::optional<double> position_size_pct;  // Absent = recommended sizing
    double fee_bps{0.0};
    double slippage_bps{0.0};
    std::vector<std::string> asset_symbols;  // Empty = every asset
    std::optional<int64_t> start_ms;         // Inclusive, ms since epoch
    std::optional<int64_t> end_ms;           // Inclusive, ms since epoch
    std::optional<size_t> max_trades;        // Absent or 0 = no limit

    // At most this share of levered equity goes into one entry
    double per_trade_cap_ratio{0.05};
    bool include_price_points{false};
    int price_buffer_minutes{5};

    // Configuration metadata
    std::string version{"1.0.0"};

    static constexpr double MIN_LEVERAGE = 0.1;
    static constexpr double MAX_LEVERAGE = 100.0;
    static constexpr double MAX_POSITION_PCT = 200.0;

    double clamped_leverage() const;

    /**
     * @brief Reject configurations no simulation can run with
     */
    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Replays a tracked account's trades against a scaled, leveraged copy
 *
 * Each call owns its simulation state; the price resolver is only read, so
 * one engine and one resolver can serve concurrent runs.
 */
class CopyBacktestEngine {
public:
    CopyBacktestEngine() = default;

    /**
     * @brief Simulate copying history
     * @param history Every trade of the tracked account, ordered by time
     *        (ties in insertion order). Filters of the config are applied here;
     *        recommended sizing looks at the unfiltered history.
     * @param config Run parameters
     * @param prices Preloaded price series, may be empty
     * @return Result set; a zero-valued result when nothing matches the filters
     */
    Result<BacktestResult> run(const std::vector<TradeEvent>& history,
                               const CopyBacktestConfig& config,
                               const PriceResolver& prices) const;

    /**
     * @brief Load an account's history and simulate it
     *
     * Price series are fetched for every traded asset when a source is given.
     * @return ACCOUNT_NOT_FOUND if the store does not know the account
     */
    Result<BacktestResult> run_for_account(TradeHistorySource& history,
                                           const std::string& account,
                                           const CopyBacktestConfig& config,
                                           PriceSeriesSource* price_source = nullptr) const;

    /**
     * @brief Sorted, de-duplicated assets appearing in events
     */
    static std::vector<std::string> list_traded_assets(const std::vector<TradeEvent>& events);

    /**
     * @brief Events a run with this config will replay
     */
    static std::vector<TradeEvent> filter_events(const std::vector<TradeEvent>& history,
                                                 const CopyBacktestConfig& config);

    /**
     * @brief Clock step for a replay window
     *
     * 1 minute up to 90 days, 5 minutes up to a year, 15 minutes beyond.
     */
    static std::chrono::minutes step_for_span(const Timestamp& first, const Timestamp& last);

private:
    BacktestMetricsCalculator metrics_;
};

}  // namespace backtest
}  // namespace copy_ngin
