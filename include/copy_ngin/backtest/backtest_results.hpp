// include/copy_ngin/backtest/backtest_results.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "copy_ngin/core/config_base.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {
namespace backtest {

/**
 * @brief One sample of the simulated account
 *
 * equity == cash + margin + unrealized_pnl at the sample time.
 */
struct EquityPoint {
    Timestamp timestamp;
    double equity{0.0};
    double unrealized_pnl{0.0};
    double cash{0.0};
    double margin{0.0};
};

/**
 * @brief One executed simulated trade
 */
struct TradeResult {
    Timestamp timestamp;
    std::string asset;
    TradeDirection direction{TradeDirection::BUY};
    double notional_usd{0.0};
    double price{0.0};
    double pnl_usd{0.0};  // Gross realized PnL, zero for entries
    double fee_usd{0.0};
    double slippage_usd{0.0};
    double net_pnl_usd{0.0};
    double cumulative_pnl_usd{0.0};  // equity - initial deposit after the trade
    double equity_usd{0.0};
    double unrealized_pnl_usd{0.0};
    Quantity position_size{0.0};  // Signed base size after the trade
};

struct BacktestSummary {
    double initial_deposit_usd{0.0};
    double recommended_position_pct{100.0};
    double used_position_pct{100.0};
    double leverage_used{1.0};
    std::vector<std::string> asset_symbols;
    double total_fees_usd{0.0};
    double total_slippage_usd{0.0};
    double gross_pnl_usd{0.0};
    double net_pnl_usd{0.0};
    double roi_percent{0.0};
    int trades_copied{0};
    std::optional<double> win_rate_percent;
    double max_drawdown_pct{0.0};
    double max_drawdown_usd{0.0};
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
};

struct BacktestResult {
    BacktestSummary summary;
    std::vector<TradeResult> trades;
    std::vector<EquityPoint> equity_curve;
    std::optional<PriceSeriesMap> price_points;
};

nlohmann::json to_json(const EquityPoint& point);
nlohmann::json to_json(const TradeResult& trade);
nlohmann::json to_json(const BacktestSummary& summary);
nlohmann::json to_json(const BacktestResult& result);

/**
 * @brief Named, persisted outcome of a backtest
 *
 * Carries the parameters a live copy session is configured from.
 */
struct RunRecord : public ConfigBase {
    std::string name;
    std::string whale_id;
    double leverage{1.0};
    double position_size_pct{100.0};
    std::vector<std::string> asset_symbols;
    double initial_deposit_usd{0.0};
    std::optional<double> win_rate_percent;
    int trades_copied{0};
    double max_drawdown_pct{0.0};
    double max_drawdown_usd{0.0};
    double net_pnl_usd{0.0};
    double roi_percent{0.0};

    std::string version{"1.0.0"};

    static RunRecord from_result(const std::string& name, const std::string& whale_id,
                                 const BacktestResult& result);

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace backtest
}  // namespace copy_ngin
