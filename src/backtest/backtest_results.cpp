// src/backtest/backtest_results.cpp
#include "copy_ngin/backtest/backtest_results.hpp"
#include "copy_ngin/core/time_utils.hpp"
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {
namespace backtest {

nlohmann::json to_json(const EquityPoint& point) {
    nlohmann::json j;
    j["timestamp"] = core::format_timestamp_utc(point.timestamp);
    j["equity_usd"] = point.equity;
    j["unrealized_pnl_usd"] = point.unrealized_pnl;
    j["cash_usd"] = point.cash;
    j["margin_usd"] = point.margin;
    return j;
}

nlohmann::json to_json(const TradeResult& trade) {
    nlohmann::json j;
    j["timestamp"] = core::format_timestamp_utc(trade.timestamp);
    j["asset"] = trade.asset;
    j["direction"] = direction_to_string(trade.direction);
    j["notional_usd"] = trade.notional_usd;
    j["price"] = trade.price;
    j["pnl_usd"] = trade.pnl_usd;
    j["fee_usd"] = trade.fee_usd;
    j["slippage_usd"] = trade.slippage_usd;
    j["net_pnl_usd"] = trade.net_pnl_usd;
    j["cumulative_pnl_usd"] = trade.cumulative_pnl_usd;
    j["equity_usd"] = trade.equity_usd;
    j["unrealized_pnl_usd"] = trade.unrealized_pnl_usd;
    j["position_size_base"] = trade.position_size;
    return j;
}

nlohmann::json to_json(const BacktestSummary& summary) {
    nlohmann::json j;
    j["initial_deposit_usd"] = summary.initial_deposit_usd;
    j["recommended_position_pct"] = summary.recommended_position_pct;
    j["used_position_pct"] = summary.used_position_pct;
    j["leverage_used"] = summary.leverage_used;
    j["asset_symbols"] = summary.asset_symbols;
    j["total_fees_usd"] = summary.total_fees_usd;
    j["total_slippage_usd"] = summary.total_slippage_usd;
    j["gross_pnl_usd"] = summary.gross_pnl_usd;
    j["net_pnl_usd"] = summary.net_pnl_usd;
    j["roi_percent"] = summary.roi_percent;
    j["trades_copied"] = summary.trades_copied;
    j["win_rate_percent"] = summary.win_rate_percent.has_value()
                                ? nlohmann::json(*summary.win_rate_percent)
                                : nlohmann::json(nullptr);
    j["max_drawdown_pct"] = summary.max_drawdown_pct;
    j["max_drawdown_usd"] = summary.max_drawdown_usd;
    j["start"] = summary.start.has_value() ? nlohmann::json(core::format_timestamp_utc(*summary.start))
                                           : nlohmann::json(nullptr);
    j["end"] = summary.end.has_value() ? nlohmann::json(core::format_timestamp_utc(*summary.end))
                                       : nlohmann::json(nullptr);
    return j;
}

nlohmann::json to_json(const BacktestResult& result) {
    nlohmann::json j;
    j["summary"] = to_json(result.summary);

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& trade : result.trades) {
        trades.push_back(to_json(trade));
    }
    j["trades"] = trades;

    nlohmann::json curve = nlohmann::json::array();
    for (const auto& point : result.equity_curve) {
        curve.push_back(to_json(point));
    }
    j["equity_curve"] = curve;

    if (result.price_points.has_value()) {
        nlohmann::json prices = nlohmann::json::object();
        for (const auto& [asset, series] : *result.price_points) {
            nlohmann::json points = nlohmann::json::array();
            for (const auto& p : series) {
                points.push_back({{"timestamp", core::format_timestamp_utc(p.timestamp)},
                                  {"price", p.price}});
            }
            prices[asset] = points;
        }
        j["price_points"] = prices;
    } else {
        j["price_points"] = nullptr;
    }
    return j;
}

RunRecord RunRecord::from_result(const std::string& name, const std::string& whale_id,
                                 const BacktestResult& result) {
    const auto& summary = result.summary;
    RunRecord run;
    run.name = name;
    run.whale_id = whale_id;
    run.leverage = summary.leverage_used;
    run.position_size_pct = summary.used_position_pct;
    run.asset_symbols = summary.asset_symbols;
    run.initial_deposit_usd = summary.initial_deposit_usd;
    run.win_rate_percent = summary.win_rate_percent;
    run.trades_copied = summary.trades_copied;
    run.max_drawdown_pct = summary.max_drawdown_pct;
    run.max_drawdown_usd = summary.max_drawdown_usd;
    run.net_pnl_usd = summary.net_pnl_usd;
    run.roi_percent = summary.roi_percent;
    return run;
}

nlohmann::json RunRecord::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["whale_id"] = whale_id;
    j["leverage"] = leverage;
    j["position_size_pct"] = position_size_pct;
    j["asset_symbols"] = asset_symbols;
    j["initial_deposit_usd"] = initial_deposit_usd;
    j["win_rate_percent"] =
        win_rate_percent.has_value() ? nlohmann::json(*win_rate_percent) : nlohmann::json(nullptr);
    j["trades_copied"] = trades_copied;
    j["max_drawdown_pct"] = max_drawdown_pct;
    j["max_drawdown_usd"] = max_drawdown_usd;
    j["net_pnl_usd"] = net_pnl_usd;
    j["roi_percent"] = roi_percent;
    j["version"] = version;
    return j;
}

void RunRecord::from_json(const nlohmann::json& j) {
    if (j.contains("name"))
        name = j.at("name").get<std::string>();
    if (j.contains("whale_id"))
        whale_id = j.at("whale_id").get<std::string>();
    if (j.contains("leverage"))
        leverage = j.at("leverage").get<double>();
    if (j.contains("position_size_pct"))
        position_size_pct = j.at("position_size_pct").get<double>();
    if (j.contains("asset_symbols"))
        asset_symbols = j.at("asset_symbols").get<std::vector<std::string>>();
    if (j.contains("initial_deposit_usd"))
        initial_deposit_usd = j.at("initial_deposit_usd").get<double>();
    if (j.contains("win_rate_percent")) {
        if (j.at("win_rate_percent").is_null())
            win_rate_percent.reset();
        else
            win_rate_percent = j.at("win_rate_percent").get<double>();
    }
    if (j.contains("trades_copied"))
        trades_copied = j.at("trades_copied").get<int>();
    if (j.contains("max_drawdown_pct"))
        max_drawdown_pct = j.at("max_drawdown_pct").get<double>();
    if (j.contains("max_drawdown_usd"))
        max_drawdown_usd = j.at("max_drawdown_usd").get<double>();
    if (j.contains("net_pnl_usd"))
        net_pnl_usd = j.at("net_pnl_usd").get<double>();
    if (j.contains("roi_percent"))
        roi_percent = j.at("roi_percent").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

}  // namespace backtest
}  // namespace copy_ngin
