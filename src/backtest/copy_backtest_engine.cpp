// src/backtest/copy_backtest_engine.cpp
#include "copy_ngin/backtest/copy_backtest_engine.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include "copy_ngin/core/logger.hpp"
#include "copy_ngin/core/time_utils.hpp"
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {
namespace backtest {

// ========== CopyBacktestConfig ==========

double CopyBacktestConfig::clamped_leverage() const {
    double value = leverage.value_or(1.0);
    if (!std::isfinite(value)) {
        value = 1.0;
    }
    return std::max(MIN_LEVERAGE, std::min(value, MAX_LEVERAGE));
}

Result<void> CopyBacktestConfig::validate() const {
    if (!std::isfinite(initial_deposit_usd) || initial_deposit_usd < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "initial_deposit_usd must be a non-negative number",
                                "CopyBacktestConfig");
    }
    if (!std::isfinite(fee_bps) || fee_bps < 0.0 || !std::isfinite(slippage_bps) ||
        slippage_bps < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "fee_bps and slippage_bps must be non-negative",
                                "CopyBacktestConfig");
    }
    if (!(per_trade_cap_ratio > 0.0) || per_trade_cap_ratio > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "per_trade_cap_ratio must be in (0, 1]", "CopyBacktestConfig");
    }
    if (start_ms.has_value() && end_ms.has_value() && *start_ms > *end_ms) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "start is after end",
                                "CopyBacktestConfig");
    }
    if (price_buffer_minutes < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "price_buffer_minutes must be non-negative",
                                "CopyBacktestConfig");
    }
    return Result<void>();
}

nlohmann::json CopyBacktestConfig::to_json() const {
    nlohmann::json j;
    j["initial_deposit_usd"] = initial_deposit_usd;
    j["leverage"] = leverage.has_value() ? nlohmann::json(*leverage) : nlohmann::json(nullptr);
    j["position_size_pct"] = position_size_pct.has_value() ? nlohmann::json(*position_size_pct)
                                                           : nlohmann::json(nullptr);
    j["fee_bps"] = fee_bps;
    j["slippage_bps"] = slippage_bps;
    j["asset_symbols"] = asset_symbols;
    j["start_ms"] = start_ms.has_value() ? nlohmann::json(*start_ms) : nlohmann::json(nullptr);
    j["end_ms"] = end_ms.has_value() ? nlohmann::json(*end_ms) : nlohmann::json(nullptr);
    j["max_trades"] =
        max_trades.has_value() ? nlohmann::json(*max_trades) : nlohmann::json(nullptr);
    j["per_trade_cap_ratio"] = per_trade_cap_ratio;
    j["include_price_points"] = include_price_points;
    j["price_buffer_minutes"] = price_buffer_minutes;
    j["version"] = version;
    return j;
}

void CopyBacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("initial_deposit_usd"))
        initial_deposit_usd = j.at("initial_deposit_usd").get<double>();
    if (j.contains("leverage")) {
        if (j.at("leverage").is_null())
            leverage.reset();
        else
            leverage = j.at("leverage").get<double>();
    }
    if (j.contains("position_size_pct")) {
        if (j.at("position_size_pct").is_null())
            position_size_pct.reset();
        else
            position_size_pct = j.at("position_size_pct").get<double>();
    }
    if (j.contains("fee_bps"))
        fee_bps = j.at("fee_bps").get<double>();
    if (j.contains("slippage_bps"))
        slippage_bps = j.at("slippage_bps").get<double>();
    if (j.contains("asset_symbols"))
        asset_symbols = j.at("asset_symbols").get<std::vector<std::string>>();
    if (j.contains("start_ms")) {
        if (j.at("start_ms").is_null())
            start_ms.reset();
        else
            start_ms = j.at("start_ms").get<int64_t>();
    }
    if (j.contains("end_ms")) {
        if (j.at("end_ms").is_null())
            end_ms.reset();
        else
            end_ms = j.at("end_ms").get<int64_t>();
    }
    if (j.contains("max_trades")) {
        if (j.at("max_trades").is_null())
            max_trades.reset();
        else
            max_trades = j.at("max_trades").get<size_t>();
    }
    if (j.contains("per_trade_cap_ratio"))
        per_trade_cap_ratio = j.at("per_trade_cap_ratio").get<double>();
    if (j.contains("include_price_points"))
        include_price_points = j.at("include_price_points").get<bool>();
    if (j.contains("price_buffer_minutes"))
        price_buffer_minutes = j.at("price_buffer_minutes").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

// ========== CopyBacktestEngine ==========

namespace {

/**
 * Mutable state of one simulation run
 */
struct SimulationState {
    double cash{0.0};
    LedgerPositions positions;
    double gross_pnl{0.0};
    double total_fees{0.0};
    double total_slippage{0.0};
    int wins{0};
    int closing_trades{0};
    std::vector<TradeResult> trades;
    std::vector<EquityPoint> equity_curve;
};

struct RunParameters {
    double initial_deposit{0.0};
    double leverage{1.0};
    double position_fraction{1.0};
    double fee_rate{0.0};
    double slippage_rate{0.0};
    double per_trade_cap_ratio{0.05};
};

EquityPoint mark_to_market(const SimulationState& state, const Timestamp& ts,
                           const PriceResolver& prices) {
    auto exposure = PositionLedger::unrealized_and_margin(state.positions, ts, prices);
    EquityPoint point;
    point.timestamp = ts;
    point.cash = state.cash;
    point.margin = exposure.margin;
    point.unrealized_pnl = exposure.unrealized_pnl;
    point.equity = state.cash + exposure.margin + exposure.unrealized_pnl;
    return point;
}

std::optional<Price> implied_price(const TradeEvent& event) {
    if (event.base_quantity == 0.0 || event.value_usd == 0.0) {
        return std::nullopt;
    }
    return std::abs(event.value_usd) / std::abs(event.base_quantity);
}

/**
 * Replay one event. Returns false when the event was skipped.
 */
bool process_event(const TradeEvent& event, const RunParameters& params,
                   const PriceResolver& prices, SimulationState& state) {
    const double desired_notional = std::abs(event.value_usd) * params.position_fraction;
    if (!(desired_notional > 0.0)) {
        DEBUG("Skipping " << event.asset << " " << direction_to_string(event.direction)
                          << ": zero copy notional");
        return false;
    }

    auto price = prices.resolve(event.asset, event.timestamp, implied_price(event));
    if (!price.has_value() || !(*price > 0.0)) {
        DEBUG("Skipping " << event.asset << " at "
                          << core::format_timestamp_utc(event.timestamp) << ": no price");
        return false;
    }

    double notional = 0.0;
    double pnl = 0.0;
    double fee = 0.0;
    double slippage = 0.0;
    double net = 0.0;

    if (is_entry(event.direction)) {
        const EquityPoint before = mark_to_market(state, event.timestamp, prices);
        const double max_notional_overall = before.equity * params.leverage;
        if (!(max_notional_overall > 0.0)) {
            DEBUG("Skipping entry on " << event.asset << ": no equity left");
            return false;
        }
        notional =
            std::min(desired_notional, max_notional_overall * params.per_trade_cap_ratio);

        fee = notional * params.fee_rate;
        slippage = notional * params.slippage_rate;
        double margin_required = notional / params.leverage;
        const double total_cost = margin_required + fee + slippage;
        if (total_cost > state.cash) {
            // Scale down to the largest affordable size
            const double afford = (state.cash > 0.0 && total_cost > 0.0)
                                      ? state.cash / total_cost
                                      : 0.0;
            notional *= afford;
            fee = notional * params.fee_rate;
            slippage = notional * params.slippage_rate;
            margin_required = notional / params.leverage;
        }
        if (!(notional > 0.0)) {
            DEBUG("Skipping entry on " << event.asset << ": insufficient cash");
            return false;
        }

        auto& position = state.positions[event.asset];
        auto applied = PositionLedger::apply_entry(position, event.direction, notional / *price,
                                                   *price, margin_required);
        if (applied.is_error()) {
            WARN("Entry on " << event.asset << " rejected: " << applied.error()->what());
            return false;
        }

        state.cash -= margin_required + fee + slippage;
        net = -(fee + slippage);
    } else if (is_close(event.direction)) {
        auto it = state.positions.find(event.asset);
        if (it == state.positions.end() || it->second.is_flat()) {
            DEBUG("Skipping close on " << event.asset << ": no open position");
            return false;
        }

        auto outcome = PositionLedger::apply_close(it->second, desired_notional / *price, *price);
        if (!outcome.closed) {
            return false;
        }

        notional = outcome.closed_quantity * *price;
        fee = notional * params.fee_rate;
        slippage = notional * params.slippage_rate;
        pnl = outcome.realized_pnl;
        net = pnl - fee - slippage;

        state.cash += outcome.released_margin + net;
        state.gross_pnl += pnl;
        state.closing_trades++;
        if (net > 0.0) {
            state.wins++;
        }
    } else {
        return false;
    }

    state.total_fees += fee;
    state.total_slippage += slippage;

    const EquityPoint after = mark_to_market(state, event.timestamp, prices);
    TradeResult trade;
    trade.timestamp = event.timestamp;
    trade.asset = event.asset;
    trade.direction = event.direction;
    trade.notional_usd = notional;
    trade.price = *price;
    trade.pnl_usd = pnl;
    trade.fee_usd = fee;
    trade.slippage_usd = slippage;
    trade.net_pnl_usd = net;
    trade.cumulative_pnl_usd = after.equity - params.initial_deposit;
    trade.equity_usd = after.equity;
    trade.unrealized_pnl_usd = after.unrealized_pnl;
    trade.position_size = state.positions[event.asset].quantity;
    state.trades.push_back(std::move(trade));
    return true;
}

}  // namespace

std::chrono::minutes CopyBacktestEngine::step_for_span(const Timestamp& first,
                                                       const Timestamp& last) {
    using days = std::chrono::duration<int64_t, std::ratio<86400>>;
    const auto span = last - first;
    if (span <= days(90)) {
        return std::chrono::minutes(1);
    }
    if (span <= days(365)) {
        return std::chrono::minutes(5);
    }
    return std::chrono::minutes(15);
}

std::vector<std::string> CopyBacktestEngine::list_traded_assets(
    const std::vector<TradeEvent>& events) {
    std::set<std::string> assets;
    for (const auto& event : events) {
        if (!event.asset.empty()) {
            assets.insert(normalize_symbol(event.asset));
        }
    }
    return std::vector<std::string>(assets.begin(), assets.end());
}

std::vector<TradeEvent> CopyBacktestEngine::filter_events(const std::vector<TradeEvent>& history,
                                                          const CopyBacktestConfig& config) {
    std::set<std::string> allowed;
    for (const auto& symbol : config.asset_symbols) {
        allowed.insert(normalize_symbol(symbol));
    }
    const std::optional<Timestamp> start =
        config.start_ms.has_value() ? std::optional<Timestamp>(core::from_epoch_ms(*config.start_ms))
                                    : std::nullopt;
    const std::optional<Timestamp> end =
        config.end_ms.has_value() ? std::optional<Timestamp>(core::from_epoch_ms(*config.end_ms))
                                  : std::nullopt;

    std::vector<TradeEvent> events;
    for (const auto& event : history) {
        if (event.direction == TradeDirection::DEPOSIT) {
            continue;
        }
        if (start.has_value() && event.timestamp < *start) {
            continue;
        }
        if (end.has_value() && event.timestamp > *end) {
            continue;
        }
        if (!allowed.empty() && allowed.count(normalize_symbol(event.asset)) == 0) {
            continue;
        }
        events.push_back(event);
        events.back().asset = normalize_symbol(event.asset);
    }

    std::stable_sort(events.begin(), events.end(), [](const TradeEvent& a, const TradeEvent& b) {
        return a.timestamp < b.timestamp;
    });
    // max_trades of zero means no limit
    if (config.max_trades.value_or(0) > 0 && events.size() > *config.max_trades) {
        events.resize(*config.max_trades);
    }
    return events;
}

Result<BacktestResult> CopyBacktestEngine::run(const std::vector<TradeEvent>& history,
                                               const CopyBacktestConfig& config,
                                               const PriceResolver& prices) const {
    auto valid = config.validate();
    if (valid.is_error()) {
        return make_error<BacktestResult>(valid.error()->code(), valid.error()->what(),
                                          "CopyBacktestEngine");
    }

    // Sizing anchors on the trader's whole history, not the requested window
    std::vector<double> entry_notionals;
    for (const auto& event : history) {
        if (is_entry(event.direction) && event.value_usd != 0.0) {
            entry_notionals.push_back(std::abs(event.value_usd));
        }
    }
    const double recommended =
        metrics_.recommended_position_fraction(config.initial_deposit_usd, entry_notionals);

    double used_pct = config.position_size_pct.has_value() ? *config.position_size_pct
                                                           : recommended * 100.0;
    if (!std::isfinite(used_pct)) {
        used_pct = recommended * 100.0;
    }
    used_pct = std::max(0.0, std::min(used_pct, CopyBacktestConfig::MAX_POSITION_PCT));

    RunParameters params;
    params.initial_deposit = config.initial_deposit_usd;
    params.leverage = config.clamped_leverage();
    params.position_fraction = used_pct / 100.0;
    params.fee_rate = config.fee_bps / 10000.0;
    params.slippage_rate = config.slippage_bps / 10000.0;
    params.per_trade_cap_ratio = config.per_trade_cap_ratio;

    BacktestResult result;
    auto& summary = result.summary;
    summary.initial_deposit_usd = config.initial_deposit_usd;
    summary.recommended_position_pct = recommended * 100.0;
    summary.used_position_pct = used_pct;
    summary.leverage_used = params.leverage;
    for (const auto& symbol : config.asset_symbols) {
        summary.asset_symbols.push_back(normalize_symbol(symbol));
    }
    if (config.include_price_points) {
        result.price_points = prices.series();
    }

    const std::vector<TradeEvent> events = filter_events(history, config);
    if (events.empty()) {
        INFO("No trades match the backtest filters, returning an empty result");
        return result;
    }

    SimulationState state;
    state.cash = config.initial_deposit_usd;

    const Timestamp first = events.front().timestamp;
    const Timestamp last = events.back().timestamp;
    const auto step = step_for_span(first, last);
    INFO("Replaying " << events.size() << " trades from " << core::format_timestamp_utc(first)
                      << " to " << core::format_timestamp_utc(last) << " at " << step.count()
                      << "m steps, leverage " << params.leverage << "x, size " << used_pct
                      << "%");

    size_t next = 0;
    size_t skipped = 0;
    const Timestamp last_bucket = core::floor_to_step(last, step);
    for (Timestamp bucket = core::floor_to_step(first, step); bucket <= last_bucket;
         bucket += step) {
        const Timestamp bucket_end = bucket + step;
        while (next < events.size() && events[next].timestamp < bucket_end) {
            if (!process_event(events[next], params, prices, state)) {
                ++skipped;
            }
            ++next;
        }
        state.equity_curve.push_back(mark_to_market(state, bucket, prices));
    }

    const double final_equity = state.equity_curve.back().equity;
    const auto drawdown = metrics_.calculate_drawdown(state.equity_curve);

    summary.total_fees_usd = state.total_fees;
    summary.total_slippage_usd = state.total_slippage;
    summary.gross_pnl_usd = state.gross_pnl;
    summary.net_pnl_usd = final_equity - config.initial_deposit_usd;
    summary.roi_percent =
        metrics_.calculate_roi_percent(summary.net_pnl_usd, config.initial_deposit_usd);
    summary.trades_copied = static_cast<int>(state.trades.size());
    summary.win_rate_percent = metrics_.calculate_win_rate(state.wins, state.closing_trades);
    summary.max_drawdown_pct = drawdown.max_drawdown_ratio * 100.0;
    summary.max_drawdown_usd = drawdown.max_drawdown_usd;
    summary.start = first;
    summary.end = last;

    result.trades = std::move(state.trades);
    result.equity_curve = std::move(state.equity_curve);

    INFO("Backtest finished: " << summary.trades_copied << " trades copied, " << skipped
                               << " skipped, net PnL " << summary.net_pnl_usd << " USD");
    return result;
}

Result<BacktestResult> CopyBacktestEngine::run_for_account(TradeHistorySource& history,
                                                           const std::string& account,
                                                           const CopyBacktestConfig& config,
                                                           PriceSeriesSource* price_source) const {
    auto exists = history.account_exists(account);
    if (exists.is_error()) {
        return make_error<BacktestResult>(exists.error()->code(), exists.error()->what(),
                                          "CopyBacktestEngine");
    }
    if (!exists.value()) {
        return make_error<BacktestResult>(ErrorCode::ACCOUNT_NOT_FOUND,
                                          "Unknown account: " + account, "CopyBacktestEngine");
    }

    auto trades = history.load_trades(account);
    if (trades.is_error()) {
        return make_error<BacktestResult>(trades.error()->code(), trades.error()->what(),
                                          "CopyBacktestEngine");
    }
    const auto& all_events = trades.value();

    PriceResolver prices;
    const auto window = filter_events(all_events, config);
    if (price_source != nullptr && !window.empty()) {
        prices = load_price_cache(*price_source, list_traded_assets(window),
                                  core::floor_to_minute(window.front().timestamp),
                                  core::floor_to_minute(window.back().timestamp),
                                  std::chrono::minutes(config.price_buffer_minutes));
    }

    return run(all_events, config, prices);
}

}  // namespace backtest
}  // namespace copy_ngin
