// src/backtest/signal_aggregator.cpp
#include "copy_ngin/backtest/signal_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_set>
#include "copy_ngin/core/logger.hpp"
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {
namespace backtest {

SignalAggregator::SignalAggregator(SignalAggregatorConfig config) : config_(std::move(config)) {
    if (config_.window.count() < 0) {
        throw std::invalid_argument("Signal window must be non-negative");
    }
    if (config_.min_accounts == 0) {
        config_.min_accounts = 1;
    }
}

std::vector<Signal> SignalAggregator::aggregate(const std::vector<TradeEvent>& events) const {
    std::vector<TradeEvent> entries;
    for (const auto& event : events) {
        if (is_entry(event.direction) && !event.asset.empty()) {
            entries.push_back(event);
            entries.back().asset = normalize_symbol(event.asset);
        }
    }
    std::stable_sort(entries.begin(), entries.end(), [](const TradeEvent& a, const TradeEvent& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<bool> consumed(entries.size(), false);
    // (asset, long family) -> time the pair may fire again
    std::map<std::pair<std::string, bool>, Timestamp> quiet_until;
    std::vector<Signal> signals;

    for (size_t i = 0; i < entries.size(); ++i) {
        if (consumed[i]) {
            continue;
        }
        const auto& anchor = entries[i];
        const bool is_long = is_long_family(anchor.direction);
        const auto key = std::make_pair(anchor.asset, is_long);

        auto quiet = quiet_until.find(key);
        if (quiet != quiet_until.end() && anchor.timestamp < quiet->second) {
            continue;
        }

        const Timestamp window_end = anchor.timestamp + config_.window;
        std::vector<size_t> contributors;
        std::unordered_set<std::string> seen_accounts;
        for (size_t j = i; j < entries.size() && entries[j].timestamp <= window_end; ++j) {
            const auto& candidate = entries[j];
            if (consumed[j] || candidate.asset != anchor.asset ||
                is_long_family(candidate.direction) != is_long) {
                continue;
            }
            // First entry per account counts
            if (seen_accounts.insert(candidate.account).second) {
                contributors.push_back(j);
            }
        }

        if (contributors.size() < config_.min_accounts) {
            continue;
        }

        Signal signal;
        signal.timestamp = anchor.timestamp;
        signal.asset = anchor.asset;
        signal.direction = is_long ? TradeDirection::LONG : TradeDirection::SHORT;
        double total = 0.0;
        for (size_t idx : contributors) {
            consumed[idx] = true;
            total += std::abs(entries[idx].value_usd);
            signal.accounts.push_back(entries[idx].account);
        }
        signal.notional_usd = total / static_cast<double>(contributors.size());
        quiet_until[key] = anchor.timestamp + config_.window;

        DEBUG("Signal " << direction_to_string(signal.direction) << " " << signal.asset << " from "
                        << signal.accounts.size() << " accounts, notional "
                        << signal.notional_usd);
        signals.push_back(std::move(signal));
    }

    return signals;
}

std::vector<TradeEvent> SignalAggregator::to_trade_events(const std::vector<Signal>& signals,
                                                          const std::string& account) {
    std::vector<TradeEvent> events;
    events.reserve(signals.size());
    for (const auto& signal : signals) {
        events.emplace_back(signal.timestamp, account, signal.asset, signal.direction, 0.0,
                            signal.notional_usd);
    }
    return events;
}

Result<BacktestResult> SignalAggregator::run_backtest(const std::vector<TradeEvent>& events,
                                                      const CopyBacktestConfig& config,
                                                      const PriceResolver& prices) const {
    const auto signals = aggregate(events);
    INFO("Aggregated " << signals.size() << " consensus signals from " << events.size()
                       << " events (min " << config_.min_accounts << " accounts)");

    CopyBacktestEngine engine;
    return engine.run(to_trade_events(signals), config, prices);
}

}  // namespace backtest
}  // namespace copy_ngin
