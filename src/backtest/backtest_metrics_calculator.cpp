#include "copy_ngin/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>

namespace copy_ngin {
namespace backtest {

// ========== Sizing ==========

double BacktestMetricsCalculator::percentile(std::vector<double> values, double pct) const {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());

    pct = std::max(0.0, std::min(pct, 100.0));
    const double rank = static_cast<double>(values.size() - 1) * pct / 100.0;
    const size_t lower = static_cast<size_t>(std::floor(rank));
    const size_t upper = static_cast<size_t>(std::ceil(rank));
    if (lower == upper) {
        return values[lower];
    }
    const double weight = rank - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * weight;
}

double BacktestMetricsCalculator::recommended_position_fraction(
    double initial_deposit, const std::vector<double>& entry_notionals) const {
    std::vector<double> sizes;
    sizes.reserve(entry_notionals.size());
    for (double notional : entry_notionals) {
        if (notional != 0.0) {
            sizes.push_back(std::abs(notional));
        }
    }
    if (sizes.empty()) {
        return 1.0;
    }

    const double anchor = percentile(std::move(sizes), 75.0);
    if (anchor <= 0.0) {
        return 1.0;
    }
    return std::max(0.0, std::min(initial_deposit / anchor, 1.0));
}

// ========== Risk Metrics ==========

DrawdownStats BacktestMetricsCalculator::calculate_drawdown(
    const std::vector<EquityPoint>& equity_curve) const {
    DrawdownStats stats;
    if (equity_curve.empty()) {
        return stats;
    }

    double peak = equity_curve.front().equity;
    for (const auto& point : equity_curve) {
        peak = std::max(peak, point.equity);
        if (peak <= 0.0) {
            continue;
        }
        const double ratio = (peak - point.equity) / peak;
        if (ratio > stats.max_drawdown_ratio) {
            stats.max_drawdown_ratio = ratio;
            stats.max_drawdown_usd = peak - point.equity;
        }
    }
    // Equity can go negative with leverage; a drawdown never exceeds 100%
    stats.max_drawdown_ratio = std::min(stats.max_drawdown_ratio, 1.0);
    return stats;
}

// ========== Trade Statistics ==========

std::optional<double> BacktestMetricsCalculator::calculate_win_rate(int wins,
                                                                    int closing_trades) const {
    if (closing_trades <= 0) {
        return std::nullopt;
    }
    return static_cast<double>(wins) / static_cast<double>(closing_trades) * 100.0;
}

double BacktestMetricsCalculator::calculate_roi_percent(double net_pnl,
                                                        double initial_deposit) const {
    if (initial_deposit <= 0.0) {
        return 0.0;
    }
    return net_pnl / initial_deposit * 100.0;
}

}  // namespace backtest
}  // namespace copy_ngin
