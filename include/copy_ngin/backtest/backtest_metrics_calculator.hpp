#pragma once

#include <optional>
#include <vector>
#include "copy_ngin/backtest/backtest_results.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {
namespace backtest {

/**
 * @brief Maximum peak-to-trough decline of an equity curve
 */
struct DrawdownStats {
    double max_drawdown_ratio{0.0};  // 0.10 = 10%
    double max_drawdown_usd{0.0};
};

/**
 * @brief Pure stateless calculation component for backtest metrics
 *
 * All methods are const and have no side effects. No logging; the caller
 * is responsible for logging.
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;
    ~BacktestMetricsCalculator() = default;

    // ========== Sizing ==========

    /**
     * @brief Percentile by linear interpolation between order statistics
     * @param values Sample, any order
     * @param pct Percentile in [0, 100]
     * @return 0 for an empty sample
     */
    double percentile(std::vector<double> values, double pct) const;

    /**
     * @brief Fraction of the tracked trader's size to copy
     *
     * deposit / p75(entry notionals), clamped to [0, 1]. Defaults to 1 when
     * there is no usable entry notional.
     * @return Fraction (1.0 = copy full size)
     */
    double recommended_position_fraction(double initial_deposit,
                                          const std::vector<double>& entry_notionals) const;

    // ========== Risk Metrics ==========

    DrawdownStats calculate_drawdown(const std::vector<EquityPoint>& equity_curve) const;

    // ========== Trade Statistics ==========

    /**
     * @brief wins / closes * 100, nullopt when nothing was closed
     */
    std::optional<double> calculate_win_rate(int wins, int closing_trades) const;

    /**
     * @brief Net PnL as a percent of the initial deposit
     */
    double calculate_roi_percent(double net_pnl, double initial_deposit) const;
};

}  // namespace backtest
}  // namespace copy_ngin
