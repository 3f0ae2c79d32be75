// include/copy_ngin/backtest/backtest_csv_exporter.hpp
#pragma once

#include <string>
#include "copy_ngin/backtest/backtest_results.hpp"
#include "copy_ngin/core/error.hpp"

namespace copy_ngin {
namespace backtest {

/**
 * @brief Writes a backtest result to an output directory
 *
 * trades.csv, equity_curve.csv and summary.json; run.json when a run
 * record is given.
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(const std::string& output_directory);

    Result<void> write_trades(const BacktestResult& result) const;
    Result<void> write_equity_curve(const BacktestResult& result) const;
    Result<void> write_summary(const BacktestResult& result) const;
    Result<void> write_run(const RunRecord& run) const;

    /**
     * @brief Write every artifact of a result
     */
    Result<void> export_all(const BacktestResult& result, const RunRecord& run) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    Result<void> ensure_directory() const;

    std::string output_directory_;
};

}  // namespace backtest
}  // namespace copy_ngin
