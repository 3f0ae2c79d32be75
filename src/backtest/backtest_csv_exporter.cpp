// src/backtest/backtest_csv_exporter.cpp
#include "copy_ngin/backtest/backtest_csv_exporter.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include "copy_ngin/core/logger.hpp"
#include "copy_ngin/core/time_utils.hpp"
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {
namespace backtest {

BacktestCSVExporter::BacktestCSVExporter(const std::string& output_directory)
    : output_directory_(output_directory) {}

Result<void> BacktestCSVExporter::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create output directory " + output_directory_ + ": " +
                                    ec.message(),
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_trades(const BacktestResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error()) {
        return dir;
    }

    const auto path = std::filesystem::path(output_directory_) / "trades.csv";
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path.string() + " for writing",
                                "BacktestCSVExporter");
    }

    file << "timestamp,asset,direction,notional_usd,price,pnl_usd,fee_usd,slippage_usd,"
         << "net_pnl_usd,cumulative_pnl_usd,equity_usd,unrealized_pnl_usd,position_size_base\n";
    file << std::setprecision(10);
    for (const auto& trade : result.trades) {
        file << core::format_timestamp_utc(trade.timestamp) << "," << trade.asset << ","
             << direction_to_string(trade.direction) << "," << trade.notional_usd << ","
             << trade.price << "," << trade.pnl_usd << "," << trade.fee_usd << ","
             << trade.slippage_usd << "," << trade.net_pnl_usd << ","
             << trade.cumulative_pnl_usd << "," << trade.equity_usd << ","
             << trade.unrealized_pnl_usd << "," << trade.position_size << "\n";
    }

    if (!file.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Error writing " + path.string(),
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_equity_curve(const BacktestResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error()) {
        return dir;
    }

    const auto path = std::filesystem::path(output_directory_) / "equity_curve.csv";
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path.string() + " for writing",
                                "BacktestCSVExporter");
    }

    file << "timestamp,equity_usd,unrealized_pnl_usd,cash_usd,margin_usd\n";
    file << std::setprecision(10);
    for (const auto& point : result.equity_curve) {
        file << core::format_timestamp_utc(point.timestamp) << "," << point.equity << ","
             << point.unrealized_pnl << "," << point.cash << "," << point.margin << "\n";
    }

    if (!file.good()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Error writing " + path.string(),
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_summary(const BacktestResult& result) const {
    auto dir = ensure_directory();
    if (dir.is_error()) {
        return dir;
    }

    const auto path = std::filesystem::path(output_directory_) / "summary.json";
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + path.string() + " for writing",
                                "BacktestCSVExporter");
    }
    file << std::setw(4) << to_json(result.summary) << std::endl;
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_run(const RunRecord& run) const {
    auto dir = ensure_directory();
    if (dir.is_error()) {
        return dir;
    }
    return run.save_to_file((std::filesystem::path(output_directory_) / "run.json").string());
}

Result<void> BacktestCSVExporter::export_all(const BacktestResult& result,
                                             const RunRecord& run) const {
    auto trades = write_trades(result);
    if (trades.is_error()) {
        return trades;
    }
    auto curve = write_equity_curve(result);
    if (curve.is_error()) {
        return curve;
    }
    auto summary = write_summary(result);
    if (summary.is_error()) {
        return summary;
    }
    auto saved = write_run(run);
    if (saved.is_error()) {
        return saved;
    }

    INFO("Wrote " << result.trades.size() << " trades and " << result.equity_curve.size()
                  << " equity points to " << output_directory_);
    return Result<void>();
}

}  // namespace backtest
}  // namespace copy_ngin
