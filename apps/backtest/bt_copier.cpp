#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include "copy_ngin/backtest/backtest_coordinator.hpp"
#include "copy_ngin/backtest/copy_backtest_engine.hpp"
#include "copy_ngin/core/logger.hpp"
#include "copy_ngin/data/csv_trade_loader.hpp"
#include "copy_ngin/data/price_resolver.hpp"

using namespace copy_ngin;
using namespace copy_ngin::backtest;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <config.json>" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::ifstream config_file(argv[1]);
        if (!config_file.is_open()) {
            std::cerr << "Cannot open config file: " << argv[1] << std::endl;
            return 1;
        }
        nlohmann::json root;
        config_file >> root;

        // Initialize logger
        LoggerConfig logger_config;
        logger_config.filename_prefix = "bt_copier";
        if (root.contains("logger")) {
            logger_config.from_json(root.at("logger"));
        }
        auto& logger = Logger::instance();
        logger.initialize(logger_config);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }

        CopyBacktestConfig config;
        if (root.contains("backtest")) {
            config.from_json(root.at("backtest"));
        }
        auto valid = config.validate();
        if (valid.is_error()) {
            std::cerr << "Invalid backtest config: " << valid.error()->what() << std::endl;
            return 1;
        }

        if (!root.contains("trades_csv") || !root.contains("account")) {
            std::cerr << "Config must name trades_csv and account" << std::endl;
            return 1;
        }
        const auto trades_csv = root.at("trades_csv").get<std::string>();
        const auto account = root.at("account").get<std::string>();
        BacktestCoordinatorConfig coordinator_config;
        coordinator_config.output_directory =
            root.value("output_directory", coordinator_config.output_directory);
        coordinator_config.run_name = root.value("run_name", coordinator_config.run_name);
        BacktestCoordinator coordinator(coordinator_config);
        auto initialized = coordinator.initialize();
        if (initialized.is_error()) {
            std::cerr << "Failed to register backtest: " << initialized.error()->what()
                      << std::endl;
            return 1;
        }

        // Load trade history
        auto events = load_trades_csv(trades_csv);
        if (events.is_error()) {
            ERROR("Failed to load trades: " << events.error()->to_string());
            return 1;
        }
        CsvTradeHistory history(events.value());

        auto exists = history.account_exists(account);
        if (exists.is_error() || !exists.value()) {
            ERROR("Account " << account << " not found in " << trades_csv);
            return 1;
        }
        auto account_events = history.load_trades(account);
        if (account_events.is_error()) {
            ERROR("Failed to load trades for " << account << ": "
                                               << account_events.error()->to_string());
            return 1;
        }

        // Optional price series
        PriceResolver prices;
        if (root.contains("prices_csv") && !root.at("prices_csv").is_null()) {
            auto series = load_prices_csv(root.at("prices_csv").get<std::string>());
            if (series.is_error()) {
                WARN("Price series unavailable, using trade-implied prices: "
                     << series.error()->to_string());
            } else {
                prices = PriceResolver(series.value());
            }
        }

        INFO("Traded assets: " << CopyBacktestEngine::list_traded_assets(account_events.value()).size());

        // Run the simulation and store the results
        auto result = coordinator.run(account_events.value(), account, config, prices);
        if (result.is_error()) {
            return 1;
        }

        const auto& summary = result.value().summary;
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "======= Copy Backtest Results =======" << std::endl;
        std::cout << "Account:          " << account << std::endl;
        std::cout << "Trades copied:    " << summary.trades_copied << std::endl;
        std::cout << "Used size:        " << summary.used_position_pct << "% (recommended "
                  << summary.recommended_position_pct << "%)" << std::endl;
        std::cout << "Leverage:         " << summary.leverage_used << "x" << std::endl;
        std::cout << "Net PnL:          " << summary.net_pnl_usd << " USD" << std::endl;
        std::cout << "ROI:              " << summary.roi_percent << "%" << std::endl;
        std::cout << "Fees / slippage:  " << summary.total_fees_usd << " / "
                  << summary.total_slippage_usd << " USD" << std::endl;
        std::cout << "Max drawdown:     " << summary.max_drawdown_pct << "% ("
                  << summary.max_drawdown_usd << " USD)" << std::endl;
        if (summary.win_rate_percent.has_value()) {
            std::cout << "Win rate:         " << *summary.win_rate_percent << "%" << std::endl;
        } else {
            std::cout << "Win rate:         n/a" << std::endl;
        }

        std::cout << "Results written to " << coordinator_config.output_directory << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
