// include/copy_ngin/data/csv_trade_loader.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"
#include "copy_ngin/data/exchange_interfaces.hpp"

namespace copy_ngin {

/**
 * @brief Load trade events from a CSV export
 *
 * Columns: timestamp_ms,account,asset,direction,base_quantity,value_usd[,realized_pnl]
 * A header row is skipped when its first field is not numeric. Events are
 * returned in file order.
 *
 * @param filepath Path to the CSV file
 * @return Events, FILE_NOT_FOUND if the file cannot be opened, INVALID_DATA
 *         (with the line number) for a malformed row
 */
Result<std::vector<TradeEvent>> load_trades_csv(const std::string& filepath);

/**
 * @brief Load price series from a CSV export
 *
 * Columns: asset,timestamp_ms,price
 */
Result<PriceSeriesMap> load_prices_csv(const std::string& filepath);

/**
 * @brief In-memory trade history keyed by account
 *
 * Accounts are matched case-insensitively (see normalize_account).
 * Stands in for the persisted trade store when the backtest runs from files.
 */
class CsvTradeHistory : public TradeHistorySource {
public:
    CsvTradeHistory() = default;
    explicit CsvTradeHistory(const std::vector<TradeEvent>& events);

    void add(const TradeEvent& event);

    Result<bool> account_exists(const std::string& account) override;
    Result<std::vector<TradeEvent>> load_trades(const std::string& account) override;

    std::vector<std::string> accounts() const;

private:
    std::unordered_map<std::string, std::vector<TradeEvent>> by_account_;
};

}  // namespace copy_ngin
