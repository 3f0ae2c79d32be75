// include/copy_ngin/data/exchange_interfaces.hpp

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {

/**
 * @brief Read-side capability of the derivatives venue
 *
 * Implementations normalize provider payloads into Fill / AccountState
 * before returning; the engine never sees raw provider fields.
 */
class ExchangeInfoClient {
public:
    virtual ~ExchangeInfoClient() = default;

    /**
     * @brief Fetch fills of an account, oldest first
     * @param account Source account address
     * @param since Only fills at or after this time, all history when empty
     * @return Fills; may repeat fills returned by earlier calls
     */
    virtual Result<std::vector<Fill>> fetch_fills(const std::string& account,
                                                  const std::optional<Timestamp>& since) = 0;

    /**
     * @brief Fetch account value and open positions
     */
    virtual Result<AccountState> fetch_account_state(const std::string& account) = 0;

    /**
     * @brief Resolve the tradable size and price granularity of an asset
     */
    virtual Result<AssetSizing> resolve_asset_sizing(const std::string& asset) = 0;
};

/**
 * @brief Side-effecting capability of the venue for the operator's own account
 */
class TradingClient {
public:
    virtual ~TradingClient() = default;

    virtual Result<void> submit_order(const CopyOrder& order) = 0;

    virtual Result<void> update_leverage(const std::string& asset, double leverage,
                                         bool is_cross) = 0;
};

/**
 * @brief Historical price series provider
 */
class PriceSeriesSource {
public:
    virtual ~PriceSeriesSource() = default;

    /**
     * @brief Fetch a price series, ordered by timestamp
     *
     * The series may be incomplete; gaps are covered by trade-implied prices.
     */
    virtual Result<std::vector<PricePoint>> price_series(const std::string& asset,
                                                         const Timestamp& from,
                                                         const Timestamp& to) = 0;
};

/**
 * @brief Persisted trade history of tracked accounts
 */
class TradeHistorySource {
public:
    virtual ~TradeHistorySource() = default;

    virtual Result<bool> account_exists(const std::string& account) = 0;

    /**
     * @brief Load every trade event of an account ordered by timestamp,
     *        ties kept in insertion order
     */
    virtual Result<std::vector<TradeEvent>> load_trades(const std::string& account) = 0;
};

}  // namespace copy_ngin
