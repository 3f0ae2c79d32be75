// include/copy_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace copy_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for order and position sizes
 * Signed where it describes a position: positive = long, negative = short
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

/**
 * @brief Closed set of directions a tracked account's activity can take
 */
enum class TradeDirection {
    BUY,
    SELL,
    DEPOSIT,
    WITHDRAW,
    LONG,
    SHORT,
    CLOSE_LONG,
    CLOSE_SHORT
};

/**
 * @brief Historical trade event of a tracked account
 * Produced by ingestion, read-only to the engine.
 */
struct TradeEvent {
    Timestamp timestamp;
    std::string account;
    std::string asset;
    TradeDirection direction{TradeDirection::BUY};
    Quantity base_quantity{0.0};  // May be zero when the source did not report it
    double value_usd{0.0};        // USD notional, sign is ignored
    std::optional<double> realized_pnl;

    TradeEvent() = default;
    TradeEvent(Timestamp ts, std::string acct, std::string sym, TradeDirection dir, Quantity qty,
               double value)
        : timestamp(ts),
          account(std::move(acct)),
          asset(std::move(sym)),
          direction(dir),
          base_quantity(qty),
          value_usd(value) {}
};

/**
 * @brief One point of a cached price series
 */
struct PricePoint {
    Timestamp timestamp;
    Price price{0.0};
};

/**
 * @brief Normalized provider fill of a source account
 */
struct Fill {
    Timestamp time;
    std::string asset;
    TradeDirection direction{TradeDirection::BUY};
    Quantity size{0.0};  // Absolute base size
    Price price{0.0};
    std::optional<double> realized_pnl;
    std::string provider_id;  // Hash or trade id assigned by the provider
};

/**
 * @brief Open position reported by the exchange for an account
 */
struct OpenPosition {
    std::string asset;
    Quantity signed_size{0.0};
    Price entry_price{0.0};
    Price mark_price{0.0};
    std::optional<double> unrealized_pnl;
};

/**
 * @brief Account snapshot reported by the exchange
 */
struct AccountState {
    double account_value_usd{0.0};
    std::vector<OpenPosition> open_positions;
};

/**
 * @brief Tradable granularity of an asset
 */
struct AssetSizing {
    double size_increment{0.0001};
    double price_increment{0.01};
};

/**
 * @brief Immediate-or-cancel limit order sent by a live copy session
 */
struct CopyOrder {
    std::string asset;
    Side side{Side::NONE};
    Quantity size{0.0};
    Price limit_price{0.0};
    bool reduce_only{false};
    std::string session_tag;  // Identifies the session that produced the order
};

/**
 * @brief Map of asset symbol to its time-ordered price series
 */
using PriceSeriesMap = std::unordered_map<std::string, std::vector<PricePoint>>;

}  // namespace copy_ngin
