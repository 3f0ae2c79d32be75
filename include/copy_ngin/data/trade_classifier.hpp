// include/copy_ngin/data/trade_classifier.hpp
#pragma once

#include <string>
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {

/**
 * @brief Canonical lower-case name ("close_long", "buy", ...)
 */
std::string direction_to_string(TradeDirection direction);

/**
 * @brief Parse a canonical direction name
 *
 * Case-insensitive; accepts '-' or ' ' in place of '_' ("close-long").
 * @return INVALID_DATA error for anything outside the closed set
 */
Result<TradeDirection> direction_from_string(const std::string& name);

/**
 * @brief Classify a provider fill from its hints
 *
 * The free-text direction hint wins when it names a side ("Open Long",
 * "Close Short"); otherwise the side code decides, with "A", "S", "ASK" and
 * "SELL" meaning short and everything else long.
 */
TradeDirection classify_fill(const std::string& side_hint, const std::string& dir_hint);

// buy, long, short
bool is_entry(TradeDirection direction);

// sell, close_long, close_short, withdraw
bool is_close(TradeDirection direction);

// buy, long
bool is_long_family(TradeDirection direction);

/**
 * @brief Exchange side that replicates the direction
 */
Side order_side(TradeDirection direction);

std::string side_to_string(Side side);

/**
 * @brief Upper-case an asset symbol so lookups are case-insensitive
 */
std::string normalize_symbol(const std::string& symbol);

/**
 * @brief Lower-case and trim a wallet address
 *
 * Hex addresses compare case-insensitively, so stored and requested accounts
 * both go through this before lookup.
 */
std::string normalize_account(const std::string& account);

}  // namespace copy_ngin
