// include/copy_ngin/backtest/position_ledger.hpp
#pragma once

#include <string>
#include <unordered_map>
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"
#include "copy_ngin/data/price_resolver.hpp"

namespace copy_ngin {
namespace backtest {

/**
 * @brief One account's exposure in one asset
 *
 * quantity is signed (positive = long). A flat position always has zero
 * average price and zero margin.
 */
struct LedgerPosition {
    Quantity quantity{0.0};
    Price average_price{0.0};
    double margin{0.0};

    bool is_flat() const {
        return quantity == 0.0;
    }

    void reset() {
        quantity = 0.0;
        average_price = 0.0;
        margin = 0.0;
    }
};

using LedgerPositions = std::unordered_map<std::string, LedgerPosition>;

/**
 * @brief Effect of a close on a position
 */
struct CloseOutcome {
    bool closed{false};  // false when the position was flat
    Quantity closed_quantity{0.0};
    double realized_pnl{0.0};
    double released_margin{0.0};
};

struct ExposureSnapshot {
    double unrealized_pnl{0.0};
    double margin{0.0};
};

/**
 * @brief Average-cost position accounting with margin reservation
 *
 * Stateless; every operation works on a position owned by the caller.
 */
class PositionLedger {
public:
    /**
     * @brief Add an entry to a position
     *
     * buy/long add quantity, short subtracts it. The average price becomes
     * the weighted average of existing and added cost; a fill that brings
     * the position back to zero resets it.
     *
     * @param position Position to update
     * @param direction buy, long or short
     * @param quantity Absolute base quantity
     * @param price Execution price
     * @param margin_required Margin reserved for the added exposure
     * @return INVALID_ARGUMENT for a non-entry direction or non-positive price
     */
    static Result<void> apply_entry(LedgerPosition& position, TradeDirection direction,
                                    Quantity quantity, Price price, double margin_required);

    /**
     * @brief Close up to quantity of a position at price
     *
     * The close is clipped to the open size. Margin is released in
     * proportion to the closed fraction.
     */
    static CloseOutcome apply_close(LedgerPosition& position, Quantity quantity, Price price);

    /**
     * @brief Sum unrealized PnL and reserved margin of all positions at as_of
     *
     * Marks come from the resolver; a position without a resolvable mark
     * contributes its margin and no unrealized PnL.
     */
    static ExposureSnapshot unrealized_and_margin(const LedgerPositions& positions,
                                                  const Timestamp& as_of,
                                                  const PriceResolver& prices);

    /**
     * @brief Unrealized PnL of one position at a mark price
     */
    static double unrealized_pnl(const LedgerPosition& position, Price mark);

    // Residual quantity below this is treated as flat
    static constexpr double QUANTITY_EPSILON = 1e-12;
};

}  // namespace backtest
}  // namespace copy_ngin
