// include/copy_ngin/live/order_builder.hpp
#pragma once

#include <string>
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {

/**
 * @brief Builds immediate-or-cancel limit orders that cross the book
 *
 * The limit price is moved against the taker by slippage_pct (up for buys,
 * down for sells), rounded to 5 significant figures and then to the asset's
 * price increment. Size is rounded to the asset's size increment.
 */
class OrderBuilder {
public:
    explicit OrderBuilder(double slippage_pct);

    /**
     * @brief Build an order copying a fill
     * @param asset Asset symbol
     * @param side BUY or SELL
     * @param size Absolute base size before rounding
     * @param reference_price Price of the copied fill
     * @param sizing Granularity of the asset
     * @param reduce_only Whether the order may only shrink a position
     * @param session_tag Session the order belongs to
     * @return INVALID_ORDER for side NONE, a non-positive price or a size
     *         that rounds to zero
     */
    Result<CopyOrder> build(const std::string& asset, Side side, Quantity size,
                            Price reference_price, const AssetSizing& sizing, bool reduce_only,
                            const std::string& session_tag) const;

    Price slipped_price(Side side, Price reference_price) const;

    double slippage_pct() const {
        return slippage_pct_;
    }

    static double round_significant(double value, int digits);
    static double round_to_increment(double value, double increment);

    static constexpr int PRICE_SIGNIFICANT_DIGITS = 5;

private:
    double slippage_pct_;
};

}  // namespace copy_ngin
