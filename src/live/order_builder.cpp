// src/live/order_builder.cpp
#include "copy_ngin/live/order_builder.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {

OrderBuilder::OrderBuilder(double slippage_pct) : slippage_pct_(slippage_pct) {
    if (!std::isfinite(slippage_pct) || slippage_pct < 0.0 || slippage_pct >= 100.0) {
        throw std::invalid_argument("slippage_pct must be in [0, 100)");
    }
}

double OrderBuilder::round_significant(double value, int digits) {
    if (value == 0.0 || !std::isfinite(value) || digits <= 0) {
        return value;
    }
    const int magnitude = static_cast<int>(std::floor(std::log10(std::abs(value)))) + 1;
    const double scale = std::pow(10.0, digits - magnitude);
    return std::round(value * scale) / scale;
}

double OrderBuilder::round_to_increment(double value, double increment) {
    if (!(increment > 0.0)) {
        return value;
    }
    const double steps = std::round(value / increment);
    // Re-round to the increment's decimals to strip binary noise (0.1 * 3)
    const int decimals =
        std::max(0, static_cast<int>(std::ceil(-std::log10(increment) - 1e-9)));
    const double factor = std::pow(10.0, decimals);
    return std::round(steps * increment * factor) / factor;
}

Price OrderBuilder::slipped_price(Side side, Price reference_price) const {
    const double nudge = slippage_pct_ / 100.0;
    if (side == Side::BUY) {
        return reference_price * (1.0 + nudge);
    }
    return reference_price * (1.0 - nudge);
}

Result<CopyOrder> OrderBuilder::build(const std::string& asset, Side side, Quantity size,
                                      Price reference_price, const AssetSizing& sizing,
                                      bool reduce_only, const std::string& session_tag) const {
    if (side == Side::NONE) {
        return make_error<CopyOrder>(ErrorCode::INVALID_ORDER, "Order side is undefined",
                                     "OrderBuilder");
    }
    if (!(reference_price > 0.0)) {
        return make_error<CopyOrder>(ErrorCode::INVALID_ORDER,
                                     "Reference price must be positive for " + asset,
                                     "OrderBuilder");
    }

    Price limit = round_significant(slipped_price(side, reference_price), PRICE_SIGNIFICANT_DIGITS);
    limit = round_to_increment(limit, sizing.price_increment);

    const Quantity rounded_size = round_to_increment(std::abs(size), sizing.size_increment);
    if (!(rounded_size > 0.0)) {
        return make_error<CopyOrder>(ErrorCode::INVALID_ORDER,
                                     "Size " + std::to_string(size) + " rounds to zero for " +
                                         asset,
                                     "OrderBuilder");
    }
    if (!(limit > 0.0)) {
        return make_error<CopyOrder>(ErrorCode::INVALID_ORDER,
                                     "Limit price rounds to zero for " + asset, "OrderBuilder");
    }

    CopyOrder order;
    order.asset = normalize_symbol(asset);
    order.side = side;
    order.size = rounded_size;
    order.limit_price = limit;
    order.reduce_only = reduce_only;
    order.session_tag = session_tag;
    return order;
}

}  // namespace copy_ngin
