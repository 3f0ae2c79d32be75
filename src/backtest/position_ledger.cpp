// src/backtest/position_ledger.cpp
#include "copy_ngin/backtest/position_ledger.hpp"
#include <algorithm>
#include <cmath>
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {
namespace backtest {

Result<void> PositionLedger::apply_entry(LedgerPosition& position, TradeDirection direction,
                                         Quantity quantity, Price price,
                                         double margin_required) {
    if (!is_entry(direction)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Not an entry direction: " + direction_to_string(direction),
                                "PositionLedger");
    }
    if (!(price > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Entry price must be positive", "PositionLedger");
    }

    const Quantity signed_qty =
        is_long_family(direction) ? std::abs(quantity) : -std::abs(quantity);
    if (signed_qty == 0.0) {
        return Result<void>();
    }

    const Quantity new_qty = position.quantity + signed_qty;
    if (std::abs(new_qty) < QUANTITY_EPSILON) {
        // Round trip within the same step
        position.reset();
        return Result<void>();
    }

    const double existing_cost = position.average_price * position.quantity;
    const double added_cost = price * signed_qty;
    position.average_price = (existing_cost + added_cost) / new_qty;
    position.quantity = new_qty;
    position.margin += margin_required;
    return Result<void>();
}

CloseOutcome PositionLedger::apply_close(LedgerPosition& position, Quantity quantity,
                                         Price price) {
    CloseOutcome outcome;
    if (position.is_flat()) {
        return outcome;
    }

    const Quantity open_qty = std::abs(position.quantity);
    const Quantity close_qty = std::min(std::abs(quantity), open_qty);
    if (close_qty <= 0.0) {
        return outcome;
    }

    const bool is_long = position.quantity > 0.0;
    const double avg = position.average_price;

    outcome.closed = true;
    outcome.closed_quantity = close_qty;
    outcome.realized_pnl = is_long ? (price - avg) * close_qty : (avg - price) * close_qty;
    outcome.released_margin = position.margin * (close_qty / open_qty);

    position.quantity -= is_long ? close_qty : -close_qty;
    if (std::abs(position.quantity) < QUANTITY_EPSILON) {
        outcome.released_margin = position.margin;
        position.reset();
    } else {
        position.margin -= outcome.released_margin;
    }
    return outcome;
}

double PositionLedger::unrealized_pnl(const LedgerPosition& position, Price mark) {
    if (position.is_flat()) {
        return 0.0;
    }
    if (position.quantity > 0.0) {
        return (mark - position.average_price) * position.quantity;
    }
    return (position.average_price - mark) * std::abs(position.quantity);
}

ExposureSnapshot PositionLedger::unrealized_and_margin(const LedgerPositions& positions,
                                                       const Timestamp& as_of,
                                                       const PriceResolver& prices) {
    ExposureSnapshot snapshot;
    for (const auto& [asset, position] : positions) {
        snapshot.margin += position.margin;
        if (position.is_flat()) {
            continue;
        }
        auto mark = prices.latest_at_or_before(asset, as_of);
        if (!mark.has_value()) {
            continue;
        }
        snapshot.unrealized_pnl += unrealized_pnl(position, *mark);
    }
    return snapshot;
}

}  // namespace backtest
}  // namespace copy_ngin
