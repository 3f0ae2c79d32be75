// src/data/trade_classifier.cpp
#include "copy_ngin/data/trade_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace copy_ngin {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

}  // namespace

std::string direction_to_string(TradeDirection direction) {
    switch (direction) {
        case TradeDirection::BUY:
            return "buy";
        case TradeDirection::SELL:
            return "sell";
        case TradeDirection::DEPOSIT:
            return "deposit";
        case TradeDirection::WITHDRAW:
            return "withdraw";
        case TradeDirection::LONG:
            return "long";
        case TradeDirection::SHORT:
            return "short";
        case TradeDirection::CLOSE_LONG:
            return "close_long";
        case TradeDirection::CLOSE_SHORT:
            return "close_short";
    }
    return "unknown";
}

Result<TradeDirection> direction_from_string(const std::string& name) {
    std::string key = to_lower(trim(name));
    std::replace(key.begin(), key.end(), '-', '_');
    std::replace(key.begin(), key.end(), ' ', '_');

    if (key == "buy")
        return TradeDirection::BUY;
    if (key == "sell")
        return TradeDirection::SELL;
    if (key == "deposit")
        return TradeDirection::DEPOSIT;
    if (key == "withdraw")
        return TradeDirection::WITHDRAW;
    if (key == "long")
        return TradeDirection::LONG;
    if (key == "short")
        return TradeDirection::SHORT;
    if (key == "close_long")
        return TradeDirection::CLOSE_LONG;
    if (key == "close_short")
        return TradeDirection::CLOSE_SHORT;

    return make_error<TradeDirection>(ErrorCode::INVALID_DATA,
                                      "Unknown trade direction: '" + name + "'",
                                      "TradeClassifier");
}

TradeDirection classify_fill(const std::string& side_hint, const std::string& dir_hint) {
    const std::string dir = to_lower(dir_hint);
    const bool closing = dir.find("close") != std::string::npos;

    if (closing && dir.find("short") != std::string::npos) {
        return TradeDirection::CLOSE_SHORT;
    }
    if (closing && dir.find("long") != std::string::npos) {
        return TradeDirection::CLOSE_LONG;
    }
    if (dir.find("short") != std::string::npos) {
        return TradeDirection::SHORT;
    }
    if (dir.find("long") != std::string::npos) {
        return TradeDirection::LONG;
    }

    const std::string side = to_lower(trim(side_hint));
    if (side == "a" || side == "s" || side == "ask" || side == "sell") {
        return TradeDirection::SHORT;
    }
    return TradeDirection::LONG;
}

bool is_entry(TradeDirection direction) {
    return direction == TradeDirection::BUY || direction == TradeDirection::LONG ||
           direction == TradeDirection::SHORT;
}

bool is_close(TradeDirection direction) {
    return direction == TradeDirection::SELL || direction == TradeDirection::CLOSE_LONG ||
           direction == TradeDirection::CLOSE_SHORT || direction == TradeDirection::WITHDRAW;
}

bool is_long_family(TradeDirection direction) {
    return direction == TradeDirection::BUY || direction == TradeDirection::LONG;
}

Side order_side(TradeDirection direction) {
    switch (direction) {
        case TradeDirection::BUY:
        case TradeDirection::LONG:
        case TradeDirection::CLOSE_SHORT:
            return Side::BUY;
        case TradeDirection::SELL:
        case TradeDirection::SHORT:
        case TradeDirection::CLOSE_LONG:
        case TradeDirection::WITHDRAW:
            return Side::SELL;
        case TradeDirection::DEPOSIT:
            return Side::NONE;
    }
    return Side::NONE;
}

std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

std::string normalize_symbol(const std::string& symbol) {
    std::string out = trim(symbol);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string normalize_account(const std::string& account) {
    return to_lower(trim(account));
}

}  // namespace copy_ngin
