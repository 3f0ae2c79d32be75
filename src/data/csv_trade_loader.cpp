// src/data/csv_trade_loader.cpp
#include "copy_ngin/data/csv_trade_loader.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include "copy_ngin/core/logger.hpp"
#include "copy_ngin/core/time_utils.hpp"
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {

namespace {

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        // Strip surrounding whitespace and a trailing CR from Windows exports
        auto begin = field.find_first_not_of(" \t\r");
        auto end = field.find_last_not_of(" \t\r");
        fields.push_back(begin == std::string::npos ? std::string()
                                                    : field.substr(begin, end - begin + 1));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

bool looks_numeric(const std::string& field) {
    if (field.empty()) {
        return false;
    }
    char c = field.front();
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.';
}

Result<double> parse_double(const std::string& field, const std::string& column, size_t line_no) {
    try {
        size_t consumed = 0;
        double value = std::stod(field, &consumed);
        if (consumed != field.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return value;
    } catch (const std::exception&) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Invalid " + column + " '" + field + "' on line " +
                                      std::to_string(line_no),
                                  "CsvTradeLoader");
    }
}

Result<int64_t> parse_millis(const std::string& field, size_t line_no) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(field, &consumed);
        if (consumed != field.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<int64_t>(value);
    } catch (const std::exception&) {
        return make_error<int64_t>(ErrorCode::INVALID_DATA,
                                   "Invalid timestamp_ms '" + field + "' on line " +
                                       std::to_string(line_no),
                                   "CsvTradeLoader");
    }
}

}  // namespace

Result<std::vector<TradeEvent>> load_trades_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<std::vector<TradeEvent>>(
            ErrorCode::FILE_NOT_FOUND, "Cannot open trades file: " + filepath, "CsvTradeLoader");
    }

    std::vector<TradeEvent> events;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line == "\r") {
            continue;
        }
        auto fields = split_csv_line(line);
        if (line_no == 1 && !looks_numeric(fields.front())) {
            continue;  // header
        }
        if (fields.size() < 6) {
            return make_error<std::vector<TradeEvent>>(
                ErrorCode::INVALID_DATA,
                "Expected at least 6 columns on line " + std::to_string(line_no) + ", got " +
                    std::to_string(fields.size()),
                "CsvTradeLoader");
        }

        auto ts = parse_millis(fields[0], line_no);
        if (ts.is_error()) {
            return make_error<std::vector<TradeEvent>>(ts.error()->code(), ts.error()->what(),
                                                       "CsvTradeLoader");
        }
        auto direction = direction_from_string(fields[3]);
        if (direction.is_error()) {
            return make_error<std::vector<TradeEvent>>(
                ErrorCode::INVALID_DATA,
                std::string(direction.error()->what()) + " on line " + std::to_string(line_no),
                "CsvTradeLoader");
        }
        auto qty = parse_double(fields[4].empty() ? "0" : fields[4], "base_quantity", line_no);
        if (qty.is_error()) {
            return make_error<std::vector<TradeEvent>>(qty.error()->code(), qty.error()->what(),
                                                       "CsvTradeLoader");
        }
        auto value = parse_double(fields[5], "value_usd", line_no);
        if (value.is_error()) {
            return make_error<std::vector<TradeEvent>>(value.error()->code(),
                                                       value.error()->what(), "CsvTradeLoader");
        }

        TradeEvent event(core::from_epoch_ms(ts.value()), fields[1], normalize_symbol(fields[2]),
                         direction.value(), qty.value(), value.value());
        if (fields.size() > 6 && !fields[6].empty()) {
            auto pnl = parse_double(fields[6], "realized_pnl", line_no);
            if (pnl.is_error()) {
                return make_error<std::vector<TradeEvent>>(pnl.error()->code(),
                                                           pnl.error()->what(), "CsvTradeLoader");
            }
            event.realized_pnl = pnl.value();
        }
        events.push_back(std::move(event));
    }

    INFO("Loaded " << events.size() << " trade events from " << filepath);
    return events;
}

Result<PriceSeriesMap> load_prices_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<PriceSeriesMap>(ErrorCode::FILE_NOT_FOUND,
                                          "Cannot open prices file: " + filepath,
                                          "CsvTradeLoader");
    }

    PriceSeriesMap series;
    std::string line;
    size_t line_no = 0;
    size_t points = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line == "\r") {
            continue;
        }
        auto fields = split_csv_line(line);
        if (fields.size() < 3) {
            return make_error<PriceSeriesMap>(
                ErrorCode::INVALID_DATA,
                "Expected 3 columns on line " + std::to_string(line_no), "CsvTradeLoader");
        }
        if (line_no == 1 && !looks_numeric(fields[1])) {
            continue;  // header
        }

        auto ts = parse_millis(fields[1], line_no);
        if (ts.is_error()) {
            return make_error<PriceSeriesMap>(ts.error()->code(), ts.error()->what(),
                                              "CsvTradeLoader");
        }
        auto price = parse_double(fields[2], "price", line_no);
        if (price.is_error()) {
            return make_error<PriceSeriesMap>(price.error()->code(), price.error()->what(),
                                              "CsvTradeLoader");
        }

        series[normalize_symbol(fields[0])].push_back(
            PricePoint{core::from_epoch_ms(ts.value()), price.value()});
        ++points;
    }

    INFO("Loaded " << points << " price points for " << series.size() << " assets from "
                   << filepath);
    return series;
}

CsvTradeHistory::CsvTradeHistory(const std::vector<TradeEvent>& events) {
    for (const auto& event : events) {
        add(event);
    }
}

void CsvTradeHistory::add(const TradeEvent& event) {
    by_account_[normalize_account(event.account)].push_back(event);
}

Result<bool> CsvTradeHistory::account_exists(const std::string& account) {
    return by_account_.count(normalize_account(account)) > 0;
}

Result<std::vector<TradeEvent>> CsvTradeHistory::load_trades(const std::string& account) {
    auto it = by_account_.find(normalize_account(account));
    if (it == by_account_.end()) {
        return std::vector<TradeEvent>{};
    }
    std::vector<TradeEvent> events = it->second;
    std::stable_sort(events.begin(), events.end(), [](const TradeEvent& a, const TradeEvent& b) {
        return a.timestamp < b.timestamp;
    });
    return events;
}

std::vector<std::string> CsvTradeHistory::accounts() const {
    std::vector<std::string> names;
    names.reserve(by_account_.size());
    for (const auto& [account, _] : by_account_) {
        names.push_back(account);
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace copy_ngin
