#include "copy_ngin/data/price_resolver.hpp"
#include <algorithm>
#include "copy_ngin/core/logger.hpp"
#include "copy_ngin/data/trade_classifier.hpp"

namespace copy_ngin {

PriceResolver::PriceResolver(PriceSeriesMap series) {
    for (auto& [asset, points] : series) {
        set_series(asset, std::move(points));
    }
}

void PriceResolver::set_series(const std::string& asset, std::vector<PricePoint> series) {
    series.erase(std::remove_if(series.begin(), series.end(),
                                [](const PricePoint& p) { return !(p.price > 0.0); }),
                 series.end());
    std::stable_sort(series.begin(), series.end(),
                     [](const PricePoint& a, const PricePoint& b) {
                         return a.timestamp < b.timestamp;
                     });

    const std::string key = normalize_symbol(asset);
    if (series.empty()) {
        series_.erase(key);
        return;
    }
    series_[key] = std::move(series);
}

std::optional<Price> PriceResolver::latest_at_or_before(const std::string& asset,
                                                        const Timestamp& ts) const {
    auto it = series_.find(normalize_symbol(asset));
    if (it == series_.end()) {
        return std::nullopt;
    }

    const auto& points = it->second;
    // First point strictly after ts; its predecessor is the answer
    auto upper = std::upper_bound(points.begin(), points.end(), ts,
                                  [](const Timestamp& value, const PricePoint& p) {
                                      return value < p.timestamp;
                                  });
    if (upper == points.begin()) {
        return std::nullopt;
    }
    return std::prev(upper)->price;
}

std::optional<Price> PriceResolver::resolve(const std::string& asset, const Timestamp& ts,
                                            const std::optional<Price>& fallback) const {
    auto price = latest_at_or_before(asset, ts);
    if (price.has_value()) {
        return price;
    }
    return fallback;
}

bool PriceResolver::has_series(const std::string& asset) const {
    return series_.count(normalize_symbol(asset)) > 0;
}

PriceResolver load_price_cache(PriceSeriesSource& source, const std::vector<std::string>& assets,
                               const Timestamp& from, const Timestamp& to,
                               std::chrono::minutes buffer) {
    PriceResolver resolver;
    const Timestamp window_from = from - buffer;
    const Timestamp window_to = to + buffer;

    for (const auto& asset : assets) {
        if (asset.empty()) {
            continue;
        }
        auto series = source.price_series(asset, window_from, window_to);
        if (series.is_error()) {
            WARN("Price series unavailable for " << asset << ", using trade-implied prices: "
                                                 << series.error()->to_string());
            continue;
        }
        const auto& points = series.value();
        DEBUG("Loaded " << points.size() << " price points for " << asset);
        resolver.set_series(asset, points);
    }

    return resolver;
}

}  // namespace copy_ngin
