#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "copy_ngin/core/error.hpp"
#include "copy_ngin/core/types.hpp"
#include "copy_ngin/data/exchange_interfaces.hpp"

namespace copy_ngin {

/**
 * Cached, time-ordered price series per asset.
 *
 * Owned by one simulation run (or shared read-only between runs). All
 * lookups are const; series are sorted once when inserted.
 */
class PriceResolver {
public:
    PriceResolver() = default;
    explicit PriceResolver(PriceSeriesMap series);

    /**
     * Replace the series of an asset. Non-positive prices are dropped and
     * the remainder is sorted by timestamp.
     */
    void set_series(const std::string& asset, std::vector<PricePoint> series);

    /**
     * Latest price at or before ts, if the asset has a series with such a point
     */
    std::optional<Price> latest_at_or_before(const std::string& asset,
                                             const Timestamp& ts) const;

    /**
     * Latest series price at or before ts, else the fallback
     */
    std::optional<Price> resolve(const std::string& asset, const Timestamp& ts,
                                 const std::optional<Price>& fallback) const;

    bool has_series(const std::string& asset) const;

    const PriceSeriesMap& series() const {
        return series_;
    }

    size_t asset_count() const {
        return series_.size();
    }

private:
    PriceSeriesMap series_;
};

/**
 * Best-effort preload of price series for a set of assets.
 *
 * The window is widened by buffer on both sides. An asset whose fetch fails
 * is logged and left without a series so callers fall back to
 * trade-implied prices.
 */
PriceResolver load_price_cache(PriceSeriesSource& source, const std::vector<std::string>& assets,
                               const Timestamp& from, const Timestamp& to,
                               std::chrono::minutes buffer = std::chrono::minutes(5));

}  // namespace copy_ngin
