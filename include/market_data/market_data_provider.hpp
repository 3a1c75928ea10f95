#pragma once

#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace arbscan {

/**
 * Source of tickers and product listings for one venue.
 *
 * Implementations must be safe to call from several threads at once: the
 * triangular detector and the aggregator fan requests out concurrently.
 * A missing ticker is std::nullopt; transport failures throw.
 */
class MarketDataProvider {
public:
    virtual ~MarketDataProvider() = default;

    virtual std::optional<Ticker> get_ticker(const std::string& product_id) = 0;

    // Mid price, falling back to the last trade. 0 when unknown.
    virtual double get_price(const std::string& product_id) = 0;

    virtual std::vector<Product> get_products() = 0;
};

} // namespace arbscan
