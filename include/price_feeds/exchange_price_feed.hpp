#pragma once

#include <memory>
#include "market_data/market_data_provider.hpp"
#include "price_feeds/price_feed.hpp"

namespace arbscan {

/**
 * Centralized exchange feed: best bid/ask from the venue's ticker plus the
 * account's fee tier.
 */
class ExchangePriceFeed : public PriceFeed {
public:
    ExchangePriceFeed(std::string name,
                      std::shared_ptr<MarketDataProvider> provider,
                      double taker_fee_pct,
                      double maker_fee_pct);

    std::optional<PriceQuote> get_price(const std::string& base, const std::string& quote) override;
    bool is_available() override;

private:
    std::shared_ptr<MarketDataProvider> provider_;
    double taker_fee_pct_;
    double maker_fee_pct_;
};

} // namespace arbscan
