#include "price_feeds/exchange_price_feed.hpp"
#include <spdlog/spdlog.h>

namespace arbscan {

ExchangePriceFeed::ExchangePriceFeed(std::string name,
                                     std::shared_ptr<MarketDataProvider> provider,
                                     double taker_fee_pct,
                                     double maker_fee_pct)
    : PriceFeed(std::move(name), ExchangeType::CEX)
    , provider_(std::move(provider))
    , taker_fee_pct_(taker_fee_pct)
    , maker_fee_pct_(maker_fee_pct)
{
}

std::optional<PriceQuote> ExchangePriceFeed::get_price(const std::string& base, const std::string& quote) {
    auto ticker = provider_->get_ticker(make_product_id(base, quote));
    if (!ticker || ticker->bid <= 0 || ticker->ask <= 0) {
        spdlog::debug("{}: no two-sided quote for {}-{}", name(), base, quote);
        return std::nullopt;
    }

    PriceQuote q;
    q.exchange = name();
    q.exchange_type = ExchangeType::CEX;
    q.base = base;
    q.quote = quote;
    q.bid = ticker->bid;
    q.ask = ticker->ask;
    q.taker_fee_pct = taker_fee_pct_;
    q.maker_fee_pct = maker_fee_pct_;
    q.timestamp = ticker->timestamp;
    return q;
}

bool ExchangePriceFeed::is_available() {
    try {
        return !provider_->get_products().empty();
    } catch (const std::exception& e) {
        spdlog::warn("{} unavailable: {}", name(), e.what());
        return false;
    }
}

} // namespace arbscan
