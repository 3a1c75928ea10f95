#include "price_feeds/dex_price_feed.hpp"
#include <spdlog/spdlog.h>

namespace arbscan {

namespace {

// Uniswap V3 fee tiers -> percent
const std::map<int, double> FEE_TIERS = {
    {100,   0.01},   // stablecoins
    {500,   0.05},   // stable pairs
    {3000,  0.30},   // most pairs
    {10000, 1.00},   // exotic pairs
};

// Rough swap gas cost in USD by chain id
const std::map<int, double> GAS_ESTIMATES_USD = {
    {1,     15.00},  // Ethereum mainnet
    {56,    0.30},   // BSC
    {137,   0.05},   // Polygon
    {42161, 0.50},   // Arbitrum
};

} // namespace

DexPriceFeed::DexPriceFeed(std::shared_ptr<DexQuoter> quoter, int chain_id, std::string dex_name)
    : PriceFeed(std::move(dex_name), ExchangeType::DEX)
    , quoter_(std::move(quoter))
    , chain_id_(chain_id)
{
}

double DexPriceFeed::fee_pct_for_tier(int fee_tier) {
    auto it = FEE_TIERS.find(fee_tier);
    return it != FEE_TIERS.end() ? it->second : DEFAULT_FEE_PCT;
}

double DexPriceFeed::gas_estimate_for_chain(int chain_id) {
    auto it = GAS_ESTIMATES_USD.find(chain_id);
    return it != GAS_ESTIMATES_USD.end() ? it->second : DEFAULT_GAS_USD;
}

std::optional<PriceQuote> DexPriceFeed::get_price(const std::string& base, const std::string& quote) {
    // Buying base: spend quote
    auto ask_quote = quoter_->get_quote(quote, base, ASK_PROBE_AMOUNT);
    // Selling base: receive quote
    auto bid_quote = quoter_->get_quote(base, quote, BID_PROBE_AMOUNT);

    if (!ask_quote || !bid_quote) {
        spdlog::warn("Could not get DEX quote for {}-{} on {}", base, quote, name());
        return std::nullopt;
    }

    PriceQuote q;
    q.exchange = name();
    q.exchange_type = ExchangeType::DEX;
    q.base = base;
    q.quote = quote;
    q.ask = ask_quote->amount_out > 0 ? ASK_PROBE_AMOUNT / ask_quote->amount_out : 0.0;
    q.bid = bid_quote->amount_out;
    q.taker_fee_pct = fee_pct_for_tier(ask_quote->fee_tier);
    q.maker_fee_pct = q.taker_fee_pct;   // no maker/taker split on AMMs
    q.gas_estimate_usd = gas_estimate_for_chain(chain_id_);
    q.chain_id = chain_id_;
    q.timestamp = wall_now();
    return q;
}

bool DexPriceFeed::is_available() {
    try {
        return quoter_->is_connected();
    } catch (const std::exception& e) {
        spdlog::warn("{} unavailable: {}", name(), e.what());
        return false;
    }
}

} // namespace arbscan
