#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include "price_feeds/price_feed.hpp"

namespace arbscan {

// Result of simulating a swap against on-chain liquidity
struct SwapQuote {
    double amount_out{0.0};
    int fee_tier{3000};          // Pool fee in hundredths of a bip (Uniswap V3)
};

/**
 * Swap quoter for one chain (e.g. a Uniswap V3 Quoter contract client).
 * Returns std::nullopt when no route exists.
 */
class DexQuoter {
public:
    virtual ~DexQuoter() = default;

    virtual std::optional<SwapQuote> get_quote(const std::string& token_in,
                                               const std::string& token_out,
                                               double amount_in) = 0;
    virtual bool is_connected() = 0;
};

/**
 * Decentralized exchange feed.
 *
 * ask: quote 1000 units of the quote token into base, ask = 1000 / amount_out.
 * bid: quote 1 unit of base into the quote token, bid = amount_out.
 * Fees come from the pool fee tier, gas from a per-chain USD estimate.
 */
class DexPriceFeed : public PriceFeed {
public:
    static constexpr double ASK_PROBE_AMOUNT = 1000.0;
    static constexpr double BID_PROBE_AMOUNT = 1.0;
    static constexpr double DEFAULT_FEE_PCT = 0.30;
    static constexpr double DEFAULT_GAS_USD = 10.0;

    DexPriceFeed(std::shared_ptr<DexQuoter> quoter, int chain_id = 1,
                 std::string dex_name = "uniswap_v3");

    std::optional<PriceQuote> get_price(const std::string& base, const std::string& quote) override;
    bool is_available() override;

    int chain_id() const { return chain_id_; }

    static double fee_pct_for_tier(int fee_tier);
    static double gas_estimate_for_chain(int chain_id);

private:
    std::shared_ptr<DexQuoter> quoter_;
    int chain_id_;
};

} // namespace arbscan
