#pragma once

#include <optional>
#include <string>
#include <utility>
#include "common/types.hpp"

namespace arbscan {

// One venue's executable quote for a pair
struct PriceQuote {
    std::string exchange;
    ExchangeType exchange_type{ExchangeType::CEX};
    std::string base;
    std::string quote;
    Price bid{0.0};
    Price ask{0.0};
    double taker_fee_pct{0.0};
    double maker_fee_pct{0.0};
    std::optional<double> gas_estimate_usd;   // DEX only
    std::optional<int> chain_id;              // DEX only
    WallClock timestamp{};

    double mid_price() const { return (bid + ask) / 2.0; }
    bool is_valid() const { return bid > 0 && ask > 0; }
};

/**
 * Price source for one venue.
 *
 * The aggregator treats every feed the same way: it never looks past this
 * interface. get_price returns std::nullopt when the venue has no quote for
 * the pair and may throw on transport errors.
 */
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    const std::string& name() const { return name_; }
    ExchangeType exchange_type() const { return exchange_type_; }

    virtual std::optional<PriceQuote> get_price(const std::string& base, const std::string& quote) = 0;
    virtual bool is_available() = 0;

protected:
    PriceFeed(std::string name, ExchangeType type)
        : name_(std::move(name)), exchange_type_(type) {}

private:
    std::string name_;
    ExchangeType exchange_type_;
};

} // namespace arbscan
