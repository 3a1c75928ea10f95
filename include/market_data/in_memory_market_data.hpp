#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "market_data/market_data_provider.hpp"

namespace arbscan {

/**
 * Provider backed by tickers held in memory.
 *
 * Used for offline scans from a JSON snapshot and as the test double for
 * every component that consumes market data. Snapshot format:
 *
 *   {"products": [{"product_id": "ETH-BTC", "trading_disabled": false}, ...],
 *    "tickers":  {"ETH-BTC": {"bid": 0.05, "ask": 0.0501, "last": 0.05}, ...}}
 *
 * Products may be omitted, in which case every ticker is listed as an
 * enabled product.
 */
class InMemoryMarketData : public MarketDataProvider {
public:
    InMemoryMarketData() = default;

    static std::shared_ptr<InMemoryMarketData> from_file(const std::string& path);

    void set_ticker(const std::string& product_id, Price bid, Price ask, Price last = 0.0);
    void remove_ticker(const std::string& product_id);

    void add_product(const std::string& product_id, bool enabled = true);
    void set_products(std::vector<Product> products);

    // Makes get_ticker throw for this product (transport failure)
    void fail_product(const std::string& product_id);

    std::optional<Ticker> get_ticker(const std::string& product_id) override;
    double get_price(const std::string& product_id) override;
    std::vector<Product> get_products() override;

    int ticker_requests() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Ticker> tickers_;
    std::vector<Product> products_;
    bool explicit_products_{false};
    std::set<std::string> failing_;
    int ticker_requests_{0};
};

} // namespace arbscan
