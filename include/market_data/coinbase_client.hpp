#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config/config.hpp"
#include "market_data/market_data_provider.hpp"
#include "utils/time_utils.hpp"

namespace arbscan {

/**
 * Coinbase public market data over REST (no credentials).
 *
 * Endpoints:
 *   GET /api/v3/brokerage/market/products
 *   GET /api/v3/brokerage/market/products/{product_id}/ticker
 *
 * Requests are spaced by ConnectionConfig::min_request_interval_ms across all
 * threads. An HTTP 429 is retried once after rate_limit_backoff_ms.
 * The product list is cached for an hour.
 */
class CoinbaseClient : public MarketDataProvider {
public:
    explicit CoinbaseClient(const ConnectionConfig& config);
    ~CoinbaseClient() override;

    CoinbaseClient(const CoinbaseClient&) = delete;
    CoinbaseClient& operator=(const CoinbaseClient&) = delete;

    std::optional<Ticker> get_ticker(const std::string& product_id) override;
    double get_price(const std::string& product_id) override;
    std::vector<Product> get_products() override;

    // Response parsing, exposed for tests
    static std::optional<Ticker> parse_ticker(const std::string& product_id, const nlohmann::json& j);
    static std::vector<Product> parse_products(const nlohmann::json& j);

private:
    struct HttpResponse {
        long status{0};
        std::string body;
    };

    ConnectionConfig config_;
    time_utils::RateLimiter limiter_;

    std::mutex products_mutex_;
    std::vector<Product> products_cache_;
    Timestamp products_fetched_at_{};

    HttpResponse http_get(const std::string& url);
    nlohmann::json public_request(const std::string& endpoint);
};

} // namespace arbscan
