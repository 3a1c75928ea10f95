#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "price_feeds/price_feed.hpp"
#include "utils/cancellation.hpp"
#include "utils/worker_pool.hpp"

namespace arbscan {

// ============================================================================
// Price Aggregator
//
// Queries every registered feed for one pair and picks the cheapest venue to
// buy (min ask) and the richest venue to sell (max bid). Spatial arbitrage
// exists when the sell venue's bid beats the buy venue's ask after fees.
// ============================================================================

struct ProfitEstimate {
    double quantity{0.0};
    std::string buy_exchange;
    double buy_price{0.0};           // effective, fees included when requested
    double buy_cost{0.0};
    std::string sell_exchange;
    double sell_price{0.0};
    double sell_revenue{0.0};
    double gross_profit{0.0};        // spread * quantity
    double net_profit{0.0};
    double net_profit_pct{0.0};      // net / buy_cost * 100
    bool is_profitable{false};
};

struct AggregatedPrice {
    std::string base;
    std::string quote;
    WallClock timestamp{};

    std::optional<PriceQuote> best_buy;     // lowest ask
    std::optional<PriceQuote> best_sell;    // highest bid
    std::vector<PriceQuote> all_quotes;

    std::string product_id() const { return make_product_id(base, quote); }

    // best_sell.bid - best_buy.ask
    std::optional<double> spread() const;
    // spread / best_buy.ask * 100
    std::optional<double> spread_pct() const;

    /**
     * Round trip at `quantity`: buy on best_buy at the ask (plus taker fee),
     * sell on best_sell at the bid (minus taker fee). Gas is charged once
     * per DEX leg. std::nullopt when either side is missing.
     */
    std::optional<ProfitEstimate> calculate_profit(double quantity,
                                                   bool include_fees = true,
                                                   bool include_gas = true) const;
};

struct ArbitrageOpportunity {
    std::string id;
    WallClock timestamp{};
    std::string product_id;
    std::string base;
    std::string quote;

    std::string buy_exchange;
    ExchangeType buy_exchange_type{ExchangeType::CEX};
    double buy_price{0.0};
    std::string sell_exchange;
    ExchangeType sell_exchange_type{ExchangeType::CEX};
    double sell_price{0.0};

    double spread{0.0};
    double spread_pct{0.0};
    double estimated_profit{0.0};
    double estimated_profit_pct{0.0};

    double max_quantity{0.0};
    double min_quantity{0.0};

    // Equal to timestamp: quotes are stale on return, re-validate before acting
    WallClock expires_at{};
    double confidence{0.0};          // 0-100
};

using SpreadCallback = std::function<void(const AggregatedPrice&)>;

class PriceAggregator {
public:
    using Config = AggregatorConfig;

    /**
     * Feed queries run on a pool of config.max_workers threads shared by
     * every call on this aggregator.
     *
     * @throws std::invalid_argument if max_workers, max_queued_requests or
     *         scan_batch_size is not positive
     */
    explicit PriceAggregator(std::vector<std::shared_ptr<PriceFeed>> feeds,
                             const Config& config = Config());

    /**
     * Query all feeds concurrently, bounded by `timeout` overall. Feeds that
     * time out, throw, or return nothing are left out of the result.
     *
     * A feed still working on an earlier request for the same pair is
     * skipped rather than queried again, so a hung venue holds at most one
     * worker per pair.
     */
    AggregatedPrice get_best_prices(const std::string& base,
                                    const std::string& quote,
                                    std::chrono::milliseconds timeout);
    AggregatedPrice get_best_prices(const std::string& base, const std::string& quote);

    /**
     * Evaluate (base, quote) pairs at min_quantity, config.scan_batch_size at
     * a time, and return profitable ones with net_profit_pct >=
     * min_profit_pct, best first.
     */
    std::vector<ArbitrageOpportunity> find_opportunities(
        const std::vector<std::pair<std::string, std::string>>& pairs,
        double min_profit_pct,
        double min_quantity,
        std::chrono::milliseconds timeout);
    std::vector<ArbitrageOpportunity> find_opportunities(
        const std::vector<std::pair<std::string, std::string>>& pairs);

    /**
     * Poll (base, quote) every `interval` and hand the result to `callback`
     * until `cancel` is triggered. A failed iteration is logged and the loop
     * carries on.
     */
    void monitor_spread(const std::string& base,
                        const std::string& quote,
                        const SpreadCallback& callback,
                        std::chrono::milliseconds interval,
                        CancellationToken& cancel);

    void add_feed(std::shared_ptr<PriceFeed> feed);
    void remove_feed(const std::string& feed_name);
    size_t feed_count() const;

    // Feed name -> availability. A feed that throws or does not answer
    // within config.timeout_ms counts as unavailable.
    std::map<std::string, bool> check_feed_health();

    struct Stats {
        uint64_t price_requests{0};
        uint64_t feed_timeouts{0};
        uint64_t feed_errors{0};
        uint64_t feed_skipped{0};            // busy with the same pair, or pool full
        uint64_t pairs_scanned{0};
        uint64_t opportunities_found{0};
        double best_profit_pct_seen{0.0};
    };
    Stats stats() const;

private:
    Config config_;

    mutable std::mutex feeds_mutex_;
    std::vector<std::shared_ptr<PriceFeed>> feeds_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    // (feed name, product id) with a query still running
    std::mutex in_flight_mutex_;
    std::set<std::pair<std::string, std::string>> in_flight_;

    // Declared last: joins its workers before the state they touch goes away
    WorkerPool pool_;

    std::vector<std::shared_ptr<PriceFeed>> snapshot_feeds() const;

    bool begin_request(const std::pair<std::string, std::string>& key);
    void end_request(const std::pair<std::string, std::string>& key);

    std::optional<ArbitrageOpportunity> check_pair(const std::string& base,
                                                   const std::string& quote,
                                                   double min_profit_pct,
                                                   double min_quantity,
                                                   std::chrono::milliseconds timeout);
};

} // namespace arbscan
