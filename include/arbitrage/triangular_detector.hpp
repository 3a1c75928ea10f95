#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "arbitrage/currency_graph.hpp"
#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/market_data_provider.hpp"

namespace arbscan {

// ============================================================================
// Triangular Arbitrage Detector
//
// Finds 3-hop currency cycles on one venue (e.g. ETH → BTC → USDT → ETH)
// and prices each leg at the touch: ask for buys, bid for sells.
// A cycle whose compounded rate exceeds 1 after fees is an opportunity.
// ============================================================================

struct PathProfit {
    TriangularPath path;
    double start_amount{0.0};
    double end_amount{0.0};          // 0 when a leg could not be priced
    double profit{0.0};
    double profit_pct{0.0};
    std::vector<double> rates;       // execution price per leg
    std::vector<double> fees;        // fee per leg, in that leg's output currency
    bool is_profitable{false};
    WallClock timestamp{};

    // Net multiplication factor around the cycle
    double net_multiplier() const {
        return start_amount > 0 ? end_amount / start_amount : 0.0;
    }

    // True for the "could not price a leg" result
    bool is_unpriced() const { return end_amount == 0.0 && rates.empty(); }
};

class TriangularDetector {
public:
    TriangularDetector(std::shared_ptr<MarketDataProvider> market_data,
                       const TriangularConfig& config = TriangularConfig());

    /**
     * Fetch the venue's products and rebuild the graph.
     * Errors from the provider and an empty listing propagate.
     */
    size_t build_currency_graph();
    size_t build_currency_graph(const std::vector<Product>& products);

    std::vector<TriangularPath> find_triangular_paths(const std::string& start_currency,
                                                      size_t max_paths = 100) const;

    /**
     * Walk the three legs. Any missing or non-positive price, or a leg with
     * UNKNOWN direction, returns the zero sentinel (end_amount 0, not
     * profitable, no rates/fees).
     */
    PathProfit calculate_path_profit(const TriangularPath& path,
                                     double start_amount,
                                     bool include_fees = true) const;

    /**
     * Evaluate candidate cycles for every start currency in batches of
     * config.batch_size (concurrently within a batch, with
     * config.batch_delay_ms between batches). Returns cycles that are
     * profitable with profit_pct >= min_profit_pct, best first.
     */
    std::vector<PathProfit> find_profitable_paths(const std::vector<std::string>& start_currencies,
                                                  double min_profit_pct,
                                                  double start_amount,
                                                  int max_paths_per_currency);
    std::vector<PathProfit> find_profitable_paths(const std::vector<std::string>& start_currencies);

    std::vector<std::string> get_all_currencies() const;
    size_t get_pair_count() const;
    std::optional<WallClock> last_build() const;

    double fee_pct() const { return config_.fee_pct; }

    struct Stats {
        uint64_t scans{0};
        uint64_t paths_evaluated{0};
        uint64_t paths_unpriced{0};
        uint64_t path_errors{0};
        uint64_t profitable_found{0};
        double best_profit_pct{0.0};
    };
    Stats stats() const;

private:
    std::shared_ptr<MarketDataProvider> market_data_;
    TriangularConfig config_;

    mutable std::mutex graph_mutex_;
    CurrencyGraph graph_;
    std::optional<WallClock> last_build_;

    mutable std::mutex stats_mutex_;
    Stats stats_;

    // Ask for buys, bid for sells. nullopt when the ticker is missing or
    // the provider fails.
    std::optional<double> get_execution_price(const std::string& pair, LegDirection direction) const;

    PathProfit unpriced(const TriangularPath& path, double start_amount) const;
};

} // namespace arbscan
