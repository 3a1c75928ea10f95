#pragma once

#include <cmath>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "arbitrage/price_history.hpp"
#include "common/types.hpp"
#include "config/config.hpp"

namespace arbscan {

// ============================================================================
// Statistical Arbitrage Analyzer
//
// Tracks rolling prices for many pairs and looks for two that move together
// (high correlation, mean-reverting spread). When the spread
// price_1 - hedge_ratio * price_2 strays far from its mean, trade the
// convergence: short the rich leg, long the cheap one.
// ============================================================================

struct PairCorrelation {
    std::string pair_1;
    std::string pair_2;
    double correlation{0.0};                 // Pearson, [-1, 1]
    double cointegration_pvalue{1.0};        // heuristic, see math::pseudo_cointegration_pvalue
    double hedge_ratio{0.0};                 // OLS slope of pair_1 on pair_2
    int lookback_days{0};
    size_t sample_size{0};
    bool is_cointegrated{false};             // pvalue < 0.05

    bool is_suitable_for_stat_arb() const {
        return std::abs(correlation) > 0.7 && is_cointegrated && sample_size >= 100;
    }
};

enum class SpreadDirection {
    LONG_SPREAD,     // buy pair_1, sell pair_2
    SHORT_SPREAD,    // sell pair_1, buy pair_2
    EXIT,            // spread reverted, close
    STOP_LOSS        // spread kept diverging, close
};

inline std::string spread_direction_to_string(SpreadDirection d) {
    switch (d) {
        case SpreadDirection::LONG_SPREAD: return "long_spread";
        case SpreadDirection::SHORT_SPREAD: return "short_spread";
        case SpreadDirection::EXIT: return "exit";
        case SpreadDirection::STOP_LOSS: return "stop_loss";
    }
    return "unknown";
}

struct ZScoreSignal {
    std::string pair_1;
    std::string pair_2;
    double z_score{0.0};
    SpreadDirection direction{SpreadDirection::EXIT};
    double confidence{0.0};                  // 0-1
    WallClock timestamp{};

    bool is_entry() const {
        return direction == SpreadDirection::LONG_SPREAD || direction == SpreadDirection::SHORT_SPREAD;
    }

    Side pair_1_action() const {
        return direction == SpreadDirection::LONG_SPREAD ? Side::BUY : Side::SELL;
    }
    // Always the opposite leg
    Side pair_2_action() const {
        return direction == SpreadDirection::LONG_SPREAD ? Side::SELL : Side::BUY;
    }
};

struct SpreadStatistics {
    std::string pair_1;
    std::string pair_2;
    double correlation{0.0};
    double hedge_ratio{0.0};
    bool is_cointegrated{false};
    double current_spread{0.0};
    double mean_spread{0.0};
    double std_spread{0.0};
    double z_score{0.0};
    double min_spread{0.0};
    double max_spread{0.0};
    size_t sample_size{0};
};

/**
 * TTL cache of correlation results keyed by the ordered (pair_1, pair_2).
 * Expiry races are last-write-wins.
 */
class CorrelationCache {
public:
    explicit CorrelationCache(ClockFn clock = wall_now);

    std::optional<PairCorrelation> get(const std::string& pair_1, const std::string& pair_2) const;
    void put(const PairCorrelation& value, std::chrono::minutes ttl);
    void clear();
    size_t size() const;

private:
    struct Entry {
        PairCorrelation value;
        WallClock expires_at;
    };

    ClockFn clock_;
    mutable std::mutex mutex_;
    std::map<std::pair<std::string, std::string>, Entry> entries_;
};

class StatArbAnalyzer {
public:
    using Config = StatArbConfig;

    StatArbAnalyzer(PriceHistoryStore& history, CorrelationCache& cache,
                    const Config& config = Config());

    void update_price(const std::string& pair, double price,
                      std::optional<WallClock> timestamp = std::nullopt);

    std::vector<double> get_prices(const std::string& pair) const;

    /**
     * Correlation, hedge ratio and pseudo-cointegration score over the most
     * recent min(len_1, len_2) points. std::nullopt when either pair has
     * fewer than config.min_samples points.
     */
    std::optional<PairCorrelation> calculate_correlation(const std::string& pair_1,
                                                         const std::string& pair_2,
                                                         bool use_cache = true,
                                                         int cache_minutes = 5);

    // (last_spread - mean) / std over the aligned window; 0 for a flat spread
    std::optional<double> calculate_z_score(const std::string& pair_1, const std::string& pair_2);

    /**
     * Entry when flat and |z| >= entry_threshold (short_spread for z > 0,
     * long_spread otherwise). When in a position: stop_loss when
     * |z| >= stop_threshold, exit when |z| <= exit_threshold, nothing in
     * between. The caller owns the position; nothing is stored here.
     *
     * stop_threshold defaults to config.stop_threshold; one at or below
     * entry_threshold is replaced by 2 * entry_threshold.
     *
     * @throws std::invalid_argument if entry_threshold <= 0
     */
    std::optional<ZScoreSignal> get_signal(const std::string& pair_1,
                                           const std::string& pair_2,
                                           double entry_threshold = 2.0,
                                           double exit_threshold = 0.5,
                                           std::optional<SpreadDirection> current_position = std::nullopt,
                                           std::optional<double> stop_threshold = std::nullopt);

    // Unordered tracked pairs with |correlation| >= min_correlation, cointegrated,
    // with enough samples; strongest first.
    std::vector<PairCorrelation> get_suitable_pairs(double min_correlation = 0.7);

    std::optional<SpreadStatistics> get_spread_statistics(const std::string& pair_1,
                                                          const std::string& pair_2);

    const Config& config() const { return config_; }

private:
    PriceHistoryStore& history_;
    CorrelationCache& cache_;
    Config config_;

    // Most recent min(len_1, len_2) points of each series
    bool aligned_prices(const std::string& pair_1, const std::string& pair_2,
                        std::vector<double>& out_1, std::vector<double>& out_2) const;

    static std::vector<double> spread_series(const std::vector<double>& prices_1,
                                             const std::vector<double>& prices_2,
                                             double hedge_ratio);
};

} // namespace arbscan
