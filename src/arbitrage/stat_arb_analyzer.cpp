#include "arbitrage/stat_arb_analyzer.hpp"
#include "arbitrage/stat_math.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace arbscan {

// ============================================================================
// CorrelationCache
// ============================================================================

CorrelationCache::CorrelationCache(ClockFn clock)
    : clock_(clock ? std::move(clock) : ClockFn(wall_now))
{
}

std::optional<PairCorrelation> CorrelationCache::get(const std::string& pair_1,
                                                     const std::string& pair_2) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find({pair_1, pair_2});
    if (it == entries_.end() || clock_() >= it->second.expires_at) {
        return std::nullopt;
    }
    return it->second.value;
}

void CorrelationCache::put(const PairCorrelation& value, std::chrono::minutes ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[{value.pair_1, value.pair_2}] = Entry{value, clock_() + ttl};
}

void CorrelationCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

size_t CorrelationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// StatArbAnalyzer
// ============================================================================

StatArbAnalyzer::StatArbAnalyzer(PriceHistoryStore& history, CorrelationCache& cache,
                                 const Config& config)
    : history_(history)
    , cache_(cache)
    , config_(config)
{
    spdlog::info("StatArbAnalyzer initialized: lookback={}d, max_points={}, min_samples={}",
                 history_.lookback_days(), history_.max_points(), config_.min_samples);
}

void StatArbAnalyzer::update_price(const std::string& pair, double price,
                                   std::optional<WallClock> timestamp) {
    history_.append(pair, price, timestamp.value_or(history_.now()));
}

std::vector<double> StatArbAnalyzer::get_prices(const std::string& pair) const {
    return history_.prices(pair);
}

bool StatArbAnalyzer::aligned_prices(const std::string& pair_1, const std::string& pair_2,
                                     std::vector<double>& out_1, std::vector<double>& out_2) const {
    out_1 = history_.prices(pair_1);
    out_2 = history_.prices(pair_2);

    const size_t n = std::min(out_1.size(), out_2.size());
    if (out_1.size() > n) out_1.erase(out_1.begin(), out_1.end() - n);
    if (out_2.size() > n) out_2.erase(out_2.begin(), out_2.end() - n);
    return n > 0;
}

std::vector<double> StatArbAnalyzer::spread_series(const std::vector<double>& prices_1,
                                                   const std::vector<double>& prices_2,
                                                   double hedge_ratio) {
    std::vector<double> spread(prices_1.size());
    for (size_t i = 0; i < prices_1.size(); ++i) {
        spread[i] = prices_1[i] - hedge_ratio * prices_2[i];
    }
    return spread;
}

std::optional<PairCorrelation> StatArbAnalyzer::calculate_correlation(const std::string& pair_1,
                                                                      const std::string& pair_2,
                                                                      bool use_cache,
                                                                      int cache_minutes) {
    if (use_cache) {
        if (auto cached = cache_.get(pair_1, pair_2)) {
            return cached;
        }
    }

    const size_t len_1 = history_.size(pair_1);
    const size_t len_2 = history_.size(pair_2);
    const size_t min_samples = static_cast<size_t>(config_.min_samples);
    if (len_1 < min_samples || len_2 < min_samples) {
        spdlog::warn("Insufficient data for correlation: {}={}, {}={}", pair_1, len_1, pair_2, len_2);
        return std::nullopt;
    }

    std::vector<double> prices_1, prices_2;
    aligned_prices(pair_1, pair_2, prices_1, prices_2);

    // Re-check after alignment in case a concurrent trim shrank a series
    if (prices_1.size() < min_samples) {
        spdlog::warn("Insufficient aligned data for correlation: {}/{} = {}", pair_1, pair_2, prices_1.size());
        return std::nullopt;
    }

    PairCorrelation result;
    result.pair_1 = pair_1;
    result.pair_2 = pair_2;
    result.correlation = math::pearson(prices_1, prices_2);
    result.hedge_ratio = math::ols_slope(prices_2, prices_1);

    auto spread = spread_series(prices_1, prices_2, result.hedge_ratio);
    result.cointegration_pvalue = math::pseudo_cointegration_pvalue(spread, math::mean(prices_1));
    result.is_cointegrated = result.cointegration_pvalue < 0.05;
    result.lookback_days = history_.lookback_days();
    result.sample_size = prices_1.size();

    cache_.put(result, std::chrono::minutes(cache_minutes));
    return result;
}

std::optional<double> StatArbAnalyzer::calculate_z_score(const std::string& pair_1, const std::string& pair_2) {
    auto correlation = calculate_correlation(pair_1, pair_2, true, config_.cache_minutes);
    if (!correlation) {
        return std::nullopt;
    }

    std::vector<double> prices_1, prices_2;
    if (!aligned_prices(pair_1, pair_2, prices_1, prices_2) || prices_1.size() < 2) {
        return std::nullopt;
    }

    auto spread = spread_series(prices_1, prices_2, correlation->hedge_ratio);
    if (math::is_flat(spread, math::mean(prices_1))) {
        return 0.0;
    }
    return (spread.back() - math::mean(spread)) / math::stddev(spread);
}

std::optional<ZScoreSignal> StatArbAnalyzer::get_signal(const std::string& pair_1,
                                                        const std::string& pair_2,
                                                        double entry_threshold,
                                                        double exit_threshold,
                                                        std::optional<SpreadDirection> current_position,
                                                        std::optional<double> stop_threshold) {
    if (entry_threshold <= 0) {
        throw std::invalid_argument("entry_threshold must be positive");
    }

    double stop = stop_threshold.value_or(config_.stop_threshold);
    if (stop <= entry_threshold) {
        stop = 2.0 * entry_threshold;
    }

    auto z = calculate_z_score(pair_1, pair_2);
    if (!z) {
        return std::nullopt;
    }

    const double abs_z = std::abs(*z);
    // Closing directions are not positions
    const bool in_position = current_position &&
                             (*current_position == SpreadDirection::LONG_SPREAD ||
                              *current_position == SpreadDirection::SHORT_SPREAD);

    ZScoreSignal signal;
    signal.pair_1 = pair_1;
    signal.pair_2 = pair_2;
    signal.z_score = *z;
    signal.timestamp = wall_now();

    if (in_position) {
        if (abs_z >= stop) {
            spdlog::warn("Stop loss {}/{}: |z|={:.2f} >= {:.2f}", pair_1, pair_2, abs_z, stop);
            signal.direction = SpreadDirection::STOP_LOSS;
            signal.confidence = 1.0;
            return signal;
        }
        if (abs_z <= exit_threshold) {
            signal.direction = SpreadDirection::EXIT;
            signal.confidence = 1.0 - abs_z / entry_threshold;
            return signal;
        }
        return std::nullopt;
    }

    if (abs_z >= entry_threshold) {
        // Positive z: pair_1 rich relative to pair_2
        signal.direction = *z > 0 ? SpreadDirection::SHORT_SPREAD : SpreadDirection::LONG_SPREAD;
        signal.confidence = std::min(1.0, abs_z / (2.0 * entry_threshold));
        return signal;
    }

    return std::nullopt;
}

std::vector<PairCorrelation> StatArbAnalyzer::get_suitable_pairs(double min_correlation) {
    const auto symbols = history_.symbols();
    const size_t min_samples = static_cast<size_t>(config_.min_samples);
    std::vector<PairCorrelation> suitable;

    for (size_t i = 0; i < symbols.size(); ++i) {
        for (size_t j = i + 1; j < symbols.size(); ++j) {
            auto corr = calculate_correlation(symbols[i], symbols[j], true, config_.cache_minutes);
            if (!corr) continue;

            if (std::abs(corr->correlation) >= min_correlation &&
                corr->is_cointegrated &&
                corr->sample_size >= min_samples) {
                suitable.push_back(std::move(*corr));
            }
        }
    }

    std::stable_sort(suitable.begin(), suitable.end(),
                     [](const PairCorrelation& a, const PairCorrelation& b) {
                         return std::abs(a.correlation) > std::abs(b.correlation);
                     });
    return suitable;
}

std::optional<SpreadStatistics> StatArbAnalyzer::get_spread_statistics(const std::string& pair_1,
                                                                       const std::string& pair_2) {
    auto correlation = calculate_correlation(pair_1, pair_2, true, config_.cache_minutes);
    if (!correlation) {
        return std::nullopt;
    }

    std::vector<double> prices_1, prices_2;
    if (!aligned_prices(pair_1, pair_2, prices_1, prices_2)) {
        return std::nullopt;
    }

    auto spread = spread_series(prices_1, prices_2, correlation->hedge_ratio);
    auto [min_it, max_it] = std::minmax_element(spread.begin(), spread.end());

    SpreadStatistics stats;
    stats.pair_1 = pair_1;
    stats.pair_2 = pair_2;
    stats.correlation = correlation->correlation;
    stats.hedge_ratio = correlation->hedge_ratio;
    stats.is_cointegrated = correlation->is_cointegrated;
    stats.current_spread = spread.back();
    stats.mean_spread = math::mean(spread);
    stats.std_spread = math::is_flat(spread, math::mean(prices_1)) ? 0.0 : math::stddev(spread);
    stats.z_score = math::zscore(stats.current_spread, stats.mean_spread, stats.std_spread);
    stats.min_spread = *min_it;
    stats.max_spread = *max_it;
    stats.sample_size = spread.size();
    return stats;
}

} // namespace arbscan
