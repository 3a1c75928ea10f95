#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace arbscan {

// ============================================================================
// Statistics for pairs trading. Population moments throughout (divide by n).
// ============================================================================

namespace math {

inline double mean(const std::vector<double>& xs) {
    if (xs.empty()) return 0.0;
    double sum = 0.0;
    for (double x : xs) sum += x;
    return sum / static_cast<double>(xs.size());
}

inline double variance(const std::vector<double>& xs) {
    if (xs.empty()) return 0.0;
    const double m = mean(xs);
    double acc = 0.0;
    for (double x : xs) acc += (x - m) * (x - m);
    return acc / static_cast<double>(xs.size());
}

inline double stddev(const std::vector<double>& xs) {
    return std::sqrt(variance(xs));
}

// Variances at or below this fraction of level^2 are summation noise
constexpr double kFlatTolerance = 1e-12;

// True when the series does not move relative to `level`. Constant prices
// such as 0.1 or 3500.1 are not exact in binary floating point, so their
// computed variance is tiny but rarely exactly 0.
inline bool is_flat(const std::vector<double>& xs, double level) {
    return variance(xs) <= kFlatTolerance * level * level;
}

inline bool is_flat(const std::vector<double>& xs) {
    return is_flat(xs, mean(xs));
}

inline double covariance(const std::vector<double>& xs, const std::vector<double>& ys) {
    const size_t n = std::min(xs.size(), ys.size());
    if (n == 0) return 0.0;
    const double mx = mean(xs);
    const double my = mean(ys);
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) acc += (xs[i] - mx) * (ys[i] - my);
    return acc / static_cast<double>(n);
}

// Pearson correlation. If either series is flat the coefficient is
// undefined: two flat series count as perfectly co-moving (1.0), one flat
// series against a moving one as uncorrelated (0.0).
inline double pearson(const std::vector<double>& xs, const std::vector<double>& ys) {
    const bool flat_x = is_flat(xs);
    const bool flat_y = is_flat(ys);
    if (flat_x || flat_y) {
        return (flat_x && flat_y) ? 1.0 : 0.0;
    }
    double r = covariance(xs, ys) / std::sqrt(variance(xs) * variance(ys));
    // Clamp rounding drift
    if (r > 1.0) r = 1.0;
    if (r < -1.0) r = -1.0;
    return r;
}

// Slope of the OLS fit y = a + b*x. With flat x the slope is undefined and
// the ratio of means is used instead (1.0 when mean(x) is 0).
inline double ols_slope(const std::vector<double>& xs, const std::vector<double>& ys) {
    if (is_flat(xs)) {
        const double mx = mean(xs);
        return mx != 0.0 ? mean(ys) / mx : 1.0;
    }
    return covariance(xs, ys) / variance(xs);
}

// Number of times the series switches between above-mean and at-or-below-mean
inline size_t mean_crossings(const std::vector<double>& xs) {
    if (xs.size() < 2) return 0;
    const double m = mean(xs);
    size_t crossings = 0;
    bool prev_above = xs[0] > m;
    for (size_t i = 1; i < xs.size(); ++i) {
        bool above = xs[i] > m;
        if (above != prev_above) crossings++;
        prev_above = above;
    }
    return crossings;
}

/**
 * Heuristic stationarity score standing in for a cointegration p-value.
 * This is NOT a unit-root test. More mean crossings relative to n/2 means
 * more mean reversion:
 *   ratio > 0.8 -> 0.01, > 0.6 -> 0.05, > 0.4 -> 0.10, else 0.50.
 * A series flat relative to `level` (the price level the spread was built
 * from) scores 1.0.
 */
inline double pseudo_cointegration_pvalue(const std::vector<double>& spread, double level) {
    if (spread.empty() || is_flat(spread, level)) {
        return 1.0;
    }

    const double expected_crossings = static_cast<double>(spread.size()) / 2.0;
    const double ratio = static_cast<double>(mean_crossings(spread)) / expected_crossings;

    if (ratio > 0.8) return 0.01;   // strong mean reversion
    if (ratio > 0.6) return 0.05;
    if (ratio > 0.4) return 0.10;
    return 0.50;                    // not mean reverting
}

inline double pseudo_cointegration_pvalue(const std::vector<double>& spread) {
    return pseudo_cointegration_pvalue(spread, mean(spread));
}

inline double zscore(double value, double mean_value, double std_value) {
    if (std_value <= 0) return 0.0;
    return (value - mean_value) / std_value;
}

}  // namespace math

}  // namespace arbscan
