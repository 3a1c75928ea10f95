#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace arbscan {

struct PricePoint {
    WallClock timestamp;
    double price;
};

/**
 * Rolling per-pair price history.
 *
 * Each pair keeps at most max_points observations (oldest dropped first)
 * and nothing older than lookback_days + 1 relative to the clock. Trimming
 * pops from the front, so inserts are expected in non-decreasing time order.
 */
class PriceHistoryStore {
public:
    PriceHistoryStore(int lookback_days, size_t max_points, ClockFn clock = wall_now);

    // Append then trim
    void append(const std::string& pair, double price, WallClock timestamp);

    std::vector<double> prices(const std::string& pair) const;
    std::vector<PricePoint> points(const std::string& pair) const;
    size_t size(const std::string& pair) const;

    // Tracked pairs in first-seen order
    std::vector<std::string> symbols() const;

    void clear();

    int lookback_days() const { return lookback_days_; }
    size_t max_points() const { return max_points_; }
    WallClock now() const { return clock_(); }

private:
    int lookback_days_;
    size_t max_points_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<PricePoint>> history_;
    std::vector<std::string> order_;
};

} // namespace arbscan
