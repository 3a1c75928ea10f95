#include "arbitrage/price_history.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace arbscan {

PriceHistoryStore::PriceHistoryStore(int lookback_days, size_t max_points, ClockFn clock)
    : lookback_days_(lookback_days)
    , max_points_(max_points)
    , clock_(std::move(clock))
{
    if (lookback_days_ <= 0 || max_points_ == 0) {
        throw std::invalid_argument("PriceHistoryStore needs positive lookback_days and max_points");
    }
    if (!clock_) {
        clock_ = wall_now;
    }
}

void PriceHistoryStore::append(const std::string& pair, double price, WallClock timestamp) {
    const auto cutoff = clock_() - std::chrono::hours(24) * (lookback_days_ + 1);

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = history_.find(pair);
    if (it == history_.end()) {
        it = history_.emplace(pair, std::deque<PricePoint>{}).first;
        order_.push_back(pair);
    }
    auto& series = it->second;

    series.push_back({timestamp, price});

    // Capacity cap
    while (series.size() > max_points_) {
        series.pop_front();
    }

    // Time trim
    size_t purged = 0;
    while (!series.empty() && series.front().timestamp < cutoff) {
        series.pop_front();
        purged++;
    }
    if (purged > 0) {
        spdlog::debug("Purged {} stale points for {}", purged, pair);
    }
}

std::vector<double> PriceHistoryStore::prices(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<double> out;
    auto it = history_.find(pair);
    if (it == history_.end()) return out;

    out.reserve(it->second.size());
    for (const auto& p : it->second) {
        out.push_back(p.price);
    }
    return out;
}

std::vector<PricePoint> PriceHistoryStore::points(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(pair);
    if (it == history_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

size_t PriceHistoryStore::size(const std::string& pair) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(pair);
    return it == history_.end() ? 0 : it->second.size();
}

std::vector<std::string> PriceHistoryStore::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

void PriceHistoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    order_.clear();
}

} // namespace arbscan
