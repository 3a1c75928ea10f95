#include "arbitrage/triangular_detector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

namespace arbscan {

TriangularDetector::TriangularDetector(std::shared_ptr<MarketDataProvider> market_data,
                                       const TriangularConfig& config)
    : market_data_(std::move(market_data))
    , config_(config)
{
    if (!market_data_) {
        throw std::invalid_argument("TriangularDetector requires a market data provider");
    }
    if (config_.batch_size <= 0) {
        throw std::invalid_argument("TriangularDetector batch_size must be positive");
    }
    spdlog::info("TriangularDetector initialized: fee={}%, batch={}, delay={}ms",
                 config_.fee_pct, config_.batch_size, config_.batch_delay_ms);
}

size_t TriangularDetector::build_currency_graph() {
    return build_currency_graph(market_data_->get_products());
}

size_t TriangularDetector::build_currency_graph(const std::vector<Product>& products) {
    CurrencyGraph fresh;
    size_t count = fresh.build(products);

    std::lock_guard<std::mutex> lock(graph_mutex_);
    graph_ = std::move(fresh);
    last_build_ = wall_now();
    return count;
}

std::vector<TriangularPath> TriangularDetector::find_triangular_paths(const std::string& start_currency,
                                                                      size_t max_paths) const {
    std::lock_guard<std::mutex> lock(graph_mutex_);
    return graph_.find_triangular_paths(start_currency, max_paths);
}

std::optional<double> TriangularDetector::get_execution_price(const std::string& pair,
                                                              LegDirection direction) const {
    try {
        auto ticker = market_data_->get_ticker(pair);
        if (!ticker) {
            return std::nullopt;
        }
        return direction == LegDirection::BUY ? ticker->ask : ticker->bid;
    } catch (const std::exception& e) {
        spdlog::error("Error getting price for {}: {}", pair, e.what());
        return std::nullopt;
    }
}

PathProfit TriangularDetector::unpriced(const TriangularPath& path, double start_amount) const {
    PathProfit result;
    result.path = path;
    result.start_amount = start_amount;
    result.timestamp = wall_now();
    return result;
}

PathProfit TriangularDetector::calculate_path_profit(const TriangularPath& path,
                                                     double start_amount,
                                                     bool include_fees) const {
    double current_amount = start_amount;
    std::vector<double> rates;
    std::vector<double> fees;

    const size_t legs = std::min(path.pairs.size(), path.directions.size());
    for (size_t i = 0; i < legs; ++i) {
        const auto& pair = path.pairs[i];
        const auto direction = path.directions[i];

        // A hop that matches neither side of its pair has no defined rate
        if (direction == LegDirection::UNKNOWN) {
            spdlog::warn("Unknown direction for {} leg {} of {}", pair, i + 1, path.to_string());
            return unpriced(path, start_amount);
        }

        auto price = get_execution_price(pair, direction);
        if (!price || *price <= 0) {
            spdlog::debug("No usable price for {} leg {} of {}", pair, i + 1, path.to_string());
            return unpriced(path, start_amount);
        }

        rates.push_back(*price);

        // Selling base yields quote; buying base spends quote
        double output = direction == LegDirection::BUY
            ? current_amount / *price
            : current_amount * *price;

        double fee = 0.0;
        if (include_fees) {
            fee = output * (config_.fee_pct / 100.0);
            output = output - fee;
        }
        fees.push_back(fee);

        current_amount = output;
    }

    PathProfit result;
    result.path = path;
    result.start_amount = start_amount;
    result.end_amount = current_amount;
    result.profit = current_amount - start_amount;
    result.profit_pct = start_amount > 0 ? result.profit / start_amount * 100.0 : 0.0;
    result.rates = std::move(rates);
    result.fees = std::move(fees);
    result.is_profitable = result.profit > 0;
    result.timestamp = wall_now();
    return result;
}

std::vector<PathProfit> TriangularDetector::find_profitable_paths(const std::vector<std::string>& start_currencies) {
    return find_profitable_paths(start_currencies, config_.min_profit_pct,
                                 config_.start_amount, config_.max_paths_per_currency);
}

std::vector<PathProfit> TriangularDetector::find_profitable_paths(const std::vector<std::string>& start_currencies,
                                                                  double min_profit_pct,
                                                                  double start_amount,
                                                                  int max_paths_per_currency) {
    std::vector<PathProfit> profitable;
    Stats scan;
    scan.scans = 1;

    const size_t batch_size = static_cast<size_t>(config_.batch_size);
    const size_t max_paths = max_paths_per_currency > 0 ? static_cast<size_t>(max_paths_per_currency) : 0;

    for (const auto& currency : start_currencies) {
        auto paths = find_triangular_paths(currency, max_paths);

        for (size_t offset = 0; offset < paths.size(); offset += batch_size) {
            const size_t end = std::min(offset + batch_size, paths.size());

            std::vector<std::future<PathProfit>> batch;
            batch.reserve(end - offset);
            for (size_t i = offset; i < end; ++i) {
                batch.push_back(std::async(std::launch::async,
                    [this, &path = paths[i], start_amount] {
                        return calculate_path_profit(path, start_amount);
                    }));
            }

            // Wait for the whole batch; one failing path never aborts the scan
            for (size_t i = 0; i < batch.size(); ++i) {
                try {
                    auto result = batch[i].get();
                    scan.paths_evaluated++;
                    if (result.is_unpriced()) {
                        scan.paths_unpriced++;
                        continue;
                    }
                    if (result.is_profitable && result.profit_pct >= min_profit_pct) {
                        scan.best_profit_pct = std::max(scan.best_profit_pct, result.profit_pct);
                        profitable.push_back(std::move(result));
                    }
                } catch (const std::exception& e) {
                    scan.path_errors++;
                    spdlog::error("Error evaluating {}: {}", paths[offset + i].to_string(), e.what());
                }
            }

            if (config_.batch_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(config_.batch_delay_ms));
            }
        }
    }

    std::stable_sort(profitable.begin(), profitable.end(),
                     [](const PathProfit& a, const PathProfit& b) {
                         return a.profit_pct > b.profit_pct;
                     });

    scan.profitable_found = profitable.size();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.scans += scan.scans;
        stats_.paths_evaluated += scan.paths_evaluated;
        stats_.paths_unpriced += scan.paths_unpriced;
        stats_.path_errors += scan.path_errors;
        stats_.profitable_found += scan.profitable_found;
        stats_.best_profit_pct = std::max(stats_.best_profit_pct, scan.best_profit_pct);
    }

    spdlog::info("Triangular scan over {} currencies: {} paths evaluated, {} profitable",
                 start_currencies.size(), scan.paths_evaluated, profitable.size());
    return profitable;
}

std::vector<std::string> TriangularDetector::get_all_currencies() const {
    std::lock_guard<std::mutex> lock(graph_mutex_);
    return graph_.currencies();
}

size_t TriangularDetector::get_pair_count() const {
    std::lock_guard<std::mutex> lock(graph_mutex_);
    return graph_.pair_count();
}

std::optional<WallClock> TriangularDetector::last_build() const {
    std::lock_guard<std::mutex> lock(graph_mutex_);
    return last_build_;
}

TriangularDetector::Stats TriangularDetector::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace arbscan
