#include "arbitrage/price_aggregator.hpp"
#include "utils/async_utils.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <stdexcept>

namespace arbscan {

std::optional<double> AggregatedPrice::spread() const {
    if (best_buy && best_sell) {
        return best_sell->bid - best_buy->ask;
    }
    return std::nullopt;
}

std::optional<double> AggregatedPrice::spread_pct() const {
    auto s = spread();
    if (s && best_buy->ask > 0) {
        return *s / best_buy->ask * 100.0;
    }
    return std::nullopt;
}

std::optional<ProfitEstimate> AggregatedPrice::calculate_profit(double quantity,
                                                                bool include_fees,
                                                                bool include_gas) const {
    if (!best_buy || !best_sell) {
        return std::nullopt;
    }

    ProfitEstimate est;
    est.quantity = quantity;

    // Buy side
    est.buy_exchange = best_buy->exchange;
    est.buy_price = best_buy->ask;
    if (include_fees) {
        est.buy_price = est.buy_price * (1.0 + best_buy->taker_fee_pct / 100.0);
    }
    est.buy_cost = quantity * est.buy_price;

    // Gas is quoted in USD; treated as quote currency (approximate for non-USD quotes)
    if (include_gas && best_buy->exchange_type == ExchangeType::DEX) {
        est.buy_cost += best_buy->gas_estimate_usd.value_or(0.0);
    }

    // Sell side
    est.sell_exchange = best_sell->exchange;
    est.sell_price = best_sell->bid;
    if (include_fees) {
        est.sell_price = est.sell_price * (1.0 - best_sell->taker_fee_pct / 100.0);
    }
    est.sell_revenue = quantity * est.sell_price;

    if (include_gas && best_sell->exchange_type == ExchangeType::DEX) {
        est.sell_revenue -= best_sell->gas_estimate_usd.value_or(0.0);
    }

    est.gross_profit = spread().value_or(0.0) * quantity;
    est.net_profit = est.sell_revenue - est.buy_cost;
    est.net_profit_pct = est.buy_cost > 0 ? est.net_profit / est.buy_cost * 100.0 : 0.0;
    est.is_profitable = est.net_profit > 0;
    return est;
}

namespace {

size_t positive_size(int value, const char* what) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(what) + " must be positive");
    }
    return static_cast<size_t>(value);
}

} // namespace

PriceAggregator::PriceAggregator(std::vector<std::shared_ptr<PriceFeed>> feeds, const Config& config)
    : config_(config)
    , feeds_(std::move(feeds))
    , pool_(positive_size(config.max_workers, "max_workers"),
            positive_size(config.max_queued_requests, "max_queued_requests"))
{
    positive_size(config_.scan_batch_size, "scan_batch_size");
    feeds_.erase(std::remove(feeds_.begin(), feeds_.end(), nullptr), feeds_.end());
    spdlog::info("PriceAggregator initialized with {} feeds, timeout={}ms, workers={}",
                 feeds_.size(), config_.timeout_ms, pool_.workers());
}

bool PriceAggregator::begin_request(const std::pair<std::string, std::string>& key) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.insert(key).second;
}

void PriceAggregator::end_request(const std::pair<std::string, std::string>& key) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(key);
}

std::vector<std::shared_ptr<PriceFeed>> PriceAggregator::snapshot_feeds() const {
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    return feeds_;
}

AggregatedPrice PriceAggregator::get_best_prices(const std::string& base, const std::string& quote) {
    return get_best_prices(base, quote, std::chrono::milliseconds(config_.timeout_ms));
}

AggregatedPrice PriceAggregator::get_best_prices(const std::string& base,
                                                 const std::string& quote,
                                                 std::chrono::milliseconds timeout) {
    auto feeds = snapshot_feeds();
    const auto product = make_product_id(base, quote);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    struct Pending {
        std::shared_ptr<PriceFeed> feed;
        std::future<std::optional<PriceQuote>> future;
    };

    uint64_t timeouts = 0;
    uint64_t errors = 0;
    uint64_t skipped = 0;

    // Fan out on the shared pool, feed order preserved
    std::vector<Pending> pending;
    pending.reserve(feeds.size());
    for (const auto& feed : feeds) {
        auto key = std::make_pair(feed->name(), product);
        if (!begin_request(key)) {
            skipped++;
            spdlog::debug("{} still busy with {}, skipping", feed->name(), product);
            continue;
        }

        auto future = pool_.submit([this, feed, base, quote, key] {
            try {
                auto q = feed->get_price(base, quote);
                end_request(key);
                return q;
            } catch (...) {
                end_request(key);
                throw;
            }
        });
        if (!future) {
            end_request(key);
            skipped++;
            spdlog::warn("Worker pool full, skipping {} for {}", feed->name(), product);
            continue;
        }
        pending.push_back({feed, std::move(*future)});
    }

    AggregatedPrice result;
    result.base = base;
    result.quote = quote;

    for (auto& p : pending) {
        if (p.future.wait_until(deadline) != std::future_status::ready) {
            timeouts++;
            spdlog::warn("Timeout fetching price from {} for {}", p.feed->name(), product);
            continue;
        }
        try {
            auto q = p.future.get();
            if (!q) {
                continue;
            }
            if (!q->is_valid()) {
                spdlog::debug("Dropping one-sided quote from {} for {} (bid={}, ask={})",
                              p.feed->name(), product, q->bid, q->ask);
                continue;
            }
            result.all_quotes.push_back(std::move(*q));
        } catch (const std::exception& e) {
            errors++;
            spdlog::error("Error fetching price from {}: {}", p.feed->name(), e.what());
        }
    }

    result.timestamp = wall_now();

    if (!result.all_quotes.empty()) {
        // First feed wins ties
        result.best_buy = *std::min_element(result.all_quotes.begin(), result.all_quotes.end(),
            [](const PriceQuote& a, const PriceQuote& b) { return a.ask < b.ask; });
        result.best_sell = *std::max_element(result.all_quotes.begin(), result.all_quotes.end(),
            [](const PriceQuote& a, const PriceQuote& b) { return a.bid < b.bid; });
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.price_requests++;
        stats_.feed_timeouts += timeouts;
        stats_.feed_errors += errors;
        stats_.feed_skipped += skipped;
    }

    return result;
}

std::optional<ArbitrageOpportunity> PriceAggregator::check_pair(const std::string& base,
                                                                const std::string& quote,
                                                                double min_profit_pct,
                                                                double min_quantity,
                                                                std::chrono::milliseconds timeout) {
    auto prices = get_best_prices(base, quote, timeout);
    if (!prices.best_buy || !prices.best_sell) {
        return std::nullopt;
    }

    auto profit = prices.calculate_profit(min_quantity);
    if (!profit || !profit->is_profitable) {
        return std::nullopt;
    }
    if (profit->net_profit_pct < min_profit_pct) {
        return std::nullopt;
    }

    ArbitrageOpportunity opp;
    opp.timestamp = wall_now();
    opp.id = fmt::format("{}-{}-{}", base, quote, time_utils::epoch_us());
    opp.product_id = make_product_id(base, quote);
    opp.base = base;
    opp.quote = quote;
    opp.buy_exchange = prices.best_buy->exchange;
    opp.buy_exchange_type = prices.best_buy->exchange_type;
    opp.buy_price = prices.best_buy->ask;
    opp.sell_exchange = prices.best_sell->exchange;
    opp.sell_exchange_type = prices.best_sell->exchange_type;
    opp.sell_price = prices.best_sell->bid;
    opp.spread = prices.spread().value_or(0.0);
    opp.spread_pct = prices.spread_pct().value_or(0.0);
    opp.estimated_profit = profit->net_profit;
    opp.estimated_profit_pct = profit->net_profit_pct;
    opp.max_quantity = config_.default_max_quantity;
    opp.min_quantity = min_quantity;
    opp.expires_at = opp.timestamp;
    opp.confidence = config_.base_confidence;
    return opp;
}

std::vector<ArbitrageOpportunity> PriceAggregator::find_opportunities(
    const std::vector<std::pair<std::string, std::string>>& pairs) {
    return find_opportunities(pairs, config_.min_profit_pct, config_.min_quantity,
                              std::chrono::milliseconds(config_.scan_timeout_ms));
}

std::vector<ArbitrageOpportunity> PriceAggregator::find_opportunities(
    const std::vector<std::pair<std::string, std::string>>& pairs,
    double min_profit_pct,
    double min_quantity,
    std::chrono::milliseconds timeout) {
    const size_t batch_size = static_cast<size_t>(config_.scan_batch_size);
    std::vector<ArbitrageOpportunity> opportunities;

    for (size_t start = 0; start < pairs.size(); start += batch_size) {
        const size_t end = std::min(start + batch_size, pairs.size());

        std::vector<std::future<std::optional<ArbitrageOpportunity>>> batch;
        batch.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            batch.push_back(std::async(std::launch::async,
                [this, base = pairs[i].first, quote = pairs[i].second, min_profit_pct, min_quantity, timeout] {
                    return check_pair(base, quote, min_profit_pct, min_quantity, timeout);
                }));
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            try {
                auto opp = batch[i].get();
                if (opp) {
                    opportunities.push_back(std::move(*opp));
                }
            } catch (const std::exception& e) {
                const auto& pair = pairs[start + i];
                spdlog::error("Error checking pair {}-{}: {}", pair.first, pair.second, e.what());
            }
        }
    }

    std::stable_sort(opportunities.begin(), opportunities.end(),
                     [](const ArbitrageOpportunity& a, const ArbitrageOpportunity& b) {
                         return a.estimated_profit_pct > b.estimated_profit_pct;
                     });

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.pairs_scanned += pairs.size();
        stats_.opportunities_found += opportunities.size();
        if (!opportunities.empty()) {
            stats_.best_profit_pct_seen = std::max(stats_.best_profit_pct_seen,
                                                   opportunities.front().estimated_profit_pct);
        }
    }

    spdlog::info("Spatial scan over {} pairs: {} opportunities", pairs.size(), opportunities.size());
    return opportunities;
}

void PriceAggregator::monitor_spread(const std::string& base,
                                     const std::string& quote,
                                     const SpreadCallback& callback,
                                     std::chrono::milliseconds interval,
                                     CancellationToken& cancel) {
    spdlog::info("Monitoring {}-{} spread every {}ms", base, quote, interval.count());

    while (!cancel.stop_requested()) {
        try {
            auto prices = get_best_prices(base, quote);
            callback(prices);
        } catch (const std::exception& e) {
            spdlog::error("Error in spread monitor for {}-{}: {}", base, quote, e.what());
        }

        if (cancel.wait_for(interval)) {
            break;
        }
    }

    spdlog::info("Spread monitor for {}-{} stopped", base, quote);
}

void PriceAggregator::add_feed(std::shared_ptr<PriceFeed> feed) {
    if (!feed) return;
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    spdlog::info("Adding price feed {} ({})", feed->name(), exchange_type_to_string(feed->exchange_type()));
    feeds_.push_back(std::move(feed));
}

void PriceAggregator::remove_feed(const std::string& feed_name) {
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    feeds_.erase(std::remove_if(feeds_.begin(), feeds_.end(),
                                [&](const std::shared_ptr<PriceFeed>& f) { return f->name() == feed_name; }),
                 feeds_.end());
}

size_t PriceAggregator::feed_count() const {
    std::lock_guard<std::mutex> lock(feeds_mutex_);
    return feeds_.size();
}

std::map<std::string, bool> PriceAggregator::check_feed_health() {
    std::map<std::string, bool> results;
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);
    for (const auto& feed : snapshot_feeds()) {
        try {
            results[feed->name()] = call_with_timeout(pool_, [feed] { return feed->is_available(); }, timeout);
        } catch (const CallTimeout&) {
            spdlog::warn("Health check timed out for {}", feed->name());
            results[feed->name()] = false;
        } catch (const std::exception& e) {
            spdlog::warn("Health check failed for {}: {}", feed->name(), e.what());
            results[feed->name()] = false;
        }
    }
    return results;
}

PriceAggregator::Stats PriceAggregator::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace arbscan
