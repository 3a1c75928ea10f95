#include <gtest/gtest.h>
#include <atomic>
#include <map>
#include <stdexcept>
#include <thread>
#include "arbitrage/price_aggregator.hpp"

using namespace arbscan;

namespace {

// Feed with scripted quotes and failure modes
class FakeFeed : public PriceFeed {
public:
    explicit FakeFeed(std::string name, double fee_pct = 0.0, ExchangeType type = ExchangeType::CEX)
        : PriceFeed(std::move(name), type), fee_pct_(fee_pct) {}

    void set_quote(const std::string& product_id, double bid, double ask) {
        quotes_[product_id] = {bid, ask};
    }

    std::optional<PriceQuote> get_price(const std::string& base, const std::string& quote) override {
        calls_++;
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (throws_) throw std::runtime_error("connection reset");

        auto it = quotes_.find(make_product_id(base, quote));
        if (it == quotes_.end()) return std::nullopt;

        PriceQuote q;
        q.exchange = name();
        q.exchange_type = exchange_type();
        q.base = base;
        q.quote = quote;
        q.bid = it->second.first;
        q.ask = it->second.second;
        q.taker_fee_pct = fee_pct_;
        q.maker_fee_pct = fee_pct_;
        if (exchange_type() == ExchangeType::DEX) {
            q.gas_estimate_usd = gas_usd_;
            q.chain_id = 1;
        }
        q.timestamp = wall_now();
        return q;
    }

    bool is_available() override {
        if (health_delay_.count() > 0) std::this_thread::sleep_for(health_delay_);
        if (health_throws_) throw std::runtime_error("health probe failed");
        return available_;
    }

    std::chrono::milliseconds delay_{0};
    std::chrono::milliseconds health_delay_{0};
    bool throws_{false};
    bool available_{true};
    bool health_throws_{false};
    double gas_usd_{0.0};
    std::atomic<int> calls_{0};

private:
    double fee_pct_;
    std::map<std::string, std::pair<double, double>> quotes_;
};

} // namespace

class PriceAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        feed_a_ = std::make_shared<FakeFeed>("venue_a", 0.1);
        feed_b_ = std::make_shared<FakeFeed>("venue_b", 0.1);

        config_.timeout_ms = 200;
        config_.scan_timeout_ms = 200;
        config_.default_max_quantity = 100.0;
        config_.base_confidence = 80.0;
    }

    std::unique_ptr<PriceAggregator> make_aggregator(std::vector<std::shared_ptr<PriceFeed>> feeds) {
        return std::make_unique<PriceAggregator>(std::move(feeds), config_);
    }

    std::shared_ptr<FakeFeed> feed_a_;
    std::shared_ptr<FakeFeed> feed_b_;
    AggregatorConfig config_;
};

TEST_F(PriceAggregatorTest, BestPrices_SameVenueCanWinBothSides) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    feed_b_->set_quote("ETH-USDT", 98.0, 101.0);
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto prices = agg->get_best_prices("ETH", "USDT");

    ASSERT_TRUE(prices.best_buy.has_value());
    ASSERT_TRUE(prices.best_sell.has_value());
    EXPECT_EQ(prices.best_buy->exchange, "venue_a");
    EXPECT_EQ(prices.best_sell->exchange, "venue_a");
    EXPECT_DOUBLE_EQ(*prices.spread(), -1.0);
    EXPECT_DOUBLE_EQ(*prices.spread_pct(), -1.0);
    EXPECT_EQ(prices.all_quotes.size(), 2u);
    EXPECT_EQ(prices.product_id(), "ETH-USDT");
}

TEST_F(PriceAggregatorTest, BestPrices_MinAskAndMaxBidOverAllQuotes) {
    std::vector<std::shared_ptr<PriceFeed>> feeds;
    const double quotes[][2] = {{99.5, 100.4}, {100.2, 100.9}, {99.0, 100.1}, {100.0, 100.3}};
    for (size_t i = 0; i < 4; ++i) {
        auto f = std::make_shared<FakeFeed>("venue_" + std::to_string(i));
        f->set_quote("BTC-USD", quotes[i][0], quotes[i][1]);
        feeds.push_back(f);
    }
    auto agg = make_aggregator(feeds);

    auto prices = agg->get_best_prices("BTC", "USD");

    ASSERT_EQ(prices.all_quotes.size(), 4u);
    for (const auto& q : prices.all_quotes) {
        EXPECT_LE(prices.best_buy->ask, q.ask);
        EXPECT_GE(prices.best_sell->bid, q.bid);
    }
    EXPECT_EQ(prices.best_buy->exchange, "venue_2");
    EXPECT_EQ(prices.best_sell->exchange, "venue_1");
}

TEST_F(PriceAggregatorTest, BestPrices_TieGoesToFirstFeed) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    feed_b_->set_quote("ETH-USDT", 99.0, 100.0);
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto prices = agg->get_best_prices("ETH", "USDT");
    EXPECT_EQ(prices.best_buy->exchange, "venue_a");
    EXPECT_EQ(prices.best_sell->exchange, "venue_a");
}

TEST_F(PriceAggregatorTest, BestPrices_SlowFeedIsExcluded) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    feed_b_->set_quote("ETH-USDT", 105.0, 106.0);
    feed_b_->delay_ = std::chrono::milliseconds(1000);
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto start = std::chrono::steady_clock::now();
    auto prices = agg->get_best_prices("ETH", "USDT", std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(prices.all_quotes.size(), 1u);
    EXPECT_EQ(prices.best_sell->exchange, "venue_a");
    EXPECT_LT(elapsed, std::chrono::milliseconds(800));
    EXPECT_EQ(agg->stats().feed_timeouts, 1u);
}

TEST_F(PriceAggregatorTest, BestPrices_HungFeedIsNotQueriedAgainWhileBusy) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    feed_b_->set_quote("ETH-USDT", 105.0, 106.0);
    feed_b_->set_quote("BTC-USDT", 1000.0, 1001.0);
    feed_b_->delay_ = std::chrono::milliseconds(2000);
    config_.max_workers = 2;
    auto agg = make_aggregator({feed_a_, feed_b_});

    for (int i = 0; i < 20; ++i) {
        auto prices = agg->get_best_prices("ETH", "USDT", std::chrono::milliseconds(50));
        ASSERT_EQ(prices.all_quotes.size(), 1u) << i;
        EXPECT_EQ(prices.all_quotes[0].exchange, "venue_a");
    }

    // One call to the hung venue; later polls skipped it
    EXPECT_EQ(feed_b_->calls_.load(), 1);
    EXPECT_EQ(feed_a_->calls_.load(), 20);
    auto s = agg->stats();
    EXPECT_EQ(s.feed_timeouts, 1u);
    EXPECT_EQ(s.feed_skipped, 19u);

    // A different pair on the same venue is still tried
    agg->get_best_prices("BTC", "USDT", std::chrono::milliseconds(50));
    EXPECT_EQ(feed_b_->calls_.load(), 2);
}

TEST_F(PriceAggregatorTest, Constructor_RejectsNonPositivePoolSizes) {
    config_.max_workers = 0;
    EXPECT_THROW(make_aggregator({feed_a_}), std::invalid_argument);

    config_ = AggregatorConfig();
    config_.max_queued_requests = 0;
    EXPECT_THROW(make_aggregator({feed_a_}), std::invalid_argument);

    config_ = AggregatorConfig();
    config_.scan_batch_size = -1;
    EXPECT_THROW(make_aggregator({feed_a_}), std::invalid_argument);
}

TEST_F(PriceAggregatorTest, BestPrices_ThrowingFeedIsExcluded) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    feed_b_->throws_ = true;
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto prices = agg->get_best_prices("ETH", "USDT");
    EXPECT_EQ(prices.all_quotes.size(), 1u);
    EXPECT_EQ(agg->stats().feed_errors, 1u);
}

TEST_F(PriceAggregatorTest, BestPrices_NoQuotesLeavesBothSidesEmpty) {
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto prices = agg->get_best_prices("XRP", "USD");
    EXPECT_TRUE(prices.all_quotes.empty());
    EXPECT_FALSE(prices.best_buy.has_value());
    EXPECT_FALSE(prices.best_sell.has_value());
    EXPECT_FALSE(prices.spread().has_value());
    EXPECT_FALSE(prices.calculate_profit(1.0).has_value());
}

TEST_F(PriceAggregatorTest, BestPrices_OneSidedQuoteIsDropped) {
    feed_a_->set_quote("ETH-USDT", 0.0, 100.0);
    feed_b_->set_quote("ETH-USDT", 99.0, 101.0);
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto prices = agg->get_best_prices("ETH", "USDT");
    ASSERT_EQ(prices.all_quotes.size(), 1u);
    EXPECT_EQ(prices.best_buy->exchange, "venue_b");
}

TEST_F(PriceAggregatorTest, CalculateProfit_FeesAndDexGas) {
    auto dex = std::make_shared<FakeFeed>("uniswap_v3", 0.3, ExchangeType::DEX);
    dex->gas_usd_ = 15.0;
    dex->set_quote("ETH-USDC", 99.0, 100.0);
    auto cex = std::make_shared<FakeFeed>("coinbase", 0.1);
    cex->set_quote("ETH-USDC", 102.0, 103.0);
    auto agg = make_aggregator({dex, cex});

    auto prices = agg->get_best_prices("ETH", "USDC");
    auto est = prices.calculate_profit(10.0);
    ASSERT_TRUE(est.has_value());

    EXPECT_EQ(est->buy_exchange, "uniswap_v3");
    EXPECT_EQ(est->sell_exchange, "coinbase");
    EXPECT_NEAR(est->buy_price, 100.3, 1e-9);
    EXPECT_NEAR(est->buy_cost, 1003.0 + 15.0, 1e-9);
    EXPECT_NEAR(est->sell_price, 101.898, 1e-9);
    EXPECT_NEAR(est->sell_revenue, 1018.98, 1e-9);
    EXPECT_NEAR(est->gross_profit, 20.0, 1e-9);
    EXPECT_NEAR(est->net_profit, 0.98, 1e-9);
    EXPECT_NEAR(est->net_profit_pct, 0.98 / 1018.0 * 100.0, 1e-9);
    EXPECT_TRUE(est->is_profitable);
}

TEST_F(PriceAggregatorTest, CalculateProfit_WithoutFeesOrGas) {
    auto dex = std::make_shared<FakeFeed>("uniswap_v3", 0.3, ExchangeType::DEX);
    dex->gas_usd_ = 15.0;
    dex->set_quote("ETH-USDC", 99.0, 100.0);
    auto cex = std::make_shared<FakeFeed>("coinbase", 0.1);
    cex->set_quote("ETH-USDC", 102.0, 103.0);
    auto agg = make_aggregator({dex, cex});

    auto est = agg->get_best_prices("ETH", "USDC").calculate_profit(10.0, false, false);
    ASSERT_TRUE(est.has_value());
    EXPECT_DOUBLE_EQ(est->buy_cost, 1000.0);
    EXPECT_DOUBLE_EQ(est->sell_revenue, 1020.0);
    EXPECT_DOUBLE_EQ(est->net_profit, est->gross_profit);
}

TEST_F(PriceAggregatorTest, FindOpportunities_FiltersAndSortsByProfit) {
    feed_a_->set_quote("ETH-USDT", 99.5, 100.0);
    feed_b_->set_quote("ETH-USDT", 103.0, 103.5);
    feed_a_->set_quote("BTC-USDT", 999.0, 1000.0);
    feed_b_->set_quote("BTC-USDT", 1010.0, 1011.0);
    feed_a_->set_quote("SOL-USDT", 9.9, 10.0);
    feed_b_->set_quote("SOL-USDT", 10.0, 10.1);
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto opps = agg->find_opportunities({{"BTC", "USDT"}, {"ETH", "USDT"}, {"SOL", "USDT"}},
                                        0.3, 1.0, std::chrono::milliseconds(200));

    ASSERT_EQ(opps.size(), 2u);
    EXPECT_EQ(opps[0].product_id, "ETH-USDT");
    EXPECT_EQ(opps[1].product_id, "BTC-USDT");
    EXPECT_GT(opps[0].estimated_profit_pct, opps[1].estimated_profit_pct);

    const auto& eth = opps[0];
    EXPECT_EQ(eth.buy_exchange, "venue_a");
    EXPECT_EQ(eth.sell_exchange, "venue_b");
    EXPECT_DOUBLE_EQ(eth.buy_price, 100.0);
    EXPECT_DOUBLE_EQ(eth.sell_price, 103.0);
    EXPECT_DOUBLE_EQ(eth.spread, 3.0);
    EXPECT_EQ(eth.expires_at, eth.timestamp);
    EXPECT_DOUBLE_EQ(eth.min_quantity, 1.0);
    EXPECT_DOUBLE_EQ(eth.max_quantity, 100.0);
    EXPECT_DOUBLE_EQ(eth.confidence, 80.0);
    EXPECT_EQ(eth.id.rfind("ETH-USDT-", 0), 0u);

    for (const auto& o : opps) {
        EXPECT_GE(o.estimated_profit_pct, 0.3);
        EXPECT_GT(o.estimated_profit, 0.0);
    }
}

TEST_F(PriceAggregatorTest, FindOpportunities_HigherThresholdKeepsFewer) {
    feed_a_->set_quote("ETH-USDT", 99.5, 100.0);
    feed_b_->set_quote("ETH-USDT", 103.0, 103.5);
    feed_a_->set_quote("BTC-USDT", 999.0, 1000.0);
    feed_b_->set_quote("BTC-USDT", 1010.0, 1011.0);
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto opps = agg->find_opportunities({{"BTC", "USDT"}, {"ETH", "USDT"}},
                                        1.0, 1.0, std::chrono::milliseconds(200));
    ASSERT_EQ(opps.size(), 1u);
    EXPECT_EQ(opps[0].product_id, "ETH-USDT");
}

TEST_F(PriceAggregatorTest, FindOpportunities_BatchesOfOneGiveSameResult) {
    feed_a_->set_quote("ETH-USDT", 99.5, 100.0);
    feed_b_->set_quote("ETH-USDT", 103.0, 103.5);
    feed_a_->set_quote("BTC-USDT", 999.0, 1000.0);
    feed_b_->set_quote("BTC-USDT", 1010.0, 1011.0);
    feed_a_->set_quote("SOL-USDT", 9.9, 10.0);
    feed_b_->set_quote("SOL-USDT", 10.0, 10.1);
    config_.scan_batch_size = 1;
    config_.max_workers = 1;
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto opps = agg->find_opportunities({{"BTC", "USDT"}, {"ETH", "USDT"}, {"SOL", "USDT"}},
                                        0.3, 1.0, std::chrono::milliseconds(500));

    ASSERT_EQ(opps.size(), 2u);
    EXPECT_EQ(opps[0].product_id, "ETH-USDT");
    EXPECT_EQ(opps[1].product_id, "BTC-USDT");
    EXPECT_EQ(agg->stats().pairs_scanned, 3u);
    EXPECT_EQ(agg->stats().feed_skipped, 0u);
}

TEST_F(PriceAggregatorTest, FindOpportunities_EmptyPairList) {
    auto agg = make_aggregator({feed_a_, feed_b_});
    EXPECT_TRUE(agg->find_opportunities({}, 0.3, 1.0, std::chrono::milliseconds(200)).empty());
}

TEST_F(PriceAggregatorTest, MonitorSpread_StopsOnCancel) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    auto agg = make_aggregator({feed_a_});

    CancellationToken cancel;
    std::atomic<int> updates{0};

    std::thread monitor([&] {
        agg->monitor_spread("ETH", "USDT",
                            [&](const AggregatedPrice& p) {
                                EXPECT_TRUE(p.best_buy.has_value());
                                updates++;
                            },
                            std::chrono::milliseconds(10), cancel);
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (updates < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    cancel.request_stop();
    monitor.join();

    EXPECT_GE(updates.load(), 3);
}

TEST_F(PriceAggregatorTest, MonitorSpread_WakesFromLongIntervalOnCancel) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    auto agg = make_aggregator({feed_a_});

    CancellationToken cancel;
    std::atomic<int> updates{0};

    auto start = std::chrono::steady_clock::now();
    std::thread monitor([&] {
        agg->monitor_spread("ETH", "USDT", [&](const AggregatedPrice&) { updates++; },
                            std::chrono::seconds(60), cancel);
    });

    while (updates == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    cancel.request_stop();
    monitor.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_EQ(updates.load(), 1);
}

TEST_F(PriceAggregatorTest, MonitorSpread_CallbackErrorDoesNotStopLoop) {
    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    auto agg = make_aggregator({feed_a_});

    CancellationToken cancel;
    std::atomic<int> calls{0};

    std::thread monitor([&] {
        agg->monitor_spread("ETH", "USDT",
                            [&](const AggregatedPrice&) {
                                if (++calls == 1) throw std::runtime_error("sink full");
                            },
                            std::chrono::milliseconds(10), cancel);
    });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (calls < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    cancel.request_stop();
    monitor.join();

    EXPECT_GE(calls.load(), 2);
}

TEST_F(PriceAggregatorTest, AddAndRemoveFeed) {
    auto agg = make_aggregator({feed_a_});
    EXPECT_EQ(agg->feed_count(), 1u);

    agg->add_feed(feed_b_);
    EXPECT_EQ(agg->feed_count(), 2u);

    agg->remove_feed("venue_a");
    EXPECT_EQ(agg->feed_count(), 1u);

    feed_a_->set_quote("ETH-USDT", 99.0, 100.0);
    feed_b_->set_quote("ETH-USDT", 98.0, 101.0);
    auto prices = agg->get_best_prices("ETH", "USDT");
    ASSERT_EQ(prices.all_quotes.size(), 1u);
    EXPECT_EQ(prices.all_quotes[0].exchange, "venue_b");

    agg->remove_feed("not_registered");
    EXPECT_EQ(agg->feed_count(), 1u);
}

TEST_F(PriceAggregatorTest, FeedHealth_ThrowingProbeCountsAsDown) {
    feed_b_->health_throws_ = true;
    auto feed_c = std::make_shared<FakeFeed>("venue_c");
    feed_c->available_ = false;
    auto agg = make_aggregator({feed_a_, feed_b_, feed_c});

    auto health = agg->check_feed_health();
    ASSERT_EQ(health.size(), 3u);
    EXPECT_TRUE(health["venue_a"]);
    EXPECT_FALSE(health["venue_b"]);
    EXPECT_FALSE(health["venue_c"]);
}

TEST_F(PriceAggregatorTest, FeedHealth_SlowProbeCountsAsDown) {
    feed_b_->health_delay_ = std::chrono::milliseconds(1000);
    auto agg = make_aggregator({feed_a_, feed_b_});

    auto start = std::chrono::steady_clock::now();
    auto health = agg->check_feed_health();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(800));

    EXPECT_TRUE(health["venue_a"]);
    EXPECT_FALSE(health["venue_b"]);
}
