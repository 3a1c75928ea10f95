#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config/config.hpp"

using namespace arbscan;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        std::remove(path_.c_str());
    }

    void write(const std::string& text) {
        std::ofstream f(path_);
        f << text;
    }

    std::string path_ = ::testing::TempDir() + "arbscan_config_test.json";
};

TEST_F(ConfigTest, Defaults_AreValid) {
    EngineConfig config;
    EXPECT_TRUE(config.validate());
    EXPECT_DOUBLE_EQ(config.triangular.fee_pct, 0.1);
    EXPECT_EQ(config.triangular.batch_size, 10);
    EXPECT_EQ(config.aggregator.timeout_ms, 5000);
    EXPECT_DOUBLE_EQ(config.aggregator.min_profit_pct, 0.3);
    EXPECT_EQ(config.stat_arb.lookback_days, 30);
    EXPECT_EQ(config.stat_arb.max_history_points, 10000);
    EXPECT_EQ(config.stat_arb.cache_minutes, 5);
}

TEST_F(ConfigTest, SaveThenLoad_PreservesValues) {
    EngineConfig config;
    config.triangular.fee_pct = 0.25;
    config.triangular.start_currencies = {"SOL", "USDC"};
    config.aggregator.pairs = {"SOL-USDC"};
    FeedConfig feed;
    feed.name = "kraken";
    feed.taker_fee_pct = 0.26;
    config.aggregator.feeds.push_back(feed);
    config.stat_arb.entry_threshold = 2.5;

    config.save(path_);
    auto loaded = EngineConfig::load(path_);

    EXPECT_DOUBLE_EQ(loaded.triangular.fee_pct, 0.25);
    EXPECT_EQ(loaded.triangular.start_currencies, (std::vector<std::string>{"SOL", "USDC"}));
    EXPECT_EQ(loaded.aggregator.pairs, (std::vector<std::string>{"SOL-USDC"}));
    ASSERT_EQ(loaded.aggregator.feeds.size(), 1u);
    EXPECT_EQ(loaded.aggregator.feeds[0].name, "kraken");
    EXPECT_EQ(loaded.aggregator.feeds[0].type, "cex");
    EXPECT_DOUBLE_EQ(loaded.aggregator.feeds[0].taker_fee_pct, 0.26);
    EXPECT_DOUBLE_EQ(loaded.stat_arb.entry_threshold, 2.5);
}

TEST_F(ConfigTest, Load_MissingKeysKeepDefaults) {
    write(R"({"triangular": {"fee_pct": 0.2}})");

    auto config = EngineConfig::load(path_);
    EXPECT_DOUBLE_EQ(config.triangular.fee_pct, 0.2);
    EXPECT_EQ(config.triangular.batch_size, 10);
    EXPECT_EQ(config.stat_arb.min_samples, 100);
}

TEST_F(ConfigTest, Load_MissingFileThrows) {
    EXPECT_THROW(EngineConfig::load("/nonexistent/arbscan.json"), std::runtime_error);
}

TEST_F(ConfigTest, Load_MalformedJsonThrows) {
    write("{not json");
    EXPECT_THROW(EngineConfig::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, Load_InvalidValuesThrow) {
    write(R"({"triangular": {"batch_size": 0}})");
    EXPECT_THROW(EngineConfig::load(path_), std::runtime_error);
}

TEST_F(ConfigTest, Validate_RejectsBadValues) {
    EngineConfig config;
    config.stat_arb.exit_threshold = 3.0;
    EXPECT_FALSE(config.validate());

    config = EngineConfig();
    config.stat_arb.entry_threshold = 0.0;
    EXPECT_FALSE(config.validate());

    config = EngineConfig();
    FeedConfig feed;
    feed.name = "pancake";
    feed.type = "amm";
    config.aggregator.feeds.push_back(feed);
    EXPECT_FALSE(config.validate());

    config = EngineConfig();
    config.aggregator.min_quantity = 0.0;
    EXPECT_FALSE(config.validate());

    config = EngineConfig();
    config.aggregator.max_workers = 0;
    EXPECT_FALSE(config.validate());

    config = EngineConfig();
    config.aggregator.scan_batch_size = 0;
    EXPECT_FALSE(config.validate());
}

TEST_F(ConfigTest, GetEnv_FallsBackToDefault) {
    EXPECT_EQ(EngineConfig::get_env("ARBSCAN_SURELY_UNSET_VARIABLE", "fallback"), "fallback");
}

TEST_F(ConfigTest, Load_StopThresholdAtOrBelowEntryIsDoubled) {
    write(R"({"stat_arb": {"entry_threshold": 2.5, "stop_threshold": 2.0}})");
    auto config = EngineConfig::load(path_);
    EXPECT_DOUBLE_EQ(config.stat_arb.stop_threshold, 5.0);

    write(R"({"stat_arb": {"entry_threshold": 2.5, "stop_threshold": 6.0}})");
    config = EngineConfig::load(path_);
    EXPECT_DOUBLE_EQ(config.stat_arb.stop_threshold, 6.0);

    // Default stop is 4.0, below an entry of 5.0
    write(R"({"stat_arb": {"entry_threshold": 5.0, "exit_threshold": 0.5}})");
    config = EngineConfig::load(path_);
    EXPECT_DOUBLE_EQ(config.stat_arb.stop_threshold, 10.0);
}
