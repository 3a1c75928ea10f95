#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace arbscan {

struct TriangularConfig {
    double fee_pct{0.1};                     // Taker fee per leg, percent
    int batch_size{10};                      // Paths evaluated concurrently per batch
    int batch_delay_ms{100};                 // Pause between batches (rate limits)
    int max_paths_per_currency{50};
    double min_profit_pct{0.1};
    double start_amount{1000.0};
    std::vector<std::string> start_currencies{"ETH", "BTC", "USDT"};
};

struct FeedConfig {
    std::string name;                        // Venue name, e.g. "coinbase"
    std::string type{"cex"};                 // cex or dex
    double taker_fee_pct{0.6};
    double maker_fee_pct{0.4};
    std::string snapshot_path;               // Offline tickers; empty = live REST
};

struct AggregatorConfig {
    int timeout_ms{5000};                    // Per-feed quote timeout
    int scan_timeout_ms{10000};              // Per-feed timeout while scanning pairs
    double min_profit_pct{0.3};
    double min_quantity{0.01};
    double default_max_quantity{100.0};      // No depth data, fixed upper bound
    double base_confidence{80.0};            // 0-100 scale
    int monitor_interval_ms{1000};
    int max_workers{8};                      // Threads shared by all feed queries
    int max_queued_requests{128};            // Feed queries waiting for a worker
    int scan_batch_size{10};                 // Pairs evaluated concurrently per batch
    std::vector<std::string> pairs{"ETH-USDT", "BTC-USDT"};
    std::vector<FeedConfig> feeds;
};

struct StatArbConfig {
    int lookback_days{30};
    int max_history_points{10000};
    int min_samples{100};                    // Below this no correlation is reported
    int cache_minutes{5};
    double entry_threshold{2.0};
    double exit_threshold{0.5};
    double stop_threshold{4.0};              // |z| that stops out a held position; <= entry means 2x entry
    double min_correlation{0.7};
};

struct ConnectionConfig {
    std::string rest_url{"https://api.coinbase.com"};
    int request_timeout_ms{10000};
    int min_request_interval_ms{200};        // Spacing between public REST calls
    int rate_limit_backoff_ms{1000};         // Wait after HTTP 429 before the retry
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{false};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct EngineConfig {
    TriangularConfig triangular;
    AggregatorConfig aggregator;
    StatArbConfig stat_arb;
    ConnectionConfig connection;
    LoggingConfig logging;

    // Load from file
    static EngineConfig load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const TriangularConfig& c);
void from_json(const nlohmann::json& j, TriangularConfig& c);
void to_json(nlohmann::json& j, const FeedConfig& c);
void from_json(const nlohmann::json& j, FeedConfig& c);
void to_json(nlohmann::json& j, const AggregatorConfig& c);
void from_json(const nlohmann::json& j, AggregatorConfig& c);
void to_json(nlohmann::json& j, const StatArbConfig& c);
void from_json(const nlohmann::json& j, StatArbConfig& c);
void to_json(nlohmann::json& j, const ConnectionConfig& c);
void from_json(const nlohmann::json& j, ConnectionConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

} // namespace arbscan
