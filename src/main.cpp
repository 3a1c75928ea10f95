#include <iostream>
#include <fstream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "market_data/coinbase_client.hpp"
#include "market_data/in_memory_market_data.hpp"
#include "price_feeds/exchange_price_feed.hpp"
#include "arbitrage/triangular_detector.hpp"
#include "arbitrage/price_aggregator.hpp"
#include "arbitrage/stat_arb_analyzer.hpp"
#include "arbitrage/record_json.hpp"
#include "utils/cancellation.hpp"
#include "utils/time_utils.hpp"

using namespace arbscan;

// Stops the spread monitor
CancellationToken g_cancel;
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout carries the JSON records, so console logs go to stderr
    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/arbscan.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("arbscan", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

void emit(const nlohmann::json& record) {
    std::cout << record.dump() << std::endl;
}

std::shared_ptr<MarketDataProvider> make_provider(const EngineConfig& config,
                                                  const std::string& snapshot_path) {
    if (!snapshot_path.empty()) {
        spdlog::info("Using market snapshot {}", snapshot_path);
        return InMemoryMarketData::from_file(snapshot_path);
    }
    spdlog::info("Using Coinbase REST at {}", config.connection.rest_url);
    return std::make_shared<CoinbaseClient>(config.connection);
}

std::vector<std::shared_ptr<PriceFeed>> make_feeds(const EngineConfig& config,
                                                   const std::string& snapshot_path) {
    std::vector<std::shared_ptr<PriceFeed>> feeds;

    if (config.aggregator.feeds.empty()) {
        feeds.push_back(std::make_shared<ExchangePriceFeed>(
            "coinbase", make_provider(config, snapshot_path), 0.6, 0.4));
        return feeds;
    }

    for (const auto& fc : config.aggregator.feeds) {
        if (exchange_type_from_string(fc.type) == ExchangeType::DEX) {
            spdlog::warn("Feed {}: no on-chain quoter available, skipped", fc.name);
            continue;
        }
        const std::string& path = fc.snapshot_path.empty() ? snapshot_path : fc.snapshot_path;
        feeds.push_back(std::make_shared<ExchangePriceFeed>(
            fc.name, make_provider(config, path), fc.taker_fee_pct, fc.maker_fee_pct));
    }
    return feeds;
}

std::pair<std::string, std::string> parse_pair(const std::string& product_id) {
    std::string base, quote;
    if (!split_product_id(product_id, base, quote)) {
        throw std::invalid_argument("Invalid pair (expected BASE-QUOTE): " + product_id);
    }
    return {base, quote};
}

int run_triangular(const EngineConfig& config, const std::string& snapshot_path) {
    TriangularDetector detector(make_provider(config, snapshot_path), config.triangular);
    detector.build_currency_graph();

    auto results = detector.find_profitable_paths(config.triangular.start_currencies);
    for (const auto& r : results) {
        emit(r);
    }

    auto s = detector.stats();
    spdlog::info("Triangular scan: {} paths evaluated, {} unpriced, {} errors, {} profitable",
                 s.paths_evaluated, s.paths_unpriced, s.path_errors, s.profitable_found);
    return 0;
}

int run_spatial(const EngineConfig& config, const std::string& snapshot_path) {
    PriceAggregator aggregator(make_feeds(config, snapshot_path), config.aggregator);

    std::vector<std::pair<std::string, std::string>> pairs;
    for (const auto& p : config.aggregator.pairs) {
        pairs.push_back(parse_pair(p));
    }

    for (const auto& opp : aggregator.find_opportunities(pairs)) {
        emit(opp);
    }
    return 0;
}

int run_monitor(const EngineConfig& config, const std::string& snapshot_path,
                const std::string& pair, int interval_ms) {
    PriceAggregator aggregator(make_feeds(config, snapshot_path), config.aggregator);
    auto [base, quote] = parse_pair(pair);

    // Signal handlers only flip an atomic; a watcher turns it into a cancel
    std::thread watcher([] {
        while (!g_cancel.stop_requested()) {
            if (g_shutdown) {
                spdlog::info("Shutdown signal received");
                g_cancel.request_stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    aggregator.monitor_spread(base, quote,
                              [](const AggregatedPrice& price) { emit(price); },
                              std::chrono::milliseconds(interval_ms),
                              g_cancel);

    g_cancel.request_stop();
    watcher.join();
    return 0;
}

/**
 * Replays price ticks, one JSON object per line:
 *   {"pair": "ETH-USD", "price": 3000.5, "ts": "2024-01-01T00:00:00.000Z"}
 * "ts" is optional. Prints suitable pairs, then the current signal and
 * spread statistics for each.
 */
int run_statarb(const EngineConfig& config, const std::string& ticks_path) {
    std::ifstream file(ticks_path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open ticks file: " + ticks_path);
    }

    // History is trimmed relative to the newest replayed tick, not the wall clock
    WallClock replay_now = wall_now();
    bool replay_started = false;
    auto clock = [&replay_now] { return replay_now; };

    PriceHistoryStore history(config.stat_arb.lookback_days,
                              static_cast<size_t>(config.stat_arb.max_history_points), clock);
    CorrelationCache cache(clock);
    StatArbAnalyzer analyzer(history, cache, config.stat_arb);

    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.empty()) continue;
        try {
            auto j = nlohmann::json::parse(line);
            auto ts = j.contains("ts") ? time_utils::from_iso8601(j.at("ts").get<std::string>())
                                       : wall_now();
            if (!replay_started || ts > replay_now) {
                replay_now = ts;
                replay_started = true;
            }
            analyzer.update_price(j.at("pair").get<std::string>(), j.at("price").get<double>(), ts);
        } catch (const std::exception& e) {
            spdlog::warn("Skipping tick on line {}: {}", line_no, e.what());
            skipped++;
        }
    }
    spdlog::info("Replayed {} lines ({} skipped) for {} pairs",
                 line_no, skipped, history.symbols().size());

    const auto& sc = config.stat_arb;
    for (const auto& corr : analyzer.get_suitable_pairs(sc.min_correlation)) {
        nlohmann::json record{{"correlation", corr}};
        if (auto signal = analyzer.get_signal(corr.pair_1, corr.pair_2,
                                              sc.entry_threshold, sc.exit_threshold,
                                              std::nullopt, sc.stop_threshold)) {
            record["signal"] = *signal;
        }
        if (auto stats = analyzer.get_spread_statistics(corr.pair_1, corr.pair_2)) {
            record["spread"] = *stats;
        }
        emit(record);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"arbscan - crypto arbitrage opportunity scanner"};
    app.require_subcommand(1);

    std::string config_path = "configs/arbscan.json";
    std::string snapshot_path;
    std::string log_level;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("-s,--snapshot", snapshot_path, "Market snapshot JSON (offline scan)")
        ->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", log_level, "Override log level (debug, info, warn, error)");

    auto* triangular = app.add_subcommand("triangular", "Scan 3-hop cycles on one venue");
    auto* spatial = app.add_subcommand("spatial", "Scan configured pairs across venues");

    auto* monitor = app.add_subcommand("monitor", "Poll one pair across venues until interrupted");
    std::string monitor_pair = "ETH-USDT";
    int monitor_interval_ms = 0;
    monitor->add_option("pair", monitor_pair, "Pair to watch, BASE-QUOTE");
    monitor->add_option("-i,--interval-ms", monitor_interval_ms, "Polling interval (default from config)");

    auto* statarb = app.add_subcommand("statarb", "Replay price ticks and report pair-trading signals");
    std::string ticks_path;
    statarb->add_option("ticks", ticks_path, "JSON-lines price ticks")
        ->required()
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    // Load config
    EngineConfig config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = EngineConfig::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }
    if (!log_level.empty()) {
        config.logging.log_level = log_level;
    }

    setup_logging(config.logging);

    if (!config.validate()) {
        spdlog::error("Invalid configuration");
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        if (*triangular) {
            return run_triangular(config, snapshot_path);
        }
        if (*spatial) {
            return run_spatial(config, snapshot_path);
        }
        if (*monitor) {
            int interval = monitor_interval_ms > 0 ? monitor_interval_ms
                                                   : config.aggregator.monitor_interval_ms;
            return run_monitor(config, snapshot_path, monitor_pair, interval);
        }
        if (*statarb) {
            return run_statarb(config, ticks_path);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
