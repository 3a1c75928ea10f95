#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace arbscan {

void to_json(nlohmann::json& j, const TriangularConfig& c) {
    j = nlohmann::json{
        {"fee_pct", c.fee_pct},
        {"batch_size", c.batch_size},
        {"batch_delay_ms", c.batch_delay_ms},
        {"max_paths_per_currency", c.max_paths_per_currency},
        {"min_profit_pct", c.min_profit_pct},
        {"start_amount", c.start_amount},
        {"start_currencies", c.start_currencies}
    };
}

void from_json(const nlohmann::json& j, TriangularConfig& c) {
    if (j.contains("fee_pct")) j.at("fee_pct").get_to(c.fee_pct);
    if (j.contains("batch_size")) j.at("batch_size").get_to(c.batch_size);
    if (j.contains("batch_delay_ms")) j.at("batch_delay_ms").get_to(c.batch_delay_ms);
    if (j.contains("max_paths_per_currency")) j.at("max_paths_per_currency").get_to(c.max_paths_per_currency);
    if (j.contains("min_profit_pct")) j.at("min_profit_pct").get_to(c.min_profit_pct);
    if (j.contains("start_amount")) j.at("start_amount").get_to(c.start_amount);
    if (j.contains("start_currencies")) j.at("start_currencies").get_to(c.start_currencies);
}

void to_json(nlohmann::json& j, const FeedConfig& c) {
    j = nlohmann::json{
        {"name", c.name},
        {"type", c.type},
        {"taker_fee_pct", c.taker_fee_pct},
        {"maker_fee_pct", c.maker_fee_pct},
        {"snapshot_path", c.snapshot_path}
    };
}

void from_json(const nlohmann::json& j, FeedConfig& c) {
    if (j.contains("name")) j.at("name").get_to(c.name);
    if (j.contains("type")) j.at("type").get_to(c.type);
    if (j.contains("taker_fee_pct")) j.at("taker_fee_pct").get_to(c.taker_fee_pct);
    if (j.contains("maker_fee_pct")) j.at("maker_fee_pct").get_to(c.maker_fee_pct);
    if (j.contains("snapshot_path")) j.at("snapshot_path").get_to(c.snapshot_path);
}

void to_json(nlohmann::json& j, const AggregatorConfig& c) {
    j = nlohmann::json{
        {"timeout_ms", c.timeout_ms},
        {"scan_timeout_ms", c.scan_timeout_ms},
        {"min_profit_pct", c.min_profit_pct},
        {"min_quantity", c.min_quantity},
        {"default_max_quantity", c.default_max_quantity},
        {"base_confidence", c.base_confidence},
        {"monitor_interval_ms", c.monitor_interval_ms},
        {"max_workers", c.max_workers},
        {"max_queued_requests", c.max_queued_requests},
        {"scan_batch_size", c.scan_batch_size},
        {"pairs", c.pairs},
        {"feeds", c.feeds}
    };
}

void from_json(const nlohmann::json& j, AggregatorConfig& c) {
    if (j.contains("timeout_ms")) j.at("timeout_ms").get_to(c.timeout_ms);
    if (j.contains("scan_timeout_ms")) j.at("scan_timeout_ms").get_to(c.scan_timeout_ms);
    if (j.contains("min_profit_pct")) j.at("min_profit_pct").get_to(c.min_profit_pct);
    if (j.contains("min_quantity")) j.at("min_quantity").get_to(c.min_quantity);
    if (j.contains("default_max_quantity")) j.at("default_max_quantity").get_to(c.default_max_quantity);
    if (j.contains("base_confidence")) j.at("base_confidence").get_to(c.base_confidence);
    if (j.contains("monitor_interval_ms")) j.at("monitor_interval_ms").get_to(c.monitor_interval_ms);
    if (j.contains("max_workers")) j.at("max_workers").get_to(c.max_workers);
    if (j.contains("max_queued_requests")) j.at("max_queued_requests").get_to(c.max_queued_requests);
    if (j.contains("scan_batch_size")) j.at("scan_batch_size").get_to(c.scan_batch_size);
    if (j.contains("pairs")) j.at("pairs").get_to(c.pairs);
    if (j.contains("feeds")) j.at("feeds").get_to(c.feeds);
}

void to_json(nlohmann::json& j, const StatArbConfig& c) {
    j = nlohmann::json{
        {"lookback_days", c.lookback_days},
        {"max_history_points", c.max_history_points},
        {"min_samples", c.min_samples},
        {"cache_minutes", c.cache_minutes},
        {"entry_threshold", c.entry_threshold},
        {"exit_threshold", c.exit_threshold},
        {"stop_threshold", c.stop_threshold},
        {"min_correlation", c.min_correlation}
    };
}

void from_json(const nlohmann::json& j, StatArbConfig& c) {
    if (j.contains("lookback_days")) j.at("lookback_days").get_to(c.lookback_days);
    if (j.contains("max_history_points")) j.at("max_history_points").get_to(c.max_history_points);
    if (j.contains("min_samples")) j.at("min_samples").get_to(c.min_samples);
    if (j.contains("cache_minutes")) j.at("cache_minutes").get_to(c.cache_minutes);
    if (j.contains("entry_threshold")) j.at("entry_threshold").get_to(c.entry_threshold);
    if (j.contains("exit_threshold")) j.at("exit_threshold").get_to(c.exit_threshold);
    if (j.contains("stop_threshold")) j.at("stop_threshold").get_to(c.stop_threshold);
    if (j.contains("min_correlation")) j.at("min_correlation").get_to(c.min_correlation);

    if (c.stop_threshold <= c.entry_threshold) {
        spdlog::warn("stat_arb.stop_threshold {} not above entry_threshold {}, using {}",
                     c.stop_threshold, c.entry_threshold, 2.0 * c.entry_threshold);
        c.stop_threshold = 2.0 * c.entry_threshold;
    }
}

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"rest_url", c.rest_url},
        {"request_timeout_ms", c.request_timeout_ms},
        {"min_request_interval_ms", c.min_request_interval_ms},
        {"rate_limit_backoff_ms", c.rate_limit_backoff_ms}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (j.contains("rest_url")) j.at("rest_url").get_to(c.rest_url);
    if (j.contains("request_timeout_ms")) j.at("request_timeout_ms").get_to(c.request_timeout_ms);
    if (j.contains("min_request_interval_ms")) j.at("min_request_interval_ms").get_to(c.min_request_interval_ms);
    if (j.contains("rate_limit_backoff_ms")) j.at("rate_limit_backoff_ms").get_to(c.rate_limit_backoff_ms);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = nlohmann::json{
        {"triangular", c.triangular},
        {"aggregator", c.aggregator},
        {"stat_arb", c.stat_arb},
        {"connection", c.connection},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    if (j.contains("triangular")) j.at("triangular").get_to(c.triangular);
    if (j.contains("aggregator")) j.at("aggregator").get_to(c.aggregator);
    if (j.contains("stat_arb")) j.at("stat_arb").get_to(c.stat_arb);
    if (j.contains("connection")) j.at("connection").get_to(c.connection);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

EngineConfig EngineConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }

    EngineConfig config;
    from_json(j, config);

    // Environment override for the REST endpoint (sandbox / proxy)
    config.connection.rest_url = get_env("ARBSCAN_REST_URL", config.connection.rest_url);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void EngineConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool EngineConfig::validate() const {
    if (triangular.fee_pct < 0 || triangular.fee_pct >= 100) {
        spdlog::error("triangular.fee_pct must be in [0, 100)");
        return false;
    }

    if (triangular.batch_size <= 0) {
        spdlog::error("triangular.batch_size must be positive");
        return false;
    }

    if (triangular.batch_delay_ms < 0) {
        spdlog::error("triangular.batch_delay_ms must be non-negative");
        return false;
    }

    if (triangular.start_amount <= 0) {
        spdlog::error("triangular.start_amount must be positive");
        return false;
    }

    if (aggregator.timeout_ms <= 0 || aggregator.scan_timeout_ms <= 0) {
        spdlog::error("aggregator timeouts must be positive");
        return false;
    }

    if (aggregator.max_workers <= 0 || aggregator.max_queued_requests <= 0 ||
        aggregator.scan_batch_size <= 0) {
        spdlog::error("aggregator.max_workers, max_queued_requests and scan_batch_size must be positive");
        return false;
    }

    if (aggregator.min_quantity <= 0) {
        spdlog::error("aggregator.min_quantity must be positive");
        return false;
    }

    for (const auto& feed : aggregator.feeds) {
        if (feed.name.empty()) {
            spdlog::error("aggregator.feeds entries need a name");
            return false;
        }
        if (feed.type != "cex" && feed.type != "dex") {
            spdlog::error("feed {}: type must be cex or dex, got '{}'", feed.name, feed.type);
            return false;
        }
    }

    if (stat_arb.lookback_days <= 0 || stat_arb.max_history_points <= 0) {
        spdlog::error("stat_arb.lookback_days and max_history_points must be positive");
        return false;
    }

    if (stat_arb.min_samples < 2) {
        spdlog::error("stat_arb.min_samples must be at least 2");
        return false;
    }

    if (stat_arb.entry_threshold <= 0) {
        spdlog::error("stat_arb.entry_threshold must be positive");
        return false;
    }

    if (stat_arb.exit_threshold < 0 || stat_arb.exit_threshold >= stat_arb.entry_threshold) {
        spdlog::error("stat_arb.exit_threshold must be in [0, entry_threshold)");
        return false;
    }

    if (stat_arb.min_samples > stat_arb.max_history_points) {
        spdlog::warn("stat_arb.min_samples exceeds max_history_points, correlations will never be computed");
    }

    return true;
}

std::string EngineConfig::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace arbscan
