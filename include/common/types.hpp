#pragma once

#include <string>
#include <chrono>
#include <functional>
#include <cstdint>

namespace arbscan {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

// Wall clock source. Components that expire or trim by time take one of these
// so tests can drive time explicitly.
using ClockFn = std::function<WallClock()>;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

using Price = double;
using Size = double;

// Side of a single leg
enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "buy" : "sell";
}

// Direction of a hop through a trading pair. UNKNOWN marks a hop whose
// currencies match neither orientation of the pair.
enum class LegDirection {
    BUY,
    SELL,
    UNKNOWN
};

inline std::string direction_to_string(LegDirection d) {
    switch (d) {
        case LegDirection::BUY: return "buy";
        case LegDirection::SELL: return "sell";
        case LegDirection::UNKNOWN: return "unknown";
    }
    return "unknown";
}

// Venue classification
enum class ExchangeType {
    CEX,
    DEX
};

inline std::string exchange_type_to_string(ExchangeType t) {
    return t == ExchangeType::DEX ? "dex" : "cex";
}

inline ExchangeType exchange_type_from_string(const std::string& s) {
    return s == "dex" ? ExchangeType::DEX : ExchangeType::CEX;
}

// Best bid/ask snapshot for one trading pair
struct Ticker {
    std::string product_id;
    Price bid{0.0};
    Price ask{0.0};
    Price last{0.0};
    WallClock timestamp{};

    Price mid() const {
        if (bid > 0 && ask > 0) return (bid + ask) / 2.0;
        return last;
    }
};

// Tradable product as listed by a venue, e.g. "ETH-BTC"
struct Product {
    std::string product_id;
    std::string base;
    std::string quote;
    bool enabled{true};
};

// Splits "BASE-QUOTE". Returns false when the id has no single separator
// or either side is empty.
inline bool split_product_id(const std::string& product_id, std::string& base, std::string& quote) {
    auto dash = product_id.find('-');
    if (dash == std::string::npos || product_id.find('-', dash + 1) != std::string::npos) {
        return false;
    }
    base = product_id.substr(0, dash);
    quote = product_id.substr(dash + 1);
    return !base.empty() && !quote.empty();
}

inline std::string make_product_id(const std::string& base, const std::string& quote) {
    return base + "-" + quote;
}

} // namespace arbscan
