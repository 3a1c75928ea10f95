#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "common/types.hpp"

namespace arbscan {

// ============================================================================
// Currency graph for triangular arbitrage
//
// Pairs live in a flat table; adjacency lists hold indices into it, so cycle
// enumeration touches contiguous vectors instead of nested hash maps.
// ============================================================================

struct TriangularPath {
    std::vector<std::string> currencies;     // e.g. ETH, BTC, USDT, ETH
    std::vector<std::string> pairs;          // e.g. ETH-BTC, BTC-USDT, ETH-USDT
    std::vector<LegDirection> directions;    // per leg

    const std::string& start_currency() const { return currencies.front(); }

    // 4 currencies closing the loop, 3 pairs, 3 directions
    bool is_valid() const {
        return currencies.size() == 4 &&
               pairs.size() == 3 &&
               directions.size() == 3 &&
               currencies.front() == currencies.back();
    }

    std::string to_string() const;
};

class CurrencyGraph {
public:
    struct Pair {
        std::string id;
        size_t base;          // currency index
        size_t quote;         // currency index
    };

    struct Edge {
        size_t to;            // currency index
        size_t pair;          // pair index
    };

    /**
     * Rebuilds the graph from a product listing. Disabled products and ids
     * without a single base-quote separator are skipped.
     *
     * @throws std::invalid_argument if products is empty
     * @return number of distinct pairs in the graph
     */
    size_t build(const std::vector<Product>& products);

    void clear();

    /**
     * All 3-hop cycles start -> mid1 -> mid2 -> start, in adjacency order,
     * stopping once max_paths are collected.
     */
    std::vector<TriangularPath> find_triangular_paths(const std::string& start, size_t max_paths = 100) const;

    /**
     * SELL when going base -> quote, BUY when going quote -> base,
     * UNKNOWN (with a warning) when the hop matches neither side.
     */
    LegDirection leg_direction(const std::string& pair_id, const std::string& from, const std::string& to) const;

    bool has_currency(const std::string& currency) const;
    std::vector<std::string> currencies() const { return currencies_; }
    size_t pair_count() const { return pairs_.size(); }
    size_t currency_count() const { return currencies_.size(); }
    std::vector<std::string> neighbors(const std::string& currency) const;

private:
    std::vector<std::string> currencies_;
    std::unordered_map<std::string, size_t> currency_index_;
    std::vector<Pair> pairs_;
    std::unordered_map<std::string, size_t> pair_index_;
    std::vector<std::vector<Edge>> adjacency_;

    size_t intern_currency(const std::string& currency);
    void link(size_t from, size_t to, size_t pair);
    LegDirection leg_direction(size_t pair, size_t from, size_t to) const;
};

} // namespace arbscan
