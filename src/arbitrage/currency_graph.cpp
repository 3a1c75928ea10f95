#include "arbitrage/currency_graph.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace arbscan {

std::string TriangularPath::to_string() const {
    std::string s;
    for (size_t i = 0; i < currencies.size(); ++i) {
        if (i > 0) s += " → ";
        s += currencies[i];
    }
    return s;
}

void CurrencyGraph::clear() {
    currencies_.clear();
    currency_index_.clear();
    pairs_.clear();
    pair_index_.clear();
    adjacency_.clear();
}

size_t CurrencyGraph::intern_currency(const std::string& currency) {
    auto it = currency_index_.find(currency);
    if (it != currency_index_.end()) {
        return it->second;
    }
    size_t idx = currencies_.size();
    currencies_.push_back(currency);
    currency_index_.emplace(currency, idx);
    adjacency_.emplace_back();
    return idx;
}

void CurrencyGraph::link(size_t from, size_t to, size_t pair) {
    // One edge per currency pair: a later listing for the same two
    // currencies (e.g. BTC-ETH after ETH-BTC) replaces the pair in place.
    for (auto& edge : adjacency_[from]) {
        if (edge.to == to) {
            edge.pair = pair;
            return;
        }
    }
    adjacency_[from].push_back({to, pair});
}

size_t CurrencyGraph::build(const std::vector<Product>& products) {
    if (products.empty()) {
        throw std::invalid_argument("Cannot build currency graph from an empty product list");
    }

    clear();

    size_t skipped = 0;
    for (const auto& product : products) {
        if (!product.enabled) {
            spdlog::debug("Skipping disabled product {}", product.product_id);
            skipped++;
            continue;
        }

        std::string base, quote;
        if (!split_product_id(product.product_id, base, quote) || base == quote) {
            spdlog::debug("Skipping malformed product id '{}'", product.product_id);
            skipped++;
            continue;
        }

        size_t b = intern_currency(base);
        size_t q = intern_currency(quote);

        size_t pair_idx;
        auto it = pair_index_.find(product.product_id);
        if (it != pair_index_.end()) {
            pair_idx = it->second;
        } else {
            pair_idx = pairs_.size();
            pairs_.push_back({product.product_id, b, q});
            pair_index_.emplace(product.product_id, pair_idx);
        }

        link(b, q, pair_idx);
        link(q, b, pair_idx);
    }

    if (pairs_.empty()) {
        spdlog::warn("Currency graph is empty: all {} products were disabled or malformed", products.size());
    }

    spdlog::info("Built currency graph with {} pairs across {} currencies ({} skipped)",
                 pairs_.size(), currencies_.size(), skipped);
    return pairs_.size();
}

bool CurrencyGraph::has_currency(const std::string& currency) const {
    return currency_index_.count(currency) > 0;
}

std::vector<std::string> CurrencyGraph::neighbors(const std::string& currency) const {
    std::vector<std::string> out;
    auto it = currency_index_.find(currency);
    if (it == currency_index_.end()) return out;

    for (const auto& edge : adjacency_[it->second]) {
        out.push_back(currencies_[edge.to]);
    }
    return out;
}

LegDirection CurrencyGraph::leg_direction(size_t pair, size_t from, size_t to) const {
    const auto& p = pairs_[pair];
    if (from == p.base && to == p.quote) {
        // Have base, want quote
        return LegDirection::SELL;
    }
    if (from == p.quote && to == p.base) {
        // Have quote, want base
        return LegDirection::BUY;
    }
    spdlog::warn("Invalid hop: {} -> {} via {}", currencies_[from], currencies_[to], p.id);
    return LegDirection::UNKNOWN;
}

LegDirection CurrencyGraph::leg_direction(const std::string& pair_id,
                                          const std::string& from,
                                          const std::string& to) const {
    std::string base, quote;
    if (!split_product_id(pair_id, base, quote)) {
        spdlog::warn("Invalid hop: {} -> {} via malformed pair {}", from, to, pair_id);
        return LegDirection::UNKNOWN;
    }
    if (from == base && to == quote) return LegDirection::SELL;
    if (from == quote && to == base) return LegDirection::BUY;

    spdlog::warn("Invalid hop: {} -> {} via {}", from, to, pair_id);
    return LegDirection::UNKNOWN;
}

std::vector<TriangularPath> CurrencyGraph::find_triangular_paths(const std::string& start,
                                                                 size_t max_paths) const {
    std::vector<TriangularPath> paths;

    auto it = currency_index_.find(start);
    if (it == currency_index_.end()) {
        spdlog::warn("Currency {} not in graph", start);
        return paths;
    }
    if (adjacency_[it->second].empty()) {
        spdlog::warn("Currency {} has no tradable pairs", start);
        return paths;
    }
    if (max_paths == 0) {
        return paths;
    }

    const size_t s = it->second;

    for (const auto& hop1 : adjacency_[s]) {
        const size_t mid1 = hop1.to;
        if (mid1 == s) continue;

        for (const auto& hop2 : adjacency_[mid1]) {
            const size_t mid2 = hop2.to;
            if (mid2 == s || mid2 == mid1) continue;

            // Close the loop back to start
            for (const auto& hop3 : adjacency_[mid2]) {
                if (hop3.to != s) continue;

                TriangularPath path;
                path.currencies = {start, currencies_[mid1], currencies_[mid2], start};
                path.pairs = {pairs_[hop1.pair].id, pairs_[hop2.pair].id, pairs_[hop3.pair].id};
                path.directions = {
                    leg_direction(hop1.pair, s, mid1),
                    leg_direction(hop2.pair, mid1, mid2),
                    leg_direction(hop3.pair, mid2, s),
                };
                paths.push_back(std::move(path));

                if (paths.size() >= max_paths) {
                    return paths;
                }
                break;
            }
        }
    }

    spdlog::debug("Found {} triangular paths from {}", paths.size(), start);
    return paths;
}

} // namespace arbscan
