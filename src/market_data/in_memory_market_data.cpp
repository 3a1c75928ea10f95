#include "market_data/in_memory_market_data.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace arbscan {

std::shared_ptr<InMemoryMarketData> InMemoryMarketData::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open market snapshot: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed market snapshot " + path + ": " + e.what());
    }

    auto data = std::make_shared<InMemoryMarketData>();

    if (j.contains("tickers")) {
        for (const auto& [product_id, t] : j.at("tickers").items()) {
            data->set_ticker(product_id,
                            t.value("bid", 0.0),
                            t.value("ask", 0.0),
                            t.value("last", 0.0));
        }
    }

    if (j.contains("products")) {
        std::vector<Product> products;
        for (const auto& p : j.at("products")) {
            Product product;
            product.product_id = p.value("product_id", "");
            product.enabled = !p.value("trading_disabled", false);
            split_product_id(product.product_id, product.base, product.quote);
            products.push_back(std::move(product));
        }
        data->set_products(std::move(products));
    }

    spdlog::info("Loaded market snapshot {}: {} tickers", path, data->tickers_.size());
    return data;
}

void InMemoryMarketData::set_ticker(const std::string& product_id, Price bid, Price ask, Price last) {
    std::lock_guard<std::mutex> lock(mutex_);
    Ticker t;
    t.product_id = product_id;
    t.bid = bid;
    t.ask = ask;
    t.last = last;
    t.timestamp = wall_now();
    tickers_[product_id] = t;
}

void InMemoryMarketData::remove_ticker(const std::string& product_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    tickers_.erase(product_id);
}

void InMemoryMarketData::add_product(const std::string& product_id, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    Product p;
    p.product_id = product_id;
    p.enabled = enabled;
    split_product_id(product_id, p.base, p.quote);
    products_.push_back(std::move(p));
    explicit_products_ = true;
}

void InMemoryMarketData::set_products(std::vector<Product> products) {
    std::lock_guard<std::mutex> lock(mutex_);
    products_ = std::move(products);
    explicit_products_ = true;
}

void InMemoryMarketData::fail_product(const std::string& product_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_.insert(product_id);
}

std::optional<Ticker> InMemoryMarketData::get_ticker(const std::string& product_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ticker_requests_++;

    if (failing_.count(product_id)) {
        throw std::runtime_error("ticker request failed for " + product_id);
    }

    auto it = tickers_.find(product_id);
    if (it == tickers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double InMemoryMarketData::get_price(const std::string& product_id) {
    auto ticker = get_ticker(product_id);
    return ticker ? ticker->mid() : 0.0;
}

std::vector<Product> InMemoryMarketData::get_products() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (explicit_products_) {
        return products_;
    }

    std::vector<Product> listed;
    listed.reserve(tickers_.size());
    for (const auto& [product_id, ticker] : tickers_) {
        Product p;
        p.product_id = product_id;
        split_product_id(product_id, p.base, p.quote);
        listed.push_back(std::move(p));
    }
    return listed;
}

int InMemoryMarketData::ticker_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ticker_requests_;
}

} // namespace arbscan
