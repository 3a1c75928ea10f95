#include "market_data/coinbase_client.hpp"
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace arbscan {

namespace {

constexpr auto PRODUCTS_CACHE_TTL = std::chrono::hours(1);

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Coinbase encodes numbers as strings
double json_number(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return 0.0;
    const auto& v = j.at(key);
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.empty()) return 0.0;
        try {
            return std::stod(s);
        } catch (const std::exception&) {
            return 0.0;
        }
    }
    return 0.0;
}

} // namespace

CoinbaseClient::CoinbaseClient(const ConnectionConfig& config)
    : config_(config)
    , limiter_(1, std::chrono::milliseconds(config.min_request_interval_ms))
{
    curl_global_init(CURL_GLOBAL_ALL);
    spdlog::info("CoinbaseClient initialized: {}", config_.rest_url);
}

CoinbaseClient::~CoinbaseClient() {
    curl_global_cleanup();
}

CoinbaseClient::HttpResponse CoinbaseClient::http_get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL");
    }

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.request_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw std::runtime_error(std::string("CURL request failed: ") + curl_easy_strerror(res));
    }

    return response;
}

nlohmann::json CoinbaseClient::public_request(const std::string& endpoint) {
    const std::string url = config_.rest_url + endpoint;

    for (int attempt = 0; attempt < 2; ++attempt) {
        limiter_.acquire();

        auto response = http_get(url);

        if (response.status == 429) {
            spdlog::warn("Public API rate-limited (429) on {}, backing off {}ms",
                         endpoint, config_.rate_limit_backoff_ms);
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.rate_limit_backoff_ms));
            continue;
        }

        if (response.status < 200 || response.status >= 300) {
            spdlog::error("Public API HTTP {} for {}: {}", response.status, endpoint,
                          response.body.substr(0, 200));
            throw std::runtime_error(fmt::format("HTTP {} for {}", response.status, endpoint));
        }

        try {
            return nlohmann::json::parse(response.body);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error(fmt::format("Malformed JSON from {}: {}", endpoint, e.what()));
        }
    }

    throw std::runtime_error("Public API request failed after retries: " + endpoint);
}

std::optional<Ticker> CoinbaseClient::parse_ticker(const std::string& product_id, const nlohmann::json& j) {
    Ticker t;
    t.product_id = product_id;
    t.bid = json_number(j, "best_bid");
    t.ask = json_number(j, "best_ask");
    t.timestamp = wall_now();

    if (j.contains("trades") && j.at("trades").is_array() && !j.at("trades").empty()) {
        t.last = json_number(j.at("trades").front(), "price");
    }

    if (t.bid <= 0 && t.ask <= 0 && t.last <= 0) {
        return std::nullopt;
    }
    return t;
}

std::vector<Product> CoinbaseClient::parse_products(const nlohmann::json& j) {
    std::vector<Product> products;
    if (!j.contains("products") || !j.at("products").is_array()) {
        return products;
    }

    for (const auto& p : j.at("products")) {
        Product product;
        product.product_id = p.value("product_id", "");
        product.enabled = !p.value("trading_disabled", false) && !p.value("is_disabled", false);
        split_product_id(product.product_id, product.base, product.quote);
        products.push_back(std::move(product));
    }
    return products;
}

std::optional<Ticker> CoinbaseClient::get_ticker(const std::string& product_id) {
    auto j = public_request("/api/v3/brokerage/market/products/" + product_id + "/ticker");
    return parse_ticker(product_id, j);
}

double CoinbaseClient::get_price(const std::string& product_id) {
    auto ticker = get_ticker(product_id);
    return ticker ? ticker->mid() : 0.0;
}

std::vector<Product> CoinbaseClient::get_products() {
    std::lock_guard<std::mutex> lock(products_mutex_);

    if (!products_cache_.empty() && now() - products_fetched_at_ < PRODUCTS_CACHE_TTL) {
        return products_cache_;
    }

    auto j = public_request("/api/v3/brokerage/market/products");
    products_cache_ = parse_products(j);
    products_fetched_at_ = now();

    spdlog::info("Fetched {} products from {}", products_cache_.size(), config_.rest_url);
    return products_cache_;
}

} // namespace arbscan
