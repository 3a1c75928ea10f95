#include "arbitrage/record_json.hpp"
#include "utils/time_utils.hpp"

namespace arbscan {

void to_json(nlohmann::json& j, const TriangularPath& p) {
    std::vector<std::string> directions;
    directions.reserve(p.directions.size());
    for (auto d : p.directions) {
        directions.push_back(direction_to_string(d));
    }

    j = nlohmann::json{
        {"currencies", p.currencies},
        {"pairs", p.pairs},
        {"directions", directions},
        {"route", p.to_string()}
    };
}

void to_json(nlohmann::json& j, const PathProfit& p) {
    j = nlohmann::json{
        {"path", p.path},
        {"start_amount", p.start_amount},
        {"end_amount", p.end_amount},
        {"profit", p.profit},
        {"profit_pct", p.profit_pct},
        {"rates", p.rates},
        {"fees", p.fees},
        {"is_profitable", p.is_profitable},
        {"timestamp", time_utils::to_iso8601(p.timestamp)}
    };
}

void to_json(nlohmann::json& j, const PriceQuote& q) {
    j = nlohmann::json{
        {"exchange", q.exchange},
        {"exchange_type", exchange_type_to_string(q.exchange_type)},
        {"base", q.base},
        {"quote", q.quote},
        {"bid", q.bid},
        {"ask", q.ask},
        {"taker_fee_pct", q.taker_fee_pct},
        {"maker_fee_pct", q.maker_fee_pct},
        {"timestamp", time_utils::to_iso8601(q.timestamp)}
    };
    j["gas_estimate_usd"] = q.gas_estimate_usd ? nlohmann::json(*q.gas_estimate_usd) : nlohmann::json();
    j["chain_id"] = q.chain_id ? nlohmann::json(*q.chain_id) : nlohmann::json();
}

void to_json(nlohmann::json& j, const AggregatedPrice& a) {
    j = nlohmann::json{
        {"product_id", a.product_id()},
        {"base", a.base},
        {"quote", a.quote},
        {"timestamp", time_utils::to_iso8601(a.timestamp)},
        {"quotes", a.all_quotes}
    };
    j["best_buy"] = a.best_buy ? nlohmann::json(*a.best_buy) : nlohmann::json();
    j["best_sell"] = a.best_sell ? nlohmann::json(*a.best_sell) : nlohmann::json();

    auto spread = a.spread();
    auto spread_pct = a.spread_pct();
    j["spread"] = spread ? nlohmann::json(*spread) : nlohmann::json();
    j["spread_pct"] = spread_pct ? nlohmann::json(*spread_pct) : nlohmann::json();
}

void to_json(nlohmann::json& j, const ProfitEstimate& e) {
    j = nlohmann::json{
        {"quantity", e.quantity},
        {"buy_exchange", e.buy_exchange},
        {"buy_price", e.buy_price},
        {"buy_cost", e.buy_cost},
        {"sell_exchange", e.sell_exchange},
        {"sell_price", e.sell_price},
        {"sell_revenue", e.sell_revenue},
        {"gross_profit", e.gross_profit},
        {"net_profit", e.net_profit},
        {"net_profit_pct", e.net_profit_pct},
        {"is_profitable", e.is_profitable}
    };
}

void to_json(nlohmann::json& j, const ArbitrageOpportunity& o) {
    j = nlohmann::json{
        {"id", o.id},
        {"timestamp", time_utils::to_iso8601(o.timestamp)},
        {"product_id", o.product_id},
        {"base", o.base},
        {"quote", o.quote},
        {"buy_exchange", o.buy_exchange},
        {"buy_exchange_type", exchange_type_to_string(o.buy_exchange_type)},
        {"buy_price", o.buy_price},
        {"sell_exchange", o.sell_exchange},
        {"sell_exchange_type", exchange_type_to_string(o.sell_exchange_type)},
        {"sell_price", o.sell_price},
        {"spread", o.spread},
        {"spread_pct", o.spread_pct},
        {"estimated_profit", o.estimated_profit},
        {"estimated_profit_pct", o.estimated_profit_pct},
        {"max_quantity", o.max_quantity},
        {"min_quantity", o.min_quantity},
        {"expires_at", time_utils::to_iso8601(o.expires_at)},
        {"confidence", o.confidence}
    };
}

void to_json(nlohmann::json& j, const PairCorrelation& c) {
    j = nlohmann::json{
        {"pair_1", c.pair_1},
        {"pair_2", c.pair_2},
        {"correlation", c.correlation},
        {"cointegration_pvalue", c.cointegration_pvalue},
        {"hedge_ratio", c.hedge_ratio},
        {"lookback_days", c.lookback_days},
        {"sample_size", c.sample_size},
        {"is_cointegrated", c.is_cointegrated}
    };
}

void to_json(nlohmann::json& j, const ZScoreSignal& s) {
    j = nlohmann::json{
        {"pair_1", s.pair_1},
        {"pair_2", s.pair_2},
        {"z_score", s.z_score},
        {"direction", spread_direction_to_string(s.direction)},
        {"confidence", s.confidence},
        {"timestamp", time_utils::to_iso8601(s.timestamp)}
    };
    // Leg actions only mean something for an entry
    if (s.is_entry()) {
        j["pair_1_action"] = side_to_string(s.pair_1_action());
        j["pair_2_action"] = side_to_string(s.pair_2_action());
    }
}

void to_json(nlohmann::json& j, const SpreadStatistics& s) {
    j = nlohmann::json{
        {"pair_1", s.pair_1},
        {"pair_2", s.pair_2},
        {"correlation", s.correlation},
        {"hedge_ratio", s.hedge_ratio},
        {"is_cointegrated", s.is_cointegrated},
        {"current_spread", s.current_spread},
        {"mean_spread", s.mean_spread},
        {"std_spread", s.std_spread},
        {"z_score", s.z_score},
        {"min_spread", s.min_spread},
        {"max_spread", s.max_spread},
        {"sample_size", s.sample_size}
    };
}

} // namespace arbscan
