#pragma once

#include <nlohmann/json.hpp>
#include "arbitrage/price_aggregator.hpp"
#include "arbitrage/stat_arb_analyzer.hpp"
#include "arbitrage/triangular_detector.hpp"

namespace arbscan {

// JSON records handed to the execution layer. Timestamps are ISO 8601 UTC.

void to_json(nlohmann::json& j, const TriangularPath& p);
void to_json(nlohmann::json& j, const PathProfit& p);
void to_json(nlohmann::json& j, const PriceQuote& q);
void to_json(nlohmann::json& j, const AggregatedPrice& a);
void to_json(nlohmann::json& j, const ProfitEstimate& e);
void to_json(nlohmann::json& j, const ArbitrageOpportunity& o);
void to_json(nlohmann::json& j, const PairCorrelation& c);
void to_json(nlohmann::json& j, const ZScoreSignal& s);
void to_json(nlohmann::json& j, const SpreadStatistics& s);

} // namespace arbscan
