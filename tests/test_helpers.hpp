#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ranking/ranking_engine.hpp"
#include "return_metrics.hpp"
#include "strategy/strategy_config.hpp"

namespace testutil {

// Metric row with only the given indicators set.
inline ReturnMetricRecord metricRow(const std::string& pair, const std::string& date,
                                    std::initializer_list<std::pair<Indicator, std::optional<double>>> values) {
    ReturnMetricRecord r;
    r.tradingPair = pair;
    r.date        = date;
    for (const auto& [indicator, value] : values) {
        r.set(indicator, value);
    }
    return r;
}

// Single-component strategy scoring one indicator as-is (no normalization).
inline StrategyConfig rawStrategy(const std::string& name, Indicator indicator = Indicator::Roi1d) {
    ComponentConfig c;
    c.name       = "raw";
    c.indicators = {indicator};
    c.weights    = {1.0};

    StrategyConfig s;
    s.name                     = name;
    s.description              = "raw " + indicatorName(indicator);
    s.components               = {c};
    s.finalCombination.scores  = {"raw"};
    s.finalCombination.weights = {1.0};
    return s;
}

inline RankingResult rankingRow(const std::string& strategy, const std::string& date, const std::string& pair,
                                int rank, double score = 0.0) {
    RankingResult r;
    r.strategyName = strategy;
    r.date         = date;
    r.tradingPair  = pair;
    r.rankPosition = rank;
    r.finalScore   = score;
    return r;
}

// Rows for one date, ranked in the given order (first = rank 1).
inline std::vector<RankingResult> rankedDay(const std::string& strategy, const std::string& date,
                                            const std::vector<std::string>& pairsInRankOrder) {
    std::vector<RankingResult> rows;
    for (std::size_t i = 0; i < pairsInRankOrder.size(); ++i) {
        rows.push_back(rankingRow(strategy, date, pairsInRankOrder[i], static_cast<int>(i + 1),
                                  static_cast<double>(pairsInRankOrder.size() - i)));
    }
    return rows;
}

}  // namespace testutil
