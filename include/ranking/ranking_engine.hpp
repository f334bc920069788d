#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "return_metrics.hpp"
#include "strategy/strategy_config.hpp"

struct RankingResult {
    std::string strategyName;
    std::string date;
    std::string tradingPair;

    /* ----- Component scores, in StrategyConfig::components order ----- */
    std::vector<std::string> componentNames;
    std::vector<double>      componentScores;

    double finalScore   = 0.0;
    int    rankPosition = 0;  // 1 = best

    /**
     * @brief Audit text of the final blend.
     * @example "short(0.1200)*0.700 + long(0.0300)*0.300 = 0.0930"
     */
    std::string combination;
};

/**
 * @brief Turns one date's cross-section of return metrics into a ranked list.
 *
 * Stateless; every call is a pure function of its arguments.
 */
class RankingEngine {
   public:
    /**
     * @brief Rank every trading pair of `date` under `strategy`.
     *
     * Records whose date differs from `date` are ignored. Absent indicator
     * values count as 0. Ties on final score are broken by trading pair
     * ascending, so ranks are always exactly 1..N.
     *
     * @throws ConfigurationError if the strategy is malformed.
     * @return One result per trading pair, ordered by rank. Empty when the
     *         cross-section has no record for `date`.
     */
    [[nodiscard]] static std::vector<RankingResult> rank(const StrategyConfig& strategy, const std::string& date,
                                                         const std::vector<ReturnMetricRecord>& crossSection);

    /**
     * @brief Score every member of a cross-section for one component.
     * @param members Records of a single date.
     * @return One score per member, same order.
     */
    [[nodiscard]] static std::vector<double> componentScores(const ComponentConfig&                 component,
                                                             const std::vector<ReturnMetricRecord>& members);

   private:
    /**
     * @brief Pull one indicator across all members, absent values as 0.
     */
    static std::vector<double> extract(Indicator indicator, const std::vector<ReturnMetricRecord>& members);

    static std::string formatCombination(const StrategyConfig& strategy, const std::vector<double>& scores,
                                         double finalScore);
};
