#pragma once

#include <optional>
#include <string>
#include <vector>

#include "factor/factor_strategy.hpp"
#include "ranking/ranking_engine.hpp"
#include "return_metrics.hpp"

/**
 * @brief Ranks trading pairs on one date from each pair's own return history.
 *
 * Stateless, like RankingEngine, and produces the same RankingResult rows, so
 * its output can be stored and backtested the same way.
 */
class FactorRankingEngine {
   public:
    /**
     * @brief Rank every pair with history up to and including `date`.
     *
     * Rows dated after `date` are ignored. A pair is left out when it was
     * first seen fewer than `skipFirstNDays` days before `date`, when none of
     * its factors is computable, or when its final score is not finite.
     * Ties are broken by trading pair ascending.
     *
     * @param history Rows of any number of pairs and dates, in any order.
     * @throws ConfigurationError if the strategy is malformed.
     */
    [[nodiscard]] static std::vector<RankingResult> rank(const FactorStrategy& strategy, const std::string& date,
                                                         const std::vector<ReturnMetricRecord>& history);

    /**
     * @brief One factor over one pair's rows (oldest first, one entry per row,
     *        absent values as nullopt).
     *
     * Only the last `window` rows are used. NaN when fewer than
     * max(2, min(window / 4, 3)) rows are available.
     */
    [[nodiscard]] static double factorScore(const FactorConfig&                       factor,
                                            const std::vector<std::optional<double>>& rows);

    /**
     * @brief Weighted mean of the ranking factors, skipping NaN ones; the
     *        weights of the factors used are renormalized to sum to 1.
     * @param factorScores One score per FactorStrategy::factors entry.
     * @return NaN when no weighted factor is computable.
     */
    [[nodiscard]] static double combine(const FactorStrategy& strategy, const std::vector<double>& factorScores);

    /**
     * @brief Whether the data source holds enough history to rank `date`:
     *        at least lookbackDays() calendar days from `earliestDate`
     *        through `date`, inclusive.
     */
    [[nodiscard]] static bool hasSufficientHistory(const FactorStrategy& strategy, const std::string& earliestDate,
                                                   const std::string& date);

   private:
    static std::string formatCombination(const FactorStrategy& strategy, const std::vector<double>& factorScores,
                                         double finalScore);
};
