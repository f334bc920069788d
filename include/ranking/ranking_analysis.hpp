#pragma once

#include <string>
#include <vector>

#include "ranking/ranking_engine.hpp"

/**
 * @brief One uninterrupted stay of a trading pair near the top of a ranking.
 */
struct PersistenceStreak {
    std::string eventId;  // "<strategy>_<pair>_(<n>)", n counts the pair's streaks from 1
    std::string strategyName;
    std::string tradingPair;

    std::string entryDate;
    int         entryRank = 0;
    std::string exitDate;      // last date still inside the hold band
    int         exitRank = 0;

    int consecutiveDays = 0;
    int cumulativeDays  = 0;  // running total of consecutiveDays for this pair

    int triggerRank = 0;  // X: rank needed to start a streak
    int holdRank    = 0;  // Y: rank needed to keep it going
};

struct TopOverlap {
    std::vector<std::string> common;  // pairs in both top-N lists, sorted
    double                   rate = 0.0;  // common.size() / n
};

class RankingAnalysis {
   public:
    /**
     * @brief Find streaks where a pair enters the top `triggerRank` and then
     *        stays within the top `holdRank` on consecutive calendar days.
     *
     * A date already covered by an earlier streak of the same pair cannot
     * start a new one. A missing date ends the streak.
     *
     * @param rankings Rows of one strategy, any order.
     * @throws ConfigurationError if triggerRank < 1 or triggerRank > holdRank.
     * @return Streaks ordered by trading pair, then entry date.
     */
    [[nodiscard]] static std::vector<PersistenceStreak> persistenceStreaks(const std::vector<RankingResult>& rankings,
                                                                           int triggerRank, int holdRank);

    /**
     * @brief Compare the top `n` of two ranked lists of the same date.
     */
    [[nodiscard]] static TopOverlap topOverlap(const std::vector<RankingResult>& a,
                                               const std::vector<RankingResult>& b, int n);

   private:
    static std::vector<std::string> topPairs(const std::vector<RankingResult>& results, int n);
};
