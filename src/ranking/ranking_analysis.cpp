#include "ranking/ranking_analysis.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <tuple>
#include <utility>

#include "configuration_error.hpp"
#include "date_utils.hpp"

std::vector<PersistenceStreak> RankingAnalysis::persistenceStreaks(const std::vector<RankingResult>& rankings,
                                                                   int triggerRank, int holdRank) {
    if (triggerRank < 1 || triggerRank > holdRank) {
        throw ConfigurationError("persistence: trigger rank " + std::to_string(triggerRank)
                                 + " must be in [1, " + std::to_string(holdRank) + "]");
    }

    // date -> pair -> rank
    std::map<std::string, std::map<std::string, int>> byDate;
    for (const auto& r : rankings) {
        byDate[r.date][r.tradingPair] = r.rankPosition;
    }

    const auto rankOn = [&byDate](const std::string& date, const std::string& pair) {
        const auto day = byDate.find(date);
        if (day == byDate.end()) {
            return 0;
        }
        const auto it = day->second.find(pair);
        return it == day->second.end() ? 0 : it->second;
    };

    std::set<std::pair<std::string, std::string>> covered;  // (pair, date)
    std::vector<PersistenceStreak>                streaks;

    for (const auto& [date, ranks] : byDate) {
        // Trigger candidates in rank order
        std::vector<std::pair<int, std::string>> triggered;
        for (const auto& [pair, rank] : ranks) {
            if (rank <= triggerRank) {
                triggered.emplace_back(rank, pair);
            }
        }
        std::sort(triggered.begin(), triggered.end());

        for (const auto& [entryRank, pair] : triggered) {
            if (covered.count({pair, date})) {
                continue;
            }

            PersistenceStreak s;
            s.strategyName = rankings.front().strategyName;
            s.tradingPair  = pair;
            s.entryDate    = date;
            s.entryRank    = entryRank;
            s.triggerRank  = triggerRank;
            s.holdRank     = holdRank;

            auto current = date;
            for (;;) {
                const int rank = rankOn(current, pair);
                if (rank == 0 || rank > holdRank) {
                    break;
                }
                covered.insert({pair, current});
                s.exitDate = current;
                s.exitRank = rank;
                s.consecutiveDays++;
                current = dates::nextDay(current);
            }
            streaks.push_back(std::move(s));
        }
    }

    std::sort(streaks.begin(), streaks.end(), [](const PersistenceStreak& a, const PersistenceStreak& b) {
        return std::tie(a.tradingPair, a.entryDate) < std::tie(b.tradingPair, b.entryDate);
    });

    std::map<std::string, std::pair<int, int>> perPair;  // pair -> (streak count, cumulative days)
    for (auto& s : streaks) {
        auto& [count, total] = perPair[s.tradingPair];
        count++;
        total += s.consecutiveDays;
        s.cumulativeDays = total;
        s.eventId        = s.strategyName + "_" + s.tradingPair + "_(" + std::to_string(count) + ")";
    }
    return streaks;
}

std::vector<std::string> RankingAnalysis::topPairs(const std::vector<RankingResult>& results, int n) {
    std::vector<std::string> pairs;
    for (const auto& r : results) {
        if (r.rankPosition >= 1 && r.rankPosition <= n) {
            pairs.push_back(r.tradingPair);
        }
    }
    std::sort(pairs.begin(), pairs.end());
    pairs.erase(std::unique(pairs.begin(), pairs.end()), pairs.end());
    return pairs;
}

TopOverlap RankingAnalysis::topOverlap(const std::vector<RankingResult>& a, const std::vector<RankingResult>& b,
                                       int n) {
    TopOverlap overlap;
    if (n < 1) {
        return overlap;
    }

    const auto topA = topPairs(a, n);
    const auto topB = topPairs(b, n);
    std::set_intersection(topA.begin(), topA.end(), topB.begin(), topB.end(), std::back_inserter(overlap.common));

    overlap.rate = static_cast<double>(overlap.common.size()) / static_cast<double>(n);
    return overlap;
}
