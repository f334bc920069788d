#include "store/ranking_store.hpp"

#include <algorithm>

bool InMemoryRankingStore::hasResults(const std::string& strategyName, const std::string& date) const {
    const auto it = results_.find({strategyName, date});
    return it != results_.end() && !it->second.empty();
}

std::size_t InMemoryRankingStore::replace(const std::string& strategyName, const std::string& date,
                                          const std::vector<RankingResult>& results) {
    auto rows = results;
    std::sort(rows.begin(), rows.end(),
              [](const RankingResult& a, const RankingResult& b) { return a.rankPosition < b.rankPosition; });

    const auto n                   = rows.size();
    results_[{strategyName, date}] = std::move(rows);
    return n;
}

std::vector<RankingResult> InMemoryRankingStore::fetch(const std::string& strategyName, const std::string& startDate,
                                                       const std::string& endDate) const {
    std::vector<RankingResult> out;
    for (auto it = results_.lower_bound({strategyName, startDate});
         it != results_.end() && it->first.first == strategyName && it->first.second <= endDate; ++it) {
        out.insert(out.end(), it->second.begin(), it->second.end());
    }
    return out;
}

std::size_t InMemoryRankingStore::count(const std::string& strategyName, const std::string& date) const {
    const auto it = results_.find({strategyName, date});
    return it == results_.end() ? 0 : it->second.size();
}

std::vector<std::string> InMemoryRankingStore::strategies() const {
    std::vector<std::string> names;
    for (const auto& [key, rows] : results_) {
        if (!rows.empty() && (names.empty() || names.back() != key.first)) {
            names.push_back(key.first);
        }
    }
    return names;
}
