#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "ranking/ranking_engine.hpp"

/**
 * @brief Persisted ranking results keyed by (strategy, date, trading pair).
 *
 * Writes are whole-key: replace() swaps the full result set of one
 * (strategy, date), never a subset of it.
 */
struct IRankingStore {
    virtual ~IRankingStore() = default;

    [[nodiscard]] virtual bool hasResults(const std::string& strategyName, const std::string& date) const = 0;

    /**
     * @brief Replace every stored row for (strategyName, date) with `results`.
     * @return Number of rows written.
     */
    virtual std::size_t replace(const std::string& strategyName, const std::string& date,
                                const std::vector<RankingResult>& results) = 0;

    /**
     * @brief Rows for one strategy with start <= date <= end, ordered by date then rank.
     */
    [[nodiscard]] virtual std::vector<RankingResult> fetch(const std::string& strategyName,
                                                           const std::string& startDate,
                                                           const std::string& endDate) const = 0;

    [[nodiscard]] virtual std::size_t count(const std::string& strategyName, const std::string& date) const = 0;
};

class InMemoryRankingStore: public IRankingStore {
   public:
    [[nodiscard]] bool hasResults(const std::string& strategyName, const std::string& date) const override;

    std::size_t replace(const std::string& strategyName, const std::string& date,
                        const std::vector<RankingResult>& results) override;

    [[nodiscard]] std::vector<RankingResult> fetch(const std::string& strategyName, const std::string& startDate,
                                                   const std::string& endDate) const override;

    [[nodiscard]] std::size_t count(const std::string& strategyName, const std::string& date) const override;

    /**
     * @brief Strategy names that have at least one stored date.
     */
    [[nodiscard]] std::vector<std::string> strategies() const;

   private:
    // (strategy, date) -> results ordered by rank
    std::map<std::pair<std::string, std::string>, std::vector<RankingResult>> results_;
};
