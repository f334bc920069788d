#include "ranking/ranking_service.hpp"

#include <iostream>
#include <map>

#include "date_utils.hpp"
#include "ranking/ranking_engine.hpp"

RankingService::RankingService(const IReturnMetricsStore& metrics, const StrategyCatalog& catalog,
                               IRankingStore& rankings)
    : metrics_(metrics)
    , catalog_(catalog)
    , rankings_(rankings) {}

RankingRunStats RankingService::run(const std::vector<std::string>& strategyNames, const std::string& startDate,
                                    const std::string& endDate, RecomputeMode mode) {
    /* Validate everything before touching data */
    if (!dates::isValid(startDate) || !dates::isValid(endDate) || startDate > endDate) {
        throw ConfigurationError("invalid date range: " + startDate + " ~ " + endDate);
    }

    std::vector<const StrategyConfig*> strategies;
    const auto                         names = strategyNames.empty() ? catalog_.names() : strategyNames;
    for (const auto& name : names) {
        strategies.push_back(&catalog_.get(name));
    }

    /* Bulk fetch, grouped by date */
    std::map<std::string, std::vector<ReturnMetricRecord>> byDate;
    for (auto& r : metrics_.fetch(startDate, endDate)) {
        auto date = r.date;
        byDate[date].push_back(std::move(r));
    }

    RankingRunStats stats;
    for (const auto* strategy : strategies) {
        std::cerr << "Ranking strategy " << strategy->name << " (" << startDate << " ~ " << endDate << ")..."
                  << std::endl;

        std::size_t computed = 0;
        std::size_t skipped  = 0;
        for (const auto& date : dates::range(startDate, endDate)) {
            const auto it = byDate.find(date);
            if (it == byDate.end()) {
                std::cerr << "  [WARN] " << date << " - no return metrics" << std::endl;
                stats.emptyDates++;
                continue;
            }

            if (mode == RecomputeMode::Incremental && rankings_.hasResults(strategy->name, date)) {
                stats.skippedDates++;
                skipped++;
                continue;
            }

            const auto results = RankingEngine::rank(*strategy, date, it->second);
            stats.rowsWritten += rankings_.replace(strategy->name, date, results);
            stats.computedDates++;
            computed++;
        }

        std::cerr << "  [OK] " << strategy->name << ": " << computed << " computed, " << skipped << " skipped"
                  << std::endl;
    }

    return stats;
}

RankingRunStats RankingService::runDate(const std::string& strategyName, const std::string& date,
                                        RecomputeMode mode) {
    return run({strategyName}, date, date, mode);
}
