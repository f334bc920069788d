#include "factor/factor_ranking_service.hpp"

#include <iostream>
#include <set>

#include "date_utils.hpp"
#include "factor/factor_ranking_engine.hpp"

FactorRankingService::FactorRankingService(const IReturnMetricsStore& metrics, const FactorStrategyCatalog& catalog,
                                           IRankingStore& rankings)
    : metrics_(metrics)
    , catalog_(catalog)
    , rankings_(rankings) {}

RankingRunStats FactorRankingService::run(const std::vector<std::string>& strategyNames,
                                          const std::string& startDate, const std::string& endDate,
                                          RecomputeMode mode) {
    /* Validate everything before touching data */
    if (!dates::isValid(startDate) || !dates::isValid(endDate) || startDate > endDate) {
        throw ConfigurationError("invalid date range: " + startDate + " ~ " + endDate);
    }

    std::vector<const FactorStrategy*> strategies;
    const auto                         names = strategyNames.empty() ? catalog_.names() : strategyNames;
    for (const auto& name : names) {
        strategies.push_back(&catalog_.get(name));
    }

    const auto earliest = metrics_.dateRange().first;

    RankingRunStats stats;
    for (const auto* strategy : strategies) {
        std::cerr << "Ranking factor strategy " << strategy->name << " (" << startDate << " ~ " << endDate
                  << ")..." << std::endl;

        /* Bulk fetch: the range plus one lookback of history before it */
        const auto lookback = strategy->lookbackDays();
        const auto rows     = metrics_.fetch(dates::addDays(startDate, 1 - lookback), endDate);

        std::set<std::string> datesWithData;
        for (const auto& r : rows) {
            datesWithData.insert(r.date);
        }

        std::size_t computed = 0;
        std::size_t skipped  = 0;
        for (const auto& date : dates::range(startDate, endDate)) {
            if (datesWithData.count(date) == 0) {
                std::cerr << "  [WARN] " << date << " - no return metrics" << std::endl;
                stats.emptyDates++;
                continue;
            }

            if (mode == RecomputeMode::Incremental && rankings_.hasResults(strategy->name, date)) {
                stats.skippedDates++;
                skipped++;
                continue;
            }

            if (!FactorRankingEngine::hasSufficientHistory(*strategy, earliest, date)) {
                std::cerr << "  [WARN] " << date << " - less than " << lookback << " days of history" << std::endl;
                stats.insufficientDates++;
                continue;
            }

            const auto                      windowStart = dates::addDays(date, 1 - lookback);
            std::vector<ReturnMetricRecord> history;
            for (const auto& r : rows) {
                if (r.date >= windowStart && r.date <= date) {
                    history.push_back(r);
                }
            }

            const auto results = FactorRankingEngine::rank(*strategy, date, history);
            stats.rowsWritten += rankings_.replace(strategy->name, date, results);
            stats.computedDates++;
            computed++;
        }

        std::cerr << "  [OK] " << strategy->name << ": " << computed << " computed, " << skipped << " skipped"
                  << std::endl;
    }

    return stats;
}
