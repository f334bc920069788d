#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "store/ranking_store.hpp"
#include "store/return_metrics_store.hpp"
#include "strategy/strategy_config.hpp"

enum class RecomputeMode
{
    Incremental,  // skip (strategy, date) keys that already have results
    Force         // recompute and replace existing results in full
};

struct RankingRunStats {
    std::size_t computedDates     = 0;  // (strategy, date) keys ranked and written
    std::size_t skippedDates      = 0;  // existing keys left untouched (incremental)
    std::size_t emptyDates        = 0;  // calendar dates with no return metrics
    std::size_t insufficientDates = 0;  // dates with too little history (factor strategies)
    std::size_t rowsWritten       = 0;
};

/**
 * @brief Batch driver: ranks every date of a range for one or more strategies
 *        and writes the results to a ranking store.
 *
 * Metrics are fetched once for the whole range before any ranking starts.
 */
class RankingService {
   public:
    RankingService(const IReturnMetricsStore& metrics, const StrategyCatalog& catalog, IRankingStore& rankings);

    /**
     * @brief Rank [startDate, endDate] for the named strategies.
     *
     * An empty `strategyNames` selects every strategy in the catalog.
     *
     * @throws ConfigurationError for an unknown strategy or a malformed date
     *         range, before any data is read.
     */
    RankingRunStats run(const std::vector<std::string>& strategyNames, const std::string& startDate,
                        const std::string& endDate, RecomputeMode mode);

    /**
     * @brief Convenience overload for a single date.
     */
    RankingRunStats runDate(const std::string& strategyName, const std::string& date, RecomputeMode mode);

   private:
    const IReturnMetricsStore& metrics_;
    const StrategyCatalog&     catalog_;
    IRankingStore&             rankings_;
};
