#pragma once

#include <string>
#include <vector>

#include "factor/factor_strategy.hpp"
#include "ranking/ranking_service.hpp"
#include "store/ranking_store.hpp"
#include "store/return_metrics_store.hpp"

/**
 * @brief Batch driver for factor strategies: ranks every date of a range and
 *        writes the rows to the same ranking store RankingService fills.
 *
 * History for the whole range (plus the longest lookback) is fetched once.
 * Dates the data source cannot cover with enough history are skipped.
 */
class FactorRankingService {
   public:
    FactorRankingService(const IReturnMetricsStore& metrics, const FactorStrategyCatalog& catalog,
                         IRankingStore& rankings);

    /**
     * @brief Rank [startDate, endDate] for the named factor strategies.
     *
     * An empty `strategyNames` selects every strategy in the catalog.
     *
     * @throws ConfigurationError for an unknown strategy or a malformed date
     *         range, before any data is read.
     */
    RankingRunStats run(const std::vector<std::string>& strategyNames, const std::string& startDate,
                        const std::string& endDate, RecomputeMode mode);

   private:
    const IReturnMetricsStore&   metrics_;
    const FactorStrategyCatalog& catalog_;
    IRankingStore&               rankings_;
};
