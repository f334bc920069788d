#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "return_metrics.hpp"

/**
 * @brief Read-only source of ReturnMetricRecord rows.
 */
struct IReturnMetricsStore {
    virtual ~IReturnMetricsStore() = default;

    /**
     * @brief All records with start <= date <= end, in no particular order.
     */
    [[nodiscard]] virtual std::vector<ReturnMetricRecord> fetch(const std::string& startDate,
                                                                const std::string& endDate) const = 0;

    /**
     * @brief Earliest and latest dates held; empty strings if there are none.
     */
    [[nodiscard]] virtual std::pair<std::string, std::string> dateRange() const = 0;
};

/**
 * @brief Record set held in memory, keyed by (trading pair, date).
 */
class InMemoryReturnMetricsStore: public IReturnMetricsStore {
   public:
    /**
     * @brief Insert or replace the record for (tradingPair, date).
     */
    void upsert(ReturnMetricRecord record);

    [[nodiscard]] std::vector<ReturnMetricRecord> fetch(const std::string& startDate,
                                                        const std::string& endDate) const override;

    [[nodiscard]] std::pair<std::string, std::string> dateRange() const override;

    [[nodiscard]] std::size_t size() const;

   private:
    // date -> trading pair -> record
    std::map<std::string, std::map<std::string, ReturnMetricRecord>> records_;
};
