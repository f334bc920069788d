#include "store/return_metrics_store.hpp"

void InMemoryReturnMetricsStore::upsert(ReturnMetricRecord record) {
    auto& byPair = records_[record.date];
    const auto pair = record.tradingPair;
    byPair[pair]    = std::move(record);
}

std::vector<ReturnMetricRecord> InMemoryReturnMetricsStore::fetch(const std::string& startDate,
                                                                  const std::string& endDate) const {
    std::vector<ReturnMetricRecord> result;
    for (auto it = records_.lower_bound(startDate); it != records_.end() && it->first <= endDate; ++it) {
        for (const auto& [pair, record] : it->second) {
            result.push_back(record);
        }
    }
    return result;
}

std::pair<std::string, std::string> InMemoryReturnMetricsStore::dateRange() const {
    if (records_.empty()) {
        return {"", ""};
    }
    return {records_.begin()->first, records_.rbegin()->first};
}

std::size_t InMemoryReturnMetricsStore::size() const {
    std::size_t n = 0;
    for (const auto& [date, byPair] : records_) {
        n += byPair.size();
    }
    return n;
}
