#include "store/backtest_store.hpp"

#include <iostream>

bool InMemoryBacktestStore::append(const BacktestRecord& record) {
    if (index_.count(record.runId)) {
        std::cerr << "  [WARN] backtest run " << record.runId << " already stored" << std::endl;
        return false;
    }
    index_[record.runId] = runs_.size();
    runs_.push_back(record);
    return true;
}

bool InMemoryBacktestStore::contains(const std::string& runId) const {
    return index_.count(runId) > 0;
}

std::vector<BacktestRecord> InMemoryBacktestStore::findByKey(const std::string& strategyName,
                                                             const std::string& startDate,
                                                             const std::string& endDate) const {
    std::vector<BacktestRecord> found;
    for (const auto& r : runs_) {
        if (r.strategyName == strategyName && r.startDate == startDate && r.endDate == endDate) {
            found.push_back(r);
        }
    }
    return found;
}

std::vector<TradeEvent> InMemoryBacktestStore::events(const std::string& runId) const {
    const auto it = index_.find(runId);
    if (it == index_.end()) {
        return {};
    }
    return runs_[it->second].events;
}

std::string makeRunId(const IBacktestStore& store, const std::string& strategyName, const std::string& startDate,
                      const std::string& endDate, std::time_t now) {
    struct tm tm {};
    gmtime_r(&now, &tm);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

    const auto base = strategyName + "_" + startDate + "_" + endDate + "_" + stamp;
    auto       id   = base;
    for (int n = 2; store.contains(id); ++n) {
        id = base + "_" + std::to_string(n);
    }
    return id;
}

BacktestRecord makeRecord(const IBacktestStore& store, const BacktestResult& result, std::time_t now) {
    BacktestRecord record;
    record.runId        = makeRunId(store, result.strategyName, result.startDate, result.endDate, now);
    record.strategyName = result.strategyName;
    record.startDate    = result.startDate;
    record.endDate      = result.endDate;
    record.config       = result.config;
    record.summary      = result.summary;
    record.events       = result.state.events;
    return record;
}
