#pragma once

#include <ctime>
#include <map>
#include <string>
#include <vector>

#include "backtest/backtest_engine.hpp"

struct BacktestRecord {
    std::string             runId;
    std::string             strategyName;
    std::string             startDate;
    std::string             endDate;
    BacktestConfig          config;
    BacktestSummary         summary;
    std::vector<TradeEvent> events;
};

/**
 * @brief Append-only sink for completed backtest runs.
 */
struct IBacktestStore {
    virtual ~IBacktestStore() = default;

    /**
     * @return false if a run with the same id already exists; nothing is written then.
     */
    virtual bool append(const BacktestRecord& record) = 0;

    [[nodiscard]] virtual bool contains(const std::string& runId) const = 0;

    /**
     * @brief Every run for (strategy, start, end), oldest first.
     */
    [[nodiscard]] virtual std::vector<BacktestRecord> findByKey(const std::string& strategyName,
                                                                const std::string& startDate,
                                                                const std::string& endDate) const = 0;

    /**
     * @brief Event log of one run; empty if the run is unknown.
     */
    [[nodiscard]] virtual std::vector<TradeEvent> events(const std::string& runId) const = 0;
};

class InMemoryBacktestStore: public IBacktestStore {
   public:
    bool append(const BacktestRecord& record) override;

    [[nodiscard]] bool contains(const std::string& runId) const override;

    [[nodiscard]] std::vector<BacktestRecord> findByKey(const std::string& strategyName,
                                                        const std::string& startDate,
                                                        const std::string& endDate) const override;

    [[nodiscard]] std::vector<TradeEvent> events(const std::string& runId) const override;

   private:
    std::vector<BacktestRecord>        runs_;
    std::map<std::string, std::size_t> index_;  // runId -> position in runs_
};

/**
 * @brief Build a run id "<strategy>_<start>_<end>_<YYYYmmdd_HHMMSS>".
 *
 * A "_<n>" suffix is appended when the id is already taken in `store`.
 */
[[nodiscard]] std::string makeRunId(const IBacktestStore& store, const std::string& strategyName,
                                    const std::string& startDate, const std::string& endDate, std::time_t now);

/**
 * @brief Package a finished run for storage under a fresh run id.
 */
[[nodiscard]] BacktestRecord makeRecord(const IBacktestStore& store, const BacktestResult& result, std::time_t now);
