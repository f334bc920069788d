#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "backtest/backtest_config.hpp"
#include "ranking/ranking_engine.hpp"
#include "return_metrics.hpp"
#include "store/ranking_store.hpp"
#include "store/return_metrics_store.hpp"

enum class TradeEventType
{
    Entry,
    Exit,
    FundingAccrual,
};

[[nodiscard]] std::string eventTypeToString(TradeEventType type);

struct TradeEvent {
    std::size_t    sequence  = 0;   // position in the run's log, 0-based
    std::string    timestamp = "";  // simulated date, "YYYY-MM-DD"
    TradeEventType type      = TradeEventType::FundingAccrual;
    std::string    tradingPair;

    /* Entry: capital moved into the position. Exit: value moved back to cash.
     * FundingAccrual: signed PnL credited to the position. */
    double amount = 0.0;
    double fee    = 0.0;

    double metricValue  = 0.0;  // accrual metric used (FundingAccrual only)
    int    rankPosition = 0;    // rank on the event date, 0 if unranked

    double cashAfter     = 0.0;
    double positionAfter = 0.0;  // total value of all open positions
};

struct Position {
    std::string tradingPair;
    std::string entryDate;
    double      allocatedCapital = 0.0;
    double      currentValue     = 0.0;  // allocated capital + accrued PnL
    double      accruedPnl       = 0.0;
    int         entryRank        = 0;
};

struct DailySnapshot {
    std::string date;
    double      cash          = 0.0;
    double      positionValue = 0.0;
    double      pnl           = 0.0;  // funding accrual minus fees
    int         heldCount     = 0;
};

struct BacktestState {
    std::string                     currentDate;
    double                          cash = 0.0;
    std::map<std::string, Position> positions;  // keyed by trading pair
    std::vector<TradeEvent>         events;
    std::vector<DailySnapshot>      days;  // one per simulated (non-skipped) date

    [[nodiscard]] double positionValue() const;

    [[nodiscard]] double equity() const {
        return cash + positionValue();
    }
};

struct BacktestSummary {
    double initialCapital = 0.0;
    double finalCapital   = 0.0;

    double totalReturn = 0.0;  // final - initial
    double totalRoi    = 0.0;  // totalReturn / initial

    int totalDays      = 0;
    int profitDays     = 0;
    int lossDays       = 0;
    int breakEvenDays  = 0;
    double winRate     = 0.0;  // profitDays / totalDays (0~1)
    double maxDrawdown = 0.0;  // largest peak-to-trough decline, fraction of peak (>= 0)

    int totalTrades = 0;  // entries + exits
    int entryCount  = 0;
    int exitCount   = 0;

    double sharpeRatio    = 0.0;  // annualized with sqrt(365)
    double avgHoldingDays = 0.0;
};

struct BacktestResult {
    std::string    strategyName;
    std::string    startDate;
    std::string    endDate;
    BacktestConfig config;

    BacktestState   state;
    BacktestSummary summary;

    std::vector<std::string> skippedDates;  // dates without ranking data
    bool                     aborted = false;
};

/**
 * @brief Rank-rotation portfolio simulator.
 *
 * Walks every calendar date of a range in order. On each date with ranking
 * data it first closes held pairs that dropped out of the exit band, then
 * opens the top-ranked pairs up to capacity, then accrues one day of funding
 * PnL on every held pair. Dates without ranking data are skipped and the
 * state carries over unchanged.
 */
class BacktestEngine {
   public:
    /**
     * @throws ConfigurationError if the config is invalid.
     */
    explicit BacktestEngine(BacktestConfig config);

    /**
     * @brief Run the backtest over pre-fetched data.
     * @param strategyName Strategy whose rankings drive the run.
     * @param rankings     Ranking rows for the range; rows of other strategies are ignored.
     * @param metrics      Return metrics for the range (accrual source).
     * @param shouldStop   Checked before each date; returning true aborts the run
     *                     with every completed date's events intact.
     * @throws ConfigurationError on a malformed or reversed date range.
     * @return BacktestResult with the event log, final state and summary.
     */
    [[nodiscard]] BacktestResult run(const std::string& strategyName, const std::vector<RankingResult>& rankings,
                                     const std::vector<ReturnMetricRecord>& metrics, const std::string& startDate,
                                     const std::string& endDate, const std::function<bool()>& shouldStop = {}) const;

    /**
     * @brief Fetch everything from the stores in bulk, then run.
     */
    [[nodiscard]] BacktestResult run(const std::string& strategyName, const IRankingStore& rankings,
                                     const IReturnMetricsStore& metrics, const std::string& startDate,
                                     const std::string& endDate, const std::function<bool()>& shouldStop = {}) const;

    [[nodiscard]] const BacktestConfig& config() const {
        return config_;
    }

    /**
     * @brief Print the summary table, daily equity and the first `maxEvents` events to std::clog.
     */
    static void printResults(const BacktestResult& result, std::size_t maxEvents = 20);

   private:
    using DayRanking = std::vector<const RankingResult*>;  // ordered by rank
    using MetricsMap = std::map<std::string, const ReturnMetricRecord*>;

    BacktestConfig config_;

    /**
     * @brief Apply one date: exits, entries, funding accrual.
     */
    void simulateDate(BacktestState& state, const std::string& date, const DayRanking& ranking,
                      const MetricsMap& metrics) const;

    void exitPosition(BacktestState& state, const std::string& date, const std::string& pair, int rank) const;

    /**
     * @brief Capital to allocate for a new entry, already capped by cash.
     */
    [[nodiscard]] double allocationFor(const BacktestState& state) const;

    static void record(BacktestState& state, TradeEvent event);
};
