#pragma once

#include <string>
#include <vector>

#include "backtest/backtest_engine.hpp"

/**
 * @brief Aggregate statistics over a completed backtest event log.
 */
class PerformanceSummarizer {
   public:
    /**
     * @brief Derive the run summary.
     *
     * Pure and deterministic: the same inputs always give the same summary.
     *
     * @param events          Full event log in sequence order.
     * @param simulatedDates  Dates the simulator processed (skipped dates excluded), ascending.
     * @param initialCapital  Starting equity.
     * @param finalCapital    Ending equity (cash + open position value).
     */
    [[nodiscard]] static BacktestSummary summarize(const std::vector<TradeEvent>&  events,
                                                   const std::vector<std::string>& simulatedDates,
                                                   double initialCapital, double finalCapital);

    /**
     * @brief Equity after each simulated date, carrying forward through dates without events.
     */
    [[nodiscard]] static std::vector<double> equityCurve(const std::vector<TradeEvent>&  events,
                                                         const std::vector<std::string>& simulatedDates,
                                                         double                          initialCapital);

    /**
     * @brief Largest (peak - trough) / peak over the series, as a fraction >= 0.
     *        The running peak starts at `initialCapital`.
     */
    [[nodiscard]] static double maxDrawdown(const std::vector<double>& equity, double initialCapital);

   private:
    static constexpr double kBreakEvenEpsilon = 1e-9;
};
