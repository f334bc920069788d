#include "backtest/performance_summarizer.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

#include "date_utils.hpp"

std::vector<double> PerformanceSummarizer::equityCurve(const std::vector<TradeEvent>&  events,
                                                       const std::vector<std::string>& simulatedDates,
                                                       double                          initialCapital) {
    // Equity after the last event of each date
    std::map<std::string, double> closing;
    for (const auto& e : events) {
        closing[e.timestamp] = e.cashAfter + e.positionAfter;
    }

    std::vector<double> curve;
    curve.reserve(simulatedDates.size());

    double equity = initialCapital;
    for (const auto& date : simulatedDates) {
        if (const auto it = closing.find(date); it != closing.end()) {
            equity = it->second;
        }
        curve.push_back(equity);
    }
    return curve;
}

double PerformanceSummarizer::maxDrawdown(const std::vector<double>& equity, double initialCapital) {
    double peak  = initialCapital;
    double maxDD = 0.0;
    for (const auto& eq : equity) {
        peak = std::max(peak, eq);
        if (peak > 0.0) {
            maxDD = std::max(maxDD, (peak - eq) / peak);
        }
    }
    return maxDD;
}

BacktestSummary PerformanceSummarizer::summarize(const std::vector<TradeEvent>&  events,
                                                 const std::vector<std::string>& simulatedDates,
                                                 double initialCapital, double finalCapital) {
    BacktestSummary s;
    s.initialCapital = initialCapital;
    s.finalCapital   = finalCapital;

    // 1. Total return
    s.totalReturn = finalCapital - initialCapital;
    s.totalRoi    = initialCapital != 0.0 ? s.totalReturn / initialCapital : 0.0;

    // 2. Day classification by net PnL (funding minus fees)
    std::map<std::string, double> dayPnl;
    for (const auto& e : events) {
        double& pnl = dayPnl[e.timestamp];
        if (e.type == TradeEventType::FundingAccrual) {
            pnl += e.amount;
        }
        pnl -= e.fee;
    }

    s.totalDays = static_cast<int>(simulatedDates.size());
    for (const auto& date : simulatedDates) {
        const auto   it  = dayPnl.find(date);
        const double pnl = it == dayPnl.end() ? 0.0 : it->second;
        if (pnl > kBreakEvenEpsilon) {
            s.profitDays++;
        } else if (pnl < -kBreakEvenEpsilon) {
            s.lossDays++;
        } else {
            s.breakEvenDays++;
        }
    }
    if (s.totalDays > 0) {
        s.winRate = static_cast<double>(s.profitDays) / static_cast<double>(s.totalDays);
    }

    // 3. Trade counts
    for (const auto& e : events) {
        if (e.type == TradeEventType::Entry) {
            s.entryCount++;
        } else if (e.type == TradeEventType::Exit) {
            s.exitCount++;
        }
    }
    s.totalTrades = s.entryCount + s.exitCount;

    // 4. Max drawdown
    const auto curve = equityCurve(events, simulatedDates, initialCapital);
    s.maxDrawdown    = maxDrawdown(curve, initialCapital);

    // 5. Sharpe ratio (daily, annualized over 365 days, risk-free = 0)
    if (!curve.empty()) {
        std::vector<double> dailyReturns;
        dailyReturns.reserve(curve.size());
        double prev = initialCapital;
        for (const auto& eq : curve) {
            if (prev > 0.0) {
                dailyReturns.push_back((eq - prev) / prev);
            }
            prev = eq;
        }

        if (dailyReturns.size() > 1) {
            const double mean = std::accumulate(dailyReturns.begin(), dailyReturns.end(), 0.0)
                              / static_cast<double>(dailyReturns.size());

            double variance = 0.0;
            for (const auto& r : dailyReturns) {
                variance += (r - mean) * (r - mean);
            }
            variance /= static_cast<double>(dailyReturns.size());

            const double stdDev = std::sqrt(variance);
            if (stdDev > 1e-12) {
                s.sharpeRatio = (mean / stdDev) * std::sqrt(365.0);
            }
        }
    }

    // 6. Average holding period (calendar days, entry to exit or to the last simulated date)
    {
        std::map<std::string, std::string> openSince;
        std::vector<double>                 holdings;
        for (const auto& e : events) {
            if (e.type == TradeEventType::Entry) {
                openSince[e.tradingPair] = e.timestamp;
            } else if (e.type == TradeEventType::Exit) {
                const auto it = openSince.find(e.tradingPair);
                if (it != openSince.end()) {
                    holdings.push_back(static_cast<double>(dates::daysBetween(it->second, e.timestamp)));
                    openSince.erase(it);
                }
            }
        }
        if (!simulatedDates.empty()) {
            for (const auto& [pair, since] : openSince) {
                holdings.push_back(static_cast<double>(dates::daysBetween(since, simulatedDates.back())));
            }
        }
        if (!holdings.empty()) {
            s.avgHoldingDays =
                std::accumulate(holdings.begin(), holdings.end(), 0.0) / static_cast<double>(holdings.size());
        }
    }

    return s;
}
