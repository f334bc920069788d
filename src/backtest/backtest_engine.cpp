#include "backtest/backtest_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

#include "backtest/performance_summarizer.hpp"
#include "configuration_error.hpp"
#include "cross_section.hpp"
#include "date_utils.hpp"

std::string eventTypeToString(TradeEventType type) {
    switch (type) {
    case TradeEventType::Entry:
        return "entry";
    case TradeEventType::Exit:
        return "exit";
    case TradeEventType::FundingAccrual:
        return "funding_accrual";
    }
    return "unknown";
}

double BacktestState::positionValue() const {
    double total = 0.0;
    for (const auto& [pair, p] : positions) {
        total += p.currentValue;
    }
    return total;
}

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

void BacktestEngine::record(BacktestState& state, TradeEvent event) {
    event.sequence      = state.events.size();
    event.cashAfter     = state.cash;
    event.positionAfter = state.positionValue();
    state.events.push_back(std::move(event));
}

double BacktestEngine::allocationFor(const BacktestState& state) const {
    double target = config_.positionSize;
    if (config_.sizing == PositionSizing::Proportional) {
        target = config_.positionSize * state.equity();
    }

    // allocation + entry fee must fit in cash
    const double affordable = state.cash / (1.0 + config_.feeRate);
    return std::max(0.0, std::min(target, affordable));
}

void BacktestEngine::exitPosition(BacktestState& state, const std::string& date, const std::string& pair,
                                  int rank) const {
    const auto it = state.positions.find(pair);
    if (it == state.positions.end()) {
        return;
    }

    const double value = it->second.currentValue;
    const double fee   = std::fabs(value) * config_.feeRate;

    state.positions.erase(it);
    state.cash += value - fee;

    TradeEvent e;
    e.timestamp    = date;
    e.type         = TradeEventType::Exit;
    e.tradingPair  = pair;
    e.amount       = value;
    e.fee          = fee;
    e.rankPosition = rank;
    record(state, std::move(e));
}

void BacktestEngine::simulateDate(BacktestState& state, const std::string& date, const DayRanking& ranking,
                                  const MetricsMap& metrics) const {
    state.currentDate = date;

    std::map<std::string, int> rankOf;
    for (const auto* r : ranking) {
        rankOf[r->tradingPair] = r->rankPosition;
    }

    const auto firstEvent = state.events.size();

    // 1. Exits: unranked today or ranked outside the exit band
    std::vector<std::string> toExit;
    for (const auto& [pair, p] : state.positions) {
        const auto it = rankOf.find(pair);
        if (it == rankOf.end() || it->second > config_.exitThreshold) {
            toExit.push_back(pair);
        }
    }
    for (const auto& pair : toExit) {
        const auto it = rankOf.find(pair);
        exitPosition(state, date, pair, it == rankOf.end() ? 0 : it->second);
    }

    // 2. Entries: top N in rank order, capacity permitting
    for (const auto* r : ranking) {
        if (r->rankPosition > config_.entryTopN) {
            break;
        }
        if (static_cast<int>(state.positions.size()) >= config_.maxPositions) {
            break;
        }
        if (state.positions.count(r->tradingPair)) {
            continue;
        }

        const double amount = allocationFor(state);
        if (amount <= 0.0) {
            std::cerr << "  [WARN] " << date << " - no cash left to enter " << r->tradingPair << std::endl;
            break;
        }
        const double fee = amount * config_.feeRate;

        Position p;
        p.tradingPair      = r->tradingPair;
        p.entryDate        = date;
        p.allocatedCapital = amount;
        p.currentValue     = amount;
        p.entryRank        = r->rankPosition;

        state.cash -= amount + fee;
        state.positions.emplace(p.tradingPair, p);

        TradeEvent e;
        e.timestamp    = date;
        e.type         = TradeEventType::Entry;
        e.tradingPair  = r->tradingPair;
        e.amount       = amount;
        e.fee          = fee;
        e.rankPosition = r->rankPosition;
        record(state, std::move(e));
    }

    // 3. Funding accrual on everything held
    std::vector<std::string> held;
    for (const auto& [pair, p] : state.positions) {
        if (!config_.accrueOnEntryDay && p.entryDate == date) {
            continue;
        }
        held.push_back(pair);
    }
    for (const auto& pair : held) {
        auto& p = state.positions.at(pair);

        double metric = 0.0;
        if (const auto it = metrics.find(pair); it != metrics.end()) {
            metric = xsection::zeroFilled(it->second->get(config_.accrualMetric));
        }

        const double pnl = p.allocatedCapital * config_.capitalFraction * metric / config_.normalizer;
        p.accruedPnl += pnl;
        p.currentValue += pnl;

        const auto rank = rankOf.find(pair);

        TradeEvent e;
        e.timestamp    = date;
        e.type         = TradeEventType::FundingAccrual;
        e.tradingPair  = pair;
        e.amount       = pnl;
        e.metricValue  = metric;
        e.rankPosition = rank == rankOf.end() ? 0 : rank->second;
        record(state, std::move(e));
    }

    DailySnapshot snap;
    snap.date          = date;
    snap.cash          = state.cash;
    snap.positionValue = state.positionValue();
    snap.heldCount     = static_cast<int>(state.positions.size());
    for (auto i = firstEvent; i < state.events.size(); ++i) {
        const auto& e = state.events[i];
        snap.pnl += (e.type == TradeEventType::FundingAccrual ? e.amount : 0.0) - e.fee;
    }
    state.days.push_back(snap);
}

BacktestResult BacktestEngine::run(const std::string& strategyName, const std::vector<RankingResult>& rankings,
                                   const std::vector<ReturnMetricRecord>& metrics, const std::string& startDate,
                                   const std::string& endDate, const std::function<bool()>& shouldStop) const {
    if (!dates::isValid(startDate) || !dates::isValid(endDate) || startDate > endDate) {
        throw ConfigurationError("invalid backtest range: " + startDate + " ~ " + endDate);
    }

    BacktestResult result;
    result.strategyName = strategyName;
    result.startDate    = startDate;
    result.endDate      = endDate;
    result.config       = config_;
    result.state.cash   = config_.initialCapital;

    // Index inputs by date
    std::map<std::string, DayRanking> rankingByDate;
    for (const auto& r : rankings) {
        if (r.strategyName == strategyName) {
            rankingByDate[r.date].push_back(&r);
        }
    }
    for (auto& [date, day] : rankingByDate) {
        std::sort(day.begin(), day.end(),
                  [](const RankingResult* a, const RankingResult* b) { return a->rankPosition < b->rankPosition; });
    }

    std::map<std::string, MetricsMap> metricsByDate;
    for (const auto& m : metrics) {
        metricsByDate[m.date][m.tradingPair] = &m;
    }

    static const MetricsMap kNoMetrics;

    for (const auto& date : dates::range(startDate, endDate)) {
        if (shouldStop && shouldStop()) {
            std::cerr << "  [WARN] backtest aborted before " << date << std::endl;
            result.aborted = true;
            break;
        }

        const auto day = rankingByDate.find(date);
        if (day == rankingByDate.end() || day->second.empty()) {
            std::cerr << "  [WARN] " << date << " - no ranking data, skipped" << std::endl;
            result.skippedDates.push_back(date);
            continue;
        }

        const auto m = metricsByDate.find(date);
        simulateDate(result.state, date, day->second, m == metricsByDate.end() ? kNoMetrics : m->second);
    }

    // Optionally realise everything still open on the last simulated date
    if (config_.closeAtEnd && !result.aborted && !result.state.days.empty()) {
        const auto lastDate   = result.state.days.back().date;
        const auto firstEvent = result.state.events.size();

        std::vector<std::string> open;
        for (const auto& [pair, p] : result.state.positions) {
            open.push_back(pair);
        }
        for (const auto& pair : open) {
            exitPosition(result.state, lastDate, pair, 0);
        }

        auto& snap         = result.state.days.back();
        snap.cash          = result.state.cash;
        snap.positionValue = result.state.positionValue();
        snap.heldCount     = 0;
        for (auto i = firstEvent; i < result.state.events.size(); ++i) {
            snap.pnl -= result.state.events[i].fee;
        }
    }

    std::vector<std::string> simulated;
    simulated.reserve(result.state.days.size());
    for (const auto& d : result.state.days) {
        simulated.push_back(d.date);
    }

    result.summary = PerformanceSummarizer::summarize(result.state.events, simulated, config_.initialCapital,
                                                      result.state.equity());
    return result;
}

BacktestResult BacktestEngine::run(const std::string& strategyName, const IRankingStore& rankings,
                                   const IReturnMetricsStore& metrics, const std::string& startDate,
                                   const std::string& endDate, const std::function<bool()>& shouldStop) const {
    const auto rankingRows = rankings.fetch(strategyName, startDate, endDate);
    const auto metricRows  = metrics.fetch(startDate, endDate);
    return run(strategyName, rankingRows, metricRows, startDate, endDate, shouldStop);
}

void BacktestEngine::printResults(const BacktestResult& result, std::size_t maxEvents) {
    const auto& s = result.summary;

    // clang-format off
    std::clog << std::endl;
    std::clog << "=== Rotation Backtest: " << result.strategyName
              << " (" << result.startDate << " ~ " << result.endDate << ") ===" << std::endl;
    std::clog << std::endl;

    std::clog << std::fixed << std::setprecision(2);
    std::clog << std::left << std::setw(20) << "Initial capital" << std::right << std::setw(14) << s.initialCapital << std::endl;
    std::clog << std::left << std::setw(20) << "Final capital"   << std::right << std::setw(14) << s.finalCapital   << std::endl;
    std::clog << std::left << std::setw(20) << "Total return"    << std::right << std::setw(14) << s.totalReturn    << std::endl;
    std::clog << std::left << std::setw(20) << "Total ROI"       << std::right << std::setw(13) << s.totalRoi * 100.0 << "%" << std::endl;
    std::clog << std::left << std::setw(20) << "Max drawdown"    << std::right << std::setw(13) << s.maxDrawdown * 100.0 << "%" << std::endl;
    std::clog << std::left << std::setw(20) << "Sharpe"          << std::right << std::setw(14) << s.sharpeRatio    << std::endl;
    std::clog << std::left << std::setw(20) << "Win rate"        << std::right << std::setw(13) << s.winRate * 100.0 << "%" << std::endl;
    std::clog << std::left << std::setw(20) << "Days (+/-/=)"    << std::right << std::setw(14)
              << (std::to_string(s.profitDays) + "/" + std::to_string(s.lossDays) + "/" + std::to_string(s.breakEvenDays))
              << std::endl;
    std::clog << std::left << std::setw(20) << "Trades (in/out)"  << std::right << std::setw(14)
              << (std::to_string(s.entryCount) + "/" + std::to_string(s.exitCount)) << std::endl;
    std::clog << std::left << std::setw(20) << "Avg holding days" << std::right << std::setw(14) << s.avgHoldingDays << std::endl;
    if (!result.skippedDates.empty()) {
        std::clog << std::left << std::setw(20) << "Skipped dates" << std::right << std::setw(14) << result.skippedDates.size() << std::endl;
    }
    if (result.aborted) {
        std::clog << "  ** ABORTED **" << std::endl;
    }

    std::clog << std::endl;
    std::clog << std::left  << std::setw(12) << "Date"
              << std::right << std::setw(14) << "Cash"
              << std::setw(14) << "Positions"
              << std::setw(12) << "PnL"
              << std::setw(6)  << "Held"
              << std::endl;
    std::clog << std::string(58, '-') << std::endl;
    for (const auto& d : result.state.days) {
        std::clog << std::left  << std::setw(12) << d.date
                  << std::right << std::setw(14) << d.cash
                  << std::setw(14) << d.positionValue
                  << std::setw(12) << d.pnl
                  << std::setw(6)  << d.heldCount
                  << std::endl;
    }

    if (maxEvents == 0 || result.state.events.empty()) {
        return;
    }

    std::clog << std::endl;
    std::clog << std::left  << std::setw(6)  << "#"
              << std::setw(12) << "Date"
              << std::setw(17) << "Type"
              << std::setw(26) << "Pair"
              << std::right << std::setw(6) << "Rank"
              << std::setw(12) << "Amount"
              << std::setw(8)  << "Fee"
              << std::endl;
    std::clog << std::string(87, '-') << std::endl;

    const auto shown = std::min(maxEvents, result.state.events.size());
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& e = result.state.events[i];
        std::clog << std::left  << std::setw(6)  << e.sequence
                  << std::setw(12) << e.timestamp
                  << std::setw(17) << eventTypeToString(e.type)
                  << std::setw(26) << e.tradingPair
                  << std::right << std::setw(6) << e.rankPosition
                  << std::setw(12) << e.amount
                  << std::setw(8)  << e.fee
                  << std::endl;
    }
    if (shown < result.state.events.size()) {
        std::clog << "  ... " << result.state.events.size() - shown << " more" << std::endl;
    }
    // clang-format on
}
