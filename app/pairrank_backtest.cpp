#include <algorithm>
#include <csignal>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "backtest/backtest_engine.hpp"
#include "configuration_error.hpp"
#include "factor/factor_ranking_service.hpp"
#include "json_codec.hpp"
#include "ranking/ranking_analysis.hpp"
#include "ranking/ranking_service.hpp"
#include "store/backtest_store.hpp"
#include "store/ranking_store.hpp"
#include "store/return_metrics_store.hpp"
#include "strategy/strategy_config.hpp"

/**
 * @brief Resolve a path relative to the project root, found from the executable.
 *        e.g., if exe is /foo/build/Debug/app/pairrank_backtest,
 *        resolveFromExe("config/x.json") -> /foo/config/x.json
 */
static std::string resolveFromExe(const std::string& relativePath) {
    char    buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return relativePath;
    }
    buf[len] = '\0';
    std::string exePath(buf);

    // exe is in build/<type>/app/
    for (int i = 0; i < 4; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos) {
            return relativePath;
        }
        exePath = exePath.substr(0, pos);
    }
    return exePath + "/" + relativePath;
}

static volatile std::sig_atomic_t g_stopRequested = 0;

static void onSigint(int) {
    g_stopRequested = 1;
}

static void printTopRanking(const std::vector<RankingResult>& rows, const std::string& date, int topN) {
    // clang-format off
    std::clog << std::endl;
    std::clog << "--- " << date << " (top " << topN << ") ---" << std::endl;
    for (const auto& r : rows) {
        if (r.date != date || r.rankPosition > topN) {
            continue;
        }
        std::clog << std::right << std::setw(4) << r.rankPosition << "  "
                  << std::left  << std::setw(26) << r.tradingPair
                  << std::right << std::fixed << std::setprecision(4) << std::setw(10) << r.finalScore
                  << "   " << r.combination
                  << std::endl;
    }
    // clang-format on
}

int main(int argc, char* argv[]) {
    std::string configPath = resolveFromExe("config/pairrank.json");
    if (argc > 1) {
        configPath = argv[1];
    }

    /* Load config */
    nlohmann::json config;
    {
        std::ifstream f(configPath);
        if (!f.is_open()) {
            std::cerr << "Error: Cannot open config: " << configPath << std::endl;
            return 1;
        }
        try {
            f >> config;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Error: Config parse error: " << e.what() << std::endl;
            return 1;
        }
    }

    std::string metricsPath = resolveFromExe(config.value("metrics_file", "data/sample_return_metrics.json"));
    if (argc > 2) {
        metricsPath = argv[2];
    }
    const std::string outputPath = argc > 3 ? argv[3] : "";

    const auto run          = config.value("run", nlohmann::json::object());
    const auto strategyName = run.value("strategy", "original");
    const auto compareWith  = run.value("compare_with", "");
    const auto topN         = run.value("overlap_top_n", 3);
    const auto showEvents   = run.value("show_events", 20);
    const auto mode =
        run.value("recompute", "incremental") == "force" ? RecomputeMode::Force : RecomputeMode::Incremental;

    try {
        const auto catalog       = StrategyCatalog::fromJson(config);
        const auto factorCatalog = FactorStrategyCatalog::fromJson(config);
        std::cerr << "  [OK] " << catalog.size() << " strategies, " << factorCatalog.size() << " factor strategies"
                  << std::endl;

        // Composite strategies take precedence on a name clash
        const auto isFactor = [&](const std::string& name) {
            return !catalog.contains(name) && factorCatalog.contains(name);
        };

        const auto backtestConfig = BacktestConfig::fromJson(config.value("backtest", nlohmann::json::object()));
        const BacktestEngine engine(backtestConfig);

        /* ---- Load return metrics ---- */
        InMemoryReturnMetricsStore metrics;
        if (!loadReturnMetricsFile(metricsPath, metrics)) {
            return 1;
        }

        const auto [firstDate, lastDate] = metrics.dateRange();
        const auto startDate             = run.value("start_date", firstDate);
        const auto endDate               = run.value("end_date", lastDate);

        /* ---- Rank ---- */
        std::vector<std::string> toRank = {strategyName};
        if (!compareWith.empty() && compareWith != strategyName) {
            toRank.push_back(compareWith);
        }

        std::cerr << "Ranking " << startDate << " ~ " << endDate << "..." << std::endl;

        std::vector<std::string> compositeNames;
        std::vector<std::string> factorNames;
        for (const auto& name : toRank) {
            (isFactor(name) ? factorNames : compositeNames).push_back(name);
        }

        InMemoryRankingStore rankings;
        RankingService       service(metrics, catalog, rankings);
        FactorRankingService factorService(metrics, factorCatalog, rankings);

        std::size_t rowsWritten = 0;
        if (!compositeNames.empty()) {
            rowsWritten += service.run(compositeNames, startDate, endDate, mode).rowsWritten;
        }
        if (!factorNames.empty()) {
            rowsWritten += factorService.run(factorNames, startDate, endDate, mode).rowsWritten;
        }
        std::cerr << "  [OK] " << rowsWritten << " ranking rows" << std::endl;

        const auto rows = rankings.fetch(strategyName, startDate, endDate);

        std::clog << std::endl;
        std::clog << "=== Strategy ===" << std::endl;
        std::clog << (isFactor(strategyName) ? factorCatalog.describe(strategyName) : catalog.describe(strategyName));
        if (!rows.empty()) {
            printTopRanking(rows, rows.back().date, topN);
        }

        /* ---- Backtest ---- */
        std::cerr << "Running backtest..." << std::endl;
        std::signal(SIGINT, onSigint);

        const auto result =
            engine.run(strategyName, rankings, metrics, startDate, endDate, [] { return g_stopRequested != 0; });

        InMemoryBacktestStore backtests;
        const auto            record = makeRecord(backtests, result, std::time(nullptr));
        if (backtests.append(record)) {
            std::cerr << "  [OK] stored run " << record.runId << std::endl;
        }

        BacktestEngine::printResults(result, static_cast<std::size_t>(std::max(0, showEvents)));

        /* ---- Rank persistence ---- */
        if (run.contains("persistence")) {
            const auto& p       = run["persistence"];
            const auto  streaks = RankingAnalysis::persistenceStreaks(rows, p.value("trigger_rank", 3),
                                                                      p.value("hold_rank", 5));

            // clang-format off
            std::clog << std::endl;
            std::clog << "=== Rank Persistence ===" << std::endl;
            std::clog << std::endl;
            std::clog << std::left  << std::setw(26) << "Pair"
                      << std::setw(12) << "Entry"
                      << std::setw(12) << "Exit"
                      << std::right << std::setw(6) << "Days"
                      << std::setw(8) << "Total"
                      << std::endl;
            std::clog << std::string(64, '-') << std::endl;
            for (const auto& s : streaks) {
                std::clog << std::left  << std::setw(26) << s.tradingPair
                          << std::setw(12) << s.entryDate
                          << std::setw(12) << s.exitDate
                          << std::right << std::setw(6) << s.consecutiveDays
                          << std::setw(8) << s.cumulativeDays
                          << std::endl;
            }
            // clang-format on
        }

        /* ---- Cross-strategy overlap on the last ranked date ---- */
        if (toRank.size() > 1 && !rows.empty()) {
            const auto& date    = rows.back().date;
            const auto  overlap = RankingAnalysis::topOverlap(rankings.fetch(strategyName, date, date),
                                                              rankings.fetch(compareWith, date, date), topN);

            std::clog << std::endl;
            std::clog << "=== Top-" << topN << " Overlap: " << strategyName << " vs " << compareWith << " (" << date
                      << ") ===" << std::endl;
            std::clog << "  Common: ";
            for (const auto& pair : overlap.common) {
                std::clog << pair << " ";
            }
            std::clog << std::endl;
            std::clog << "  Rate:   " << std::fixed << std::setprecision(1) << overlap.rate * 100.0 << "%" << std::endl;
        }

        if (!outputPath.empty()) {
            std::ofstream out(outputPath);
            if (!out.is_open()) {
                std::cerr << "Error: Cannot write " << outputPath << std::endl;
                return 1;
            }
            out << backtestResultToJson(result).dump(2) << std::endl;
            std::cerr << "  [OK] wrote " << outputPath << std::endl;
        }
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Config " << configPath << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
