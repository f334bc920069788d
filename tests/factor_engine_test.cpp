// factor_engine_test.cpp - time-series factors, factor strategy parsing, per-date factor ranking

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backtest/backtest_engine.hpp"
#include "configuration_error.hpp"
#include "date_utils.hpp"
#include "factor/factor_library.hpp"
#include "factor/factor_ranking_engine.hpp"
#include "factor/factor_ranking_service.hpp"
#include "factor/factor_strategy.hpp"
#include "store/ranking_store.hpp"
#include "store/return_metrics_store.hpp"
#include "test_helpers.hpp"

using testutil::metricRow;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

FactorConfig factor(const std::string& name, FactorFunction function, int window) {
    FactorConfig f;
    f.name     = name;
    f.function = function;
    f.window   = window;
    return f;
}

// One win-rate factor over roi_1d, weight 1.
FactorStrategy winRateStrategy(const std::string& name, int window, int skipFirstNDays = 0) {
    FactorStrategy s;
    s.name           = name;
    s.description    = "win rate";
    s.skipFirstNDays = skipFirstNDays;
    s.factors        = {factor("F_win", FactorFunction::WinRate, window)};
    s.rankingFactors = {"F_win"};
    s.rankingWeights = {1.0};
    return s;
}

// roi_1d rows for one pair, one per consecutive day from `firstDate`.
void appendSeries(std::vector<ReturnMetricRecord>& rows, const std::string& pair, const std::string& firstDate,
                  const std::vector<double>& roi) {
    for (std::size_t i = 0; i < roi.size(); ++i) {
        rows.push_back(
            metricRow(pair, dates::addDays(firstDate, static_cast<int64_t>(i)), {{Indicator::Roi1d, roi[i]}}));
    }
}

nlohmann::json twoFactorDocument() {
    return nlohmann::json::parse(R"({
        "factor_strategies": {
            "steady": {
                "description": "sharpe and stability",
                "data_requirements": { "min_data_days": 10, "skip_first_n_days": 2 },
                "factors": {
                    "F_sharpe": { "function": "calculate_sharpe_ratio", "window": 14, "input_col": "roi_7d",
                                  "params": { "annualizing_factor": 52, "high_score": 1000 } },
                    "F_stable": { "function": "calculate_inv_std_dev", "window": 7,
                                  "params": { "epsilon": 0.001 } }
                },
                "ranking_logic": { "indicators": ["F_sharpe", "F_stable"], "weights": [0.6, 0.4] }
            }
        }
    })");
}

// Expect a ConfigurationError whose message mentions `needle`.
void expectConfigError(const nlohmann::json& definition, const std::string& needle) {
    try {
        (void)FactorStrategyCatalog::parseStrategy("broken", definition);
        FAIL() << "expected ConfigurationError containing '" << needle << "'";
    } catch (const ConfigurationError& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("broken"), std::string::npos) << what;
        EXPECT_NE(what.find(needle), std::string::npos) << what;
    }
}

}  // namespace

// ===========================================================================
// 1. Factor library
// ===========================================================================
class FactorLibraryTest : public ::testing::Test {};

TEST_F(FactorLibraryTest, TrendSlopeFitsAgainstIndex) {
    EXPECT_DOUBLE_EQ(FactorLibrary::trendSlope({1.0, 2.0, 3.0}), 1.0);
    EXPECT_DOUBLE_EQ(FactorLibrary::trendSlope({4.0, 2.0, 0.0}), -2.0);
    EXPECT_DOUBLE_EQ(FactorLibrary::trendSlope({1.0, kNaN, 3.0}), 2.0);
    EXPECT_TRUE(std::isnan(FactorLibrary::trendSlope({5.0})));
    EXPECT_TRUE(std::isnan(FactorLibrary::trendSlope({})));
}

TEST_F(FactorLibraryTest, SharpeRatioUsesSampleStdDev) {
    EXPECT_NEAR(FactorLibrary::sharpeRatio({1.0, 3.0}, 4.0), 2.0 * std::sqrt(2.0), 1e-12);
    EXPECT_TRUE(std::isnan(FactorLibrary::sharpeRatio({})));
}

TEST_F(FactorLibraryTest, SharpeRatioWithoutDispersion) {
    EXPECT_DOUBLE_EQ(FactorLibrary::sharpeRatio({0.01, 0.01}), 1e9);
    EXPECT_DOUBLE_EQ(FactorLibrary::sharpeRatio({0.01, 0.01}, 365.0, 50.0), 50.0);
    EXPECT_DOUBLE_EQ(FactorLibrary::sharpeRatio({-0.01, -0.01}), 0.0);
    EXPECT_DOUBLE_EQ(FactorLibrary::sharpeRatio({0.02}), 1e9);
}

TEST_F(FactorLibraryTest, InvStdDevRewardsStablePositiveReturns) {
    EXPECT_NEAR(FactorLibrary::invStdDev({1.0, 3.0}), 1.0 / std::sqrt(2.0), 1e-12);
    EXPECT_DOUBLE_EQ(FactorLibrary::invStdDev({2.0, 2.0}), 1e9);
    EXPECT_DOUBLE_EQ(FactorLibrary::invStdDev({-1.0, -3.0}), 0.0);
    EXPECT_DOUBLE_EQ(FactorLibrary::invStdDev({}), 0.0);
}

TEST_F(FactorLibraryTest, WinRateCountsStrictlyPositive) {
    EXPECT_DOUBLE_EQ(FactorLibrary::winRate({1.0, -1.0, 0.0, 2.0}), 0.5);
    EXPECT_DOUBLE_EQ(FactorLibrary::winRate({1.0, kNaN}), 1.0);
    EXPECT_DOUBLE_EQ(FactorLibrary::winRate({}), 0.0);
}

TEST_F(FactorLibraryTest, MaxDrawdownCompoundsReturns) {
    EXPECT_DOUBLE_EQ(FactorLibrary::maxDrawdown({0.1, -0.5}), -0.5);
    EXPECT_NEAR(FactorLibrary::maxDrawdown({0.1, -0.5, 0.2, -0.5}), -0.7, 1e-12);
    EXPECT_DOUBLE_EQ(FactorLibrary::maxDrawdown({0.1, 0.2}), 0.0);
    EXPECT_DOUBLE_EQ(FactorLibrary::maxDrawdown({}), 0.0);
}

TEST_F(FactorLibraryTest, SortinoRatioPenalisesDownsideOnly) {
    EXPECT_NEAR(FactorLibrary::sortinoRatio({1.0, -1.0, -3.0}, 1.0), -1.0 / std::sqrt(2.0), 1e-12);
    EXPECT_DOUBLE_EQ(FactorLibrary::sortinoRatio({1.0, 2.0}), 1e9);
    EXPECT_DOUBLE_EQ(FactorLibrary::sortinoRatio({-1.0, 2.0}), 1e9);
    EXPECT_DOUBLE_EQ(FactorLibrary::sortinoRatio({-1.0, 0.5}), 0.0);
    EXPECT_TRUE(std::isnan(FactorLibrary::sortinoRatio({})));
}

// ===========================================================================
// 2. Strategy parsing and validation
// ===========================================================================
class FactorStrategyTest : public ::testing::Test {};

TEST_F(FactorStrategyTest, ParsesFactorsRequirementsAndRankingLogic) {
    const auto catalog = FactorStrategyCatalog::fromJson(twoFactorDocument());
    ASSERT_EQ(catalog.size(), 1u);
    ASSERT_TRUE(catalog.contains("steady"));

    const auto& s = catalog.get("steady");
    EXPECT_EQ(s.description, "sharpe and stability");
    EXPECT_EQ(s.minDataDays, 10);
    EXPECT_EQ(s.skipFirstNDays, 2);
    ASSERT_EQ(s.factors.size(), 2u);

    const auto& sharpe = s.factors[static_cast<std::size_t>(s.factorIndex("F_sharpe"))];
    EXPECT_EQ(sharpe.function, FactorFunction::SharpeRatio);
    EXPECT_EQ(sharpe.window, 14);
    EXPECT_EQ(sharpe.input, Indicator::Roi7d);
    EXPECT_DOUBLE_EQ(sharpe.annualizingFactor, 52.0);
    EXPECT_DOUBLE_EQ(sharpe.highScore, 1000.0);

    const auto& stable = s.factors[static_cast<std::size_t>(s.factorIndex("F_stable"))];
    EXPECT_EQ(stable.function, FactorFunction::InvStdDev);
    EXPECT_EQ(stable.input, Indicator::Roi1d);
    EXPECT_DOUBLE_EQ(stable.epsilon, 0.001);

    EXPECT_EQ(s.rankingFactors, (std::vector<std::string>{"F_sharpe", "F_stable"}));
    EXPECT_EQ(s.maxWindow(), 14);
    EXPECT_EQ(s.lookbackDays(), 16);
}

TEST_F(FactorStrategyTest, FunctionNamesRoundTrip) {
    for (const auto function : {FactorFunction::TrendSlope, FactorFunction::SharpeRatio, FactorFunction::InvStdDev,
                                FactorFunction::WinRate, FactorFunction::MaxDrawdown, FactorFunction::SortinoRatio}) {
        EXPECT_EQ(factorFunctionFromName(factorFunctionName(function)), function);
    }
    EXPECT_FALSE(factorFunctionFromName("calculate_alpha").has_value());
}

TEST_F(FactorStrategyTest, MissingSectionGivesEmptyCatalog) {
    const auto catalog = FactorStrategyCatalog::fromJson(nlohmann::json::parse(R"({ "strategies": {} })"));
    EXPECT_EQ(catalog.size(), 0u);
    EXPECT_TRUE(catalog.names().empty());
    EXPECT_THROW((void)catalog.get("steady"), ConfigurationError);

    EXPECT_THROW(FactorStrategyCatalog::fromJson(nlohmann::json::parse(R"({ "factor_strategies": [] })")),
                 ConfigurationError);
}

TEST_F(FactorStrategyTest, RejectsMalformedDefinitions) {
    auto base = twoFactorDocument()["factor_strategies"]["steady"];

    auto d = base;
    d["factors"]["F_sharpe"]["function"] = "calculate_alpha";
    expectConfigError(d, "calculate_alpha");

    d                                     = base;
    d["factors"]["F_sharpe"]["input_col"] = "roi_9d";
    expectConfigError(d, "roi_9d");

    d                                  = base;
    d["factors"]["F_stable"]["window"] = 0;
    expectConfigError(d, "window");

    d                                       = base;
    d["data_requirements"]["min_data_days"] = 0;
    expectConfigError(d, "min_data_days");

    d            = base;
    d["factors"] = nlohmann::json::object();
    expectConfigError(d, "no factors");

    d = base;
    d.erase("ranking_logic");
    expectConfigError(d, "ranking_logic");

    d                             = base;
    d["ranking_logic"]["weights"] = nlohmann::json::array({1.0});
    expectConfigError(d, "weights");

    d                                = base;
    d["ranking_logic"]["indicators"] = nlohmann::json::array({"F_sharpe", "F_missing"});
    expectConfigError(d, "F_missing");

    d                                  = base;
    d["factors"]["F_sharpe"]["window"] = "long";
    expectConfigError(d, "malformed");
}

TEST_F(FactorStrategyTest, DescribeListsFactorsAndWeights) {
    const auto catalog = FactorStrategyCatalog::fromJson(twoFactorDocument());
    const auto text    = catalog.describe("steady");

    EXPECT_NE(text.find("calculate_sharpe_ratio"), std::string::npos) << text;
    EXPECT_NE(text.find("roi_7d (last 14 days)"), std::string::npos) << text;
    EXPECT_NE(text.find("F_stable: 40.0%"), std::string::npos) << text;
}

// ===========================================================================
// 3. Scoring one pair
// ===========================================================================
class FactorScoreTest : public ::testing::Test {};

TEST_F(FactorScoreTest, UsesOnlyTheTrailingWindow) {
    const auto f = factor("F_win", FactorFunction::WinRate, 2);
    EXPECT_DOUBLE_EQ(FactorRankingEngine::factorScore(f, {1.0, 1.0, -1.0, -1.0}), 0.0);

    const auto wide = factor("F_win", FactorFunction::WinRate, 8);
    EXPECT_DOUBLE_EQ(FactorRankingEngine::factorScore(wide, {1.0, 1.0, -1.0, -1.0}), 0.5);
}

TEST_F(FactorScoreTest, NeedsAMinimumNumberOfRows) {
    // window 30 needs 3 rows, window 4 needs 2
    const auto monthly = factor("F_trend", FactorFunction::TrendSlope, 30);
    EXPECT_TRUE(std::isnan(FactorRankingEngine::factorScore(monthly, {1.0, 2.0})));
    EXPECT_DOUBLE_EQ(FactorRankingEngine::factorScore(monthly, {1.0, 2.0, 3.0}), 1.0);

    const auto shortWindow = factor("F_trend", FactorFunction::TrendSlope, 4);
    EXPECT_DOUBLE_EQ(FactorRankingEngine::factorScore(shortWindow, {1.0, 2.0}), 1.0);
    EXPECT_TRUE(std::isnan(FactorRankingEngine::factorScore(shortWindow, {1.0})));
}

TEST_F(FactorScoreTest, AbsentValuesAreDropped) {
    const auto f = factor("F_trend", FactorFunction::TrendSlope, 3);
    EXPECT_DOUBLE_EQ(FactorRankingEngine::factorScore(f, {1.0, std::nullopt, 3.0}), 2.0);
}

TEST_F(FactorScoreTest, CombineRenormalisesOverComputableFactors) {
    FactorStrategy s;
    s.name           = "pair";
    s.factors        = {factor("A", FactorFunction::WinRate, 4), factor("B", FactorFunction::WinRate, 4)};
    s.rankingFactors = {"A", "B"};
    s.rankingWeights = {0.75, 0.25};

    EXPECT_DOUBLE_EQ(FactorRankingEngine::combine(s, {2.0, 6.0}), 3.0);
    EXPECT_DOUBLE_EQ(FactorRankingEngine::combine(s, {2.0, kNaN}), 2.0);
    EXPECT_DOUBLE_EQ(FactorRankingEngine::combine(s, {kNaN, 6.0}), 6.0);
    EXPECT_TRUE(std::isnan(FactorRankingEngine::combine(s, {kNaN, kNaN})));
}

// ===========================================================================
// 4. Ranking one date
// ===========================================================================
class FactorRankingEngineTest : public ::testing::Test {
   protected:
    // Win rates over the last four days up to 06-04: B 1.0, A 0.75, D 0.75, C 0.5
    void SetUp() override {
        appendSeries(history_, "A", "2024-06-01", {1.0, 1.0, 1.0, -1.0});
        appendSeries(history_, "B", "2024-06-01", {1.0, 1.0, 1.0, 1.0});
        appendSeries(history_, "C", "2024-06-01", {-1.0, -1.0, 1.0, 1.0, 1.0});
        appendSeries(history_, "D", "2024-06-01", {1.0, 1.0, -1.0, 1.0});
    }

    std::vector<ReturnMetricRecord> history_;
};

TEST_F(FactorRankingEngineTest, OrdersByScoreThenPair) {
    const auto results = FactorRankingEngine::rank(winRateStrategy("wins", 4), "2024-06-04", history_);

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].tradingPair, "B");
    EXPECT_EQ(results[1].tradingPair, "A");
    EXPECT_EQ(results[2].tradingPair, "D");
    EXPECT_EQ(results[3].tradingPair, "C");
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].rankPosition, static_cast<int>(i + 1));
        EXPECT_EQ(results[i].strategyName, "wins");
        EXPECT_EQ(results[i].date, "2024-06-04");
    }
    EXPECT_DOUBLE_EQ(results[3].finalScore, 0.5);
}

TEST_F(FactorRankingEngineTest, RowsRecordFactorsAndCombination) {
    const auto results = FactorRankingEngine::rank(winRateStrategy("wins", 4), "2024-06-04", history_);

    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].componentNames, (std::vector<std::string>{"F_win"}));
    ASSERT_EQ(results[0].componentScores.size(), 1u);
    EXPECT_DOUBLE_EQ(results[0].componentScores[0], 1.0);
    EXPECT_EQ(results[0].combination, "F_win(1.0000)*1.000 / 1.000 = 1.0000");
}

TEST_F(FactorRankingEngineTest, IgnoresRowsAfterTheDate) {
    // C's 06-05 win would lift it to a tie with A and D
    const auto results = FactorRankingEngine::rank(winRateStrategy("wins", 4), "2024-06-04", history_);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results.back().tradingPair, "C");

    const auto nextDay = FactorRankingEngine::rank(winRateStrategy("wins", 4), "2024-06-05", history_);
    ASSERT_EQ(nextDay.size(), 4u);
    EXPECT_EQ(nextDay[0].tradingPair, "B");
    EXPECT_EQ(nextDay[1].tradingPair, "A");
    EXPECT_EQ(nextDay[2].tradingPair, "C");
    EXPECT_DOUBLE_EQ(nextDay[2].finalScore, 0.75);
    EXPECT_EQ(nextDay[3].tradingPair, "D");
}

TEST_F(FactorRankingEngineTest, SkipsRecentlyListedPairs) {
    appendSeries(history_, "E", "2024-06-03", {1.0, 1.0});

    const auto kept = FactorRankingEngine::rank(winRateStrategy("wins", 4, 1), "2024-06-04", history_);
    EXPECT_EQ(kept.size(), 5u);
    EXPECT_EQ(kept[0].tradingPair, "B");
    EXPECT_EQ(kept[1].tradingPair, "E");

    const auto skipped = FactorRankingEngine::rank(winRateStrategy("wins", 4, 2), "2024-06-04", history_);
    ASSERT_EQ(skipped.size(), 4u);
    for (const auto& r : skipped) {
        EXPECT_NE(r.tradingPair, "E");
    }
}

TEST_F(FactorRankingEngineTest, LeavesOutPairsWithoutComputableFactors) {
    appendSeries(history_, "F", "2024-06-04", {1.0});

    const auto results = FactorRankingEngine::rank(winRateStrategy("wins", 4), "2024-06-04", history_);
    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) {
        EXPECT_NE(r.tradingPair, "F");
    }
}

TEST_F(FactorRankingEngineTest, EnoughRowsWithAbsentValuesScoreZeroWinRate) {
    history_.push_back(metricRow("G", "2024-06-03", {{Indicator::Roi1d, std::nullopt}}));
    history_.push_back(metricRow("G", "2024-06-04", {{Indicator::Roi7d, 2.0}}));

    const auto results = FactorRankingEngine::rank(winRateStrategy("wins", 4), "2024-06-04", history_);
    ASSERT_EQ(results.size(), 5u);
    EXPECT_EQ(results.back().tradingPair, "G");
    EXPECT_DOUBLE_EQ(results.back().finalScore, 0.0);
}

TEST_F(FactorRankingEngineTest, PartiallyComputablePairsUseTheRemainingFactors) {
    FactorStrategy s = winRateStrategy("mixed", 4);
    s.factors.push_back(factor("F_trend", FactorFunction::TrendSlope, 30));
    s.rankingFactors = {"F_win", "F_trend"};
    s.rankingWeights = {0.5, 0.5};

    // F_trend needs 3 rows; only 2 are available at 06-02
    const auto results = FactorRankingEngine::rank(s, "2024-06-02", history_);
    ASSERT_EQ(results.size(), 4u);
    for (const auto& r : results) {
        ASSERT_EQ(r.componentScores.size(), 2u);
        EXPECT_TRUE(std::isnan(r.componentScores[1])) << r.tradingPair;
        EXPECT_EQ(r.combination.find("F_trend"), std::string::npos) << r.combination;
    }
    EXPECT_EQ(results[0].tradingPair, "A");
    EXPECT_DOUBLE_EQ(results[0].finalScore, 1.0);
}

TEST_F(FactorRankingEngineTest, MalformedStrategyThrows) {
    auto s           = winRateStrategy("wins", 4);
    s.rankingWeights = {};
    EXPECT_THROW((void)FactorRankingEngine::rank(s, "2024-06-04", history_), ConfigurationError);
}

TEST_F(FactorRankingEngineTest, SufficientHistoryCountsCalendarDaysInclusive) {
    FactorStrategy s = winRateStrategy("wins", 4, 1);
    s.minDataDays    = 3;
    ASSERT_EQ(s.lookbackDays(), 5);

    EXPECT_TRUE(FactorRankingEngine::hasSufficientHistory(s, "2024-06-01", "2024-06-05"));
    EXPECT_FALSE(FactorRankingEngine::hasSufficientHistory(s, "2024-06-01", "2024-06-04"));
    EXPECT_FALSE(FactorRankingEngine::hasSufficientHistory(s, "", "2024-06-05"));
}

// ===========================================================================
// 5. Batch ranking and backtest
// ===========================================================================
class FactorRankingServiceTest : public ::testing::Test {
   protected:
    // A wins every day; B alternates, so any four days give it 0.5
    void SetUp() override {
        std::vector<ReturnMetricRecord> rows;
        appendSeries(rows, "A", "2024-06-01", {1.0, 1.0, 1.0, 1.0, 1.0, 1.0});
        appendSeries(rows, "B", "2024-06-01", {-1.0, 1.0, -1.0, 1.0, -1.0, 1.0});
        for (auto& r : rows) {
            metrics_.upsert(std::move(r));
        }
        catalog_.add(winRateStrategy("wins", 4));
    }

    InMemoryReturnMetricsStore metrics_;
    FactorStrategyCatalog      catalog_;
    InMemoryRankingStore       rankings_;
};

TEST_F(FactorRankingServiceTest, RanksDatesWithEnoughHistory) {
    FactorRankingService service(metrics_, catalog_, rankings_);
    const auto stats = service.run({"wins"}, "2024-06-01", "2024-06-07", RecomputeMode::Incremental);

    EXPECT_EQ(stats.insufficientDates, 3u);
    EXPECT_EQ(stats.computedDates, 3u);
    EXPECT_EQ(stats.emptyDates, 1u);
    EXPECT_EQ(stats.rowsWritten, 6u);

    EXPECT_FALSE(rankings_.hasResults("wins", "2024-06-03"));
    EXPECT_TRUE(rankings_.hasResults("wins", "2024-06-04"));

    const auto rows = rankings_.fetch("wins", "2024-06-06", "2024-06-06");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].tradingPair, "A");
    EXPECT_DOUBLE_EQ(rows[0].finalScore, 1.0);
    EXPECT_DOUBLE_EQ(rows[1].finalScore, 0.5);
}

TEST_F(FactorRankingServiceTest, IncrementalSkipsAndForceRecomputes) {
    FactorRankingService service(metrics_, catalog_, rankings_);
    (void)service.run({}, "2024-06-01", "2024-06-06", RecomputeMode::Incremental);

    const auto again = service.run({}, "2024-06-01", "2024-06-06", RecomputeMode::Incremental);
    EXPECT_EQ(again.computedDates, 0u);
    EXPECT_EQ(again.skippedDates, 3u);
    EXPECT_EQ(again.rowsWritten, 0u);

    const auto forced = service.run({}, "2024-06-01", "2024-06-06", RecomputeMode::Force);
    EXPECT_EQ(forced.computedDates, 3u);
    EXPECT_EQ(forced.rowsWritten, 6u);
    EXPECT_EQ(rankings_.fetch("wins", "2024-06-04", "2024-06-04").size(), 2u);
}

TEST_F(FactorRankingServiceTest, RejectsUnknownStrategyAndBadRangeUpFront) {
    FactorRankingService service(metrics_, catalog_, rankings_);
    EXPECT_THROW((void)service.run({"wins", "nope"}, "2024-06-01", "2024-06-06", RecomputeMode::Incremental),
                 ConfigurationError);
    EXPECT_THROW((void)service.run({"wins"}, "2024-06-06", "2024-06-01", RecomputeMode::Incremental),
                 ConfigurationError);
    EXPECT_FALSE(rankings_.hasResults("wins", "2024-06-04"));
}

TEST_F(FactorRankingServiceTest, BacktestRunsOnFactorRankings) {
    FactorRankingService service(metrics_, catalog_, rankings_);
    (void)service.run({"wins"}, "2024-06-01", "2024-06-06", RecomputeMode::Incremental);

    const BacktestEngine engine{BacktestConfig{}};
    const auto           result = engine.run("wins", rankings_, metrics_, "2024-06-04", "2024-06-06");

    EXPECT_EQ(result.summary.entryCount, 2);
    EXPECT_TRUE(result.skippedDates.empty());
    EXPECT_EQ(result.state.positions.size(), 2u);
}
