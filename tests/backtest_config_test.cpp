// backtest_config_test.cpp - backtest parameters from JSON and their validation

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "backtest/backtest_config.hpp"
#include "configuration_error.hpp"

// ===========================================================================
// 1. Defaults and parsing
// ===========================================================================
TEST(BacktestConfigTest, Defaults) {
    const BacktestConfig cfg;
    EXPECT_DOUBLE_EQ(cfg.initialCapital, 10000.0);
    EXPECT_EQ(cfg.sizing, PositionSizing::Fixed);
    EXPECT_DOUBLE_EQ(cfg.positionSize, 2500.0);
    EXPECT_DOUBLE_EQ(cfg.feeRate, 0.0);
    EXPECT_EQ(cfg.maxPositions, 3);
    EXPECT_EQ(cfg.entryTopN, 3);
    EXPECT_EQ(cfg.exitThreshold, 3);
    EXPECT_EQ(cfg.accrualMetric, Indicator::Roi1d);
    EXPECT_DOUBLE_EQ(cfg.capitalFraction, 0.5);
    EXPECT_DOUBLE_EQ(cfg.normalizer, 100.0);
    EXPECT_TRUE(cfg.accrueOnEntryDay);
    EXPECT_FALSE(cfg.closeAtEnd);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(BacktestConfigTest, NonObjectSectionGivesDefaults) {
    const auto cfg = BacktestConfig::fromJson(nlohmann::json());
    EXPECT_DOUBLE_EQ(cfg.initialCapital, 10000.0);
    EXPECT_EQ(cfg.maxPositions, 3);
}

TEST(BacktestConfigTest, ParsesEveryKey) {
    const auto cfg = BacktestConfig::fromJson(nlohmann::json::parse(R"({
        "initial_capital": 50000,
        "sizing": "proportional",
        "position_size": 0.2,
        "fee_rate": 0.001,
        "max_positions": 5,
        "entry_top_n": 4,
        "exit_threshold": 8,
        "accrual_metric": "7d_ROI",
        "capital_fraction": 1.0,
        "normalizer": 365,
        "accrue_on_entry_day": false,
        "close_at_end": true
    })"));

    EXPECT_DOUBLE_EQ(cfg.initialCapital, 50000.0);
    EXPECT_EQ(cfg.sizing, PositionSizing::Proportional);
    EXPECT_DOUBLE_EQ(cfg.positionSize, 0.2);
    EXPECT_DOUBLE_EQ(cfg.feeRate, 0.001);
    EXPECT_EQ(cfg.maxPositions, 5);
    EXPECT_EQ(cfg.entryTopN, 4);
    EXPECT_EQ(cfg.exitThreshold, 8);
    EXPECT_EQ(cfg.accrualMetric, Indicator::Roi7d);
    EXPECT_DOUBLE_EQ(cfg.capitalFraction, 1.0);
    EXPECT_DOUBLE_EQ(cfg.normalizer, 365.0);
    EXPECT_FALSE(cfg.accrueOnEntryDay);
    EXPECT_TRUE(cfg.closeAtEnd);
}

TEST(BacktestConfigTest, ToJsonUsesCanonicalNames) {
    BacktestConfig cfg;
    cfg.accrualMetric = Indicator::Return2d;

    const auto j = cfg.toJson();
    EXPECT_EQ(j["accrual_metric"], "return_2d");
    EXPECT_EQ(j["sizing"], "fixed");
    EXPECT_EQ(j["max_positions"], 3);

    const auto back = BacktestConfig::fromJson(j);
    EXPECT_EQ(back.accrualMetric, Indicator::Return2d);
}

// ===========================================================================
// 2. Rejections
// ===========================================================================
TEST(BacktestConfigTest, RejectsUnknownNames) {
    EXPECT_THROW((void)BacktestConfig::fromJson({{"sizing", "kelly"}}), ConfigurationError);
    EXPECT_THROW((void)BacktestConfig::fromJson({{"accrual_metric", "roi_3d"}}), ConfigurationError);
    EXPECT_THROW((void)BacktestConfig::fromJson({{"max_positions", "three"}}), ConfigurationError);
}

TEST(BacktestConfigTest, RejectsInvalidValues) {
    const auto rejects = [](auto mutate) {
        BacktestConfig cfg;
        mutate(cfg);
        EXPECT_THROW(cfg.validate(), ConfigurationError);
    };

    rejects([](BacktestConfig& c) { c.initialCapital = 0.0; });
    rejects([](BacktestConfig& c) { c.initialCapital = -100.0; });
    rejects([](BacktestConfig& c) { c.positionSize = 0.0; });
    rejects([](BacktestConfig& c) { c.feeRate = -0.01; });
    rejects([](BacktestConfig& c) { c.feeRate = 1.0; });
    rejects([](BacktestConfig& c) { c.maxPositions = 0; });
    rejects([](BacktestConfig& c) { c.entryTopN = 0; });
    rejects([](BacktestConfig& c) { c.exitThreshold = 0; });
    rejects([](BacktestConfig& c) { c.normalizer = 0.0; });
    rejects([](BacktestConfig& c) {
        c.sizing       = PositionSizing::Proportional;
        c.positionSize = 1.5;
    });
}
