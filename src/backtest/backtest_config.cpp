#include "backtest/backtest_config.hpp"

#include <cmath>

#include "configuration_error.hpp"

BacktestConfig BacktestConfig::fromJson(const nlohmann::json& section) {
    BacktestConfig cfg;
    if (!section.is_object()) {
        cfg.validate();
        return cfg;
    }

    try {
        cfg.initialCapital = section.value("initial_capital", cfg.initialCapital);
        cfg.positionSize   = section.value("position_size", cfg.positionSize);
        cfg.feeRate        = section.value("fee_rate", cfg.feeRate);
        cfg.maxPositions   = section.value("max_positions", cfg.maxPositions);
        cfg.entryTopN      = section.value("entry_top_n", cfg.entryTopN);
        cfg.exitThreshold  = section.value("exit_threshold", cfg.exitThreshold);

        cfg.capitalFraction  = section.value("capital_fraction", cfg.capitalFraction);
        cfg.normalizer       = section.value("normalizer", cfg.normalizer);
        cfg.accrueOnEntryDay = section.value("accrue_on_entry_day", cfg.accrueOnEntryDay);
        cfg.closeAtEnd       = section.value("close_at_end", cfg.closeAtEnd);

        const auto sizing = section.value("sizing", std::string("fixed"));
        if (sizing == "fixed") {
            cfg.sizing = PositionSizing::Fixed;
        } else if (sizing == "proportional") {
            cfg.sizing = PositionSizing::Proportional;
        } else {
            throw ConfigurationError("backtest: unknown sizing '" + sizing + "' (expected fixed|proportional)");
        }

        const auto metric    = section.value("accrual_metric", indicatorName(cfg.accrualMetric));
        const auto indicator = indicatorFromName(metric);
        if (!indicator) {
            throw ConfigurationError("backtest: unknown accrual_metric '" + metric + "'");
        }
        cfg.accrualMetric = *indicator;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("backtest: malformed section: ") + e.what());
    }

    cfg.validate();
    return cfg;
}

nlohmann::json BacktestConfig::toJson() const {
    return {
        {"initial_capital", initialCapital},
        {"sizing", sizing == PositionSizing::Fixed ? "fixed" : "proportional"},
        {"position_size", positionSize},
        {"fee_rate", feeRate},
        {"max_positions", maxPositions},
        {"entry_top_n", entryTopN},
        {"exit_threshold", exitThreshold},
        {"accrual_metric", indicatorName(accrualMetric)},
        {"capital_fraction", capitalFraction},
        {"normalizer", normalizer},
        {"accrue_on_entry_day", accrueOnEntryDay},
        {"close_at_end", closeAtEnd},
    };
}

void BacktestConfig::validate() const {
    const auto fail = [](const std::string& what) { throw ConfigurationError("backtest: " + what); };

    if (!std::isfinite(initialCapital) || initialCapital <= 0.0) {
        fail("initial_capital must be positive");
    }
    if (!std::isfinite(positionSize) || positionSize <= 0.0) {
        fail("position_size must be positive");
    }
    if (sizing == PositionSizing::Proportional && positionSize > 1.0) {
        fail("proportional position_size is a fraction of equity and must be <= 1");
    }
    if (!std::isfinite(feeRate) || feeRate < 0.0 || feeRate >= 1.0) {
        fail("fee_rate must be in [0, 1)");
    }
    if (maxPositions < 1) {
        fail("max_positions must be >= 1");
    }
    if (entryTopN < 1) {
        fail("entry_top_n must be >= 1");
    }
    if (exitThreshold < 1) {
        fail("exit_threshold must be >= 1");
    }
    if (!std::isfinite(capitalFraction)) {
        fail("capital_fraction must be finite");
    }
    if (!std::isfinite(normalizer) || std::fabs(normalizer) < 1e-12) {
        fail("normalizer must be non-zero");
    }
}
