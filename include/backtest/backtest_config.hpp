#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "return_metrics.hpp"

enum class PositionSizing
{
    Fixed,        // allocate `positionSize` currency units per entry
    Proportional  // allocate `positionSize` x current equity per entry
};

struct BacktestConfig {
    double         initialCapital = 10000.0;
    PositionSizing sizing         = PositionSizing::Fixed;
    double         positionSize   = 2500.0;
    double         feeRate        = 0.0;  // charged on entry and exit notional

    int maxPositions  = 3;
    int entryTopN     = 3;
    int exitThreshold = 3;  // held pairs ranked worse than this are closed

    /* ----- Funding accrual: allocated * capitalFraction * metric / normalizer ----- */
    Indicator accrualMetric   = Indicator::Roi1d;
    double    capitalFraction = 0.5;    // each hedged pair is two legs; one leg earns the funding spread
    double    normalizer      = 100.0;  // roi_1d is expressed in percent

    bool accrueOnEntryDay = true;
    bool closeAtEnd       = false;

    /**
     * @brief Build from the "backtest" section of a config document.
     *        Missing keys keep their defaults.
     * @throws ConfigurationError on unknown enum values or invalid numbers.
     */
    static BacktestConfig fromJson(const nlohmann::json& section);

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @throws ConfigurationError naming the offending parameter.
     */
    void validate() const;
};
