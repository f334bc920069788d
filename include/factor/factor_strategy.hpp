#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "configuration_error.hpp"
#include "return_metrics.hpp"

enum class FactorFunction
{
    TrendSlope,
    SharpeRatio,
    InvStdDev,
    WinRate,
    MaxDrawdown,
    SortinoRatio
};

/**
 * @brief Config name of a factor function, e.g. "calculate_sharpe_ratio".
 */
std::string factorFunctionName(FactorFunction function);

std::optional<FactorFunction> factorFunctionFromName(const std::string& name);

struct FactorConfig {
    std::string    name;
    FactorFunction function = FactorFunction::TrendSlope;
    int            window   = 30;  // most recent rows of the pair fed to the function
    Indicator      input    = Indicator::Roi1d;

    /* ----- Function parameters (unused ones are ignored) ----- */
    double annualizingFactor = 365.0;
    double epsilon           = 1e-9;
    double highScore         = 1e9;
};

/**
 * @brief Ranking built from per-pair time-series factors rather than from one
 *        date's cross-section.
 */
struct FactorStrategy {
    std::string name;
    std::string description;

    /* ----- Data requirements ----- */
    int minDataDays    = 1;  // calendar days of history the store must hold before the target date
    int skipFirstNDays = 0;  // pairs listed fewer days than this are left out

    std::vector<FactorConfig> factors;

    /* ----- Ranking logic: weighted mean of the named factors ----- */
    std::vector<std::string> rankingFactors;
    std::vector<double>      rankingWeights;

    /**
     * @brief Index of a factor by name, or -1.
     */
    [[nodiscard]] int factorIndex(const std::string& factorName) const;

    /**
     * @brief Largest factor window.
     */
    [[nodiscard]] int maxWindow() const;

    /**
     * @brief Calendar days of history needed to rank one date:
     *        max(minDataDays, maxWindow) + skipFirstNDays.
     */
    [[nodiscard]] int lookbackDays() const;
};

/**
 * @brief Name -> FactorStrategy lookup loaded from JSON.
 *
 * Expected layout (the section is optional in a config document):
 * {
 *   "factor_strategies": {
 *     "cerebrum_core": {
 *       "description": "...",
 *       "data_requirements": { "min_data_days": 30, "skip_first_n_days": 3 },
 *       "factors": {
 *         "F_sharpe": { "function": "calculate_sharpe_ratio", "window": 60,
 *                       "input_col": "roi_1d", "params": { "annualizing_factor": 365 } }
 *       },
 *       "ranking_logic": { "indicators": ["F_sharpe"], "weights": [1.0] }
 *     }
 *   }
 * }
 */
class FactorStrategyCatalog {
   public:
    FactorStrategyCatalog() = default;

    /**
     * @brief Parse every strategy of the "factor_strategies" section.
     *        A document without the section gives an empty catalog.
     * @throws ConfigurationError on the first invalid strategy.
     */
    static FactorStrategyCatalog fromJson(const nlohmann::json& document);

    /**
     * @throws ConfigurationError naming the strategy and field at fault.
     */
    static FactorStrategy parseStrategy(const std::string& name, const nlohmann::json& definition);

    /**
     * @throws ConfigurationError
     */
    static void validate(const FactorStrategy& strategy);

    void add(FactorStrategy strategy);

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @throws ConfigurationError for an unknown strategy name.
     */
    [[nodiscard]] const FactorStrategy& get(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::string describe(const std::string& name) const;

    [[nodiscard]] std::size_t size() const {
        return strategies_.size();
    }

   private:
    std::map<std::string, FactorStrategy> strategies_;
};
