#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "configuration_error.hpp"
#include "return_metrics.hpp"

struct ComponentConfig {
    std::string            name;
    std::vector<Indicator> indicators;
    std::vector<double>    weights;  // one per indicator, used as-is
    bool                   normalize         = false;
    bool                   volatilityPenalty = false;
};

struct FinalCombination {
    std::vector<std::string> scores;  // component names
    std::vector<double>      weights;
};

/**
 * @brief A named ranking strategy: scoring components plus their final blend.
 */
struct StrategyConfig {
    std::string                  name;
    std::string                  description;
    std::vector<ComponentConfig> components;
    FinalCombination             finalCombination;

    /**
     * @brief Index of a component by name, or -1.
     */
    [[nodiscard]] int componentIndex(const std::string& componentName) const;
};

/**
 * @brief Name -> StrategyConfig lookup loaded from JSON.
 *
 * Expected layout:
 * {
 *   "strategies": {
 *     "original": {
 *       "description": "...",
 *       "components": [
 *         { "name": "long_term_score", "indicators": ["roi_1d", ...],
 *           "weights": [1, ...], "normalize": true, "volatility_penalty": false }
 *       ],
 *       "final_combination": { "scores": ["long_term_score"], "weights": [1.0] }
 *     }
 *   }
 * }
 */
class StrategyCatalog {
   public:
    StrategyCatalog() = default;

    /**
     * @brief Parse and validate every strategy in the document.
     * @throws ConfigurationError on the first invalid strategy.
     */
    static StrategyCatalog fromJson(const nlohmann::json& document);

    /**
     * @brief Load a catalog from a JSON file.
     * @return nullptr if the file cannot be opened or parsed.
     * @throws ConfigurationError if a strategy in the file is invalid.
     */
    static std::shared_ptr<StrategyCatalog> loadFile(const std::string& path);

    /**
     * @brief Parse a single strategy definition.
     * @throws ConfigurationError naming the strategy and field at fault.
     */
    static StrategyConfig parseStrategy(const std::string& name, const nlohmann::json& definition);

    /**
     * @brief Check internal consistency of a strategy built in code.
     * @throws ConfigurationError
     */
    static void validate(const StrategyConfig& strategy);

    /**
     * @brief Add or replace a strategy after validating it.
     */
    void add(StrategyConfig strategy);

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @throws ConfigurationError for an unknown strategy name.
     */
    [[nodiscard]] const StrategyConfig& get(const std::string& name) const;

    /**
     * @brief All strategy names, sorted.
     */
    [[nodiscard]] std::vector<std::string> names() const;

    /**
     * @brief Multi-line human readable description of a strategy.
     */
    [[nodiscard]] std::string describe(const std::string& name) const;

    [[nodiscard]] std::size_t size() const {
        return strategies_.size();
    }

   private:
    std::map<std::string, StrategyConfig> strategies_;
};
