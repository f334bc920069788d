#include "factor/factor_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

// clang-format off
const std::map<FactorFunction, std::string> kFunctionNames = {
    {FactorFunction::TrendSlope,   "calculate_trend_slope"},
    {FactorFunction::SharpeRatio,  "calculate_sharpe_ratio"},
    {FactorFunction::InvStdDev,    "calculate_inv_std_dev"},
    {FactorFunction::WinRate,      "calculate_win_rate"},
    {FactorFunction::MaxDrawdown,  "calculate_max_drawdown"},
    {FactorFunction::SortinoRatio, "calculate_sortino_ratio"},
};
// clang-format on

}  // namespace

std::string factorFunctionName(FactorFunction function) {
    return kFunctionNames.at(function);
}

std::optional<FactorFunction> factorFunctionFromName(const std::string& name) {
    for (const auto& [function, functionName] : kFunctionNames) {
        if (functionName == name) {
            return function;
        }
    }
    return std::nullopt;
}

int FactorStrategy::factorIndex(const std::string& factorName) const {
    for (std::size_t i = 0; i < factors.size(); ++i) {
        if (factors[i].name == factorName) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

int FactorStrategy::maxWindow() const {
    int window = 0;
    for (const auto& f : factors) {
        window = std::max(window, f.window);
    }
    return window;
}

int FactorStrategy::lookbackDays() const {
    return std::max(minDataDays, maxWindow()) + skipFirstNDays;
}

FactorStrategyCatalog FactorStrategyCatalog::fromJson(const nlohmann::json& document) {
    FactorStrategyCatalog catalog;
    if (!document.is_object() || !document.contains("factor_strategies")) {
        return catalog;
    }
    if (!document["factor_strategies"].is_object()) {
        throw ConfigurationError("\"factor_strategies\" must be an object");
    }

    for (const auto& [name, definition] : document["factor_strategies"].items()) {
        catalog.add(parseStrategy(name, definition));
    }
    return catalog;
}

FactorStrategy FactorStrategyCatalog::parseStrategy(const std::string& name, const nlohmann::json& definition) {
    const auto fail = [&name](const std::string& what) {
        throw ConfigurationError("factor strategy '" + name + "': " + what);
    };

    if (!definition.is_object()) {
        fail("definition must be an object");
    }

    FactorStrategy strategy;
    strategy.name        = name;
    strategy.description = definition.value("description", name);

    try {
        const auto requirements  = definition.value("data_requirements", nlohmann::json::object());
        strategy.minDataDays    = requirements.value("min_data_days", strategy.minDataDays);
        strategy.skipFirstNDays = requirements.value("skip_first_n_days", strategy.skipFirstNDays);

        if (!definition.contains("factors") || !definition["factors"].is_object()) {
            fail("missing \"factors\" object");
        }
        for (const auto& [factorName, f] : definition["factors"].items()) {
            FactorConfig factor;
            factor.name   = factorName;
            factor.window = f.value("window", factor.window);

            const auto functionName = f.value("function", "");
            const auto function     = factorFunctionFromName(functionName);
            if (!function) {
                fail("factor '" + factorName + "' uses unknown function '" + functionName + "'");
            }
            factor.function = *function;

            const auto inputName = f.value("input_col", indicatorName(factor.input));
            const auto input     = indicatorFromName(inputName);
            if (!input) {
                fail("factor '" + factorName + "' reads unknown indicator '" + inputName + "'");
            }
            factor.input = *input;

            const auto params        = f.value("params", nlohmann::json::object());
            factor.annualizingFactor = params.value("annualizing_factor", factor.annualizingFactor);
            factor.epsilon           = params.value("epsilon", factor.epsilon);
            factor.highScore         = params.value("high_score", factor.highScore);

            strategy.factors.push_back(std::move(factor));
        }

        if (!definition.contains("ranking_logic") || !definition["ranking_logic"].is_object()) {
            fail("missing \"ranking_logic\" object");
        }
        const auto& logic = definition["ranking_logic"];
        if (logic.contains("indicators") && logic["indicators"].is_array()) {
            strategy.rankingFactors = logic["indicators"].get<std::vector<std::string>>();
        }
        if (logic.contains("weights") && logic["weights"].is_array()) {
            strategy.rankingWeights = logic["weights"].get<std::vector<double>>();
        }
    } catch (const nlohmann::json::exception& e) {
        fail(std::string("malformed definition: ") + e.what());
    }

    validate(strategy);
    return strategy;
}

void FactorStrategyCatalog::validate(const FactorStrategy& strategy) {
    const auto fail = [&strategy](const std::string& what) {
        throw ConfigurationError("factor strategy '" + strategy.name + "': " + what);
    };

    if (strategy.minDataDays < 1) {
        fail("min_data_days must be >= 1");
    }
    if (strategy.skipFirstNDays < 0) {
        fail("skip_first_n_days must be >= 0");
    }
    if (strategy.factors.empty()) {
        fail("no factors defined");
    }
    for (const auto& f : strategy.factors) {
        if (f.window < 1) {
            fail("factor '" + f.name + "' window must be >= 1");
        }
        if (!std::isfinite(f.annualizingFactor) || f.annualizingFactor <= 0.0) {
            fail("factor '" + f.name + "' annualizing_factor must be > 0");
        }
    }

    if (strategy.rankingFactors.empty()) {
        fail("ranking logic is empty");
    }
    if (strategy.rankingWeights.size() != strategy.rankingFactors.size()) {
        fail("ranking logic has " + std::to_string(strategy.rankingWeights.size()) + " weights for "
             + std::to_string(strategy.rankingFactors.size()) + " factors");
    }
    for (const auto& name : strategy.rankingFactors) {
        if (strategy.factorIndex(name) < 0) {
            fail("ranking logic references unknown factor '" + name + "'");
        }
    }
    for (const auto& w : strategy.rankingWeights) {
        if (!std::isfinite(w)) {
            fail("ranking logic has a non-finite weight");
        }
    }
}

void FactorStrategyCatalog::add(FactorStrategy strategy) {
    validate(strategy);
    const auto name    = strategy.name;
    strategies_[name] = std::move(strategy);
}

bool FactorStrategyCatalog::contains(const std::string& name) const {
    return strategies_.count(name) > 0;
}

const FactorStrategy& FactorStrategyCatalog::get(const std::string& name) const {
    const auto it = strategies_.find(name);
    if (it == strategies_.end()) {
        throw ConfigurationError("unknown factor strategy '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> FactorStrategyCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(strategies_.size());
    for (const auto& [name, _] : strategies_) {
        result.push_back(name);
    }
    return result;
}

std::string FactorStrategyCatalog::describe(const std::string& name) const {
    const auto& s = get(name);

    std::ostringstream out;
    out << "Factor strategy: " << s.name << " - " << s.description << "\n";
    out << std::string(40, '=') << "\n";
    out << "Data: min " << s.minDataDays << " days, skip first " << s.skipFirstNDays << " days\n\n";

    for (const auto& f : s.factors) {
        out << "Factor: " << f.name << "\n";
        out << "  Function: " << factorFunctionName(f.function) << "\n";
        out << "  Input:    " << indicatorName(f.input) << " (last " << f.window << " days)\n";
    }

    out << "\nRanking logic:\n";
    for (std::size_t i = 0; i < s.rankingFactors.size(); ++i) {
        out << "  " << s.rankingFactors[i] << ": " << std::fixed << std::setprecision(1)
            << s.rankingWeights[i] * 100.0 << "%\n";
    }
    return out.str();
}
