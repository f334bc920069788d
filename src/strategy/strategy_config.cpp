#include "strategy/strategy_config.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

int StrategyConfig::componentIndex(const std::string& componentName) const {
    for (std::size_t i = 0; i < components.size(); ++i) {
        if (components[i].name == componentName) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

StrategyCatalog StrategyCatalog::fromJson(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("strategies") || !document["strategies"].is_object()) {
        throw ConfigurationError("configuration has no \"strategies\" object");
    }

    StrategyCatalog catalog;
    for (const auto& [name, definition] : document["strategies"].items()) {
        catalog.add(parseStrategy(name, definition));
    }
    return catalog;
}

std::shared_ptr<StrategyCatalog> StrategyCatalog::loadFile(const std::string& path) {
    nlohmann::json document;
    {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "Error: Cannot open strategy config: " << path << std::endl;
            return nullptr;
        }
        try {
            f >> document;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Strategy config parse error: " << e.what() << std::endl;
            return nullptr;
        }
    }
    return std::make_shared<StrategyCatalog>(fromJson(document));
}

StrategyConfig StrategyCatalog::parseStrategy(const std::string& name, const nlohmann::json& definition) {
    const auto fail = [&name](const std::string& what) {
        throw ConfigurationError("strategy '" + name + "': " + what);
    };

    if (!definition.is_object()) {
        fail("definition must be an object");
    }

    StrategyConfig strategy;
    strategy.name        = name;
    strategy.description = definition.value("description", name);

    if (!definition.contains("components") || !definition["components"].is_array()) {
        fail("missing \"components\" array");
    }

    try {
        for (const auto& c : definition["components"]) {
            ComponentConfig component;
            component.name              = c.value("name", "");
            component.normalize         = c.value("normalize", false);
            component.volatilityPenalty = c.value("volatility_penalty", false);

            if (!c.contains("indicators") || !c["indicators"].is_array()) {
                fail("component '" + component.name + "' has no \"indicators\" array");
            }
            for (const auto& ind : c["indicators"]) {
                const auto field     = ind.get<std::string>();
                const auto indicator = indicatorFromName(field);
                if (!indicator) {
                    fail("component '" + component.name + "' references unknown indicator '" + field + "'");
                }
                component.indicators.push_back(*indicator);
            }

            if (c.contains("weights") && c["weights"].is_array()) {
                component.weights = c["weights"].get<std::vector<double>>();
            }

            strategy.components.push_back(std::move(component));
        }

        if (!definition.contains("final_combination") || !definition["final_combination"].is_object()) {
            fail("missing \"final_combination\" object");
        }
        const auto& fc = definition["final_combination"];
        if (fc.contains("scores") && fc["scores"].is_array()) {
            strategy.finalCombination.scores = fc["scores"].get<std::vector<std::string>>();
        }
        if (fc.contains("weights") && fc["weights"].is_array()) {
            strategy.finalCombination.weights = fc["weights"].get<std::vector<double>>();
        }
    } catch (const nlohmann::json::exception& e) {
        fail(std::string("malformed definition: ") + e.what());
    }

    validate(strategy);
    return strategy;
}

void StrategyCatalog::validate(const StrategyConfig& strategy) {
    const auto fail = [&strategy](const std::string& what) {
        throw ConfigurationError("strategy '" + strategy.name + "': " + what);
    };

    if (strategy.components.empty()) {
        fail("no components defined");
    }

    std::set<std::string> seen;
    for (const auto& c : strategy.components) {
        if (c.name.empty()) {
            fail("component without a name");
        }
        if (!seen.insert(c.name).second) {
            fail("duplicate component '" + c.name + "'");
        }
        if (c.indicators.empty()) {
            fail("component '" + c.name + "' has no indicators");
        }
        if (c.weights.size() != c.indicators.size()) {
            fail("component '" + c.name + "' has " + std::to_string(c.weights.size()) + " weights for "
                 + std::to_string(c.indicators.size()) + " indicators");
        }
        for (const auto& w : c.weights) {
            if (!std::isfinite(w)) {
                fail("component '" + c.name + "' has a non-finite weight");
            }
        }
    }

    const auto& fc = strategy.finalCombination;
    if (fc.scores.empty()) {
        fail("final combination is empty");
    }
    if (fc.weights.size() != fc.scores.size()) {
        fail("final combination has " + std::to_string(fc.weights.size()) + " weights for "
             + std::to_string(fc.scores.size()) + " scores");
    }
    for (const auto& s : fc.scores) {
        if (strategy.componentIndex(s) < 0) {
            fail("final combination references unknown component '" + s + "'");
        }
    }
    for (const auto& w : fc.weights) {
        if (!std::isfinite(w)) {
            fail("final combination has a non-finite weight");
        }
    }
}

void StrategyCatalog::add(StrategyConfig strategy) {
    validate(strategy);
    const auto name    = strategy.name;
    strategies_[name] = std::move(strategy);
}

bool StrategyCatalog::contains(const std::string& name) const {
    return strategies_.count(name) > 0;
}

const StrategyConfig& StrategyCatalog::get(const std::string& name) const {
    const auto it = strategies_.find(name);
    if (it == strategies_.end()) {
        throw ConfigurationError("unknown strategy '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> StrategyCatalog::names() const {
    std::vector<std::string> result;
    result.reserve(strategies_.size());
    for (const auto& [name, _] : strategies_) {
        result.push_back(name);
    }
    return result;
}

std::string StrategyCatalog::describe(const std::string& name) const {
    const auto& s = get(name);

    std::ostringstream out;
    out << "Strategy: " << s.name << " - " << s.description << "\n";
    out << std::string(40, '=') << "\n";

    for (const auto& c : s.components) {
        out << "Component: " << c.name << "\n";
        out << "  Indicators: ";
        for (std::size_t i = 0; i < c.indicators.size(); ++i) {
            out << (i ? ", " : "") << indicatorName(c.indicators[i]);
        }
        out << "\n  Weights:    ";
        for (std::size_t i = 0; i < c.weights.size(); ++i) {
            out << (i ? ", " : "") << c.weights[i];
        }
        out << "\n  Normalize:  " << (c.normalize ? "yes" : "no") << "\n";
        if (c.volatilityPenalty) {
            out << "  Volatility penalty\n";
        }
        out << "\n";
    }

    out << "Final combination:\n";
    for (std::size_t i = 0; i < s.finalCombination.scores.size(); ++i) {
        out << "  " << s.finalCombination.scores[i] << ": " << std::fixed << std::setprecision(1)
            << s.finalCombination.weights[i] * 100.0 << "%\n";
    }
    return out.str();
}
