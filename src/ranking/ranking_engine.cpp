#include "ranking/ranking_engine.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

#include "cross_section.hpp"

std::vector<double> RankingEngine::extract(Indicator indicator, const std::vector<ReturnMetricRecord>& members) {
    std::vector<double> values;
    values.reserve(members.size());
    for (const auto& m : members) {
        values.push_back(xsection::zeroFilled(m.get(indicator)));
    }
    return values;
}

std::vector<double> RankingEngine::componentScores(const ComponentConfig&                 component,
                                                   const std::vector<ReturnMetricRecord>& members) {
    const auto n = members.size();

    // columns[k][i]: indicator k of member i, after optional normalization
    std::vector<std::vector<double>> columns;
    columns.reserve(component.indicators.size());
    for (const auto& indicator : component.indicators) {
        auto column = extract(indicator, members);
        if (component.normalize) {
            column = xsection::zScore(column);
        }
        columns.push_back(std::move(column));
    }

    std::vector<double> score(n, 0.0);
    for (std::size_t k = 0; k < columns.size(); ++k) {
        const double w = k < component.weights.size() ? component.weights[k] : 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            score[i] += columns[k][i] * w;
        }
    }

    /* Volatility penalty: damp members whose indicators disagree */
    if (component.volatilityPenalty) {
        std::vector<double> row(columns.size());
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t k = 0; k < columns.size(); ++k) {
                row[k] = columns[k][i];
            }
            score[i] *= xsection::dampingFactor(xsection::populationStdDev(row));
        }
    }

    // Overflowing inputs must not leak inf/NaN into the ordering
    for (auto& s : score) {
        s = xsection::zeroFilled(s);
    }
    return score;
}

std::string RankingEngine::formatCombination(const StrategyConfig& strategy, const std::vector<double>& scores,
                                             double finalScore) {
    std::ostringstream out;
    out << std::fixed;
    for (std::size_t j = 0; j < strategy.finalCombination.scores.size(); ++j) {
        out << (j ? " + " : "") << strategy.finalCombination.scores[j] << "(" << std::setprecision(4) << scores[j]
            << ")*" << std::setprecision(3) << strategy.finalCombination.weights[j];
    }
    out << " = " << std::setprecision(4) << finalScore;
    return out.str();
}

std::vector<RankingResult> RankingEngine::rank(const StrategyConfig& strategy, const std::string& date,
                                               const std::vector<ReturnMetricRecord>& crossSection) {
    StrategyCatalog::validate(strategy);

    std::vector<ReturnMetricRecord> members;
    for (const auto& r : crossSection) {
        if (r.date == date) {
            members.push_back(r);
        }
    }
    if (members.empty()) {
        return {};
    }

    const auto n = members.size();

    // 1. Component scores
    std::vector<std::vector<double>> components;
    components.reserve(strategy.components.size());
    for (const auto& c : strategy.components) {
        components.push_back(componentScores(c, members));
    }

    // 2. Final blend
    const auto&                      fc = strategy.finalCombination;
    std::vector<double>              finalScores(n, 0.0);
    std::vector<std::vector<double>> blendInputs(n, std::vector<double>(fc.scores.size(), 0.0));
    for (std::size_t j = 0; j < fc.scores.size(); ++j) {
        const auto& component = components[static_cast<std::size_t>(strategy.componentIndex(fc.scores[j]))];
        for (std::size_t i = 0; i < n; ++i) {
            blendInputs[i][j] = component[i];
            finalScores[i] += component[i] * fc.weights[j];
        }
    }
    for (auto& s : finalScores) {
        s = xsection::zeroFilled(s);
    }

    // 3. Order: score descending, trading pair ascending on ties
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        if (finalScores[a] != finalScores[b]) {
            return finalScores[a] > finalScores[b];
        }
        return members[a].tradingPair < members[b].tradingPair;
    });

    std::vector<std::string> componentNames;
    componentNames.reserve(strategy.components.size());
    for (const auto& c : strategy.components) {
        componentNames.push_back(c.name);
    }

    std::vector<RankingResult> results;
    results.reserve(n);
    for (std::size_t pos = 0; pos < n; ++pos) {
        const auto i = order[pos];

        RankingResult r;
        r.strategyName   = strategy.name;
        r.date           = date;
        r.tradingPair    = members[i].tradingPair;
        r.componentNames = componentNames;
        r.componentScores.reserve(components.size());
        for (const auto& c : components) {
            r.componentScores.push_back(c[i]);
        }
        r.finalScore   = finalScores[i];
        r.rankPosition = static_cast<int>(pos + 1);
        r.combination  = formatCombination(strategy, blendInputs[i], finalScores[i]);

        results.push_back(std::move(r));
    }

    return results;
}
