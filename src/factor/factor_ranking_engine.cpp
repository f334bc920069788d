#include "factor/factor_ranking_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <map>
#include <sstream>

#include "date_utils.hpp"
#include "factor/factor_library.hpp"

double FactorRankingEngine::factorScore(const FactorConfig& factor, const std::vector<std::optional<double>>& rows) {
    const auto window      = static_cast<std::size_t>(factor.window);
    const auto minRequired = std::max<std::size_t>(2, std::min<std::size_t>(window / 4, 3));

    const auto used = std::min(window, rows.size());
    if (used < minRequired) {
        return FactorLibrary::kNaN;
    }

    // Absent values become NaN; the library drops them
    std::vector<double> series;
    series.reserve(used);
    for (auto it = rows.end() - static_cast<std::ptrdiff_t>(used); it != rows.end(); ++it) {
        series.push_back(it->value_or(FactorLibrary::kNaN));
    }

    switch (factor.function) {
    case FactorFunction::TrendSlope:
        return FactorLibrary::trendSlope(series);
    case FactorFunction::SharpeRatio:
        return FactorLibrary::sharpeRatio(series, factor.annualizingFactor, factor.highScore);
    case FactorFunction::InvStdDev:
        return FactorLibrary::invStdDev(series, factor.epsilon, factor.highScore);
    case FactorFunction::WinRate:
        return FactorLibrary::winRate(series);
    case FactorFunction::MaxDrawdown:
        return FactorLibrary::maxDrawdown(series);
    case FactorFunction::SortinoRatio:
        return FactorLibrary::sortinoRatio(series, factor.annualizingFactor, factor.highScore);
    }
    return FactorLibrary::kNaN;
}

double FactorRankingEngine::combine(const FactorStrategy& strategy, const std::vector<double>& factorScores) {
    double weightedSum = 0.0;
    double totalWeight = 0.0;
    for (std::size_t j = 0; j < strategy.rankingFactors.size(); ++j) {
        const auto   index = strategy.factorIndex(strategy.rankingFactors[j]);
        const double score = index >= 0 ? factorScores[static_cast<std::size_t>(index)] : FactorLibrary::kNaN;
        if (std::isnan(score)) {
            continue;
        }
        weightedSum += score * strategy.rankingWeights[j];
        totalWeight += strategy.rankingWeights[j];
    }

    if (totalWeight == 0.0) {
        return FactorLibrary::kNaN;
    }
    return weightedSum / totalWeight;
}

bool FactorRankingEngine::hasSufficientHistory(const FactorStrategy& strategy, const std::string& earliestDate,
                                               const std::string& date) {
    if (!dates::isValid(earliestDate) || !dates::isValid(date)) {
        return false;
    }
    const auto available = dates::daysBetween(earliestDate, date) + 1;
    return available >= strategy.lookbackDays();
}

std::string FactorRankingEngine::formatCombination(const FactorStrategy& strategy,
                                                   const std::vector<double>& factorScores, double finalScore) {
    std::ostringstream out;
    out << std::fixed;

    double      totalWeight = 0.0;
    std::size_t terms       = 0;
    for (std::size_t j = 0; j < strategy.rankingFactors.size(); ++j) {
        const auto   index = strategy.factorIndex(strategy.rankingFactors[j]);
        const double score = factorScores[static_cast<std::size_t>(index)];
        if (std::isnan(score)) {
            continue;
        }
        out << (terms++ ? " + " : "") << strategy.rankingFactors[j] << "(" << std::setprecision(4) << score
            << ")*" << std::setprecision(3) << strategy.rankingWeights[j];
        totalWeight += strategy.rankingWeights[j];
    }
    out << " / " << std::setprecision(3) << totalWeight << " = " << std::setprecision(4) << finalScore;
    return out.str();
}

std::vector<RankingResult> FactorRankingEngine::rank(const FactorStrategy& strategy, const std::string& date,
                                                     const std::vector<ReturnMetricRecord>& history) {
    FactorStrategyCatalog::validate(strategy);

    // trading pair -> rows up to `date`, oldest first
    std::map<std::string, std::vector<const ReturnMetricRecord*>> byPair;
    for (const auto& r : history) {
        if (r.date <= date) {
            byPair[r.tradingPair].push_back(&r);
        }
    }

    std::vector<std::string> factorNames;
    factorNames.reserve(strategy.factors.size());
    for (const auto& f : strategy.factors) {
        factorNames.push_back(f.name);
    }

    std::vector<RankingResult> results;
    for (auto& [pair, rows] : byPair) {
        std::sort(rows.begin(), rows.end(),
                  [](const ReturnMetricRecord* a, const ReturnMetricRecord* b) { return a->date < b->date; });

        if (dates::daysBetween(rows.front()->date, date) < strategy.skipFirstNDays) {
            continue;
        }

        std::vector<double> scores;
        scores.reserve(strategy.factors.size());
        bool anyComputable = false;
        for (const auto& f : strategy.factors) {
            std::vector<std::optional<double>> values;
            values.reserve(rows.size());
            for (const auto* row : rows) {
                values.push_back(row->get(f.input));
            }
            scores.push_back(factorScore(f, values));
            anyComputable = anyComputable || !std::isnan(scores.back());
        }
        if (!anyComputable) {
            continue;
        }

        const double finalScore = combine(strategy, scores);
        if (!std::isfinite(finalScore)) {
            continue;
        }

        RankingResult r;
        r.strategyName    = strategy.name;
        r.date            = date;
        r.tradingPair     = pair;
        r.componentNames  = factorNames;
        r.componentScores = scores;
        r.finalScore      = finalScore;
        r.combination     = formatCombination(strategy, scores, finalScore);
        results.push_back(std::move(r));
    }

    // Score descending, trading pair ascending on ties
    std::sort(results.begin(), results.end(), [](const RankingResult& a, const RankingResult& b) {
        if (a.finalScore != b.finalScore) {
            return a.finalScore > b.finalScore;
        }
        return a.tradingPair < b.tradingPair;
    });
    for (std::size_t i = 0; i < results.size(); ++i) {
        results[i].rankPosition = static_cast<int>(i + 1);
    }

    return results;
}
