#include "factor/factor_library.hpp"

#include <algorithm>
#include <cmath>

#include "cross_section.hpp"

std::vector<double> FactorLibrary::finiteOnly(const std::vector<double>& series) {
    std::vector<double> values;
    values.reserve(series.size());
    for (const auto& v : series) {
        if (std::isfinite(v)) {
            values.push_back(v);
        }
    }
    return values;
}

double FactorLibrary::trendSlope(const std::vector<double>& series) {
    const auto values = finiteOnly(series);
    if (values.size() < 2) {
        return kNaN;
    }

    const auto   n  = static_cast<double>(values.size());
    const double xm = (n - 1.0) / 2.0;
    const double ym = xsection::mean(values);

    double sxy = 0.0;
    double sxx = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        const double dx = static_cast<double>(i) - xm;
        sxy += dx * (values[i] - ym);
        sxx += dx * dx;
    }
    return sxy / sxx;
}

double FactorLibrary::sharpeRatio(const std::vector<double>& series, double annualizingFactor, double highScore) {
    const auto values = finiteOnly(series);
    if (values.empty()) {
        return kNaN;
    }

    const double mean   = xsection::mean(values);
    const double stdDev = xsection::sampleStdDev(values);
    if (stdDev == 0.0) {
        return mean > 0.0 ? highScore : 0.0;
    }
    return (mean / stdDev) * std::sqrt(annualizingFactor);
}

double FactorLibrary::invStdDev(const std::vector<double>& series, double epsilon, double highScore) {
    const auto values = finiteOnly(series);
    if (values.empty() || xsection::mean(values) <= 0.0) {
        return 0.0;
    }

    const double stdDev = xsection::sampleStdDev(values);
    if (stdDev < epsilon) {
        return highScore;
    }
    return 1.0 / stdDev;
}

double FactorLibrary::winRate(const std::vector<double>& series) {
    const auto values = finiteOnly(series);
    if (values.empty()) {
        return 0.0;
    }
    const auto wins = std::count_if(values.begin(), values.end(), [](double v) { return v > 0.0; });
    return static_cast<double>(wins) / static_cast<double>(values.size());
}

double FactorLibrary::maxDrawdown(const std::vector<double>& series) {
    const auto values = finiteOnly(series);

    double cumulative = 1.0;
    double peak       = 0.0;
    double worst      = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        cumulative *= 1.0 + values[i];
        peak = i == 0 ? cumulative : std::max(peak, cumulative);
        if (peak != 0.0) {
            worst = std::min(worst, (cumulative - peak) / peak);
        }
    }
    return worst;
}

double FactorLibrary::sortinoRatio(const std::vector<double>& series, double annualizingFactor, double highScore) {
    const auto values = finiteOnly(series);
    if (values.empty()) {
        return kNaN;
    }

    const double        mean = xsection::mean(values);
    std::vector<double> downside;
    for (const auto& v : values) {
        if (v < 0.0) {
            downside.push_back(v);
        }
    }

    // sampleStdDev is 0 below two values, which covers "no downside" too
    const double downsideStd = xsection::sampleStdDev(downside);
    if (downsideStd == 0.0) {
        return mean > 0.0 ? highScore : 0.0;
    }
    return (mean / downsideStd) * std::sqrt(annualizingFactor);
}
