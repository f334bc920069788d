#pragma once

#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace xsection {

/**
 * @brief Replace absent or non-finite values with 0.
 */
[[nodiscard]] inline double zeroFilled(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value)) {
        return 0.0;
    }
    return *value;
}

/**
 * @brief Arithmetic mean. 0 for an empty series.
 */
[[nodiscard]] inline double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto& v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

/**
 * @brief Sample standard deviation (n - 1 denominator).
 * @return 0 when fewer than two values are given.
 */
[[nodiscard]] inline double sampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double m        = mean(values);
    double       variance = 0.0;
    for (const auto& v : values) {
        variance += (v - m) * (v - m);
    }
    variance /= static_cast<double>(values.size() - 1);
    return std::sqrt(variance);
}

/**
 * @brief Population standard deviation (n denominator).
 * @return 0 for an empty series.
 */
[[nodiscard]] inline double populationStdDev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double m        = mean(values);
    double       variance = 0.0;
    for (const auto& v : values) {
        variance += (v - m) * (v - m);
    }
    variance /= static_cast<double>(values.size());
    return std::sqrt(variance);
}

/**
 * @brief Cross-sectional z-score: (x - mean) / std.
 * @param values  One indicator across all members of a cross-section.
 * @return        Same length as values. Every element is 0 when the
 *                standard deviation is zero (or below 1e-12) or when there
 *                are fewer than two members.
 */
[[nodiscard]] inline std::vector<double> zScore(const std::vector<double>& values) {
    std::vector<double> result(values.size(), 0.0);

    const double sd = sampleStdDev(values);
    if (sd < 1e-12) {
        return result;
    }

    const double m = mean(values);
    for (std::size_t i = 0; i < values.size(); ++i) {
        result[i] = (values[i] - m) / sd;
    }
    return result;
}

/**
 * @brief Damping factor for a dispersion measure: 1 / (1 + dispersion).
 *
 * Negative or non-finite dispersion is treated as 0, so the result is always
 * in (0, 1].
 */
[[nodiscard]] inline double dampingFactor(double dispersion) {
    if (!std::isfinite(dispersion) || dispersion < 0.0) {
        dispersion = 0.0;
    }
    return 1.0 / (1.0 + dispersion);
}

}  // namespace xsection
