#pragma once

#include <limits>
#include <vector>

/**
 * @brief Time-series factors over one pair's return history.
 *
 * Every function takes the series oldest first and ignores non-finite
 * entries. A result of NaN means "not computable" and is excluded from the
 * final blend by the caller.
 */
class FactorLibrary {
   public:
    static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

    /**
     * @brief Least-squares slope of the series against its index 0..n-1.
     * @return NaN with fewer than two values.
     */
    static double trendSlope(const std::vector<double>& series);

    /**
     * @brief mean / sample std * sqrt(annualizingFactor).
     *
     * With zero (or undefined) dispersion the ratio is `highScore` for a
     * positive mean and 0 otherwise.
     *
     * @return NaN for an empty series.
     */
    static double sharpeRatio(const std::vector<double>& series, double annualizingFactor = 365.0,
                              double highScore = 1e9);

    /**
     * @brief 1 / sample std, as a stability score.
     *
     * 0 for an empty series or a non-positive mean; `highScore` when the std
     * is below `epsilon`.
     */
    static double invStdDev(const std::vector<double>& series, double epsilon = 1e-9, double highScore = 1e9);

    /**
     * @brief Share of values strictly above zero, in [0, 1]. 0 when empty.
     */
    static double winRate(const std::vector<double>& series);

    /**
     * @brief Deepest peak-to-trough loss of the compounded series prod(1 + r).
     * @return A value <= 0; 0 when empty or never below a previous peak.
     */
    static double maxDrawdown(const std::vector<double>& series);

    /**
     * @brief mean / sample std of the negative values * sqrt(annualizingFactor).
     *
     * Without (or with a single) negative value the downside risk is undefined
     * and the ratio is `highScore` for a positive mean, 0 otherwise.
     *
     * @return NaN for an empty series.
     */
    static double sortinoRatio(const std::vector<double>& series, double annualizingFactor = 365.0,
                               double highScore = 1e9);

   private:
    static std::vector<double> finiteOnly(const std::vector<double>& series);
};
