#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Indicator fields carried by a ReturnMetricRecord.
 *
 * Order matches the storage layout of ReturnMetricRecord::values.
 */
enum class Indicator
{
    Return1d,
    Roi1d,
    Return2d,
    Roi2d,
    Return7d,
    Roi7d,
    Return14d,
    Roi14d,
    Return30d,
    Roi30d,
    ReturnAll,
    RoiAll,
};

constexpr std::size_t kIndicatorCount = 12;

struct ReturnMetricRecord {
    /**
     * @brief
     * @example "BTC/USDT_binance_bybit"
     */
    std::string tradingPair = "";

    /**
     * @brief
     * @example "2024-06-01"
     */
    std::string date = "";

    /**
     * @brief Cumulative return and annualized ROI per lookback horizon.
     *        Any field may be absent.
     * @example return_1d = 0.0050, roi_1d = 1.8250
     */
    std::array<std::optional<double>, kIndicatorCount> values{};

    [[nodiscard]] const std::optional<double>& get(Indicator indicator) const {
        return values[static_cast<std::size_t>(indicator)];
    }

    void set(Indicator indicator, std::optional<double> value) {
        values[static_cast<std::size_t>(indicator)] = value;
    }
};

/**
 * @brief Resolve an indicator by field name.
 *
 * Accepts the canonical names ("roi_1d", "return_all", ...) and the legacy
 * spreadsheet aliases ("1d_ROI", "all_return", ...).
 */
[[nodiscard]] std::optional<Indicator> indicatorFromName(const std::string& name);

/**
 * @brief Canonical field name of an indicator, e.g. "roi_7d".
 */
[[nodiscard]] std::string indicatorName(Indicator indicator);
