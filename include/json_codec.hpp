#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "backtest/backtest_engine.hpp"
#include "ranking/ranking_analysis.hpp"
#include "ranking/ranking_engine.hpp"
#include "return_metrics.hpp"
#include "store/return_metrics_store.hpp"

/* ----- nlohmann::json conversions (found by ADL) ----- */

/**
 * @brief {"trading_pair", "date", "return_1d", "roi_1d", ...}; absent values as null.
 */
void to_json(nlohmann::json& j, const ReturnMetricRecord& record);

/**
 * @brief Inverse of to_json. Indicator keys may use canonical or legacy names;
 *        unknown keys are ignored and null values stay absent.
 */
void from_json(const nlohmann::json& j, ReturnMetricRecord& record);

void to_json(nlohmann::json& j, const RankingResult& result);
void from_json(const nlohmann::json& j, RankingResult& result);

void to_json(nlohmann::json& j, const TradeEvent& event);
void to_json(nlohmann::json& j, const BacktestSummary& summary);
void to_json(nlohmann::json& j, const PersistenceStreak& streak);

/**
 * @brief Full run export: strategy, range, config, summary, skipped dates and event log.
 */
[[nodiscard]] nlohmann::json backtestResultToJson(const BacktestResult& result);

/**
 * @brief Upsert every record of a metrics document into `store`.
 *
 * Accepts either a top-level array of records or {"return_metrics": [...]}.
 * Records whose date is not a valid "YYYY-MM-DD" are skipped with a warning.
 *
 * @return Number of records loaded.
 * @throws nlohmann::json::exception on a malformed record.
 */
std::size_t loadReturnMetrics(const nlohmann::json& document, InMemoryReturnMetricsStore& store);

/**
 * @brief Read a metrics JSON file into `store`.
 * @return false if the file cannot be opened or parsed; `store` may then hold
 *         the records read before the bad one.
 */
bool loadReturnMetricsFile(const std::string& path, InMemoryReturnMetricsStore& store);
