#include "json_codec.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <utility>

#include "date_utils.hpp"

void to_json(nlohmann::json& j, const ReturnMetricRecord& record) {
    j = nlohmann::json{{"trading_pair", record.tradingPair}, {"date", record.date}};
    for (std::size_t i = 0; i < kIndicatorCount; ++i) {
        const auto  indicator = static_cast<Indicator>(i);
        const auto& value     = record.get(indicator);
        if (value) {
            j[indicatorName(indicator)] = *value;
        } else {
            j[indicatorName(indicator)] = nullptr;
        }
    }
}

void from_json(const nlohmann::json& j, ReturnMetricRecord& record) {
    record             = ReturnMetricRecord{};
    record.tradingPair = j.at("trading_pair").get<std::string>();
    record.date        = j.at("date").get<std::string>();

    for (const auto& [key, value] : j.items()) {
        const auto indicator = indicatorFromName(key);
        if (!indicator || value.is_null()) {
            continue;
        }
        record.set(*indicator, value.get<double>());
    }
}

void to_json(nlohmann::json& j, const RankingResult& result) {
    nlohmann::json components = nlohmann::json::array();
    for (std::size_t i = 0; i < result.componentNames.size() && i < result.componentScores.size(); ++i) {
        components.push_back({{"name", result.componentNames[i]}, {"score", result.componentScores[i]}});
    }

    j = nlohmann::json{
        {"strategy", result.strategyName},
        {"date", result.date},
        {"trading_pair", result.tradingPair},
        {"rank_position", result.rankPosition},
        {"final_ranking_score", result.finalScore},
        {"component_scores", components},
        {"combination", result.combination},
    };
}

void from_json(const nlohmann::json& j, RankingResult& result) {
    result              = RankingResult{};
    result.strategyName = j.at("strategy").get<std::string>();
    result.date         = j.at("date").get<std::string>();
    result.tradingPair  = j.at("trading_pair").get<std::string>();
    result.rankPosition = j.at("rank_position").get<int>();
    result.finalScore   = j.at("final_ranking_score").get<double>();
    result.combination  = j.value("combination", "");

    if (j.contains("component_scores")) {
        for (const auto& c : j["component_scores"]) {
            result.componentNames.push_back(c.at("name").get<std::string>());
            // Non-finite scores are written as null
            const auto& score = c.at("score");
            result.componentScores.push_back(score.is_null() ? std::numeric_limits<double>::quiet_NaN()
                                                             : score.get<double>());
        }
    }
}

void to_json(nlohmann::json& j, const TradeEvent& event) {
    j = nlohmann::json{
        {"sequence", event.sequence},
        {"timestamp", event.timestamp},
        {"event_type", eventTypeToString(event.type)},
        {"trading_pair", event.tradingPair},
        {"amount", event.amount},
        {"fee", event.fee},
        {"metric_value", event.metricValue},
        {"rank_position", event.rankPosition},
        {"cash_after", event.cashAfter},
        {"position_after", event.positionAfter},
    };
}

void to_json(nlohmann::json& j, const BacktestSummary& summary) {
    j = nlohmann::json{
        {"initial_capital", summary.initialCapital},
        {"final_capital", summary.finalCapital},
        {"total_return", summary.totalReturn},
        {"total_roi", summary.totalRoi},
        {"total_days", summary.totalDays},
        {"profit_days", summary.profitDays},
        {"loss_days", summary.lossDays},
        {"break_even_days", summary.breakEvenDays},
        {"win_rate", summary.winRate},
        {"max_drawdown", summary.maxDrawdown},
        {"total_trades", summary.totalTrades},
        {"entry_count", summary.entryCount},
        {"exit_count", summary.exitCount},
        {"sharpe_ratio", summary.sharpeRatio},
        {"avg_holding_days", summary.avgHoldingDays},
    };
}

void to_json(nlohmann::json& j, const PersistenceStreak& streak) {
    j = nlohmann::json{
        {"event_id", streak.eventId},
        {"strategy", streak.strategyName},
        {"trading_pair", streak.tradingPair},
        {"entry_date", streak.entryDate},
        {"entry_rank", streak.entryRank},
        {"exit_date", streak.exitDate},
        {"exit_rank", streak.exitRank},
        {"consecutive_days", streak.consecutiveDays},
        {"cumulative_consecutive_days", streak.cumulativeDays},
        {"trigger_rank_x", streak.triggerRank},
        {"persistence_rank_y", streak.holdRank},
    };
}

nlohmann::json backtestResultToJson(const BacktestResult& result) {
    return nlohmann::json{
        {"strategy", result.strategyName},
        {"start_date", result.startDate},
        {"end_date", result.endDate},
        {"config", result.config.toJson()},
        {"summary", result.summary},
        {"skipped_dates", result.skippedDates},
        {"aborted", result.aborted},
        {"events", result.state.events},
    };
}

std::size_t loadReturnMetrics(const nlohmann::json& document, InMemoryReturnMetricsStore& store) {
    const auto& rows = document.is_object() ? document.at("return_metrics") : document;

    std::size_t loaded = 0;
    for (const auto& row : rows) {
        auto record = row.get<ReturnMetricRecord>();
        if (!dates::isValid(record.date)) {
            std::cerr << "  [WARN] " << record.tradingPair << " - bad date \"" << record.date << "\", skipped"
                      << std::endl;
            continue;
        }
        store.upsert(std::move(record));
        loaded++;
    }
    return loaded;
}

bool loadReturnMetricsFile(const std::string& path, InMemoryReturnMetricsStore& store) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot open return metrics: " << path << std::endl;
        return false;
    }

    try {
        nlohmann::json document;
        f >> document;
        const auto loaded = loadReturnMetrics(document, store);
        std::cerr << "  [OK] " << path << " (" << loaded << " records)" << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Return metrics " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}
