// include/campaign_analytics/analytics/report_serializer.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "campaign_analytics/analytics/campaign_summary.hpp"
#include "campaign_analytics/analytics/insight_aggregator.hpp"
#include "campaign_analytics/analytics/metrics_calculator.hpp"
#include "campaign_analytics/analytics/performance_ranker.hpp"
#include "campaign_analytics/analytics/trend_analyzer.hpp"

namespace campaign_analytics {

/**
 * @brief JSON rendering of engine results for presentation and export
 *
 * Dates are "YYYY-MM-DD", weeks "YYYY-Www", platforms use display names.
 * Undefined ratios and absent post metrics are written as null.
 */
class ReportSerializer {
public:
    static nlohmann::json to_json(const RoiRoasMetrics& metrics);
    static nlohmann::json to_json(const PerformerRecord& record);
    static nlohmann::json to_json(const std::vector<PerformerRecord>& records);
    static nlohmann::json to_json(const InfluencerPerformance& row);
    static nlohmann::json to_json(const PoorPerformerRecord& record);
    static nlohmann::json to_json(const std::vector<PoorPerformerRecord>& records);
    static nlohmann::json to_json(const PlatformStats& stats);
    static nlohmann::json to_json(const CategoryStats& stats);
    static nlohmann::json to_json(const TrendReport& trends);
    static nlohmann::json to_json(const InsightReport& report);
    static nlohmann::json to_json(const InfluencerProfile& profile);
    static nlohmann::json to_json(const DataSummary& summary);
    static nlohmann::json to_json(const ExportSummary& summary);
    static nlohmann::json to_json(const PayoutSummary& summary);
    static nlohmann::json to_json(const ReportHeadline& headline);
};

}  // namespace campaign_analytics
