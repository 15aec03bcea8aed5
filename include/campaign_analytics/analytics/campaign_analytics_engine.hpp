// include/campaign_analytics/analytics/campaign_analytics_engine.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "campaign_analytics/analytics/analytics_config.hpp"
#include "campaign_analytics/analytics/campaign_summary.hpp"
#include "campaign_analytics/analytics/filter_engine.hpp"
#include "campaign_analytics/analytics/insight_aggregator.hpp"
#include "campaign_analytics/analytics/metrics_calculator.hpp"
#include "campaign_analytics/analytics/performance_ranker.hpp"
#include "campaign_analytics/analytics/recommendation_engine.hpp"
#include "campaign_analytics/analytics/trend_analyzer.hpp"
#include "campaign_analytics/core/error.hpp"

namespace campaign_analytics {

/**
 * @brief Single entry point for all campaign analyses
 *
 * Built once from a validated configuration; every call works on the
 * snapshot it is given and keeps no state between calls.
 */
class CampaignAnalyticsEngine {
public:
    /**
     * @brief Build an engine from configuration that is already validated
     */
    explicit CampaignAnalyticsEngine(AnalyticsConfig config = {},
                                     RecommendationConfig recommendation_config = {});

    /**
     * @brief Validate the configuration and build the engine
     * @return INVALID_ARGUMENT if either configuration fails validation
     */
    static Result<std::unique_ptr<CampaignAnalyticsEngine>> create(
        AnalyticsConfig config, RecommendationConfig recommendation_config = {});

    CampaignTables apply_filters(const CampaignTables& tables,
                                 const FilterCriteria& criteria) const {
        return filter_engine_.apply_filters(tables, criteria);
    }

    RoiRoasMetrics calculate_roi_roas(const CampaignTables& snapshot) const {
        return metrics_.calculate_roi_roas(snapshot);
    }

    std::vector<PerformerRecord> get_top_performers(const CampaignTables& snapshot) const {
        return ranker_.get_top_performers(snapshot);
    }

    std::vector<PerformerRecord> get_top_performers(const CampaignTables& snapshot,
                                                    size_t limit) const {
        return ranker_.get_top_performers(snapshot, limit);
    }

    std::vector<PoorPerformerRecord> identify_poor_performers(
        const CampaignTables& snapshot) const {
        return ranker_.identify_poor_performers(snapshot);
    }

    InsightReport generate_insights(const CampaignTables& snapshot) const {
        return aggregator_.generate_insights(snapshot);
    }

    TrendReport analyze_trends(const CampaignTables& snapshot) const {
        return trends_.analyze(snapshot);
    }

    double calculate_incremental_roas(const CampaignTables& snapshot) const {
        return trends_.calculate_incremental_roas(snapshot);
    }

    double calculate_incremental_roas(const CampaignTables& snapshot, int baseline_days) const {
        return trends_.calculate_incremental_roas(snapshot, baseline_days);
    }

    std::optional<InfluencerProfile> get_influencer_performance(
        const CampaignTables& tables, const InfluencerId& influencer_id) const {
        return CampaignSummaries::get_influencer_performance(tables, influencer_id);
    }

    DataSummary summarize(const CampaignTables& tables) const {
        return CampaignSummaries::summarize(tables);
    }

    ExportSummary build_export_summary(const CampaignTables& tables) const {
        return CampaignSummaries::build_export_summary(tables, trends_);
    }

    PayoutSummary summarize_payouts(const CampaignTables& tables) const {
        return CampaignSummaries::summarize_payouts(tables);
    }

    ReportHeadline build_headline(const CampaignTables& tables) const {
        return CampaignSummaries::build_headline(tables, trends_);
    }

    std::vector<std::string> generate_recommendations(const CampaignTables& tables) const {
        return recommendations_.generate_recommendations(tables);
    }

    const AnalyticsConfig& config() const {
        return config_;
    }

private:
    AnalyticsConfig config_;
    FilterEngine filter_engine_;
    MetricsCalculator metrics_;
    PerformanceRanker ranker_;
    TrendAnalyzer trends_;
    InsightAggregator aggregator_;
    RecommendationEngine recommendations_;
};

}  // namespace campaign_analytics
