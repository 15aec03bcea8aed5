// include/campaign_analytics/analytics/recommendation_engine.hpp
#pragma once

#include <string>
#include <vector>
#include "campaign_analytics/analytics/analytics_config.hpp"
#include "campaign_analytics/analytics/metrics_calculator.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Turns headline metrics into short actionable messages
 *
 * Rules are checked in a fixed order (top platform, ROI, engagement, order
 * value, seasonality, campaign diversity) and the list is capped at
 * max_recommendations. Without tracking data a single upload prompt is
 * returned; when no rule fires a default monitoring checklist is returned.
 */
class RecommendationEngine {
public:
    RecommendationEngine(AnalyticsConfig analytics_config, RecommendationConfig config);

    std::vector<std::string> generate_recommendations(const CampaignTables& tables) const;

private:
    void recommend_platform(const CampaignTables& tables, std::vector<std::string>& out) const;
    void recommend_roi(const CampaignTables& tables, std::vector<std::string>& out) const;
    void recommend_engagement(const CampaignTables& tables, std::vector<std::string>& out) const;
    void recommend_order_value(const CampaignTables& tables, std::vector<std::string>& out) const;
    void recommend_season(const CampaignTables& tables, std::vector<std::string>& out) const;
    void recommend_diversification(const CampaignTables& tables,
                                   std::vector<std::string>& out) const;

    MetricsCalculator metrics_;
    RecommendationConfig config_;
};

}  // namespace campaign_analytics
