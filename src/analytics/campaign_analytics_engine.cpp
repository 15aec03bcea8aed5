// src/analytics/campaign_analytics_engine.cpp

#include "campaign_analytics/analytics/campaign_analytics_engine.hpp"
#include <utility>
#include "campaign_analytics/core/logger.hpp"

namespace campaign_analytics {

CampaignAnalyticsEngine::CampaignAnalyticsEngine(AnalyticsConfig config,
                                                 RecommendationConfig recommendation_config)
    : config_(std::move(config)),
      metrics_(config_),
      ranker_(config_),
      trends_(config_),
      aggregator_(config_),
      recommendations_(config_, std::move(recommendation_config)) {}

Result<std::unique_ptr<CampaignAnalyticsEngine>> CampaignAnalyticsEngine::create(
    AnalyticsConfig config, RecommendationConfig recommendation_config) {
    auto valid = config.validate();
    if (valid.is_error()) {
        ERROR("Invalid analytics configuration: " << valid.error()->what());
        return make_error<std::unique_ptr<CampaignAnalyticsEngine>>(
            valid.error()->code(), valid.error()->what(), "CampaignAnalyticsEngine");
    }

    auto valid_recommendations = recommendation_config.validate();
    if (valid_recommendations.is_error()) {
        ERROR("Invalid recommendation configuration: " << valid_recommendations.error()->what());
        return make_error<std::unique_ptr<CampaignAnalyticsEngine>>(
            valid_recommendations.error()->code(), valid_recommendations.error()->what(),
            "CampaignAnalyticsEngine");
    }

    INFO("Analytics engine ready (benchmark ROI " << config.benchmark_roi << "%, ROAS "
                                                  << config.benchmark_roas << "x, cost ratio "
                                                  << config.cost_ratio << ")");
    return std::make_unique<CampaignAnalyticsEngine>(std::move(config),
                                                     std::move(recommendation_config));
}

}  // namespace campaign_analytics
