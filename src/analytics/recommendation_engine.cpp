// src/analytics/recommendation_engine.cpp

#include "campaign_analytics/analytics/recommendation_engine.hpp"
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>
#include "campaign_analytics/core/format_utils.hpp"

namespace campaign_analytics {

RecommendationEngine::RecommendationEngine(AnalyticsConfig analytics_config,
                                           RecommendationConfig config)
    : metrics_(std::move(analytics_config)), config_(std::move(config)) {}

std::vector<std::string> RecommendationEngine::generate_recommendations(
    const CampaignTables& tables) const {
    if (tables.tracking.empty()) {
        return {"Upload campaign data to generate personalized recommendations."};
    }

    std::vector<std::string> recommendations;
    recommend_platform(tables, recommendations);
    recommend_roi(tables, recommendations);
    recommend_engagement(tables, recommendations);
    recommend_order_value(tables, recommendations);
    recommend_season(tables, recommendations);
    recommend_diversification(tables, recommendations);

    if (recommendations.empty()) {
        recommendations = {
            "Continue monitoring campaign performance regularly",
            "Experiment with different content formats and posting schedules",
            "Consider A/B testing different influencer categories",
            "Set up automated alerts for significant performance changes",
        };
    }

    const size_t limit = static_cast<size_t>(config_.max_recommendations);
    if (recommendations.size() > limit) {
        recommendations.resize(limit);
    }
    return recommendations;
}

void RecommendationEngine::recommend_platform(const CampaignTables& tables,
                                              std::vector<std::string>& out) const {
    if (tables.influencers.empty()) {
        return;
    }

    std::unordered_map<InfluencerId, Platform> platform_of;
    for (const auto& influencer : tables.influencers) {
        platform_of.emplace(influencer.id, influencer.platform);
    }

    std::map<Platform, double> revenue;
    for (const auto& row : tables.tracking) {
        auto found = platform_of.find(row.influencer_id);
        if (found != platform_of.end()) {
            revenue[found->second] += row.revenue;
        }
    }
    if (revenue.empty()) {
        return;
    }

    auto best = revenue.begin();
    for (auto it = revenue.begin(); it != revenue.end(); ++it) {
        if (it->second > best->second) {
            best = it;
        }
    }

    out.push_back("Focus investment on " + platform_to_string(best->first) +
                  " as it generates the highest revenue (" +
                  core::format_currency_grouped(best->second) + ")");
}

void RecommendationEngine::recommend_roi(const CampaignTables& tables,
                                         std::vector<std::string>& out) const {
    const double roi = metrics_.calculate_roi_roas(tables).avg_roi;
    if (roi < config_.low_roi_threshold) {
        out.push_back("Consider optimizing campaign costs as ROI is below industry standards "
                      "(target: >200%)");
    } else if (roi > config_.high_roi_threshold) {
        out.push_back("Excellent ROI performance! Consider scaling successful campaigns");
    }
}

void RecommendationEngine::recommend_engagement(const CampaignTables& tables,
                                                std::vector<std::string>& out) const {
    double rate_sum = 0.0;
    size_t counted = 0;
    for (const auto& post : tables.posts) {
        // Posts without reach have no engagement rate
        if (post.reach <= 0) {
            continue;
        }
        rate_sum += static_cast<double>(post.likes + post.comments) / post.reach * 100.0;
        ++counted;
    }
    if (counted == 0) {
        return;
    }

    const double avg_engagement = rate_sum / static_cast<double>(counted);
    if (avg_engagement < config_.low_engagement_threshold) {
        std::ostringstream msg;
        msg << "Work on content strategy to improve engagement rates (currently below "
            << config_.low_engagement_threshold << "%)";
        out.push_back(msg.str());
    } else if (avg_engagement > config_.high_engagement_threshold) {
        out.push_back("High engagement rates detected! Leverage successful content formats");
    }
}

void RecommendationEngine::recommend_order_value(const CampaignTables& tables,
                                                 std::vector<std::string>& out) const {
    double revenue = 0.0;
    int64_t orders = 0;
    for (const auto& row : tables.tracking) {
        revenue += row.revenue;
        orders += row.orders;
    }
    if (orders <= 0) {
        return;
    }

    const double avg_order_value = revenue / static_cast<double>(orders);
    if (avg_order_value < config_.low_order_value_threshold) {
        out.push_back("Focus on promoting higher-value products to increase average order value");
    } else if (avg_order_value > config_.high_order_value_threshold) {
        out.push_back("Strong average order value! Consider expanding premium product campaigns");
    }
}

void RecommendationEngine::recommend_season(const CampaignTables& tables,
                                            std::vector<std::string>& out) const {
    if (tables.tracking.size() <= static_cast<size_t>(config_.seasonal_min_rows)) {
        return;
    }

    // Calendar month number only; the same month of different years is merged
    std::map<int, double> by_month;
    for (const auto& row : tables.tracking) {
        by_month[row.date.month] += row.revenue;
    }
    if (by_month.size() <= 1) {
        return;
    }

    auto best = by_month.begin();
    for (auto it = by_month.begin(); it != by_month.end(); ++it) {
        if (it->second > best->second) {
            best = it;
        }
    }

    out.push_back("Month " + std::to_string(best->first) +
                  " shows peak performance - plan major campaigns during similar periods");
}

void RecommendationEngine::recommend_diversification(const CampaignTables& tables,
                                                     std::vector<std::string>& out) const {
    std::set<std::string> campaigns;
    for (const auto& row : tables.tracking) {
        campaigns.insert(row.campaign);
    }
    if (campaigns.size() < static_cast<size_t>(config_.min_distinct_campaigns)) {
        out.push_back("Consider diversifying campaigns across more brands/products to reduce risk");
    }
}

}  // namespace campaign_analytics
