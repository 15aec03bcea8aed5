// include/campaign_analytics/analytics/insight_aggregator.hpp
#pragma once

#include <string>
#include <vector>
#include "campaign_analytics/analytics/analytics_config.hpp"
#include "campaign_analytics/analytics/cost_model.hpp"
#include "campaign_analytics/analytics/performance_ranker.hpp"
#include "campaign_analytics/analytics/trend_analyzer.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

struct TopInfluencers {
    std::vector<InfluencerPerformance> by_revenue;
    std::vector<InfluencerPerformance> by_roi;
};

struct PlatformStats {
    Platform platform{Platform::UNKNOWN};
    double total_revenue{0.0};
    int64_t total_orders{0};
    size_t influencer_count{0};
    double avg_revenue_per_influencer{0.0};
    double avg_engagement_rate{0.0};  // From posts published on the platform
    double estimated_cost{0.0};
    double avg_roi{0.0};
};

struct CategoryStats {
    std::string category;
    size_t influencer_count{0};
    double avg_follower_count{0.0};
    int64_t total_followers{0};
    size_t total_posts{0};
    double revenue{0.0};
    int64_t orders{0};
    double avg_revenue_per_post{0.0};
    double estimated_cost{0.0};
    double avg_roi{0.0};
};

/**
 * @brief Everything shown on the insights page
 */
struct InsightReport {
    TopInfluencers top_influencers;
    std::vector<PlatformStats> platform_analysis;
    std::vector<CategoryStats> category_analysis;
    std::vector<PoorPerformerRecord> poor_performers;
    TrendReport trends;
};

/**
 * @brief Composes the platform, category, ranking and trend rollups
 *
 * Every sub-analysis uses the fixed-ratio cost model and yields an empty
 * section when the tables it needs are empty.
 */
class InsightAggregator {
public:
    explicit InsightAggregator(AnalyticsConfig config);

    /**
     * @brief Build the full report
     *
     * With parallel_insights set the five sections are computed on their own
     * threads over the same snapshot and joined before returning.
     */
    InsightReport generate_insights(const CampaignTables& snapshot) const;

    TopInfluencers analyze_top_influencers(const CampaignTables& snapshot) const;
    std::vector<PlatformStats> analyze_platforms(const CampaignTables& snapshot) const;
    std::vector<CategoryStats> analyze_categories(const CampaignTables& snapshot) const;

private:
    AnalyticsConfig config_;
    FixedRatioCost fixed_cost_;
    PerformanceRanker ranker_;
    TrendAnalyzer trend_analyzer_;
};

}  // namespace campaign_analytics
