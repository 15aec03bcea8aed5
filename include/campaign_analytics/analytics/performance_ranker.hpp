// include/campaign_analytics/analytics/performance_ranker.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "campaign_analytics/analytics/analytics_config.hpp"
#include "campaign_analytics/analytics/cost_model.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief One row of the top performer ranking
 *
 * Post metrics are present only when the snapshot has posts for the
 * influencer. Ratios whose denominator is zero or missing are nullopt.
 */
struct PerformerRecord {
    InfluencerId influencer_id;
    std::string name;
    Platform platform{Platform::UNKNOWN};
    std::string category;
    int64_t follower_count{0};
    double revenue{0.0};
    int64_t orders{0};

    std::optional<int64_t> reach;
    std::optional<int64_t> likes;
    std::optional<int64_t> comments;
    std::optional<double> engagement_rate;  // Percent; 0 when reach is 0

    std::optional<double> revenue_per_follower;
    std::optional<double> orders_per_post;  // orders / reach
};

/**
 * @brief Revenue, orders and fixed-ratio cost of one known influencer
 */
struct InfluencerPerformance {
    InfluencerId influencer_id;
    std::string name;
    Platform platform{Platform::UNKNOWN};
    double revenue{0.0};
    int64_t orders{0};
    double cost{0.0};
    double roi{0.0};
};

struct PoorPerformerRecord {
    InfluencerId influencer_id;
    std::string name;
    Platform platform{Platform::UNKNOWN};
    double revenue{0.0};
    int64_t orders{0};
    double cost{0.0};
    double roi{0.0};
    std::string reason;
};

/**
 * @brief Ranks influencers by revenue and flags those below benchmark ROI
 */
class PerformanceRanker {
public:
    static constexpr const char* kUnknownName = "Unknown";

    explicit PerformanceRanker(AnalyticsConfig config);

    /**
     * @brief Influencers ordered by revenue, highest first
     *
     * Ties are ordered by influencer id ascending. Tracking rows whose
     * influencer is missing from the influencer table are kept with name
     * "Unknown", platform UNKNOWN and no follower count.
     *
     * @param limit Maximum rows returned
     */
    std::vector<PerformerRecord> get_top_performers(const CampaignTables& snapshot,
                                                    size_t limit) const;

    std::vector<PerformerRecord> get_top_performers(const CampaignTables& snapshot) const {
        return get_top_performers(snapshot, static_cast<size_t>(config_.top_performer_limit));
    }

    /**
     * @brief Influencers whose fixed-ratio ROI is below benchmark, worst first
     *
     * Only influencers present in the influencer table are considered.
     */
    std::vector<PoorPerformerRecord> identify_poor_performers(
        const CampaignTables& snapshot) const;

    /**
     * @brief Per-influencer totals with fixed-ratio cost, ordered by id
     *
     * Tracking rows of unknown influencers are dropped.
     */
    std::vector<InfluencerPerformance> influencer_performance(
        const CampaignTables& snapshot) const;

    /**
     * @brief First matching rule wins: low revenue, low orders, very low ROI, else below benchmark
     */
    std::string classify_reason(double revenue, double orders, double roi) const;

private:
    AnalyticsConfig config_;
    FixedRatioCost fixed_cost_;
};

}  // namespace campaign_analytics
