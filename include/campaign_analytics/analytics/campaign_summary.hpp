// include/campaign_analytics/analytics/campaign_summary.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "campaign_analytics/analytics/trend_analyzer.hpp"
#include "campaign_analytics/core/date.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Everything known about one influencer's results
 */
struct InfluencerProfile {
    InfluencerId influencer_id;
    double total_revenue{0.0};
    int64_t total_orders{0};
    double avg_order_value{0.0};
    size_t active_days{0};
    std::vector<std::string> campaigns;  // First-seen order
    std::vector<std::string> products;   // First-seen order

    struct PostMetrics {
        size_t total_posts{0};
        int64_t total_reach{0};
        int64_t total_engagement{0};  // likes + comments
        double avg_engagement_rate{0.0};
    };
    std::optional<PostMetrics> posts;

    struct PayoutTerms {
        PayoutBasis basis{PayoutBasis::POST};
        double rate{0.0};
        double total_payout{0.0};
    };
    std::optional<PayoutTerms> payout;
};

/**
 * @brief Row counts and headline totals of loaded data
 */
struct DataSummary {
    size_t influencer_count{0};
    std::vector<Platform> platforms;
    std::vector<std::string> categories;

    size_t post_count{0};
    std::optional<DateRange> post_dates;
    int64_t total_reach{0};

    size_t tracking_count{0};
    double total_revenue{0.0};
    int64_t total_orders{0};

    size_t payout_count{0};
    double total_payout{0.0};
};

struct InfluencerGroupSummary {
    Platform platform{Platform::UNKNOWN};
    std::string category;
    size_t count{0};
    double mean_followers{0.0};
    int64_t total_followers{0};
};

struct CampaignSummaryRow {
    std::string campaign;
    double revenue{0.0};
    int64_t orders{0};
    size_t influencer_count{0};
};

/**
 * @brief Tables handed to report exporters
 */
struct ExportSummary {
    std::vector<InfluencerGroupSummary> influencer_summary;  // By (platform, category)
    std::vector<CampaignSummaryRow> campaign_summary;        // By campaign name
    std::vector<DailyTrend> daily_performance;
};

struct PayoutBasisRow {
    PayoutBasis basis{PayoutBasis::POST};
    double total_payout{0.0};
    size_t count{0};
};

/**
 * @brief One payout row joined to its influencer
 *
 * Payouts for ids missing from the influencer table keep the payout fields
 * and leave name, platform and category unset.
 */
struct PayoutDetail {
    InfluencerId influencer_id;
    std::optional<std::string> name;
    std::optional<Platform> platform;
    std::optional<std::string> category;
    PayoutBasis basis{PayoutBasis::POST};
    double rate{0.0};
    int64_t orders{0};
    double total_payout{0.0};
};

struct PayoutSummary {
    size_t payout_count{0};
    double total_payout{0.0};
    double avg_payout{0.0};
    size_t active_influencers{0};  // Rows with a positive total_payout
    std::vector<PayoutBasisRow> by_basis;  // Ascending by basis name
    std::vector<PayoutDetail> details;     // Descending by total_payout
};

/**
 * @brief Formatted totals shown at the top of a report
 */
struct ReportHeadline {
    std::string total_revenue;  // Compact rupees, e.g. "₹1.5L"
    std::string total_orders;   // Compact count, e.g. "2.3K"
    std::string total_payout;
    std::optional<double> weekly_revenue_growth;  // Last ISO week over the one before
};

/**
 * @brief Descriptive rollups that need no benchmarks
 */
class CampaignSummaries {
public:
    /**
     * @brief Profile of one influencer; nullopt if they have no tracking rows
     */
    static std::optional<InfluencerProfile> get_influencer_performance(
        const CampaignTables& tables, const InfluencerId& influencer_id);

    static DataSummary summarize(const CampaignTables& tables);

    static ExportSummary build_export_summary(const CampaignTables& tables,
                                              const TrendAnalyzer& trends);

    static PayoutSummary summarize_payouts(const CampaignTables& tables);

    /**
     * @brief Growth is unset when the data spans fewer than two ISO weeks
     */
    static ReportHeadline build_headline(const CampaignTables& tables,
                                         const TrendAnalyzer& trends);
};

}  // namespace campaign_analytics
