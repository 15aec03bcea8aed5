// include/campaign_analytics/analytics/metrics_calculator.hpp
#pragma once

#include "campaign_analytics/analytics/analytics_config.hpp"
#include "campaign_analytics/analytics/cost_model.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Campaign-level return figures and their distance from benchmark
 */
struct RoiRoasMetrics {
    double avg_roi{0.0};      // Percent
    double avg_roas{0.0};
    double roi_change{0.0};   // avg_roi - benchmark_roi
    double roas_change{0.0};  // avg_roas - benchmark_roas
    double total_revenue{0.0};
    double total_cost{0.0};
    CostBasis cost_basis{CostBasis::NONE};
};

/**
 * @brief Derives ROI and ROAS for a snapshot
 *
 * Cost comes from PayoutBasedCost when payouts cover tracked influencers,
 * otherwise from FixedRatioCost at the configured ratio.
 */
class MetricsCalculator {
public:
    explicit MetricsCalculator(AnalyticsConfig config);

    /**
     * @brief Compute ROI/ROAS for the snapshot
     *
     * An empty tracking table yields zero revenue, cost, ROI and ROAS, and
     * changes equal to the negated benchmarks.
     */
    RoiRoasMetrics calculate_roi_roas(const CampaignTables& snapshot) const;

    const AnalyticsConfig& config() const {
        return config_;
    }

private:
    AnalyticsConfig config_;
    PayoutBasedCost payout_cost_;
    FixedRatioCost fixed_cost_;
};

}  // namespace campaign_analytics
