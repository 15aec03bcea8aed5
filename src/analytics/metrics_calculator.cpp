// src/analytics/metrics_calculator.cpp

#include "campaign_analytics/analytics/metrics_calculator.hpp"
#include <utility>
#include "campaign_analytics/core/logger.hpp"

namespace campaign_analytics {

MetricsCalculator::MetricsCalculator(AnalyticsConfig config)
    : config_(std::move(config)), fixed_cost_(config_.cost_ratio) {}

RoiRoasMetrics MetricsCalculator::calculate_roi_roas(const CampaignTables& snapshot) const {
    RoiRoasMetrics metrics;
    metrics.roi_change = -config_.benchmark_roi;
    metrics.roas_change = -config_.benchmark_roas;

    if (snapshot.tracking.empty()) {
        return metrics;
    }

    for (const auto& row : snapshot.tracking) {
        metrics.total_revenue += row.revenue;
    }

    auto payout_cost = payout_cost_.estimate_cost(snapshot, metrics.total_revenue);
    if (payout_cost) {
        metrics.total_cost = *payout_cost;
        metrics.cost_basis = payout_cost_.basis();
    } else {
        metrics.total_cost = fixed_cost_.cost_for(metrics.total_revenue);
        metrics.cost_basis = fixed_cost_.basis();
    }

    DEBUG("ROI/ROAS over " << snapshot.tracking.size() << " tracking rows using "
                           << cost_basis_to_string(metrics.cost_basis) << " cost");

    metrics.avg_roi = calculate_roi(metrics.total_revenue, metrics.total_cost);
    metrics.avg_roas = calculate_roas(metrics.total_revenue, metrics.total_cost);
    metrics.roi_change = metrics.avg_roi - config_.benchmark_roi;
    metrics.roas_change = metrics.avg_roas - config_.benchmark_roas;

    return metrics;
}

}  // namespace campaign_analytics
