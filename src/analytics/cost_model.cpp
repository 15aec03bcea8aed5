// src/analytics/cost_model.cpp

#include "campaign_analytics/analytics/cost_model.hpp"
#include <algorithm>
#include <unordered_set>

namespace campaign_analytics {

std::string cost_basis_to_string(CostBasis basis) {
    switch (basis) {
        case CostBasis::PAYOUT_BASED:
            return "payout_based";
        case CostBasis::FIXED_RATIO:
            return "fixed_ratio";
        case CostBasis::NONE:
        default:
            return "none";
    }
}

double calculate_roi(double revenue, double cost) {
    if (cost <= 0.0) {
        return 0.0;
    }
    return (revenue - cost) / std::max(cost, 1.0) * 100.0;
}

double calculate_roas(double revenue, double cost) {
    if (cost <= 0.0) {
        return 0.0;
    }
    return revenue / std::max(cost, 1.0);
}

std::optional<double> PayoutBasedCost::estimate_cost(const CampaignTables& tables,
                                                     double /*total_revenue*/) const {
    if (tables.payouts.empty() || tables.tracking.empty()) {
        return std::nullopt;
    }

    std::unordered_set<InfluencerId> tracked;
    for (const auto& row : tables.tracking) {
        tracked.insert(row.influencer_id);
    }

    bool matched = false;
    double total = 0.0;
    for (const auto& payout : tables.payouts) {
        if (tracked.count(payout.influencer_id) > 0) {
            matched = true;
            total += payout.total_payout;
        }
    }

    if (!matched) {
        return std::nullopt;
    }
    return total;
}

std::optional<double> FixedRatioCost::estimate_cost(const CampaignTables& /*tables*/,
                                                    double total_revenue) const {
    return cost_for(total_revenue);
}

}  // namespace campaign_analytics
