// include/campaign_analytics/analytics/cost_model.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Which cost model produced a campaign cost figure
 */
enum class CostBasis { NONE, PAYOUT_BASED, FIXED_RATIO };

std::string cost_basis_to_string(CostBasis basis);

/**
 * @brief Return on investment in percent
 *
 * (revenue - cost) / max(cost, 1) * 100 when cost > 0, else 0.
 */
double calculate_roi(double revenue, double cost);

/**
 * @brief Return on ad spend: revenue / max(cost, 1) when cost > 0, else 0
 */
double calculate_roas(double revenue, double cost);

/**
 * @brief Strategy for estimating what a campaign cost
 */
class CostModel {
public:
    virtual ~CostModel() = default;

    /**
     * @brief Estimate the cost of the snapshot
     * @param tables Snapshot the revenue was earned in
     * @param total_revenue Sum of tracked revenue in the snapshot
     * @return nullopt when the model has nothing to base an estimate on
     */
    virtual std::optional<double> estimate_cost(const CampaignTables& tables,
                                                double total_revenue) const = 0;

    virtual CostBasis basis() const = 0;
};

/**
 * @brief Cost is the recorded payouts of influencers with tracked revenue
 *
 * Not applicable unless at least one payout row belongs to an influencer
 * that appears in the tracking table.
 */
class PayoutBasedCost : public CostModel {
public:
    std::optional<double> estimate_cost(const CampaignTables& tables,
                                        double total_revenue) const override;

    CostBasis basis() const override {
        return CostBasis::PAYOUT_BASED;
    }
};

/**
 * @brief Cost is a fixed share of revenue
 */
class FixedRatioCost : public CostModel {
public:
    explicit FixedRatioCost(double cost_ratio) : cost_ratio_(cost_ratio) {}

    std::optional<double> estimate_cost(const CampaignTables& tables,
                                        double total_revenue) const override;

    CostBasis basis() const override {
        return CostBasis::FIXED_RATIO;
    }

    double cost_for(double revenue) const {
        return revenue * cost_ratio_;
    }

    double cost_ratio() const {
        return cost_ratio_;
    }

private:
    double cost_ratio_;
};

}  // namespace campaign_analytics
