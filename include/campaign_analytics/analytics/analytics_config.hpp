// include/campaign_analytics/analytics/analytics_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include "campaign_analytics/core/config_base.hpp"

namespace campaign_analytics {

/**
 * @brief Benchmarks and tuning constants shared by all engine components
 *
 * Held by value by each component; read-only once the engine is built.
 */
struct AnalyticsConfig : public ConfigBase {
    double benchmark_roi{200.0};   // Target ROI in percent
    double benchmark_roas{4.0};    // Target revenue per unit of cost
    double cost_ratio{0.25};       // Fixed-ratio cost: share of revenue spent

    int top_performer_limit{10};
    int insight_top_limit{10};
    int incremental_baseline_days{30};

    // Poor performer reason thresholds
    double low_revenue_threshold{1000.0};
    double low_orders_threshold{10.0};
    double very_low_roi_threshold{50.0};

    // Run the insight sub-analyses on separate threads
    bool parallel_insights{false};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

/**
 * @brief Thresholds used to phrase recommendations
 */
struct RecommendationConfig : public ConfigBase {
    double low_roi_threshold{150.0};
    double high_roi_threshold{300.0};
    double low_engagement_threshold{2.0};
    double high_engagement_threshold{5.0};
    double low_order_value_threshold{500.0};
    double high_order_value_threshold{2000.0};
    int seasonal_min_rows{30};
    int min_distinct_campaigns{3};
    int max_recommendations{6};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

}  // namespace campaign_analytics
