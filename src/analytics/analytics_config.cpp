// src/analytics/analytics_config.cpp

#include "campaign_analytics/analytics/analytics_config.hpp"

namespace campaign_analytics {

nlohmann::json AnalyticsConfig::to_json() const {
    nlohmann::json j;
    j["benchmark_roi"] = benchmark_roi;
    j["benchmark_roas"] = benchmark_roas;
    j["cost_ratio"] = cost_ratio;
    j["top_performer_limit"] = top_performer_limit;
    j["insight_top_limit"] = insight_top_limit;
    j["incremental_baseline_days"] = incremental_baseline_days;
    j["low_revenue_threshold"] = low_revenue_threshold;
    j["low_orders_threshold"] = low_orders_threshold;
    j["very_low_roi_threshold"] = very_low_roi_threshold;
    j["parallel_insights"] = parallel_insights;
    return j;
}

void AnalyticsConfig::from_json(const nlohmann::json& j) {
    if (j.contains("benchmark_roi"))
        benchmark_roi = j.at("benchmark_roi").get<double>();
    if (j.contains("benchmark_roas"))
        benchmark_roas = j.at("benchmark_roas").get<double>();
    if (j.contains("cost_ratio"))
        cost_ratio = j.at("cost_ratio").get<double>();
    if (j.contains("top_performer_limit"))
        top_performer_limit = j.at("top_performer_limit").get<int>();
    if (j.contains("insight_top_limit"))
        insight_top_limit = j.at("insight_top_limit").get<int>();
    if (j.contains("incremental_baseline_days"))
        incremental_baseline_days = j.at("incremental_baseline_days").get<int>();
    if (j.contains("low_revenue_threshold"))
        low_revenue_threshold = j.at("low_revenue_threshold").get<double>();
    if (j.contains("low_orders_threshold"))
        low_orders_threshold = j.at("low_orders_threshold").get<double>();
    if (j.contains("very_low_roi_threshold"))
        very_low_roi_threshold = j.at("very_low_roi_threshold").get<double>();
    if (j.contains("parallel_insights"))
        parallel_insights = j.at("parallel_insights").get<bool>();
}

Result<void> AnalyticsConfig::validate() const {
    if (cost_ratio < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "cost_ratio must be non-negative",
                                "AnalyticsConfig");
    }
    if (benchmark_roas < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "benchmark_roas must be non-negative", "AnalyticsConfig");
    }
    if (incremental_baseline_days < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "incremental_baseline_days must be non-negative",
                                "AnalyticsConfig");
    }
    if (top_performer_limit < 0 || insight_top_limit < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "top_performer_limit and insight_top_limit must be non-negative",
                                "AnalyticsConfig");
    }
    if (low_revenue_threshold < 0.0 || low_orders_threshold < 0.0 ||
        very_low_roi_threshold < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Poor performer thresholds must be non-negative",
                                "AnalyticsConfig");
    }
    return Result<void>();
}

nlohmann::json RecommendationConfig::to_json() const {
    nlohmann::json j;
    j["low_roi_threshold"] = low_roi_threshold;
    j["high_roi_threshold"] = high_roi_threshold;
    j["low_engagement_threshold"] = low_engagement_threshold;
    j["high_engagement_threshold"] = high_engagement_threshold;
    j["low_order_value_threshold"] = low_order_value_threshold;
    j["high_order_value_threshold"] = high_order_value_threshold;
    j["seasonal_min_rows"] = seasonal_min_rows;
    j["min_distinct_campaigns"] = min_distinct_campaigns;
    j["max_recommendations"] = max_recommendations;
    return j;
}

void RecommendationConfig::from_json(const nlohmann::json& j) {
    if (j.contains("low_roi_threshold"))
        low_roi_threshold = j.at("low_roi_threshold").get<double>();
    if (j.contains("high_roi_threshold"))
        high_roi_threshold = j.at("high_roi_threshold").get<double>();
    if (j.contains("low_engagement_threshold"))
        low_engagement_threshold = j.at("low_engagement_threshold").get<double>();
    if (j.contains("high_engagement_threshold"))
        high_engagement_threshold = j.at("high_engagement_threshold").get<double>();
    if (j.contains("low_order_value_threshold"))
        low_order_value_threshold = j.at("low_order_value_threshold").get<double>();
    if (j.contains("high_order_value_threshold"))
        high_order_value_threshold = j.at("high_order_value_threshold").get<double>();
    if (j.contains("seasonal_min_rows"))
        seasonal_min_rows = j.at("seasonal_min_rows").get<int>();
    if (j.contains("min_distinct_campaigns"))
        min_distinct_campaigns = j.at("min_distinct_campaigns").get<int>();
    if (j.contains("max_recommendations"))
        max_recommendations = j.at("max_recommendations").get<int>();
}

Result<void> RecommendationConfig::validate() const {
    if (low_roi_threshold > high_roi_threshold ||
        low_engagement_threshold > high_engagement_threshold ||
        low_order_value_threshold > high_order_value_threshold) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Low thresholds must not exceed high thresholds",
                                "RecommendationConfig");
    }
    if (seasonal_min_rows < 0 || min_distinct_campaigns < 0 || max_recommendations < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Recommendation limits must be non-negative",
                                "RecommendationConfig");
    }
    return Result<void>();
}

}  // namespace campaign_analytics
