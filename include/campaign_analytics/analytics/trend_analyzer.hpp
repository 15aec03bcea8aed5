// include/campaign_analytics/analytics/trend_analyzer.hpp
#pragma once

#include <vector>
#include "campaign_analytics/analytics/analytics_config.hpp"
#include "campaign_analytics/analytics/cost_model.hpp"
#include "campaign_analytics/core/date.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

struct DailyTrend {
    Date date;
    double revenue{0.0};
    int64_t orders{0};
};

/**
 * @brief Totals for one ISO week, keyed by (ISO year, week number)
 */
struct WeeklyTrend {
    IsoWeek week;
    double revenue{0.0};
    int64_t orders{0};
};

struct TrendReport {
    std::vector<DailyTrend> daily;
    std::vector<WeeklyTrend> weekly;

    bool empty() const {
        return daily.empty() && weekly.empty();
    }
};

/**
 * @brief Time rollups of tracked revenue and the recent-vs-baseline lift
 */
class TrendAnalyzer {
public:
    explicit TrendAnalyzer(AnalyticsConfig config);

    /**
     * @brief Revenue and orders per calendar day, ascending by date
     */
    std::vector<DailyTrend> daily(const CampaignTables& snapshot) const;

    /**
     * @brief Revenue and orders per ISO week, ascending
     */
    std::vector<WeeklyTrend> weekly(const CampaignTables& snapshot) const;

    TrendReport analyze(const CampaignTables& snapshot) const;

    /**
     * @brief Lift of the last baseline_days over the rows before them
     *
     * Rows dated before (latest date - baseline_days) form the baseline and
     * the rest form the recent window. Returns
     * (mean(recent) - mean(baseline)) / max(cost, 1) with cost the fixed-ratio
     * cost of mean(recent), clamped to >= 0. Either window being empty gives 0.
     */
    double calculate_incremental_roas(const CampaignTables& snapshot, int baseline_days) const;

    double calculate_incremental_roas(const CampaignTables& snapshot) const {
        return calculate_incremental_roas(snapshot, config_.incremental_baseline_days);
    }

private:
    AnalyticsConfig config_;
    FixedRatioCost fixed_cost_;
};

}  // namespace campaign_analytics
