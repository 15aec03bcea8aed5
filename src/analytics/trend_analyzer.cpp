// src/analytics/trend_analyzer.cpp

#include "campaign_analytics/analytics/trend_analyzer.hpp"
#include <algorithm>
#include <map>
#include <utility>

namespace campaign_analytics {

TrendAnalyzer::TrendAnalyzer(AnalyticsConfig config)
    : config_(std::move(config)), fixed_cost_(config_.cost_ratio) {}

std::vector<DailyTrend> TrendAnalyzer::daily(const CampaignTables& snapshot) const {
    std::map<Date, DailyTrend> by_date;
    for (const auto& row : snapshot.tracking) {
        auto& entry = by_date[row.date];
        entry.date = row.date;
        entry.revenue += row.revenue;
        entry.orders += row.orders;
    }

    std::vector<DailyTrend> trends;
    trends.reserve(by_date.size());
    for (auto& [date, trend] : by_date) {
        trends.push_back(trend);
    }
    return trends;
}

std::vector<WeeklyTrend> TrendAnalyzer::weekly(const CampaignTables& snapshot) const {
    std::map<IsoWeek, WeeklyTrend> by_week;
    for (const auto& row : snapshot.tracking) {
        IsoWeek week = IsoWeek::of(row.date);
        auto& entry = by_week[week];
        entry.week = week;
        entry.revenue += row.revenue;
        entry.orders += row.orders;
    }

    std::vector<WeeklyTrend> trends;
    trends.reserve(by_week.size());
    for (auto& [week, trend] : by_week) {
        trends.push_back(trend);
    }
    return trends;
}

TrendReport TrendAnalyzer::analyze(const CampaignTables& snapshot) const {
    TrendReport report;
    if (snapshot.tracking.empty()) {
        return report;
    }
    report.daily = daily(snapshot);
    report.weekly = weekly(snapshot);
    return report;
}

double TrendAnalyzer::calculate_incremental_roas(const CampaignTables& snapshot,
                                                 int baseline_days) const {
    if (snapshot.tracking.empty()) {
        return 0.0;
    }

    Date latest = snapshot.tracking.front().date;
    for (const auto& row : snapshot.tracking) {
        latest = std::max(latest, row.date);
    }
    const Date cutoff = latest.add_days(-baseline_days);

    double baseline_sum = 0.0;
    double recent_sum = 0.0;
    size_t baseline_count = 0;
    size_t recent_count = 0;
    for (const auto& row : snapshot.tracking) {
        if (row.date < cutoff) {
            baseline_sum += row.revenue;
            ++baseline_count;
        } else {
            recent_sum += row.revenue;
            ++recent_count;
        }
    }

    if (baseline_count == 0 || recent_count == 0) {
        return 0.0;
    }

    const double baseline_mean = baseline_sum / static_cast<double>(baseline_count);
    const double recent_mean = recent_sum / static_cast<double>(recent_count);
    const double incremental_revenue = recent_mean - baseline_mean;
    const double estimated_cost = fixed_cost_.cost_for(recent_mean);

    double incremental_roas = 0.0;
    if (estimated_cost > 0.0) {
        incremental_roas = incremental_revenue / std::max(estimated_cost, 1.0);
    }
    return std::max(incremental_roas, 0.0);
}

}  // namespace campaign_analytics
