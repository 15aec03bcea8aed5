// src/analytics/insight_aggregator.cpp

#include "campaign_analytics/analytics/insight_aggregator.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include "campaign_analytics/core/logger.hpp"
#include "campaign_analytics/core/parallel.hpp"

namespace campaign_analytics {

InsightAggregator::InsightAggregator(AnalyticsConfig config)
    : config_(std::move(config)),
      fixed_cost_(config_.cost_ratio),
      ranker_(config_),
      trend_analyzer_(config_) {}

InsightReport InsightAggregator::generate_insights(const CampaignTables& snapshot) const {
    InsightReport report;

    if (!config_.parallel_insights) {
        report.top_influencers = analyze_top_influencers(snapshot);
        report.platform_analysis = analyze_platforms(snapshot);
        report.category_analysis = analyze_categories(snapshot);
        report.poor_performers = ranker_.identify_poor_performers(snapshot);
        report.trends = trend_analyzer_.analyze(snapshot);
        return report;
    }

    // Each task writes only its own section of the report
    const std::vector<std::function<void()>> tasks = {
        [&] { report.top_influencers = analyze_top_influencers(snapshot); },
        [&] { report.platform_analysis = analyze_platforms(snapshot); },
        [&] { report.category_analysis = analyze_categories(snapshot); },
        [&] { report.poor_performers = ranker_.identify_poor_performers(snapshot); },
        [&] { report.trends = trend_analyzer_.analyze(snapshot); },
    };
    core::run_in_parallel(tasks);

    DEBUG("Generated insights on " << tasks.size() << " threads");
    return report;
}

TopInfluencers InsightAggregator::analyze_top_influencers(const CampaignTables& snapshot) const {
    TopInfluencers top;
    auto performance = ranker_.influencer_performance(snapshot);
    if (performance.empty()) {
        return top;
    }

    const size_t limit = static_cast<size_t>(config_.insight_top_limit);

    top.by_revenue = performance;
    std::stable_sort(top.by_revenue.begin(), top.by_revenue.end(),
                     [](const InfluencerPerformance& a, const InfluencerPerformance& b) {
                         return a.revenue > b.revenue;
                     });
    if (top.by_revenue.size() > limit) {
        top.by_revenue.resize(limit);
    }

    top.by_roi = std::move(performance);
    std::stable_sort(top.by_roi.begin(), top.by_roi.end(),
                     [](const InfluencerPerformance& a, const InfluencerPerformance& b) {
                         return a.roi > b.roi;
                     });
    if (top.by_roi.size() > limit) {
        top.by_roi.resize(limit);
    }

    return top;
}

std::vector<PlatformStats> InsightAggregator::analyze_platforms(
    const CampaignTables& snapshot) const {
    std::vector<PlatformStats> stats;
    if (snapshot.tracking.empty() || snapshot.influencers.empty()) {
        return stats;
    }

    std::unordered_map<InfluencerId, Platform> platform_of;
    for (const auto& influencer : snapshot.influencers) {
        platform_of.emplace(influencer.id, influencer.platform);
    }

    struct Accumulator {
        double revenue{0.0};
        int64_t orders{0};
        std::unordered_set<InfluencerId> influencers;
    };
    std::map<Platform, Accumulator> by_platform;
    for (const auto& row : snapshot.tracking) {
        auto found = platform_of.find(row.influencer_id);
        if (found == platform_of.end()) {
            continue;
        }
        auto& acc = by_platform[found->second];
        acc.revenue += row.revenue;
        acc.orders += row.orders;
        acc.influencers.insert(row.influencer_id);
    }

    // Engagement is grouped by the platform recorded on each post
    struct Engagement {
        int64_t reach{0};
        int64_t interactions{0};
    };
    std::map<Platform, Engagement> engagement;
    for (const auto& post : snapshot.posts) {
        auto& e = engagement[post.platform];
        e.reach += post.reach;
        e.interactions += post.likes + post.comments;
    }

    for (const auto& [platform, acc] : by_platform) {
        PlatformStats row;
        row.platform = platform;
        row.total_revenue = acc.revenue;
        row.total_orders = acc.orders;
        row.influencer_count = acc.influencers.size();
        row.avg_revenue_per_influencer =
            row.influencer_count > 0 ? acc.revenue / static_cast<double>(row.influencer_count)
                                     : 0.0;

        auto e = engagement.find(platform);
        if (e != engagement.end() && e->second.reach > 0) {
            row.avg_engagement_rate =
                static_cast<double>(e->second.interactions) / e->second.reach * 100.0;
        }

        row.estimated_cost = fixed_cost_.cost_for(acc.revenue);
        row.avg_roi = calculate_roi(acc.revenue, row.estimated_cost);
        stats.push_back(row);
    }

    return stats;
}

std::vector<CategoryStats> InsightAggregator::analyze_categories(
    const CampaignTables& snapshot) const {
    std::vector<CategoryStats> stats;
    if (snapshot.influencers.empty()) {
        return stats;
    }

    std::unordered_map<InfluencerId, std::string> category_of;
    std::map<std::string, CategoryStats> by_category;
    for (const auto& influencer : snapshot.influencers) {
        category_of.emplace(influencer.id, influencer.category);
        auto& row = by_category[influencer.category];
        row.category = influencer.category;
        row.influencer_count += 1;
        row.total_followers += influencer.follower_count;
    }

    for (const auto& post : snapshot.posts) {
        auto found = category_of.find(post.influencer_id);
        if (found != category_of.end()) {
            by_category[found->second].total_posts += 1;
        }
    }

    for (const auto& row : snapshot.tracking) {
        auto found = category_of.find(row.influencer_id);
        if (found != category_of.end()) {
            auto& category = by_category[found->second];
            category.revenue += row.revenue;
            category.orders += row.orders;
        }
    }

    stats.reserve(by_category.size());
    for (auto& [name, row] : by_category) {
        row.avg_follower_count =
            static_cast<double>(row.total_followers) / static_cast<double>(row.influencer_count);
        row.avg_revenue_per_post =
            row.total_posts > 0 ? row.revenue / static_cast<double>(row.total_posts) : 0.0;
        row.estimated_cost = fixed_cost_.cost_for(row.revenue);
        row.avg_roi = calculate_roi(row.revenue, row.estimated_cost);
        stats.push_back(std::move(row));
    }

    return stats;
}

}  // namespace campaign_analytics
