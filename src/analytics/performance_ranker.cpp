// src/analytics/performance_ranker.cpp

#include "campaign_analytics/analytics/performance_ranker.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>
#include <utility>
#include "campaign_analytics/core/logger.hpp"

namespace campaign_analytics {

namespace {

struct Totals {
    double revenue{0.0};
    int64_t orders{0};
};

struct PostTotals {
    int64_t reach{0};
    int64_t likes{0};
    int64_t comments{0};
};

// Ordered by influencer id so later stable sorts break ties by id
std::map<InfluencerId, Totals> group_tracking(const std::vector<TrackingRecord>& tracking) {
    std::map<InfluencerId, Totals> totals;
    for (const auto& row : tracking) {
        auto& entry = totals[row.influencer_id];
        entry.revenue += row.revenue;
        entry.orders += row.orders;
    }
    return totals;
}

std::unordered_map<InfluencerId, const Influencer*> index_influencers(
    const std::vector<Influencer>& influencers) {
    std::unordered_map<InfluencerId, const Influencer*> index;
    for (const auto& influencer : influencers) {
        index.emplace(influencer.id, &influencer);
    }
    return index;
}

}  // namespace

PerformanceRanker::PerformanceRanker(AnalyticsConfig config)
    : config_(std::move(config)), fixed_cost_(config_.cost_ratio) {}

std::vector<PerformerRecord> PerformanceRanker::get_top_performers(const CampaignTables& snapshot,
                                                                   size_t limit) const {
    std::vector<PerformerRecord> ranking;
    if (snapshot.tracking.empty() || limit == 0) {
        return ranking;
    }

    auto totals = group_tracking(snapshot.tracking);
    auto influencers = index_influencers(snapshot.influencers);

    std::unordered_map<InfluencerId, PostTotals> post_totals;
    for (const auto& post : snapshot.posts) {
        auto& entry = post_totals[post.influencer_id];
        entry.reach += post.reach;
        entry.likes += post.likes;
        entry.comments += post.comments;
    }

    ranking.reserve(totals.size());
    for (const auto& [id, total] : totals) {
        PerformerRecord record;
        record.influencer_id = id;
        record.revenue = total.revenue;
        record.orders = total.orders;

        auto found = influencers.find(id);
        if (found != influencers.end()) {
            const Influencer& influencer = *found->second;
            record.name = influencer.name;
            record.platform = influencer.platform;
            record.category = influencer.category;
            record.follower_count = influencer.follower_count;
            if (influencer.follower_count > 0) {
                record.revenue_per_follower =
                    total.revenue / static_cast<double>(influencer.follower_count);
            }
        } else {
            record.name = kUnknownName;
        }

        auto posts = post_totals.find(id);
        if (posts != post_totals.end()) {
            const PostTotals& p = posts->second;
            record.reach = p.reach;
            record.likes = p.likes;
            record.comments = p.comments;
            record.engagement_rate =
                p.reach > 0 ? static_cast<double>(p.likes + p.comments) / p.reach * 100.0 : 0.0;
            if (p.reach > 0) {
                record.orders_per_post = static_cast<double>(total.orders) / p.reach;
            }
        }

        ranking.push_back(std::move(record));
    }

    std::stable_sort(ranking.begin(), ranking.end(),
                     [](const PerformerRecord& a, const PerformerRecord& b) {
                         return a.revenue > b.revenue;
                     });

    if (ranking.size() > limit) {
        ranking.resize(limit);
    }
    return ranking;
}

std::vector<InfluencerPerformance> PerformanceRanker::influencer_performance(
    const CampaignTables& snapshot) const {
    std::vector<InfluencerPerformance> rows;
    if (snapshot.tracking.empty() || snapshot.influencers.empty()) {
        return rows;
    }

    auto totals = group_tracking(snapshot.tracking);
    auto influencers = index_influencers(snapshot.influencers);

    size_t dropped = 0;
    for (const auto& [id, total] : totals) {
        auto found = influencers.find(id);
        if (found == influencers.end()) {
            ++dropped;
            continue;
        }
        InfluencerPerformance row;
        row.influencer_id = id;
        row.name = found->second->name;
        row.platform = found->second->platform;
        row.revenue = total.revenue;
        row.orders = total.orders;
        row.cost = fixed_cost_.cost_for(total.revenue);
        row.roi = calculate_roi(row.revenue, row.cost);
        rows.push_back(std::move(row));
    }

    if (dropped > 0) {
        DEBUG("Dropped " << dropped << " tracked influencers missing from influencer table");
    }
    return rows;
}

std::string PerformanceRanker::classify_reason(double revenue, double orders, double roi) const {
    if (revenue < config_.low_revenue_threshold) {
        return "Low revenue generation";
    }
    if (orders < config_.low_orders_threshold) {
        return "Low order conversion";
    }
    if (roi < config_.very_low_roi_threshold) {
        return "Very low ROI";
    }
    return "Below benchmark ROI";
}

std::vector<PoorPerformerRecord> PerformanceRanker::identify_poor_performers(
    const CampaignTables& snapshot) const {
    std::vector<PoorPerformerRecord> poor;

    for (auto& row : influencer_performance(snapshot)) {
        if (row.roi >= config_.benchmark_roi) {
            continue;
        }
        PoorPerformerRecord record;
        record.reason =
            classify_reason(row.revenue, static_cast<double>(row.orders), row.roi);
        record.influencer_id = std::move(row.influencer_id);
        record.name = std::move(row.name);
        record.platform = row.platform;
        record.revenue = row.revenue;
        record.orders = row.orders;
        record.cost = row.cost;
        record.roi = row.roi;
        poor.push_back(std::move(record));
    }

    std::stable_sort(poor.begin(), poor.end(),
                     [](const PoorPerformerRecord& a, const PoorPerformerRecord& b) {
                         return a.roi < b.roi;
                     });
    return poor;
}

}  // namespace campaign_analytics
