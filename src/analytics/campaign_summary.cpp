// src/analytics/campaign_summary.cpp

#include "campaign_analytics/analytics/campaign_summary.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include "campaign_analytics/core/format_utils.hpp"

namespace campaign_analytics {

namespace {

template <typename T>
void append_unique(std::vector<T>& values, const T& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

}  // namespace

std::optional<InfluencerProfile> CampaignSummaries::get_influencer_performance(
    const CampaignTables& tables, const InfluencerId& influencer_id) {
    InfluencerProfile profile;
    profile.influencer_id = influencer_id;

    std::unordered_set<Date> days;
    size_t rows = 0;
    for (const auto& row : tables.tracking) {
        if (row.influencer_id != influencer_id) {
            continue;
        }
        ++rows;
        profile.total_revenue += row.revenue;
        profile.total_orders += row.orders;
        days.insert(row.date);
        append_unique(profile.campaigns, row.campaign);
        append_unique(profile.products, row.product);
    }

    if (rows == 0) {
        return std::nullopt;
    }

    profile.avg_order_value =
        profile.total_revenue / static_cast<double>(std::max<int64_t>(profile.total_orders, 1));
    profile.active_days = days.size();

    InfluencerProfile::PostMetrics post_metrics;
    for (const auto& post : tables.posts) {
        if (post.influencer_id != influencer_id) {
            continue;
        }
        post_metrics.total_posts += 1;
        post_metrics.total_reach += post.reach;
        post_metrics.total_engagement += post.likes + post.comments;
    }
    if (post_metrics.total_posts > 0) {
        post_metrics.avg_engagement_rate =
            static_cast<double>(post_metrics.total_engagement) /
            static_cast<double>(std::max<int64_t>(post_metrics.total_reach, 1)) * 100.0;
        profile.posts = post_metrics;
    }

    auto payout = std::find_if(
        tables.payouts.begin(), tables.payouts.end(),
        [&influencer_id](const PayoutRecord& row) { return row.influencer_id == influencer_id; });
    if (payout != tables.payouts.end()) {
        profile.payout = InfluencerProfile::PayoutTerms{payout->basis, payout->rate,
                                                        payout->total_payout};
    }

    return profile;
}

DataSummary CampaignSummaries::summarize(const CampaignTables& tables) {
    DataSummary summary;

    summary.influencer_count = tables.influencers.size();
    for (const auto& influencer : tables.influencers) {
        append_unique(summary.platforms, influencer.platform);
        append_unique(summary.categories, influencer.category);
    }

    summary.post_count = tables.posts.size();
    if (!tables.posts.empty()) {
        DateRange range{tables.posts.front().date, tables.posts.front().date};
        for (const auto& post : tables.posts) {
            range.start = std::min(range.start, post.date);
            range.end = std::max(range.end, post.date);
            summary.total_reach += post.reach;
        }
        summary.post_dates = range;
    }

    summary.tracking_count = tables.tracking.size();
    for (const auto& row : tables.tracking) {
        summary.total_revenue += row.revenue;
        summary.total_orders += row.orders;
    }

    summary.payout_count = tables.payouts.size();
    for (const auto& payout : tables.payouts) {
        summary.total_payout += payout.total_payout;
    }

    return summary;
}

ExportSummary CampaignSummaries::build_export_summary(const CampaignTables& tables,
                                                      const TrendAnalyzer& trends) {
    ExportSummary summary;

    std::map<std::pair<std::string, std::string>, InfluencerGroupSummary> groups;
    for (const auto& influencer : tables.influencers) {
        auto key = std::make_pair(platform_to_string(influencer.platform), influencer.category);
        auto& group = groups[key];
        group.platform = influencer.platform;
        group.category = influencer.category;
        group.count += 1;
        group.total_followers += influencer.follower_count;
    }
    for (auto& [key, group] : groups) {
        group.mean_followers =
            static_cast<double>(group.total_followers) / static_cast<double>(group.count);
        summary.influencer_summary.push_back(std::move(group));
    }

    std::map<std::string, std::pair<CampaignSummaryRow, std::unordered_set<InfluencerId>>>
        campaigns;
    for (const auto& row : tables.tracking) {
        auto& entry = campaigns[row.campaign];
        entry.first.campaign = row.campaign;
        entry.first.revenue += row.revenue;
        entry.first.orders += row.orders;
        entry.second.insert(row.influencer_id);
    }
    for (auto& [name, entry] : campaigns) {
        entry.first.influencer_count = entry.second.size();
        summary.campaign_summary.push_back(std::move(entry.first));
    }

    summary.daily_performance = trends.daily(tables);
    return summary;
}

PayoutSummary CampaignSummaries::summarize_payouts(const CampaignTables& tables) {
    PayoutSummary summary;
    summary.payout_count = tables.payouts.size();

    std::unordered_map<InfluencerId, const Influencer*> influencers;
    for (const auto& influencer : tables.influencers) {
        influencers.emplace(influencer.id, &influencer);
    }

    std::map<std::string, PayoutBasisRow> by_basis;
    for (const auto& payout : tables.payouts) {
        summary.total_payout += payout.total_payout;
        if (payout.total_payout > 0.0) {
            summary.active_influencers += 1;
        }

        auto& basis_row = by_basis[payout_basis_to_string(payout.basis)];
        basis_row.basis = payout.basis;
        basis_row.total_payout += payout.total_payout;
        basis_row.count += 1;

        PayoutDetail detail;
        detail.influencer_id = payout.influencer_id;
        detail.basis = payout.basis;
        detail.rate = payout.rate;
        detail.orders = payout.orders;
        detail.total_payout = payout.total_payout;
        auto found = influencers.find(payout.influencer_id);
        if (found != influencers.end()) {
            detail.name = found->second->name;
            detail.platform = found->second->platform;
            detail.category = found->second->category;
        }
        summary.details.push_back(std::move(detail));
    }

    if (summary.payout_count > 0) {
        summary.avg_payout = summary.total_payout / static_cast<double>(summary.payout_count);
    }
    for (auto& [name, row] : by_basis) {
        summary.by_basis.push_back(row);
    }
    std::stable_sort(summary.details.begin(), summary.details.end(),
                     [](const PayoutDetail& a, const PayoutDetail& b) {
                         return a.total_payout > b.total_payout;
                     });
    return summary;
}

ReportHeadline CampaignSummaries::build_headline(const CampaignTables& tables,
                                                 const TrendAnalyzer& trends) {
    const DataSummary totals = summarize(tables);

    ReportHeadline headline;
    headline.total_revenue = core::format_currency(totals.total_revenue);
    headline.total_orders = core::format_number(static_cast<double>(totals.total_orders));
    headline.total_payout = core::format_currency(totals.total_payout);

    const auto weeks = trends.weekly(tables);
    if (weeks.size() >= 2) {
        const auto& current = weeks[weeks.size() - 1];
        const auto& previous = weeks[weeks.size() - 2];
        headline.weekly_revenue_growth =
            core::calculate_growth_rate(current.revenue, previous.revenue);
    }
    return headline;
}

}  // namespace campaign_analytics
