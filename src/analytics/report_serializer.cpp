// src/analytics/report_serializer.cpp

#include "campaign_analytics/analytics/report_serializer.hpp"

namespace campaign_analytics {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

template <typename T>
nlohmann::json array_to_json(const std::vector<T>& rows) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& row : rows) {
        array.push_back(ReportSerializer::to_json(row));
    }
    return array;
}

nlohmann::json daily_to_json(const std::vector<DailyTrend>& daily) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& day : daily) {
        array.push_back(
            {{"date", day.date.to_string()}, {"revenue", day.revenue}, {"orders", day.orders}});
    }
    return array;
}

}  // namespace

nlohmann::json ReportSerializer::to_json(const RoiRoasMetrics& metrics) {
    return {{"avg_roi", metrics.avg_roi},
            {"avg_roas", metrics.avg_roas},
            {"roi_change", metrics.roi_change},
            {"roas_change", metrics.roas_change},
            {"total_revenue", metrics.total_revenue},
            {"total_cost", metrics.total_cost},
            {"cost_basis", cost_basis_to_string(metrics.cost_basis)}};
}

nlohmann::json ReportSerializer::to_json(const PerformerRecord& record) {
    return {{"influencer_id", record.influencer_id},
            {"name", record.name},
            {"platform", platform_to_string(record.platform)},
            {"category", record.category},
            {"follower_count", record.follower_count},
            {"revenue", record.revenue},
            {"orders", record.orders},
            {"reach", optional_to_json(record.reach)},
            {"likes", optional_to_json(record.likes)},
            {"comments", optional_to_json(record.comments)},
            {"engagement_rate", optional_to_json(record.engagement_rate)},
            {"revenue_per_follower", optional_to_json(record.revenue_per_follower)},
            {"orders_per_post", optional_to_json(record.orders_per_post)}};
}

nlohmann::json ReportSerializer::to_json(const std::vector<PerformerRecord>& records) {
    return array_to_json(records);
}

nlohmann::json ReportSerializer::to_json(const InfluencerPerformance& row) {
    return {{"influencer_id", row.influencer_id},
            {"name", row.name},
            {"platform", platform_to_string(row.platform)},
            {"revenue", row.revenue},
            {"orders", row.orders},
            {"cost", row.cost},
            {"roi", row.roi}};
}

nlohmann::json ReportSerializer::to_json(const PoorPerformerRecord& record) {
    return {{"influencer_id", record.influencer_id},
            {"name", record.name},
            {"platform", platform_to_string(record.platform)},
            {"revenue", record.revenue},
            {"orders", record.orders},
            {"cost", record.cost},
            {"roi", record.roi},
            {"reason", record.reason}};
}

nlohmann::json ReportSerializer::to_json(const std::vector<PoorPerformerRecord>& records) {
    return array_to_json(records);
}

nlohmann::json ReportSerializer::to_json(const PlatformStats& stats) {
    return {{"platform", platform_to_string(stats.platform)},
            {"total_revenue", stats.total_revenue},
            {"total_orders", stats.total_orders},
            {"influencer_count", stats.influencer_count},
            {"avg_revenue_per_influencer", stats.avg_revenue_per_influencer},
            {"avg_engagement_rate", stats.avg_engagement_rate},
            {"estimated_cost", stats.estimated_cost},
            {"avg_roi", stats.avg_roi}};
}

nlohmann::json ReportSerializer::to_json(const CategoryStats& stats) {
    return {{"category", stats.category},
            {"influencer_count", stats.influencer_count},
            {"avg_follower_count", stats.avg_follower_count},
            {"total_followers", stats.total_followers},
            {"total_posts", stats.total_posts},
            {"revenue", stats.revenue},
            {"orders", stats.orders},
            {"avg_revenue_per_post", stats.avg_revenue_per_post},
            {"estimated_cost", stats.estimated_cost},
            {"avg_roi", stats.avg_roi}};
}

nlohmann::json ReportSerializer::to_json(const TrendReport& trends) {
    nlohmann::json weekly = nlohmann::json::array();
    for (const auto& week : trends.weekly) {
        weekly.push_back({{"week", week.week.to_string()},
                          {"iso_year", week.week.year},
                          {"week_number", week.week.week},
                          {"revenue", week.revenue},
                          {"orders", week.orders}});
    }
    return {{"daily", daily_to_json(trends.daily)}, {"weekly", weekly}};
}

nlohmann::json ReportSerializer::to_json(const InsightReport& report) {
    return {{"top_influencers",
             {{"by_revenue", array_to_json(report.top_influencers.by_revenue)},
              {"by_roi", array_to_json(report.top_influencers.by_roi)}}},
            {"platform_analysis", array_to_json(report.platform_analysis)},
            {"category_analysis", array_to_json(report.category_analysis)},
            {"poor_performers", array_to_json(report.poor_performers)},
            {"trends", to_json(report.trends)}};
}

nlohmann::json ReportSerializer::to_json(const InfluencerProfile& profile) {
    nlohmann::json j = {{"influencer_id", profile.influencer_id},
                        {"total_revenue", profile.total_revenue},
                        {"total_orders", profile.total_orders},
                        {"avg_order_value", profile.avg_order_value},
                        {"active_days", profile.active_days},
                        {"campaigns", profile.campaigns},
                        {"products", profile.products}};

    if (profile.posts) {
        j["total_posts"] = profile.posts->total_posts;
        j["total_reach"] = profile.posts->total_reach;
        j["total_engagement"] = profile.posts->total_engagement;
        j["avg_engagement_rate"] = profile.posts->avg_engagement_rate;
    }
    if (profile.payout) {
        j["payout_basis"] = payout_basis_to_string(profile.payout->basis);
        j["payout_rate"] = profile.payout->rate;
        j["total_payout"] = profile.payout->total_payout;
    }
    return j;
}

nlohmann::json ReportSerializer::to_json(const DataSummary& summary) {
    nlohmann::json platforms = nlohmann::json::array();
    for (auto platform : summary.platforms) {
        platforms.push_back(platform_to_string(platform));
    }

    nlohmann::json post_dates = nullptr;
    if (summary.post_dates) {
        post_dates = {{"start", summary.post_dates->start.to_string()},
                      {"end", summary.post_dates->end.to_string()}};
    }

    return {{"influencers",
             {{"count", summary.influencer_count},
              {"platforms", platforms},
              {"categories", summary.categories}}},
            {"posts",
             {{"count", summary.post_count},
              {"date_range", post_dates},
              {"total_reach", summary.total_reach}}},
            {"tracking",
             {{"count", summary.tracking_count},
              {"total_revenue", summary.total_revenue},
              {"total_orders", summary.total_orders}}},
            {"payouts", {{"count", summary.payout_count}, {"total_amount", summary.total_payout}}}};
}

nlohmann::json ReportSerializer::to_json(const ExportSummary& summary) {
    nlohmann::json influencers = nlohmann::json::array();
    for (const auto& group : summary.influencer_summary) {
        influencers.push_back({{"platform", platform_to_string(group.platform)},
                               {"category", group.category},
                               {"count", group.count},
                               {"mean_followers", group.mean_followers},
                               {"total_followers", group.total_followers}});
    }

    nlohmann::json campaigns = nlohmann::json::array();
    for (const auto& row : summary.campaign_summary) {
        campaigns.push_back({{"campaign", row.campaign},
                             {"revenue", row.revenue},
                             {"orders", row.orders},
                             {"influencer_count", row.influencer_count}});
    }

    return {{"influencer_summary", influencers},
            {"campaign_summary", campaigns},
            {"daily_performance", daily_to_json(summary.daily_performance)}};
}

nlohmann::json ReportSerializer::to_json(const PayoutSummary& summary) {
    nlohmann::json by_basis = nlohmann::json::array();
    for (const auto& row : summary.by_basis) {
        by_basis.push_back({{"basis", payout_basis_to_string(row.basis)},
                            {"total_payout", row.total_payout},
                            {"count", row.count}});
    }

    nlohmann::json details = nlohmann::json::array();
    for (const auto& detail : summary.details) {
        nlohmann::json platform = nullptr;
        if (detail.platform) {
            platform = platform_to_string(*detail.platform);
        }
        details.push_back({{"influencer_id", detail.influencer_id},
                           {"name", optional_to_json(detail.name)},
                           {"platform", platform},
                           {"category", optional_to_json(detail.category)},
                           {"basis", payout_basis_to_string(detail.basis)},
                           {"rate", detail.rate},
                           {"orders", detail.orders},
                           {"total_payout", detail.total_payout}});
    }

    return {{"count", summary.payout_count},
            {"total_payout", summary.total_payout},
            {"avg_payout", summary.avg_payout},
            {"active_influencers", summary.active_influencers},
            {"by_basis", by_basis},
            {"details", details}};
}

nlohmann::json ReportSerializer::to_json(const ReportHeadline& headline) {
    return {{"total_revenue", headline.total_revenue},
            {"total_orders", headline.total_orders},
            {"total_payout", headline.total_payout},
            {"weekly_revenue_growth", optional_to_json(headline.weekly_revenue_growth)}};
}

}  // namespace campaign_analytics
