#include <gtest/gtest.h>
#include "analytics/test_fixtures.hpp"
#include "campaign_analytics/analytics/campaign_summary.hpp"
#include "campaign_analytics/analytics/metrics_calculator.hpp"
#include "campaign_analytics/analytics/report_serializer.hpp"

using namespace campaign_analytics;
using namespace campaign_analytics::testing;

TEST(ReportSerializerTest, MetricsIncludeCostBasis) {
    MetricsCalculator calculator{AnalyticsConfig{}};
    auto j = ReportSerializer::to_json(calculator.calculate_roi_roas(two_influencer_tables()));

    EXPECT_DOUBLE_EQ(j["avg_roi"].get<double>(), 300.0);
    EXPECT_DOUBLE_EQ(j["avg_roas"].get<double>(), 4.0);
    EXPECT_EQ(j["cost_basis"], "fixed_ratio");
}

TEST(ReportSerializerTest, UndefinedRatiosAreNull) {
    PerformerRecord record;
    record.influencer_id = "Y2";
    record.name = "Name Y2";
    record.platform = Platform::YOUTUBE;

    auto j = ReportSerializer::to_json(record);
    EXPECT_EQ(j["platform"], "YouTube");
    EXPECT_TRUE(j["reach"].is_null());
    EXPECT_TRUE(j["engagement_rate"].is_null());
    EXPECT_TRUE(j["revenue_per_follower"].is_null());
    EXPECT_TRUE(j["orders_per_post"].is_null());
}

TEST(ReportSerializerTest, PerformerListIsArray) {
    PerformerRecord record;
    record.influencer_id = "A";
    record.engagement_rate = 2.5;

    auto j = ReportSerializer::to_json(std::vector<PerformerRecord>{record});
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_DOUBLE_EQ(j[0]["engagement_rate"].get<double>(), 2.5);
}

TEST(ReportSerializerTest, TrendWeeksCarryIsoYear) {
    TrendReport trends;
    trends.daily.push_back(DailyTrend{Date(2021, 1, 3), 100.0, 2});
    trends.weekly.push_back(WeeklyTrend{IsoWeek{2020, 53}, 100.0, 2});

    auto j = ReportSerializer::to_json(trends);
    EXPECT_EQ(j["daily"][0]["date"], "2021-01-03");
    EXPECT_EQ(j["weekly"][0]["week"], "2020-W53");
    EXPECT_EQ(j["weekly"][0]["iso_year"], 2020);
    EXPECT_EQ(j["weekly"][0]["week_number"], 53);
}

TEST(ReportSerializerTest, DataSummaryLayout) {
    auto j = ReportSerializer::to_json(CampaignSummaries::summarize(mixed_tables()));

    EXPECT_EQ(j["influencers"]["count"], 4);
    EXPECT_EQ(j["influencers"]["platforms"][0], "Instagram");
    EXPECT_EQ(j["posts"]["date_range"]["start"], "2024-03-01");
    EXPECT_EQ(j["posts"]["date_range"]["end"], "2024-03-20");
    EXPECT_DOUBLE_EQ(j["tracking"]["total_revenue"].get<double>(), 13500.0);
    EXPECT_DOUBLE_EQ(j["payouts"]["total_amount"].get<double>(), 4000.0);

    auto empty = ReportSerializer::to_json(CampaignSummaries::summarize(CampaignTables{}));
    EXPECT_TRUE(empty["posts"]["date_range"].is_null());
}

TEST(ReportSerializerTest, PayoutDetailsWithoutInfluencerAreNull) {
    auto tables = mixed_tables();
    tables.payouts.push_back(make_payout("Z", 800, PayoutBasis::ORDER));

    auto j = ReportSerializer::to_json(CampaignSummaries::summarize_payouts(tables));
    EXPECT_EQ(j["count"], 3);
    EXPECT_EQ(j["active_influencers"], 3);
    EXPECT_DOUBLE_EQ(j["avg_payout"].get<double>(), 1600.0);
    EXPECT_EQ(j["by_basis"][0]["basis"], "order");
    EXPECT_EQ(j["by_basis"][1]["count"], 2);

    ASSERT_EQ(j["details"].size(), 3u);
    EXPECT_EQ(j["details"][0]["influencer_id"], "Y1");
    EXPECT_EQ(j["details"][0]["platform"], "YouTube");
    const auto& unknown = j["details"][2];
    EXPECT_EQ(unknown["influencer_id"], "Z");
    EXPECT_TRUE(unknown["name"].is_null());
    EXPECT_TRUE(unknown["platform"].is_null());
    EXPECT_TRUE(unknown["category"].is_null());
    EXPECT_EQ(unknown["basis"], "order");
}

TEST(ReportSerializerTest, HeadlineGrowthNullForOneWeek) {
    TrendAnalyzer trends{AnalyticsConfig{}};
    auto j = ReportSerializer::to_json(
        CampaignSummaries::build_headline(two_influencer_tables(), trends));
    EXPECT_EQ(j["total_revenue"], "\xE2\x82\xB9" "8.0K");
    EXPECT_EQ(j["total_orders"], "70");
    EXPECT_TRUE(j["weekly_revenue_growth"].is_null());
}

TEST(ReportSerializerTest, ProfileOmitsMissingSections) {
    auto with_all = CampaignSummaries::get_influencer_performance(mixed_tables(), "I1");
    auto bare = CampaignSummaries::get_influencer_performance(mixed_tables(), "Y2");
    ASSERT_TRUE(with_all && bare);

    auto j = ReportSerializer::to_json(*with_all);
    EXPECT_EQ(j["payout_basis"], "post");
    EXPECT_EQ(j["total_posts"], 1);
    EXPECT_EQ(j["campaigns"].size(), 2u);

    auto k = ReportSerializer::to_json(*bare);
    EXPECT_FALSE(k.contains("payout_basis"));
    EXPECT_FALSE(k.contains("total_posts"));
}

TEST(ReportSerializerTest, PoorPerformerCarriesReason) {
    PoorPerformerRecord record;
    record.influencer_id = "A";
    record.roi = 11.1;
    record.reason = "Low revenue generation";

    auto j = ReportSerializer::to_json(std::vector<PoorPerformerRecord>{record});
    EXPECT_EQ(j[0]["reason"], "Low revenue generation");
}
