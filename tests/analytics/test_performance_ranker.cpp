#include <gtest/gtest.h>
#include "analytics/test_fixtures.hpp"
#include "campaign_analytics/analytics/performance_ranker.hpp"

using namespace campaign_analytics;
using namespace campaign_analytics::testing;

namespace {

AnalyticsConfig with_cost_ratio(double ratio) {
    AnalyticsConfig config;
    config.cost_ratio = ratio;
    return config;
}

}  // namespace

class PerformanceRankerTest : public ::testing::Test {
protected:
    PerformanceRanker ranker{AnalyticsConfig{}};
};

TEST_F(PerformanceRankerTest, RanksByRevenueDescending) {
    auto top = ranker.get_top_performers(mixed_tables(), 10);

    ASSERT_EQ(top.size(), 4u);
    EXPECT_EQ(top[0].influencer_id, "Y1");
    EXPECT_EQ(top[1].influencer_id, "I1");
    EXPECT_EQ(top[2].influencer_id, "I2");
    EXPECT_EQ(top[3].influencer_id, "Y2");
    EXPECT_DOUBLE_EQ(top[1].revenue, 5000.0);
    EXPECT_EQ(top[1].orders, 25);
}

TEST_F(PerformanceRankerTest, JoinsProfileAndPostMetrics) {
    auto top = ranker.get_top_performers(mixed_tables(), 1);

    ASSERT_EQ(top.size(), 1u);
    const auto& y1 = top[0];
    EXPECT_EQ(y1.name, "Name Y1");
    EXPECT_EQ(y1.platform, Platform::YOUTUBE);
    EXPECT_EQ(y1.category, "Fitness");
    EXPECT_EQ(y1.follower_count, 20000);
    ASSERT_TRUE(y1.reach.has_value());
    EXPECT_EQ(*y1.reach, 4000);
    ASSERT_TRUE(y1.engagement_rate.has_value());
    EXPECT_DOUBLE_EQ(*y1.engagement_rate, 3.0);
    ASSERT_TRUE(y1.revenue_per_follower.has_value());
    EXPECT_DOUBLE_EQ(*y1.revenue_per_follower, 0.3);
    ASSERT_TRUE(y1.orders_per_post.has_value());
    EXPECT_DOUBLE_EQ(*y1.orders_per_post, 30.0 / 4000.0);
}

TEST_F(PerformanceRankerTest, MissingPostsAndFollowersLeaveRatiosUndefined) {
    auto top = ranker.get_top_performers(mixed_tables(), 10);

    const auto& y2 = top.back();
    ASSERT_EQ(y2.influencer_id, "Y2");
    EXPECT_FALSE(y2.reach.has_value());
    EXPECT_FALSE(y2.engagement_rate.has_value());
    EXPECT_FALSE(y2.orders_per_post.has_value());
    EXPECT_FALSE(y2.revenue_per_follower.has_value());
}

TEST_F(PerformanceRankerTest, ZeroReachGivesZeroEngagement) {
    auto tables = two_influencer_tables();
    tables.posts = {make_post("A", Platform::INSTAGRAM, 0, 10, 5)};

    auto top = ranker.get_top_performers(tables, 10);
    ASSERT_EQ(top[0].influencer_id, "A");
    ASSERT_TRUE(top[0].engagement_rate.has_value());
    EXPECT_DOUBLE_EQ(*top[0].engagement_rate, 0.0);
    EXPECT_FALSE(top[0].orders_per_post.has_value());
}

TEST_F(PerformanceRankerTest, TiesBreakByInfluencerId) {
    CampaignTables tables;
    tables.tracking = {make_tracking("C", 100, 1), make_tracking("A", 100, 1),
                       make_tracking("B", 100, 1)};

    auto top = ranker.get_top_performers(tables, 10);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].influencer_id, "A");
    EXPECT_EQ(top[1].influencer_id, "B");
    EXPECT_EQ(top[2].influencer_id, "C");
}

TEST_F(PerformanceRankerTest, DanglingIdsAreKeptAsUnknown) {
    auto tables = two_influencer_tables();
    tables.tracking.push_back(make_tracking("Z", 9000, 90));

    auto top = ranker.get_top_performers(tables, 10);
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].influencer_id, "Z");
    EXPECT_EQ(top[0].name, PerformanceRanker::kUnknownName);
    EXPECT_EQ(top[0].platform, Platform::UNKNOWN);
    EXPECT_EQ(top[0].follower_count, 0);
}

TEST_F(PerformanceRankerTest, LimitTruncatesAndDefaultsFromConfig) {
    CampaignTables tables;
    for (int i = 0; i < 15; ++i) {
        tables.tracking.push_back(make_tracking("ID" + std::to_string(i), 100.0 + i, 1));
    }

    EXPECT_EQ(ranker.get_top_performers(tables, 3).size(), 3u);
    EXPECT_EQ(ranker.get_top_performers(tables).size(), 10u);
    EXPECT_TRUE(ranker.get_top_performers(tables, 0).empty());
    EXPECT_TRUE(ranker.get_top_performers(CampaignTables{}, 5).empty());
}

TEST_F(PerformanceRankerTest, EndToEndTopPerformer) {
    auto top = ranker.get_top_performers(two_influencer_tables(), 10);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].influencer_id, "A");
    EXPECT_DOUBLE_EQ(top[0].revenue, 5000.0);
}

TEST_F(PerformanceRankerTest, InfluencerPerformanceDropsUnknownIds) {
    auto tables = two_influencer_tables();
    tables.tracking.push_back(make_tracking("Z", 9000, 90));

    auto rows = ranker.influencer_performance(tables);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].influencer_id, "A");
    EXPECT_DOUBLE_EQ(rows[0].cost, 1250.0);
    EXPECT_DOUBLE_EQ(rows[0].roi, 300.0);
}

TEST_F(PerformanceRankerTest, NoPoorPerformersAtDefaultRatio) {
    EXPECT_TRUE(ranker.identify_poor_performers(mixed_tables()).empty());
}

TEST_F(PerformanceRankerTest, ReasonPriority) {
    EXPECT_EQ(ranker.classify_reason(500, 2, 10), "Low revenue generation");
    EXPECT_EQ(ranker.classify_reason(5000, 2, 10), "Low order conversion");
    EXPECT_EQ(ranker.classify_reason(5000, 20, 10), "Very low ROI");
    EXPECT_EQ(ranker.classify_reason(5000, 20, 120), "Below benchmark ROI");
}

TEST(PoorPerformerTest, HighCostRatioFlagsEveryone) {
    PerformanceRanker ranker(with_cost_ratio(0.9));
    CampaignTables tables;
    tables.influencers = {make_influencer("A", Platform::INSTAGRAM)};
    tables.tracking = {make_tracking("A", 500, 2)};

    auto poor = ranker.identify_poor_performers(tables);
    ASSERT_EQ(poor.size(), 1u);
    EXPECT_NEAR(poor[0].roi, 11.11, 0.01);
    EXPECT_EQ(poor[0].reason, "Low revenue generation");
}

TEST(PoorPerformerTest, SortedByRoiAscending) {
    PerformanceRanker ranker(with_cost_ratio(0.9));
    CampaignTables tables;
    tables.influencers = {make_influencer("big", Platform::INSTAGRAM),
                          make_influencer("one", Platform::INSTAGRAM),
                          make_influencer("zero", Platform::YOUTUBE)};
    // Revenue 1 costs 0.9, which is divided by one; revenue 0 has no cost
    tables.tracking = {make_tracking("big", 5000, 50), make_tracking("one", 1, 1),
                       make_tracking("zero", 0, 0)};

    auto poor = ranker.identify_poor_performers(tables);
    ASSERT_EQ(poor.size(), 3u);
    EXPECT_EQ(poor[0].influencer_id, "zero");
    EXPECT_EQ(poor[1].influencer_id, "one");
    EXPECT_EQ(poor[2].influencer_id, "big");
    EXPECT_EQ(poor[2].reason, "Very low ROI");
}

TEST(PoorPerformerTest, BelowBenchmarkReason) {
    PerformanceRanker ranker(with_cost_ratio(0.5));
    CampaignTables tables;
    tables.influencers = {make_influencer("A", Platform::INSTAGRAM)};
    tables.tracking = {make_tracking("A", 4000, 40)};

    auto poor = ranker.identify_poor_performers(tables);
    ASSERT_EQ(poor.size(), 1u);
    EXPECT_DOUBLE_EQ(poor[0].roi, 100.0);
    EXPECT_EQ(poor[0].reason, "Below benchmark ROI");
}
