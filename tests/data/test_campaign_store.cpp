#include <gtest/gtest.h>
#include "analytics/test_fixtures.hpp"
#include "campaign_analytics/data/campaign_store.hpp"

using namespace campaign_analytics;
using namespace campaign_analytics::testing;

class InMemoryCampaignStoreTest : public ::testing::Test {
protected:
    InMemoryCampaignStore store;
};

TEST_F(InMemoryCampaignStoreTest, StartsEmpty) {
    auto tables = store.load_tables();
    ASSERT_TRUE(tables.is_ok());
    EXPECT_TRUE(tables.value().empty());

    auto summary = store.summary();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().influencers, 0u);
    EXPECT_EQ(summary.value().tracking, 0u);
}

TEST_F(InMemoryCampaignStoreTest, SavesReplaceWholeTable) {
    ASSERT_TRUE(store.save_tracking({make_tracking("A", 100, 1), make_tracking("B", 200, 2)})
                    .is_ok());
    ASSERT_TRUE(store.save_tracking({make_tracking("C", 300, 3)}).is_ok());

    auto tables = store.load_tables();
    ASSERT_TRUE(tables.is_ok());
    ASSERT_EQ(tables.value().tracking.size(), 1u);
    EXPECT_EQ(tables.value().tracking[0].influencer_id, "C");
}

TEST_F(InMemoryCampaignStoreTest, SummaryCountsEveryTable) {
    auto mixed = mixed_tables();
    ASSERT_TRUE(store.save_influencers(mixed.influencers).is_ok());
    ASSERT_TRUE(store.save_posts(mixed.posts).is_ok());
    ASSERT_TRUE(store.save_tracking(mixed.tracking).is_ok());
    ASSERT_TRUE(store.save_payouts(mixed.payouts).is_ok());

    auto summary = store.summary();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().influencers, 4u);
    EXPECT_EQ(summary.value().posts, 3u);
    EXPECT_EQ(summary.value().tracking, 5u);
    EXPECT_EQ(summary.value().payouts, 2u);
}

TEST_F(InMemoryCampaignStoreTest, ClearAllRemovesRows) {
    InMemoryCampaignStore seeded(mixed_tables());
    ASSERT_TRUE(seeded.clear_all().is_ok());

    auto tables = seeded.load_tables();
    ASSERT_TRUE(tables.is_ok());
    EXPECT_TRUE(tables.value().empty());
}

TEST_F(InMemoryCampaignStoreTest, LoadReturnsIndependentCopy) {
    ASSERT_TRUE(store.save_influencers({make_influencer("A", Platform::INSTAGRAM)}).is_ok());

    auto first = store.load_tables();
    ASSERT_TRUE(first.is_ok());
    CampaignTables copy = first.take_value();
    copy.influencers.clear();

    auto second = store.load_tables();
    EXPECT_EQ(second.value().influencers.size(), 1u);
}
