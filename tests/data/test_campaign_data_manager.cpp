#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include "analytics/test_fixtures.hpp"
#include "campaign_analytics/data/campaign_data_manager.hpp"

using namespace campaign_analytics;
using namespace campaign_analytics::testing;
using ::testing::_;
using ::testing::Invoke;

namespace {

class MockCampaignStore : public CampaignStore {
public:
    MOCK_METHOD(Result<CampaignTables>, load_tables, (), (override));
    MOCK_METHOD(Result<void>, save_influencers, (const std::vector<Influencer>&), (override));
    MOCK_METHOD(Result<void>, save_posts, (const std::vector<Post>&), (override));
    MOCK_METHOD(Result<void>, save_tracking, (const std::vector<TrackingRecord>&), (override));
    MOCK_METHOD(Result<void>, save_payouts, (const std::vector<PayoutRecord>&), (override));
    MOCK_METHOD(Result<void>, clear_all, (), (override));
    MOCK_METHOD(Result<StoreSummary>, summary, (), (override));
};

Result<void> store_down() {
    return make_error<void>(ErrorCode::CONNECTION_ERROR, "connection refused", "MockStore");
}

}  // namespace

class CampaignDataManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<::testing::StrictMock<MockCampaignStore>>();
    }

    std::shared_ptr<::testing::StrictMock<MockCampaignStore>> store;
};

TEST_F(CampaignDataManagerTest, SaveReachesPrimaryStore) {
    EXPECT_CALL(*store, save_tracking(_)).WillOnce(Invoke([](const auto& rows) {
        EXPECT_EQ(rows.size(), 2u);
        return Result<void>();
    }));

    CampaignDataManager manager(store);
    auto outcome = manager.save_tracking({make_tracking("A", 100, 1), make_tracking("B", 50, 1)});

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value(), SaveOutcome::PERSISTED);
    EXPECT_EQ(manager.snapshot().tracking.size(), 2u);
}

TEST_F(CampaignDataManagerTest, FailedSaveFallsBackToMemory) {
    EXPECT_CALL(*store, save_influencers(_)).WillOnce(Invoke([](const auto&) {
        return store_down();
    }));

    CampaignDataManager manager(store);
    auto outcome = manager.save_influencers({make_influencer("A", Platform::INSTAGRAM)});

    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value(), SaveOutcome::IN_MEMORY_FALLBACK);
    ASSERT_EQ(manager.snapshot().influencers.size(), 1u);
    EXPECT_EQ(manager.snapshot().influencers[0].id, "A");
}

TEST_F(CampaignDataManagerTest, NoPrimaryStoreKeepsRowsInMemory) {
    CampaignDataManager manager;
    EXPECT_FALSE(manager.has_primary_store());

    auto outcome = manager.save_payouts({make_payout("A", 300)});
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value(), SaveOutcome::IN_MEMORY_FALLBACK);
    EXPECT_EQ(manager.snapshot().payouts.size(), 1u);
}

TEST_F(CampaignDataManagerTest, SaveReplacesOnlyThatTable) {
    EXPECT_CALL(*store, save_posts(_)).WillRepeatedly(Invoke([](const auto&) {
        return Result<void>();
    }));
    EXPECT_CALL(*store, save_tracking(_)).WillOnce(Invoke([](const auto&) {
        return Result<void>();
    }));

    CampaignDataManager manager(store);
    ASSERT_TRUE(manager.save_tracking({make_tracking("A", 100, 1)}).is_ok());
    ASSERT_TRUE(manager.save_posts({make_post("A", Platform::INSTAGRAM, 10, 1, 1)}).is_ok());
    ASSERT_TRUE(manager.save_posts({}).is_ok());

    auto tables = manager.snapshot();
    EXPECT_TRUE(tables.posts.empty());
    EXPECT_EQ(tables.tracking.size(), 1u);
}

TEST_F(CampaignDataManagerTest, RefreshLoadsFromPrimaryStore) {
    EXPECT_CALL(*store, load_tables()).WillOnce(Invoke([] {
        return Result<CampaignTables>(mixed_tables());
    }));

    CampaignDataManager manager(store);
    ASSERT_TRUE(manager.refresh().is_ok());
    EXPECT_EQ(manager.snapshot().influencers.size(), 4u);
    EXPECT_EQ(manager.snapshot().tracking.size(), 5u);
}

TEST_F(CampaignDataManagerTest, FailedRefreshKeepsCurrentSnapshot) {
    EXPECT_CALL(*store, save_tracking(_)).WillOnce(Invoke([](const auto&) {
        return Result<void>();
    }));
    EXPECT_CALL(*store, load_tables()).WillOnce(Invoke([] {
        return make_error<CampaignTables>(ErrorCode::DATABASE_ERROR, "relation missing",
                                          "MockStore");
    }));

    CampaignDataManager manager(store);
    ASSERT_TRUE(manager.save_tracking({make_tracking("A", 100, 1)}).is_ok());

    auto refreshed = manager.refresh();
    ASSERT_TRUE(refreshed.is_error());
    EXPECT_EQ(refreshed.error()->code(), ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(manager.snapshot().tracking.size(), 1u);
}

TEST_F(CampaignDataManagerTest, RefreshWithoutPrimaryIsNoOp) {
    CampaignDataManager manager;
    ASSERT_TRUE(manager.save_tracking({make_tracking("A", 100, 1)}).is_ok());
    EXPECT_TRUE(manager.refresh().is_ok());
    EXPECT_EQ(manager.snapshot().tracking.size(), 1u);
}

TEST(SaveOutcomeTest, Names) {
    EXPECT_EQ(save_outcome_to_string(SaveOutcome::PERSISTED), "PERSISTED");
    EXPECT_EQ(save_outcome_to_string(SaveOutcome::IN_MEMORY_FALLBACK), "IN_MEMORY_FALLBACK");
}
