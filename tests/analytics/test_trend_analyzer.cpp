#include <gtest/gtest.h>
#include "analytics/test_fixtures.hpp"
#include "campaign_analytics/analytics/trend_analyzer.hpp"

using namespace campaign_analytics;
using namespace campaign_analytics::testing;

class TrendAnalyzerTest : public ::testing::Test {
protected:
    TrendAnalyzer analyzer{AnalyticsConfig{}};
};

TEST_F(TrendAnalyzerTest, EmptyTrackingGivesEmptyReport) {
    EXPECT_TRUE(analyzer.analyze(CampaignTables{}).empty());
    EXPECT_DOUBLE_EQ(analyzer.calculate_incremental_roas(CampaignTables{}), 0.0);
}

TEST_F(TrendAnalyzerTest, DailyAggregatesAscending) {
    CampaignTables tables;
    tables.tracking = {make_tracking("A", 100, 1, Date(2024, 3, 5)),
                       make_tracking("B", 200, 2, Date(2024, 3, 1)),
                       make_tracking("C", 50, 1, Date(2024, 3, 5))};

    auto daily = analyzer.daily(tables);
    ASSERT_EQ(daily.size(), 2u);
    EXPECT_EQ(daily[0].date, Date(2024, 3, 1));
    EXPECT_DOUBLE_EQ(daily[0].revenue, 200.0);
    EXPECT_EQ(daily[1].date, Date(2024, 3, 5));
    EXPECT_DOUBLE_EQ(daily[1].revenue, 150.0);
    EXPECT_EQ(daily[1].orders, 2);
}

TEST_F(TrendAnalyzerTest, WeeklyKeysOnIsoYearAndWeek) {
    CampaignTables tables;
    tables.tracking = {make_tracking("A", 100, 1, Date(2019, 12, 30)),  // 2020-W01
                       make_tracking("B", 200, 2, Date(2020, 12, 28)),  // 2020-W53
                       make_tracking("C", 300, 3, Date(2021, 1, 3))};   // 2020-W53

    auto weekly = analyzer.weekly(tables);
    ASSERT_EQ(weekly.size(), 2u);
    EXPECT_EQ(weekly[0].week.to_string(), "2020-W01");
    EXPECT_DOUBLE_EQ(weekly[0].revenue, 100.0);
    EXPECT_EQ(weekly[1].week.to_string(), "2020-W53");
    EXPECT_DOUBLE_EQ(weekly[1].revenue, 500.0);
    EXPECT_EQ(weekly[1].orders, 5);
}

TEST_F(TrendAnalyzerTest, AnalyzeFillsBothSeries) {
    auto report = analyzer.analyze(mixed_tables());
    EXPECT_EQ(report.daily.size(), 5u);
    EXPECT_EQ(report.weekly.size(), 5u);
    EXPECT_FALSE(report.empty());
}

TEST_F(TrendAnalyzerTest, IncrementalRoasClampsDeclineToZero) {
    CampaignTables tables;
    tables.tracking = {make_tracking("A", 1000, 1, Date(2024, 1, 1)),
                       make_tracking("A", 1000, 1, Date(2024, 1, 2)),
                       make_tracking("A", 800, 1, Date(2024, 3, 1))};

    EXPECT_DOUBLE_EQ(analyzer.calculate_incremental_roas(tables), 0.0);
}

TEST_F(TrendAnalyzerTest, IncrementalRoasOverRecentCost) {
    CampaignTables tables;
    tables.tracking = {make_tracking("A", 1000, 1, Date(2024, 1, 30)),
                       make_tracking("A", 3000, 1, Date(2024, 1, 31)),  // exactly at cutoff
                       make_tracking("A", 1000, 1, Date(2024, 3, 1))};

    // Recent mean 2000, baseline mean 1000, cost 2000 * 0.25
    EXPECT_DOUBLE_EQ(analyzer.calculate_incremental_roas(tables, 30), 2.0);
}

TEST_F(TrendAnalyzerTest, IncrementalRoasNeedsBothWindows) {
    CampaignTables tables;
    tables.tracking = {make_tracking("A", 1000, 1, Date(2024, 3, 1)),
                       make_tracking("A", 5000, 1, Date(2024, 3, 20))};

    EXPECT_DOUBLE_EQ(analyzer.calculate_incremental_roas(tables), 0.0);
}
