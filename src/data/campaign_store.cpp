// src/data/campaign_store.cpp

#include "campaign_analytics/data/campaign_store.hpp"

namespace campaign_analytics {

Result<CampaignTables> InMemoryCampaignStore::load_tables() {
    std::lock_guard<std::mutex> lock(mutex_);
    return CampaignTables(tables_);
}

Result<void> InMemoryCampaignStore::save_influencers(const std::vector<Influencer>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.influencers = rows;
    return Result<void>();
}

Result<void> InMemoryCampaignStore::save_posts(const std::vector<Post>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.posts = rows;
    return Result<void>();
}

Result<void> InMemoryCampaignStore::save_tracking(const std::vector<TrackingRecord>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.tracking = rows;
    return Result<void>();
}

Result<void> InMemoryCampaignStore::save_payouts(const std::vector<PayoutRecord>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_.payouts = rows;
    return Result<void>();
}

Result<void> InMemoryCampaignStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    tables_ = CampaignTables();
    return Result<void>();
}

Result<StoreSummary> InMemoryCampaignStore::summary() {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreSummary summary;
    summary.influencers = tables_.influencers.size();
    summary.posts = tables_.posts.size();
    summary.tracking = tables_.tracking.size();
    summary.payouts = tables_.payouts.size();
    return summary;
}

}  // namespace campaign_analytics
