// src/data/campaign_data_manager.cpp

#include "campaign_analytics/data/campaign_data_manager.hpp"
#include "campaign_analytics/core/logger.hpp"

namespace campaign_analytics {

std::string save_outcome_to_string(SaveOutcome outcome) {
    return outcome == SaveOutcome::PERSISTED ? "PERSISTED" : "IN_MEMORY_FALLBACK";
}

CampaignDataManager::CampaignDataManager(std::shared_ptr<CampaignStore> primary)
    : primary_(std::move(primary)) {
    Logger::register_component("CampaignDataManager");
}

Result<void> CampaignDataManager::refresh() {
    if (!primary_) {
        WARN("No primary store configured, keeping current data");
        return Result<void>();
    }

    auto loaded = primary_->load_tables();
    if (loaded.is_error()) {
        ERROR("Error loading data from primary store: " << loaded.error()->what());
        return forward_error<void>(loaded);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tables_ = loaded.take_value();
    INFO("Data loaded from primary store: " << tables_.influencers.size() << " influencers, "
                                            << tables_.tracking.size() << " tracking rows");
    return Result<void>();
}

template <typename Row>
Result<SaveOutcome> CampaignDataManager::save_rows(
    const std::vector<Row>& rows, std::vector<Row> CampaignTables::*table,
    Result<void> (CampaignStore::*persist)(const std::vector<Row>&), const std::string& entity) {
    SaveOutcome outcome = SaveOutcome::IN_MEMORY_FALLBACK;

    if (primary_) {
        auto stored = ((*primary_).*persist)(rows);
        if (stored.is_ok()) {
            outcome = SaveOutcome::PERSISTED;
        } else {
            WARN("Saving " << entity << " to primary store failed, keeping in memory: "
                           << stored.error()->what());
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tables_.*table = rows;
    DEBUG("Saved " << rows.size() << " " << entity << " ("
                   << save_outcome_to_string(outcome) << ")");
    return outcome;
}

Result<SaveOutcome> CampaignDataManager::save_influencers(const std::vector<Influencer>& rows) {
    return save_rows(rows, &CampaignTables::influencers, &CampaignStore::save_influencers,
                     "influencers");
}

Result<SaveOutcome> CampaignDataManager::save_posts(const std::vector<Post>& rows) {
    return save_rows(rows, &CampaignTables::posts, &CampaignStore::save_posts, "posts");
}

Result<SaveOutcome> CampaignDataManager::save_tracking(const std::vector<TrackingRecord>& rows) {
    return save_rows(rows, &CampaignTables::tracking, &CampaignStore::save_tracking,
                     "tracking records");
}

Result<SaveOutcome> CampaignDataManager::save_payouts(const std::vector<PayoutRecord>& rows) {
    return save_rows(rows, &CampaignTables::payouts, &CampaignStore::save_payouts, "payouts");
}

CampaignTables CampaignDataManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tables_;
}

}  // namespace campaign_analytics
