// include/campaign_analytics/data/campaign_data_manager.hpp
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "campaign_analytics/core/error.hpp"
#include "campaign_analytics/data/campaign_store.hpp"

namespace campaign_analytics {

/**
 * @brief Where a save ended up
 */
enum class SaveOutcome {
    PERSISTED,           // Written to the primary store
    IN_MEMORY_FALLBACK   // Primary store absent or failed; kept in memory only
};

std::string save_outcome_to_string(SaveOutcome outcome);

/**
 * @brief Holds the current snapshot and forwards saves to a primary store
 *
 * Every save updates the in-memory snapshot. The returned SaveOutcome tells
 * the caller whether the rows also reached the primary store.
 */
class CampaignDataManager {
public:
    /**
     * @param primary Persistent store; nullptr runs in memory only
     */
    explicit CampaignDataManager(std::shared_ptr<CampaignStore> primary = nullptr);

    /**
     * @brief Reload the snapshot from the primary store
     *
     * On failure the current snapshot is kept and the error is returned.
     */
    Result<void> refresh();

    Result<SaveOutcome> save_influencers(const std::vector<Influencer>& rows);
    Result<SaveOutcome> save_posts(const std::vector<Post>& rows);
    Result<SaveOutcome> save_tracking(const std::vector<TrackingRecord>& rows);
    Result<SaveOutcome> save_payouts(const std::vector<PayoutRecord>& rows);

    /**
     * @brief Copy of the current tables
     */
    CampaignTables snapshot() const;

    bool has_primary_store() const {
        return primary_ != nullptr;
    }

private:
    template <typename Row>
    Result<SaveOutcome> save_rows(const std::vector<Row>& rows,
                                  std::vector<Row> CampaignTables::*table,
                                  Result<void> (CampaignStore::*persist)(const std::vector<Row>&),
                                  const std::string& entity);

    std::shared_ptr<CampaignStore> primary_;
    mutable std::mutex mutex_;
    CampaignTables tables_;
};

}  // namespace campaign_analytics
