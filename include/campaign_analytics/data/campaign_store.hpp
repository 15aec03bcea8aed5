// include/campaign_analytics/data/campaign_store.hpp

#pragma once

#include <cstddef>
#include <mutex>
#include <vector>
#include "campaign_analytics/core/error.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Row counts held by a store
 */
struct StoreSummary {
    size_t influencers{0};
    size_t posts{0};
    size_t tracking{0};
    size_t payouts{0};
};

/**
 * @brief Abstract storage for the four campaign tables
 *
 * Saves replace the whole table of that entity.
 */
class CampaignStore {
public:
    virtual ~CampaignStore() = default;

    virtual Result<CampaignTables> load_tables() = 0;

    virtual Result<void> save_influencers(const std::vector<Influencer>& rows) = 0;
    virtual Result<void> save_posts(const std::vector<Post>& rows) = 0;
    virtual Result<void> save_tracking(const std::vector<TrackingRecord>& rows) = 0;
    virtual Result<void> save_payouts(const std::vector<PayoutRecord>& rows) = 0;

    /**
     * @brief Remove every row of every table
     */
    virtual Result<void> clear_all() = 0;

    virtual Result<StoreSummary> summary() = 0;
};

/**
 * @brief Process-local store; never fails
 */
class InMemoryCampaignStore : public CampaignStore {
public:
    InMemoryCampaignStore() = default;
    explicit InMemoryCampaignStore(CampaignTables tables) : tables_(std::move(tables)) {}

    Result<CampaignTables> load_tables() override;

    Result<void> save_influencers(const std::vector<Influencer>& rows) override;
    Result<void> save_posts(const std::vector<Post>& rows) override;
    Result<void> save_tracking(const std::vector<TrackingRecord>& rows) override;
    Result<void> save_payouts(const std::vector<PayoutRecord>& rows) override;

    Result<void> clear_all() override;
    Result<StoreSummary> summary() override;

private:
    mutable std::mutex mutex_;
    CampaignTables tables_;
};

}  // namespace campaign_analytics
