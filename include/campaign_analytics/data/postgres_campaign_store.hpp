// include/campaign_analytics/data/postgres_campaign_store.hpp

#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>
#include "campaign_analytics/core/error.hpp"
#include "campaign_analytics/data/campaign_store.hpp"

namespace campaign_analytics {

/**
 * @brief CampaignStore backed by PostgreSQL
 *
 * Uses the tables influencers, posts, tracking_data and payouts. Each save
 * replaces the table contents inside one transaction.
 */
class PostgresCampaignStore : public CampaignStore {
public:
    /**
     * @brief Constructor
     * @param connection_string libpq connection string or postgresql:// URI
     */
    explicit PostgresCampaignStore(std::string connection_string);

    ~PostgresCampaignStore() override;

    PostgresCampaignStore(const PostgresCampaignStore&) = delete;
    PostgresCampaignStore& operator=(const PostgresCampaignStore&) = delete;
    PostgresCampaignStore(PostgresCampaignStore&&) = delete;
    PostgresCampaignStore& operator=(PostgresCampaignStore&&) = delete;

    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    /**
     * @brief Create the four tables if they do not exist
     */
    Result<void> create_tables();

    Result<CampaignTables> load_tables() override;

    Result<void> save_influencers(const std::vector<Influencer>& rows) override;
    Result<void> save_posts(const std::vector<Post>& rows) override;
    Result<void> save_tracking(const std::vector<TrackingRecord>& rows) override;
    Result<void> save_payouts(const std::vector<PayoutRecord>& rows) override;

    Result<void> clear_all() override;
    Result<StoreSummary> summary() override;

private:
    Result<void> validate_connection() const;

    Result<std::vector<Influencer>> load_influencers(pqxx::work& txn) const;
    Result<std::vector<Post>> load_posts(pqxx::work& txn) const;
    Result<std::vector<TrackingRecord>> load_tracking(pqxx::work& txn) const;
    Result<std::vector<PayoutRecord>> load_payouts(pqxx::work& txn) const;

    std::string connection_string_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

}  // namespace campaign_analytics
