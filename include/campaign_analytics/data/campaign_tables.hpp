// include/campaign_analytics/data/campaign_tables.hpp

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "campaign_analytics/core/date.hpp"

namespace campaign_analytics {

/**
 * @brief Social platform an influencer publishes on
 */
enum class Platform { INSTAGRAM, YOUTUBE, TWITTER, FACEBOOK, TIKTOK, LINKEDIN, UNKNOWN };

/**
 * @brief Display name ("Instagram", "YouTube", ...; "Unknown" for UNKNOWN)
 */
std::string platform_to_string(Platform platform);

/**
 * @brief Parse a display name, case-insensitive; nullopt if not a known platform
 */
std::optional<Platform> platform_from_string(const std::string& name);

/**
 * @brief How an influencer is paid: flat fee per post or commission per order
 */
enum class PayoutBasis { POST, ORDER };

std::string payout_basis_to_string(PayoutBasis basis);
std::optional<PayoutBasis> payout_basis_from_string(const std::string& name);

using InfluencerId = std::string;

struct Influencer {
    InfluencerId id;
    std::string name;
    std::string category;
    std::string gender;
    int64_t follower_count{0};
    Platform platform{Platform::UNKNOWN};
};

struct Post {
    InfluencerId influencer_id;
    Platform platform{Platform::UNKNOWN};
    Date date;
    std::string url;
    std::string caption;
    int64_t reach{0};
    int64_t likes{0};
    int64_t comments{0};
};

/**
 * @brief One attribution row: orders and revenue credited to an influencer
 */
struct TrackingRecord {
    std::string source;
    std::string campaign;
    InfluencerId influencer_id;
    std::string user_id;
    std::string product;
    Date date;
    int64_t orders{0};
    double revenue{0.0};
};

struct PayoutRecord {
    InfluencerId influencer_id;
    PayoutBasis basis{PayoutBasis::POST};
    double rate{0.0};
    int64_t orders{0};
    double total_payout{0.0};
};

/**
 * @brief The four campaign tables passed between engine components
 *
 * Engine operations take a snapshot by const reference and return new
 * snapshots or derived structures; a snapshot is never modified in place.
 */
struct CampaignTables {
    std::vector<Influencer> influencers;
    std::vector<Post> posts;
    std::vector<TrackingRecord> tracking;
    std::vector<PayoutRecord> payouts;

    bool empty() const {
        return influencers.empty() && posts.empty() && tracking.empty() && payouts.empty();
    }
};

/**
 * @brief Required column names of each input table
 */
namespace columns {
extern const std::vector<std::string> kInfluencer;
extern const std::vector<std::string> kPost;
extern const std::vector<std::string> kTracking;
extern const std::vector<std::string> kPayout;
}  // namespace columns

}  // namespace campaign_analytics
