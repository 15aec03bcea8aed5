// include/campaign_analytics/analytics/filter_engine.hpp
#pragma once

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "campaign_analytics/core/date.hpp"
#include "campaign_analytics/core/error.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Platform / brand / category / date selection
 *
 * An empty optional means "All" (no filtering on that dimension).
 */
struct FilterCriteria {
    static constexpr const char* kAll = "All";

    std::optional<Platform> platform;
    std::optional<std::string> brand;     // Exact campaign name
    std::optional<std::string> category;
    std::optional<DateRange> date_range;  // Inclusive on both ends

    /**
     * @brief Build criteria from dashboard-style selections
     * @param platform Platform display name or "All"
     * @param brand Campaign name or "All"
     * @param category Category or "All"
     * @param dates Either empty or exactly [start, end]
     * @return INVALID_ARGUMENT for an unknown platform or a date list of another size
     */
    static Result<FilterCriteria> from_selection(const std::string& platform,
                                                 const std::string& brand,
                                                 const std::string& category,
                                                 const std::vector<Date>& dates = {});

    bool is_unfiltered() const {
        return !platform && !brand && !category && !date_range;
    }
};

/**
 * @brief Narrows the four tables to a consistent subset
 *
 * Stages run in a fixed order, each narrowing the output of the previous one:
 * platform, then category (recomputed from the platform-filtered influencers),
 * then brand (tracking only), then date range (posts and tracking only).
 * The result is always a fresh copy and applying the same criteria again
 * returns an identical snapshot.
 */
class FilterEngine {
public:
    CampaignTables apply_filters(const CampaignTables& tables,
                                 const FilterCriteria& criteria) const;

private:
    static void restrict_to_influencers(CampaignTables& tables,
                                        const std::unordered_set<InfluencerId>& ids);
};

}  // namespace campaign_analytics
