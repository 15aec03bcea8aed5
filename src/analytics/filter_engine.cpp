// src/analytics/filter_engine.cpp

#include "campaign_analytics/analytics/filter_engine.hpp"
#include <algorithm>
#include <cctype>
#include "campaign_analytics/core/logger.hpp"

namespace campaign_analytics {

namespace {

bool is_all(const std::string& selection) {
    std::string lowered = selection;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.empty() || lowered == "all";
}

template <typename Row, typename Predicate>
void keep_if(std::vector<Row>& rows, Predicate keep) {
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&keep](const Row& row) { return !keep(row); }),
               rows.end());
}

}  // namespace

Result<FilterCriteria> FilterCriteria::from_selection(const std::string& platform,
                                                      const std::string& brand,
                                                      const std::string& category,
                                                      const std::vector<Date>& dates) {
    FilterCriteria criteria;

    if (!is_all(platform)) {
        auto parsed = platform_from_string(platform);
        if (!parsed) {
            return make_error<FilterCriteria>(ErrorCode::INVALID_ARGUMENT,
                                              "Unknown platform: " + platform, "FilterEngine");
        }
        criteria.platform = *parsed;
    }

    if (!is_all(brand)) {
        criteria.brand = brand;
    }
    if (!is_all(category)) {
        criteria.category = category;
    }

    if (dates.size() == 2) {
        criteria.date_range = DateRange{dates[0], dates[1]};
    } else if (!dates.empty()) {
        return make_error<FilterCriteria>(
            ErrorCode::INVALID_ARGUMENT,
            "Date range needs exactly two dates, got " + std::to_string(dates.size()),
            "FilterEngine");
    }

    return criteria;
}

void FilterEngine::restrict_to_influencers(CampaignTables& tables,
                                           const std::unordered_set<InfluencerId>& ids) {
    auto known = [&ids](const InfluencerId& id) { return ids.count(id) > 0; };

    keep_if(tables.influencers, [&](const Influencer& row) { return known(row.id); });
    keep_if(tables.posts, [&](const Post& row) { return known(row.influencer_id); });
    keep_if(tables.tracking, [&](const TrackingRecord& row) { return known(row.influencer_id); });
    keep_if(tables.payouts, [&](const PayoutRecord& row) { return known(row.influencer_id); });
}

CampaignTables FilterEngine::apply_filters(const CampaignTables& tables,
                                           const FilterCriteria& criteria) const {
    CampaignTables filtered = tables;

    if (criteria.platform) {
        std::unordered_set<InfluencerId> ids;
        for (const auto& influencer : filtered.influencers) {
            if (influencer.platform == *criteria.platform) {
                ids.insert(influencer.id);
            }
        }
        restrict_to_influencers(filtered, ids);
        DEBUG("Platform filter " << platform_to_string(*criteria.platform) << " kept "
                                 << filtered.influencers.size() << " influencers");
    }

    // Category ids come from the already platform-filtered influencers
    if (criteria.category) {
        std::unordered_set<InfluencerId> ids;
        for (const auto& influencer : filtered.influencers) {
            if (influencer.category == *criteria.category) {
                ids.insert(influencer.id);
            }
        }
        restrict_to_influencers(filtered, ids);
        DEBUG("Category filter " << *criteria.category << " kept "
                                 << filtered.influencers.size() << " influencers");
    }

    if (criteria.brand) {
        const std::string& brand = *criteria.brand;
        keep_if(filtered.tracking,
                [&brand](const TrackingRecord& row) { return row.campaign == brand; });
        DEBUG("Brand filter " << brand << " kept " << filtered.tracking.size()
                              << " tracking rows");
    }

    if (criteria.date_range) {
        const DateRange& range = *criteria.date_range;
        keep_if(filtered.posts, [&range](const Post& row) { return range.contains(row.date); });
        keep_if(filtered.tracking,
                [&range](const TrackingRecord& row) { return range.contains(row.date); });
        DEBUG("Date filter " << range.start.to_string() << ".." << range.end.to_string()
                             << " kept " << filtered.posts.size() << " posts, "
                             << filtered.tracking.size() << " tracking rows");
    }

    return filtered;
}

}  // namespace campaign_analytics
