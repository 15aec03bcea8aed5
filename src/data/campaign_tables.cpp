// src/data/campaign_tables.cpp

#include "campaign_analytics/data/campaign_tables.hpp"
#include <algorithm>
#include <cctype>

namespace campaign_analytics {

namespace {
std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}  // namespace

std::string platform_to_string(Platform platform) {
    switch (platform) {
        case Platform::INSTAGRAM:
            return "Instagram";
        case Platform::YOUTUBE:
            return "YouTube";
        case Platform::TWITTER:
            return "Twitter";
        case Platform::FACEBOOK:
            return "Facebook";
        case Platform::TIKTOK:
            return "TikTok";
        case Platform::LINKEDIN:
            return "LinkedIn";
        default:
            return "Unknown";
    }
}

std::optional<Platform> platform_from_string(const std::string& name) {
    const std::string key = to_lower(name);
    for (Platform platform : {Platform::INSTAGRAM, Platform::YOUTUBE, Platform::TWITTER,
                              Platform::FACEBOOK, Platform::TIKTOK, Platform::LINKEDIN}) {
        if (to_lower(platform_to_string(platform)) == key) {
            return platform;
        }
    }
    return std::nullopt;
}

std::string payout_basis_to_string(PayoutBasis basis) {
    return basis == PayoutBasis::ORDER ? "order" : "post";
}

std::optional<PayoutBasis> payout_basis_from_string(const std::string& name) {
    const std::string key = to_lower(name);
    if (key == "post") {
        return PayoutBasis::POST;
    }
    if (key == "order") {
        return PayoutBasis::ORDER;
    }
    return std::nullopt;
}

namespace columns {
const std::vector<std::string> kInfluencer = {"ID",       "name",           "category",
                                              "gender",   "follower_count", "platform"};
const std::vector<std::string> kPost = {"influencer_id", "platform", "date",  "URL",
                                        "caption",       "reach",    "likes", "comments"};
const std::vector<std::string> kTracking = {"source", "campaign", "influencer_id", "user_id",
                                            "product", "date",    "orders",        "revenue"};
const std::vector<std::string> kPayout = {"influencer_id", "basis", "rate", "orders",
                                          "total_payout"};
}  // namespace columns

}  // namespace campaign_analytics
