// include/campaign_analytics/analytics/report_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "campaign_analytics/analytics/analytics_config.hpp"
#include "campaign_analytics/analytics/filter_engine.hpp"
#include "campaign_analytics/core/config_base.hpp"
#include "campaign_analytics/core/logger.hpp"

namespace campaign_analytics {

/**
 * @brief PostgreSQL connection settings
 */
struct DatabaseConfig {
    std::string host;
    std::string port{"5432"};
    std::string username;
    std::string password;
    std::string name;

    bool is_set() const {
        return !host.empty() && !name.empty();
    }

    std::string get_connection_string() const {
        return "postgresql://" + username + ":" + password + "@" + host + ":" + port + "/" + name;
    }

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Dashboard-style filter selection; "All" disables a dimension
 */
struct FilterSelection {
    std::string platform{FilterCriteria::kAll};
    std::string brand{FilterCriteria::kAll};
    std::string category{FilterCriteria::kAll};
    std::string start_date;  // YYYY-MM-DD, empty for no date filter
    std::string end_date;

    /**
     * @brief Parse dates and names into filter criteria
     * @return INVALID_ARGUMENT for unknown platforms or half-open date ranges
     */
    Result<FilterCriteria> to_criteria() const;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Configuration of the campaign_report tool
 *
 * Data comes from csv_directory when set, otherwise from the database.
 */
struct ReportConfig : public ConfigBase {
    LoggerConfig logger;
    AnalyticsConfig analytics;
    RecommendationConfig recommendations;

    std::string csv_directory;
    DatabaseConfig database;
    bool create_tables{false};  // Create the database tables before loading

    FilterSelection filters;

    std::string influencer_id;  // Profile to include in the report, if any
    bool include_recommendations{true};
    bool include_export_summary{false};
    std::string output_file;  // Empty writes the report to stdout

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
    Result<void> validate() const override;
};

}  // namespace campaign_analytics
