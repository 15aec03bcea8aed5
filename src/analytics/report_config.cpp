// src/analytics/report_config.cpp

#include "campaign_analytics/analytics/report_config.hpp"
#include <vector>
#include "campaign_analytics/core/format_utils.hpp"

namespace campaign_analytics {

nlohmann::json DatabaseConfig::to_json() const {
    nlohmann::json j;
    j["host"] = host;
    j["port"] = port;
    j["username"] = username;
    j["password"] = password;
    j["name"] = name;
    return j;
}

void DatabaseConfig::from_json(const nlohmann::json& j) {
    if (j.contains("host"))
        host = j.at("host").get<std::string>();
    if (j.contains("port"))
        port = j.at("port").get<std::string>();
    if (j.contains("username"))
        username = j.at("username").get<std::string>();
    if (j.contains("password"))
        password = j.at("password").get<std::string>();
    if (j.contains("name"))
        name = j.at("name").get<std::string>();
}

Result<FilterCriteria> FilterSelection::to_criteria() const {
    if (start_date.empty() != end_date.empty()) {
        return make_error<FilterCriteria>(ErrorCode::INVALID_ARGUMENT,
                                          "Both start_date and end_date are required",
                                          "FilterSelection");
    }

    std::vector<Date> dates;
    if (!start_date.empty()) {
        auto start = Date::parse(start_date);
        if (start.is_error()) {
            return forward_error<FilterCriteria>(start);
        }
        auto end = Date::parse(end_date);
        if (end.is_error()) {
            return forward_error<FilterCriteria>(end);
        }
        auto range = core::validate_date_range(start.value(), end.value(), Date::today());
        if (range.is_error()) {
            return forward_error<FilterCriteria>(range);
        }
        dates = {start.value(), end.value()};
    }

    return FilterCriteria::from_selection(platform, brand, category, dates);
}

nlohmann::json FilterSelection::to_json() const {
    nlohmann::json j;
    j["platform"] = platform;
    j["brand"] = brand;
    j["category"] = category;
    j["start_date"] = start_date;
    j["end_date"] = end_date;
    return j;
}

void FilterSelection::from_json(const nlohmann::json& j) {
    if (j.contains("platform"))
        platform = j.at("platform").get<std::string>();
    if (j.contains("brand"))
        brand = j.at("brand").get<std::string>();
    if (j.contains("category"))
        category = j.at("category").get<std::string>();
    if (j.contains("start_date"))
        start_date = j.at("start_date").get<std::string>();
    if (j.contains("end_date"))
        end_date = j.at("end_date").get<std::string>();
}

nlohmann::json ReportConfig::to_json() const {
    nlohmann::json j;
    j["logger"] = logger.to_json();
    j["analytics"] = analytics.to_json();
    j["recommendations"] = recommendations.to_json();
    j["csv_directory"] = csv_directory;
    j["database"] = database.to_json();
    j["create_tables"] = create_tables;
    j["filters"] = filters.to_json();
    j["influencer_id"] = influencer_id;
    j["include_recommendations"] = include_recommendations;
    j["include_export_summary"] = include_export_summary;
    j["output_file"] = output_file;
    return j;
}

void ReportConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
    if (j.contains("analytics"))
        analytics.from_json(j.at("analytics"));
    if (j.contains("recommendations"))
        recommendations.from_json(j.at("recommendations"));
    if (j.contains("csv_directory"))
        csv_directory = j.at("csv_directory").get<std::string>();
    if (j.contains("database"))
        database.from_json(j.at("database"));
    if (j.contains("create_tables"))
        create_tables = j.at("create_tables").get<bool>();
    if (j.contains("filters"))
        filters.from_json(j.at("filters"));
    if (j.contains("influencer_id"))
        influencer_id = j.at("influencer_id").get<std::string>();
    if (j.contains("include_recommendations"))
        include_recommendations = j.at("include_recommendations").get<bool>();
    if (j.contains("include_export_summary"))
        include_export_summary = j.at("include_export_summary").get<bool>();
    if (j.contains("output_file"))
        output_file = j.at("output_file").get<std::string>();
}

Result<void> ReportConfig::validate() const {
    if (csv_directory.empty() && !database.is_set()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Either csv_directory or database host and name must be set",
                                "ReportConfig");
    }

    auto logger_valid = logger.validate();
    if (logger_valid.is_error()) {
        return logger_valid;
    }
    auto analytics_valid = analytics.validate();
    if (analytics_valid.is_error()) {
        return analytics_valid;
    }
    auto recommendations_valid = recommendations.validate();
    if (recommendations_valid.is_error()) {
        return recommendations_valid;
    }

    auto criteria = filters.to_criteria();
    if (criteria.is_error()) {
        return make_error<void>(criteria.error()->code(), criteria.error()->what(),
                                "ReportConfig");
    }
    return Result<void>();
}

}  // namespace campaign_analytics
