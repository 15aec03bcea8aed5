// include/campaign_analytics/data/table_conversion.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "campaign_analytics/core/error.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Converts Arrow tables supplied by a data source into typed records
 *
 * Every conversion first checks that all required columns are present and
 * fails with SCHEMA_ERROR otherwise; no partial tables are returned.
 * Numeric columns may be any Arrow integer or floating type (or numeric
 * strings). Date columns may be strings (YYYY-MM-DD), date32 or timestamps.
 */
class TableConversion {
public:
    static Result<std::vector<Influencer>> to_influencers(
        const std::shared_ptr<arrow::Table>& table);

    static Result<std::vector<Post>> to_posts(const std::shared_ptr<arrow::Table>& table);

    static Result<std::vector<TrackingRecord>> to_tracking(
        const std::shared_ptr<arrow::Table>& table);

    static Result<std::vector<PayoutRecord>> to_payouts(const std::shared_ptr<arrow::Table>& table);

    /**
     * @brief Verify that every required column exists
     * @param table_name Used in the error message
     * @return SCHEMA_ERROR listing all missing columns
     */
    static Result<void> check_schema(const std::shared_ptr<arrow::Table>& table,
                                     const std::vector<std::string>& required,
                                     const std::string& table_name);
};

}  // namespace campaign_analytics
