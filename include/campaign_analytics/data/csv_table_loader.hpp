// include/campaign_analytics/data/csv_table_loader.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "campaign_analytics/core/error.hpp"
#include "campaign_analytics/data/campaign_tables.hpp"

namespace campaign_analytics {

/**
 * @brief Loads the campaign tables from CSV files with the Arrow CSV reader
 *
 * Identifier, text and date columns are read as strings; counts and amounts
 * are read as numbers. Rows are then converted through TableConversion, so a
 * file lacking a required column fails with SCHEMA_ERROR.
 */
class CsvTableLoader {
public:
    static constexpr const char* kInfluencersFile = "influencers.csv";
    static constexpr const char* kPostsFile = "posts.csv";
    static constexpr const char* kTrackingFile = "tracking.csv";
    static constexpr const char* kPayoutsFile = "payouts.csv";

    /**
     * @brief Read a CSV file into an Arrow table
     * @return FILE_NOT_FOUND if the file does not exist, FILE_IO_ERROR if unreadable
     */
    static Result<std::shared_ptr<arrow::Table>> read_table(const std::string& path);

    static Result<std::vector<Influencer>> load_influencers(const std::string& path);
    static Result<std::vector<Post>> load_posts(const std::string& path);
    static Result<std::vector<TrackingRecord>> load_tracking(const std::string& path);
    static Result<std::vector<PayoutRecord>> load_payouts(const std::string& path);

    /**
     * @brief Load all four tables from a directory
     *
     * A file that is absent leaves its table empty; any other failure aborts
     * the whole load.
     */
    static Result<CampaignTables> load_directory(const std::string& directory);
};

}  // namespace campaign_analytics
