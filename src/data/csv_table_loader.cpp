// src/data/csv_table_loader.cpp

#include "campaign_analytics/data/csv_table_loader.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <filesystem>
#include "campaign_analytics/core/logger.hpp"
#include "campaign_analytics/data/table_conversion.hpp"

namespace campaign_analytics {

namespace {

const char* const kComponent = "CsvTableLoader";

// Columns always read as text, whatever the reader would infer
const std::vector<std::string> kTextColumns = {
    "ID",      "influencer_id", "name", "category", "gender", "platform", "date",
    "URL",     "caption",       "source", "campaign", "user_id", "product", "basis"};

const std::vector<std::string> kAmountColumns = {"revenue", "rate", "total_payout"};

const std::vector<std::string> kCountColumns = {"follower_count", "reach", "likes", "comments",
                                                "orders"};

}  // namespace

Result<std::shared_ptr<arrow::Table>> CsvTableLoader::read_table(const std::string& path) {
    using TablePtr = std::shared_ptr<arrow::Table>;

    if (!std::filesystem::exists(path)) {
        return make_error<TablePtr>(ErrorCode::FILE_NOT_FOUND, "CSV file not found: " + path,
                                    kComponent);
    }

    auto input = arrow::io::ReadableFile::Open(path);
    if (!input.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to open " + path + ": " + input.status().ToString(),
                                    kComponent);
    }

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();
    for (const auto& column : kTextColumns) {
        convert_options.column_types[column] = arrow::utf8();
    }
    for (const auto& column : kAmountColumns) {
        convert_options.column_types[column] = arrow::float64();
    }
    for (const auto& column : kCountColumns) {
        convert_options.column_types[column] = arrow::float64();
    }

    auto reader = arrow::csv::TableReader::Make(arrow::io::default_io_context(), *input,
                                                read_options, parse_options, convert_options);
    if (!reader.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to create CSV reader for " + path + ": " +
                                        reader.status().ToString(),
                                    kComponent);
    }

    auto table = (*reader)->Read();
    if (!table.ok()) {
        return make_error<TablePtr>(ErrorCode::FILE_IO_ERROR,
                                    "Failed to parse " + path + ": " + table.status().ToString(),
                                    kComponent);
    }

    DEBUG("Read " << (*table)->num_rows() << " rows from " << path);
    return *table;
}

Result<std::vector<Influencer>> CsvTableLoader::load_influencers(const std::string& path) {
    auto table = read_table(path);
    if (table.is_error()) {
        return forward_error<std::vector<Influencer>>(table);
    }
    return TableConversion::to_influencers(table.value());
}

Result<std::vector<Post>> CsvTableLoader::load_posts(const std::string& path) {
    auto table = read_table(path);
    if (table.is_error()) {
        return forward_error<std::vector<Post>>(table);
    }
    return TableConversion::to_posts(table.value());
}

Result<std::vector<TrackingRecord>> CsvTableLoader::load_tracking(const std::string& path) {
    auto table = read_table(path);
    if (table.is_error()) {
        return forward_error<std::vector<TrackingRecord>>(table);
    }
    return TableConversion::to_tracking(table.value());
}

Result<std::vector<PayoutRecord>> CsvTableLoader::load_payouts(const std::string& path) {
    auto table = read_table(path);
    if (table.is_error()) {
        return forward_error<std::vector<PayoutRecord>>(table);
    }
    return TableConversion::to_payouts(table.value());
}

namespace {

// Absent files leave the target empty; every other error is returned
template <typename Row, typename Loader>
Result<void> load_optional(const std::filesystem::path& path, Loader loader,
                           std::vector<Row>& target) {
    if (!std::filesystem::exists(path)) {
        WARN("No " << path.filename().string() << " in " << path.parent_path().string()
                   << ", table left empty");
        return Result<void>();
    }

    auto rows = loader(path.string());
    if (rows.is_error()) {
        ERROR(rows.error()->to_string());
        return make_error<void>(rows.error()->code(), rows.error()->what(),
                                rows.error()->component());
    }
    target = rows.take_value();
    return Result<void>();
}

}  // namespace

Result<CampaignTables> CsvTableLoader::load_directory(const std::string& directory) {
    Logger::register_component(kComponent);

    std::filesystem::path dir(directory);
    if (!std::filesystem::is_directory(dir)) {
        return make_error<CampaignTables>(ErrorCode::FILE_NOT_FOUND,
                                          "Data directory not found: " + directory, kComponent);
    }

    CampaignTables tables;

    auto influencers = load_optional(dir / kInfluencersFile, &CsvTableLoader::load_influencers,
                                     tables.influencers);
    if (influencers.is_error()) {
        return forward_error<CampaignTables>(influencers);
    }

    auto posts = load_optional(dir / kPostsFile, &CsvTableLoader::load_posts, tables.posts);
    if (posts.is_error()) {
        return forward_error<CampaignTables>(posts);
    }

    auto tracking =
        load_optional(dir / kTrackingFile, &CsvTableLoader::load_tracking, tables.tracking);
    if (tracking.is_error()) {
        return forward_error<CampaignTables>(tracking);
    }

    auto payouts = load_optional(dir / kPayoutsFile, &CsvTableLoader::load_payouts, tables.payouts);
    if (payouts.is_error()) {
        return forward_error<CampaignTables>(payouts);
    }

    INFO("Loaded " << tables.influencers.size() << " influencers, " << tables.posts.size()
                   << " posts, " << tables.tracking.size() << " tracking rows, "
                   << tables.payouts.size() << " payouts from " << directory);
    return tables;
}

}  // namespace campaign_analytics
