// src/data/table_conversion.cpp

#include "campaign_analytics/data/table_conversion.hpp"
#include <cmath>
#include <cstdlib>
#include <unordered_map>

namespace campaign_analytics {

namespace {

const char* const kComponent = "TableConversion";

/**
 * @brief Typed cell access over one combined column
 */
class ColumnReader {
public:
    ColumnReader(std::string name, std::shared_ptr<arrow::Array> array)
        : name_(std::move(name)), array_(std::move(array)) {}

    Result<std::string> get_string(int64_t row) const {
        if (array_->IsNull(row)) {
            return null_error<std::string>(row);
        }
        switch (array_->type_id()) {
            case arrow::Type::STRING:
                return std::static_pointer_cast<arrow::StringArray>(array_)->GetString(row);
            case arrow::Type::LARGE_STRING:
                return std::static_pointer_cast<arrow::LargeStringArray>(array_)->GetString(row);
            case arrow::Type::INT64:
                return std::to_string(
                    std::static_pointer_cast<arrow::Int64Array>(array_)->Value(row));
            case arrow::Type::INT32:
                return std::to_string(
                    std::static_pointer_cast<arrow::Int32Array>(array_)->Value(row));
            default:
                return type_error<std::string>("string");
        }
    }

    Result<double> get_double(int64_t row) const {
        if (array_->IsNull(row)) {
            return null_error<double>(row);
        }
        switch (array_->type_id()) {
            case arrow::Type::DOUBLE:
                return std::static_pointer_cast<arrow::DoubleArray>(array_)->Value(row);
            case arrow::Type::FLOAT:
                return static_cast<double>(
                    std::static_pointer_cast<arrow::FloatArray>(array_)->Value(row));
            case arrow::Type::INT64:
                return static_cast<double>(
                    std::static_pointer_cast<arrow::Int64Array>(array_)->Value(row));
            case arrow::Type::INT32:
                return static_cast<double>(
                    std::static_pointer_cast<arrow::Int32Array>(array_)->Value(row));
            case arrow::Type::STRING: {
                std::string text =
                    std::static_pointer_cast<arrow::StringArray>(array_)->GetString(row);
                char* end = nullptr;
                double value = std::strtod(text.c_str(), &end);
                if (text.empty() || end == nullptr || *end != '\0') {
                    return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                              "Column '" + name_ + "' row " + std::to_string(row) +
                                                  ": '" + text + "' is not numeric",
                                              kComponent);
                }
                return value;
            }
            default:
                return type_error<double>("numeric");
        }
    }

    Result<int64_t> get_count(int64_t row) const {
        auto value = get_double(row);
        if (value.is_error()) {
            return forward_error<int64_t>(value);
        }
        if (value.value() < 0.0 || !std::isfinite(value.value())) {
            return make_error<int64_t>(ErrorCode::INVALID_DATA,
                                       "Column '" + name_ + "' row " + std::to_string(row) +
                                           " must be a non-negative count",
                                       kComponent);
        }
        return static_cast<int64_t>(std::llround(value.value()));
    }

    Result<double> get_amount(int64_t row) const {
        auto value = get_double(row);
        if (value.is_error()) {
            return value;
        }
        if (value.value() < 0.0 || !std::isfinite(value.value())) {
            return make_error<double>(ErrorCode::INVALID_DATA,
                                      "Column '" + name_ + "' row " + std::to_string(row) +
                                          " must be a non-negative amount",
                                      kComponent);
        }
        return value;
    }

    Result<Date> get_date(int64_t row) const {
        if (array_->IsNull(row)) {
            return null_error<Date>(row);
        }
        switch (array_->type_id()) {
            case arrow::Type::STRING:
            case arrow::Type::LARGE_STRING: {
                auto text = get_string(row);
                if (text.is_error()) {
                    return forward_error<Date>(text);
                }
                return Date::parse(text.value());
            }
            case arrow::Type::DATE32:
                return Date::from_days(
                    std::static_pointer_cast<arrow::Date32Array>(array_)->Value(row));
            case arrow::Type::TIMESTAMP: {
                auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array_->type());
                int64_t raw = std::static_pointer_cast<arrow::TimestampArray>(array_)->Value(row);
                int64_t per_day = 86400;
                switch (ts_type->unit()) {
                    case arrow::TimeUnit::MILLI:
                        per_day *= 1000LL;
                        break;
                    case arrow::TimeUnit::MICRO:
                        per_day *= 1000000LL;
                        break;
                    case arrow::TimeUnit::NANO:
                        per_day *= 1000000000LL;
                        break;
                    default:
                        break;
                }
                int64_t days = raw / per_day;
                if (raw % per_day < 0) {
                    --days;
                }
                return Date::from_days(days);
            }
            default:
                return type_error<Date>("date");
        }
    }

private:
    template <typename T>
    Result<T> null_error(int64_t row) const {
        return make_error<T>(ErrorCode::INVALID_DATA,
                             "Null value in column '" + name_ + "' at row " + std::to_string(row),
                             kComponent);
    }

    template <typename T>
    Result<T> type_error(const std::string& expected) const {
        return make_error<T>(ErrorCode::CONVERSION_ERROR,
                             "Column '" + name_ + "' has type " + array_->type()->ToString() +
                                 ", expected " + expected,
                             kComponent);
    }

    std::string name_;
    std::shared_ptr<arrow::Array> array_;
};

/**
 * @brief Schema check plus chunk combination shared by all conversions
 */
Result<std::unordered_map<std::string, ColumnReader>> open_columns(
    const std::shared_ptr<arrow::Table>& table, const std::vector<std::string>& required,
    const std::string& table_name) {
    using Columns = std::unordered_map<std::string, ColumnReader>;

    auto schema = TableConversion::check_schema(table, required, table_name);
    if (schema.is_error()) {
        return forward_error<Columns>(schema);
    }

    Columns readers;
    if (table->num_rows() == 0) {
        return readers;
    }

    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        return make_error<Columns>(ErrorCode::CONVERSION_ERROR,
                                   "Failed to combine chunks of " + table_name + ": " +
                                       combined.status().ToString(),
                                   kComponent);
    }

    for (const auto& name : required) {
        auto column = (*combined)->GetColumnByName(name);
        readers.emplace(name, ColumnReader(name, column->chunk(0)));
    }
    return readers;
}

template <typename T>
Result<std::vector<T>> row_error(const AnalyticsError* error, const std::string& table_name) {
    return make_error<std::vector<T>>(error->code(), table_name + ": " + error->what(),
                                      kComponent);
}

}  // namespace

Result<void> TableConversion::check_schema(const std::shared_ptr<arrow::Table>& table,
                                           const std::vector<std::string>& required,
                                           const std::string& table_name) {
    if (!table) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Table pointer is null for " + table_name, kComponent);
    }

    std::string missing;
    for (const auto& column : required) {
        if (table->GetColumnByName(column) == nullptr) {
            missing += (missing.empty() ? "" : ", ") + column;
        }
    }

    if (!missing.empty()) {
        return make_error<void>(ErrorCode::SCHEMA_ERROR,
                                "Missing required columns in " + table_name + ": " + missing,
                                kComponent);
    }
    return Result<void>();
}

Result<std::vector<Influencer>> TableConversion::to_influencers(
    const std::shared_ptr<arrow::Table>& table) {
    const std::string table_name = "influencers";
    auto columns = open_columns(table, columns::kInfluencer, table_name);
    if (columns.is_error()) {
        return forward_error<std::vector<Influencer>>(columns);
    }
    const auto& cols = columns.value();

    std::vector<Influencer> rows;
    rows.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto id = cols.at("ID").get_string(i);
        auto name = cols.at("name").get_string(i);
        auto category = cols.at("category").get_string(i);
        auto gender = cols.at("gender").get_string(i);
        auto followers = cols.at("follower_count").get_count(i);
        auto platform_name = cols.at("platform").get_string(i);

        for (const AnalyticsError* error :
             {id.error(), name.error(), category.error(), gender.error(), followers.error(),
              platform_name.error()}) {
            if (error) {
                return row_error<Influencer>(error, table_name);
            }
        }

        auto platform = platform_from_string(platform_name.value());
        if (!platform) {
            return make_error<std::vector<Influencer>>(
                ErrorCode::INVALID_DATA,
                table_name + ": invalid platform '" + platform_name.value() + "' at row " +
                    std::to_string(i),
                kComponent);
        }

        Influencer row;
        row.id = id.value();
        row.name = name.value();
        row.category = category.value();
        row.gender = gender.value();
        row.follower_count = followers.value();
        row.platform = *platform;
        rows.push_back(std::move(row));
    }

    return rows;
}

Result<std::vector<Post>> TableConversion::to_posts(const std::shared_ptr<arrow::Table>& table) {
    const std::string table_name = "posts";
    auto columns = open_columns(table, columns::kPost, table_name);
    if (columns.is_error()) {
        return forward_error<std::vector<Post>>(columns);
    }
    const auto& cols = columns.value();

    std::vector<Post> rows;
    rows.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto influencer_id = cols.at("influencer_id").get_string(i);
        auto platform_name = cols.at("platform").get_string(i);
        auto date = cols.at("date").get_date(i);
        auto url = cols.at("URL").get_string(i);
        auto caption = cols.at("caption").get_string(i);
        auto reach = cols.at("reach").get_count(i);
        auto likes = cols.at("likes").get_count(i);
        auto comments = cols.at("comments").get_count(i);

        for (const AnalyticsError* error :
             {influencer_id.error(), platform_name.error(), date.error(), url.error(),
              caption.error(), reach.error(), likes.error(), comments.error()}) {
            if (error) {
                return row_error<Post>(error, table_name);
            }
        }

        auto platform = platform_from_string(platform_name.value());
        if (!platform) {
            return make_error<std::vector<Post>>(ErrorCode::INVALID_DATA,
                                                 table_name + ": invalid platform '" +
                                                     platform_name.value() + "' at row " +
                                                     std::to_string(i),
                                                 kComponent);
        }

        Post row;
        row.influencer_id = influencer_id.value();
        row.platform = *platform;
        row.date = date.value();
        row.url = url.value();
        row.caption = caption.value();
        row.reach = reach.value();
        row.likes = likes.value();
        row.comments = comments.value();
        rows.push_back(std::move(row));
    }

    return rows;
}

Result<std::vector<TrackingRecord>> TableConversion::to_tracking(
    const std::shared_ptr<arrow::Table>& table) {
    const std::string table_name = "tracking";
    auto columns = open_columns(table, columns::kTracking, table_name);
    if (columns.is_error()) {
        return forward_error<std::vector<TrackingRecord>>(columns);
    }
    const auto& cols = columns.value();

    std::vector<TrackingRecord> rows;
    rows.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto source = cols.at("source").get_string(i);
        auto campaign = cols.at("campaign").get_string(i);
        auto influencer_id = cols.at("influencer_id").get_string(i);
        auto user_id = cols.at("user_id").get_string(i);
        auto product = cols.at("product").get_string(i);
        auto date = cols.at("date").get_date(i);
        auto orders = cols.at("orders").get_count(i);
        auto revenue = cols.at("revenue").get_amount(i);

        for (const AnalyticsError* error :
             {source.error(), campaign.error(), influencer_id.error(), user_id.error(),
              product.error(), date.error(), orders.error(), revenue.error()}) {
            if (error) {
                return row_error<TrackingRecord>(error, table_name);
            }
        }

        TrackingRecord row;
        row.source = source.value();
        row.campaign = campaign.value();
        row.influencer_id = influencer_id.value();
        row.user_id = user_id.value();
        row.product = product.value();
        row.date = date.value();
        row.orders = orders.value();
        row.revenue = revenue.value();
        rows.push_back(std::move(row));
    }

    return rows;
}

Result<std::vector<PayoutRecord>> TableConversion::to_payouts(
    const std::shared_ptr<arrow::Table>& table) {
    const std::string table_name = "payouts";
    auto columns = open_columns(table, columns::kPayout, table_name);
    if (columns.is_error()) {
        return forward_error<std::vector<PayoutRecord>>(columns);
    }
    const auto& cols = columns.value();

    std::vector<PayoutRecord> rows;
    rows.reserve(static_cast<size_t>(table->num_rows()));

    for (int64_t i = 0; i < table->num_rows(); ++i) {
        auto influencer_id = cols.at("influencer_id").get_string(i);
        auto basis_name = cols.at("basis").get_string(i);
        auto rate = cols.at("rate").get_amount(i);
        auto orders = cols.at("orders").get_count(i);
        auto total_payout = cols.at("total_payout").get_amount(i);

        for (const AnalyticsError* error : {influencer_id.error(), basis_name.error(),
                                            rate.error(), orders.error(), total_payout.error()}) {
            if (error) {
                return row_error<PayoutRecord>(error, table_name);
            }
        }

        auto basis = payout_basis_from_string(basis_name.value());
        if (!basis) {
            return make_error<std::vector<PayoutRecord>>(
                ErrorCode::INVALID_DATA,
                table_name + ": invalid basis '" + basis_name.value() + "' at row " +
                    std::to_string(i) + ", expected post or order",
                kComponent);
        }

        PayoutRecord row;
        row.influencer_id = influencer_id.value();
        row.basis = *basis;
        row.rate = rate.value();
        row.orders = orders.value();
        row.total_payout = total_payout.value();
        rows.push_back(std::move(row));
    }

    return rows;
}

}  // namespace campaign_analytics
