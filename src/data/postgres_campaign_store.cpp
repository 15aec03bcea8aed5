// src/data/postgres_campaign_store.cpp

#include "campaign_analytics/data/postgres_campaign_store.hpp"
#include "campaign_analytics/core/logger.hpp"

namespace campaign_analytics {

namespace {
const char* const kComponent = "PostgresCampaignStore";

const char* const kCreateTables = R"SQL(
CREATE TABLE IF NOT EXISTS influencers (
    id TEXT PRIMARY KEY,
    name VARCHAR(255) NOT NULL,
    category VARCHAR(100) NOT NULL,
    gender VARCHAR(20) NOT NULL,
    follower_count BIGINT NOT NULL,
    platform VARCHAR(50) NOT NULL,
    created_at TIMESTAMP DEFAULT NOW()
);
CREATE TABLE IF NOT EXISTS posts (
    id SERIAL PRIMARY KEY,
    influencer_id TEXT NOT NULL,
    platform VARCHAR(50) NOT NULL,
    date DATE NOT NULL,
    url TEXT NOT NULL,
    caption TEXT,
    reach BIGINT NOT NULL DEFAULT 0,
    likes BIGINT NOT NULL DEFAULT 0,
    comments BIGINT NOT NULL DEFAULT 0,
    created_at TIMESTAMP DEFAULT NOW()
);
CREATE TABLE IF NOT EXISTS tracking_data (
    id SERIAL PRIMARY KEY,
    source VARCHAR(100) NOT NULL,
    campaign VARCHAR(255) NOT NULL,
    influencer_id TEXT NOT NULL,
    user_id VARCHAR(100) NOT NULL,
    product VARCHAR(255) NOT NULL,
    date DATE NOT NULL,
    orders BIGINT NOT NULL DEFAULT 0,
    revenue DOUBLE PRECISION NOT NULL DEFAULT 0,
    created_at TIMESTAMP DEFAULT NOW()
);
CREATE TABLE IF NOT EXISTS payouts (
    id SERIAL PRIMARY KEY,
    influencer_id TEXT NOT NULL,
    basis VARCHAR(20) NOT NULL,
    rate DOUBLE PRECISION NOT NULL,
    orders BIGINT NOT NULL DEFAULT 0,
    total_payout DOUBLE PRECISION NOT NULL DEFAULT 0,
    created_at TIMESTAMP DEFAULT NOW()
);
)SQL";

Result<Date> parse_db_date(const pqxx::field& field) {
    return Date::parse(field.as<std::string>());
}
}  // namespace

PostgresCampaignStore::PostgresCampaignStore(std::string connection_string)
    : connection_string_(std::move(connection_string)), connection_(nullptr) {}

PostgresCampaignStore::~PostgresCampaignStore() {
    disconnect();
}

Result<void> PostgresCampaignStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    Logger::register_component(kComponent);

    try {
        connection_ = std::make_unique<pqxx::connection>(connection_string_);
        if (!connection_->is_open()) {
            return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                    "Failed to open database connection", kComponent);
        }
        INFO("Connected to PostgreSQL database " << connection_->dbname());
        return Result<void>();
    } catch (const std::exception& e) {
        connection_.reset();
        return make_error<void>(ErrorCode::CONNECTION_ERROR,
                                "Database connection error: " + std::string(e.what()),
                                kComponent);
    }
}

void PostgresCampaignStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connection_ && connection_->is_open()) {
        connection_->close();
        connection_.reset();
        INFO("Disconnected from PostgreSQL database");
    }
}

bool PostgresCampaignStore::is_connected() const {
    return connection_ && connection_->is_open();
}

Result<void> PostgresCampaignStore::validate_connection() const {
    if (!is_connected()) {
        return make_error<void>(ErrorCode::CONNECTION_ERROR, "Not connected to database",
                                kComponent);
    }
    return Result<void>();
}

Result<void> PostgresCampaignStore::create_tables() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec(kCreateTables);
        txn.commit();
        INFO("Campaign tables created");
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Error creating tables: " + std::string(e.what()), kComponent);
    }
}

Result<CampaignTables> PostgresCampaignStore::load_tables() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<CampaignTables>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        CampaignTables tables;

        auto influencers = load_influencers(txn);
        if (influencers.is_error()) {
            return forward_error<CampaignTables>(influencers);
        }
        tables.influencers = influencers.take_value();

        auto posts = load_posts(txn);
        if (posts.is_error()) {
            return forward_error<CampaignTables>(posts);
        }
        tables.posts = posts.take_value();

        auto tracking = load_tracking(txn);
        if (tracking.is_error()) {
            return forward_error<CampaignTables>(tracking);
        }
        tables.tracking = tracking.take_value();

        auto payouts = load_payouts(txn);
        if (payouts.is_error()) {
            return forward_error<CampaignTables>(payouts);
        }
        tables.payouts = payouts.take_value();

        txn.commit();
        return tables;
    } catch (const std::exception& e) {
        return make_error<CampaignTables>(
            ErrorCode::DATABASE_ERROR,
            "Failed to load campaign tables: " + std::string(e.what()), kComponent);
    }
}

Result<std::vector<Influencer>> PostgresCampaignStore::load_influencers(pqxx::work& txn) const {
    std::vector<Influencer> rows;
    auto result = txn.exec(
        "SELECT id, name, category, gender, follower_count, platform FROM influencers ORDER BY id");

    for (const auto& record : result) {
        Influencer row;
        row.id = record["id"].as<std::string>();
        row.name = record["name"].as<std::string>();
        row.category = record["category"].as<std::string>();
        row.gender = record["gender"].as<std::string>();
        row.follower_count = record["follower_count"].as<int64_t>();
        row.platform = platform_from_string(record["platform"].as<std::string>())
                           .value_or(Platform::UNKNOWN);
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<Post>> PostgresCampaignStore::load_posts(pqxx::work& txn) const {
    std::vector<Post> rows;
    auto result = txn.exec(
        "SELECT influencer_id, platform, date, url, COALESCE(caption, '') AS caption, reach, "
        "likes, comments FROM posts ORDER BY id");

    for (const auto& record : result) {
        auto date = parse_db_date(record["date"]);
        if (date.is_error()) {
            return forward_error<std::vector<Post>>(date);
        }

        Post row;
        row.influencer_id = record["influencer_id"].as<std::string>();
        row.platform = platform_from_string(record["platform"].as<std::string>())
                           .value_or(Platform::UNKNOWN);
        row.date = date.value();
        row.url = record["url"].as<std::string>();
        row.caption = record["caption"].as<std::string>();
        row.reach = record["reach"].as<int64_t>();
        row.likes = record["likes"].as<int64_t>();
        row.comments = record["comments"].as<int64_t>();
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<TrackingRecord>> PostgresCampaignStore::load_tracking(pqxx::work& txn) const {
    std::vector<TrackingRecord> rows;
    auto result = txn.exec(
        "SELECT source, campaign, influencer_id, user_id, product, date, orders, revenue "
        "FROM tracking_data ORDER BY id");

    for (const auto& record : result) {
        auto date = parse_db_date(record["date"]);
        if (date.is_error()) {
            return forward_error<std::vector<TrackingRecord>>(date);
        }

        TrackingRecord row;
        row.source = record["source"].as<std::string>();
        row.campaign = record["campaign"].as<std::string>();
        row.influencer_id = record["influencer_id"].as<std::string>();
        row.user_id = record["user_id"].as<std::string>();
        row.product = record["product"].as<std::string>();
        row.date = date.value();
        row.orders = record["orders"].as<int64_t>();
        row.revenue = record["revenue"].as<double>();
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<PayoutRecord>> PostgresCampaignStore::load_payouts(pqxx::work& txn) const {
    std::vector<PayoutRecord> rows;
    auto result = txn.exec(
        "SELECT influencer_id, basis, rate, orders, total_payout FROM payouts ORDER BY id");

    for (const auto& record : result) {
        auto basis = payout_basis_from_string(record["basis"].as<std::string>());
        if (!basis) {
            return make_error<std::vector<PayoutRecord>>(
                ErrorCode::INVALID_DATA,
                "Invalid payout basis '" + record["basis"].as<std::string>() + "'", kComponent);
        }

        PayoutRecord row;
        row.influencer_id = record["influencer_id"].as<std::string>();
        row.basis = *basis;
        row.rate = record["rate"].as<double>();
        row.orders = record["orders"].as<int64_t>();
        row.total_payout = record["total_payout"].as<double>();
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<void> PostgresCampaignStore::save_influencers(const std::vector<Influencer>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec("DELETE FROM influencers");
        for (const auto& row : rows) {
            txn.exec_params(
                "INSERT INTO influencers (id, name, category, gender, follower_count, platform) "
                "VALUES ($1, $2, $3, $4, $5, $6)",
                row.id, row.name, row.category, row.gender, row.follower_count,
                platform_to_string(row.platform));
        }
        txn.commit();
        INFO("Inserted " << rows.size() << " influencers");
        return Result<void>();
    } catch (const std::exception& e) {
        ERROR("Error inserting influencers: " << e.what());
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Error inserting influencers: " + std::string(e.what()),
                                kComponent);
    }
}

Result<void> PostgresCampaignStore::save_posts(const std::vector<Post>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec("DELETE FROM posts");
        for (const auto& row : rows) {
            txn.exec_params(
                "INSERT INTO posts (influencer_id, platform, date, url, caption, reach, likes, "
                "comments) VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
                row.influencer_id, platform_to_string(row.platform), row.date.to_string(),
                row.url, row.caption, row.reach, row.likes, row.comments);
        }
        txn.commit();
        INFO("Inserted " << rows.size() << " posts");
        return Result<void>();
    } catch (const std::exception& e) {
        ERROR("Error inserting posts: " << e.what());
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Error inserting posts: " + std::string(e.what()), kComponent);
    }
}

Result<void> PostgresCampaignStore::save_tracking(const std::vector<TrackingRecord>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec("DELETE FROM tracking_data");
        for (const auto& row : rows) {
            txn.exec_params(
                "INSERT INTO tracking_data (source, campaign, influencer_id, user_id, product, "
                "date, orders, revenue) VALUES ($1, $2, $3, $4, $5, $6, $7, $8)",
                row.source, row.campaign, row.influencer_id, row.user_id, row.product,
                row.date.to_string(), row.orders, row.revenue);
        }
        txn.commit();
        INFO("Inserted " << rows.size() << " tracking records");
        return Result<void>();
    } catch (const std::exception& e) {
        ERROR("Error inserting tracking data: " << e.what());
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Error inserting tracking data: " + std::string(e.what()),
                                kComponent);
    }
}

Result<void> PostgresCampaignStore::save_payouts(const std::vector<PayoutRecord>& rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec("DELETE FROM payouts");
        for (const auto& row : rows) {
            txn.exec_params(
                "INSERT INTO payouts (influencer_id, basis, rate, orders, total_payout) "
                "VALUES ($1, $2, $3, $4, $5)",
                row.influencer_id, payout_basis_to_string(row.basis), row.rate, row.orders,
                row.total_payout);
        }
        txn.commit();
        INFO("Inserted " << rows.size() << " payouts");
        return Result<void>();
    } catch (const std::exception& e) {
        ERROR("Error inserting payouts: " << e.what());
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Error inserting payouts: " + std::string(e.what()), kComponent);
    }
}

Result<void> PostgresCampaignStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return validation;
    }

    try {
        pqxx::work txn(*connection_);
        txn.exec("DELETE FROM payouts");
        txn.exec("DELETE FROM tracking_data");
        txn.exec("DELETE FROM posts");
        txn.exec("DELETE FROM influencers");
        txn.commit();
        INFO("All campaign data cleared from database");
        return Result<void>();
    } catch (const std::exception& e) {
        return make_error<void>(ErrorCode::DATABASE_ERROR,
                                "Error clearing data: " + std::string(e.what()), kComponent);
    }
}

Result<StoreSummary> PostgresCampaignStore::summary() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto validation = validate_connection();
    if (validation.is_error()) {
        return forward_error<StoreSummary>(validation);
    }

    try {
        pqxx::work txn(*connection_);
        auto row = txn.exec1(
            "SELECT (SELECT COUNT(*) FROM influencers), (SELECT COUNT(*) FROM posts), "
            "(SELECT COUNT(*) FROM tracking_data), (SELECT COUNT(*) FROM payouts)");
        txn.commit();

        StoreSummary summary;
        summary.influencers = row[0].as<size_t>();
        summary.posts = row[1].as<size_t>();
        summary.tracking = row[2].as<size_t>();
        summary.payouts = row[3].as<size_t>();
        return summary;
    } catch (const std::exception& e) {
        return make_error<StoreSummary>(ErrorCode::DATABASE_ERROR,
                                        "Failed to count rows: " + std::string(e.what()),
                                        kComponent);
    }
}

}  // namespace campaign_analytics
