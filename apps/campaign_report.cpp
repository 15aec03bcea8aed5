// apps/campaign_report.cpp

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include "campaign_analytics/analytics/campaign_analytics_engine.hpp"
#include "campaign_analytics/analytics/report_config.hpp"
#include "campaign_analytics/analytics/report_serializer.hpp"
#include "campaign_analytics/core/logger.hpp"
#include "campaign_analytics/data/campaign_data_manager.hpp"
#include "campaign_analytics/data/csv_table_loader.hpp"
#include "campaign_analytics/data/postgres_campaign_store.hpp"

using namespace campaign_analytics;

namespace {

// Saves the CSV tables through the manager so they reach the database when one is configured
bool import_tables(CampaignDataManager& manager, const CampaignTables& tables) {
    auto influencers = manager.save_influencers(tables.influencers);
    auto posts = manager.save_posts(tables.posts);
    auto tracking = manager.save_tracking(tables.tracking);
    auto payouts = manager.save_payouts(tables.payouts);

    for (const auto* result : {&influencers, &posts, &tracking, &payouts}) {
        if (result->is_error()) {
            std::cerr << "Failed to import tables: " << result->error()->what() << std::endl;
            return false;
        }
        if (result->value() == SaveOutcome::IN_MEMORY_FALLBACK && manager.has_primary_store()) {
            WARN("Imported rows were kept in memory only");
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "./config.json";

        ReportConfig config;
        auto load_result = config.load_from_file(config_path);
        if (load_result.is_error()) {
            std::cerr << "Failed to load configuration " << config_path << ": "
                      << load_result.error()->what() << std::endl;
            return 1;
        }

        // Initialize logger
        auto& logger = Logger::instance();
        logger.initialize(config.logger);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("campaign_report");
        INFO("Logger initialized successfully");

        // Setup the data source
        std::shared_ptr<PostgresCampaignStore> database;
        if (config.database.is_set()) {
            INFO("Connecting to database " << config.database.name << " at "
                                           << config.database.host);
            database =
                std::make_shared<PostgresCampaignStore>(config.database.get_connection_string());
            auto connect_result = database->connect();
            if (connect_result.is_error()) {
                ERROR("Database unavailable, continuing in memory: "
                      << connect_result.error()->what());
                database.reset();
            } else if (config.create_tables) {
                auto create_result = database->create_tables();
                if (create_result.is_error()) {
                    std::cerr << "Failed to create tables: " << create_result.error()->what()
                              << std::endl;
                    return 1;
                }
            }
        }

        CampaignDataManager manager(database);

        if (!config.csv_directory.empty()) {
            INFO("Loading CSV files from " << config.csv_directory);
            auto tables_result = CsvTableLoader::load_directory(config.csv_directory);
            if (tables_result.is_error()) {
                std::cerr << "Failed to load CSV files: " << tables_result.error()->what()
                          << std::endl;
                return 1;
            }
            if (!import_tables(manager, tables_result.value())) {
                return 1;
            }
        } else if (manager.has_primary_store()) {
            auto refresh_result = manager.refresh();
            if (refresh_result.is_error()) {
                std::cerr << "Failed to load tables from database: "
                          << refresh_result.error()->what() << std::endl;
                return 1;
            }
        } else {
            std::cerr << "No data source available" << std::endl;
            return 1;
        }

        // Build the engine and apply the filter selection
        auto engine_result =
            CampaignAnalyticsEngine::create(config.analytics, config.recommendations);
        if (engine_result.is_error()) {
            std::cerr << "Failed to create analytics engine: " << engine_result.error()->what()
                      << std::endl;
            return 1;
        }
        const auto& engine = *engine_result.value();

        auto criteria_result = config.filters.to_criteria();
        if (criteria_result.is_error()) {
            std::cerr << "Invalid filter selection: " << criteria_result.error()->what()
                      << std::endl;
            return 1;
        }

        const CampaignTables all_tables = manager.snapshot();
        const CampaignTables snapshot = engine.apply_filters(all_tables, criteria_result.value());
        INFO("Analyzing " << snapshot.tracking.size() << " of " << all_tables.tracking.size()
                          << " tracking rows");

        nlohmann::json report;
        report["filters"] = config.filters.to_json();
        report["headline"] = ReportSerializer::to_json(engine.build_headline(snapshot));
        report["data_summary"] = ReportSerializer::to_json(engine.summarize(snapshot));
        report["metrics"] = ReportSerializer::to_json(engine.calculate_roi_roas(snapshot));
        report["incremental_roas"] = engine.calculate_incremental_roas(snapshot);
        report["top_performers"] = ReportSerializer::to_json(engine.get_top_performers(snapshot));
        report["insights"] = ReportSerializer::to_json(engine.generate_insights(snapshot));
        report["payouts"] = ReportSerializer::to_json(engine.summarize_payouts(snapshot));

        if (config.include_recommendations) {
            report["recommendations"] = engine.generate_recommendations(snapshot);
        }
        if (config.include_export_summary) {
            report["export_summary"] =
                ReportSerializer::to_json(engine.build_export_summary(snapshot));
        }
        if (!config.influencer_id.empty()) {
            auto profile = engine.get_influencer_performance(snapshot, config.influencer_id);
            if (profile) {
                report["influencer_profile"] = ReportSerializer::to_json(*profile);
            } else {
                WARN("No tracking data for influencer " << config.influencer_id);
                report["influencer_profile"] = nullptr;
            }
        }

        if (config.output_file.empty()) {
            std::cout << report.dump(2) << std::endl;
        } else {
            std::ofstream out(config.output_file);
            if (!out.is_open()) {
                std::cerr << "Failed to open output file " << config.output_file << std::endl;
                return 1;
            }
            out << report.dump(2) << std::endl;
            INFO("Report written to " << config.output_file);
        }

        INFO("Campaign report complete");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
