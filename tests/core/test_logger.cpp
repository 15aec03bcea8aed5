#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <vector>
#include "campaign_analytics/core/logger.hpp"

using namespace campaign_analytics;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Close any file left open by an earlier test
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        Logger::register_component("");
        Logger::reset_for_tests();

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        if (!std::filesystem::exists(dir)) {
            return files;
        }
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "test_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.log_directory = test_log_dir + "/nested";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
    EXPECT_TRUE(Logger::instance().is_initialized());
}

TEST_F(LoggerTest, ConsoleOutputWithoutDecorations) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "Loaded 12 influencers");

    EXPECT_EQ(cout_buffer.str(), "Loaded 12 influencers\n");
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, BothDestinationsReceiveMessage) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::WARNING, "Primary store unavailable");

    EXPECT_EQ(cout_buffer.str(), "Primary store unavailable\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Primary store unavailable\n");
}

TEST_F(LoggerTest, FileNameFollowsSessionPattern) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.filename_prefix = "campaign_report";
    Logger::instance().initialize(config);
    Logger::instance().log(LogLevel::INFO, "started");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    std::regex pattern(R"(campaign_report_\d{8}_\d{6}_part1\.log)");
    EXPECT_TRUE(std::regex_match(files[0].filename().string(), pattern))
        << files[0].filename().string();
}

TEST_F(LoggerTest, MacrosRespectMinimumLevel) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    int rows = 3;
    DEBUG("debug rows " << rows);
    INFO("info rows " << rows);
    WARN("warn rows " << rows);
    ERROR("error rows " << rows);

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("debug rows"), std::string::npos);
    EXPECT_EQ(content.find("info rows"), std::string::npos);
    EXPECT_NE(content.find("warn rows 3\nerror rows 3\n"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelChangesFiltering) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));
    Logger::instance().set_level(LogLevel::ERR);
    EXPECT_EQ(Logger::instance().get_min_level(), LogLevel::ERR);

    WARN("hidden");
    ERROR("shown");

    EXPECT_EQ(cout_buffer.str(), "shown\n");
}

TEST_F(LoggerTest, LevelAndComponentPrefixes) {
    LoggerConfig config = plain_config(LogDestination::CONSOLE);
    config.include_level = true;
    Logger::instance().initialize(config);
    Logger::register_component("FilterEngine");

    INFO("kept 4 influencers");

    EXPECT_EQ(cout_buffer.str(), "[INFO] [FilterEngine] kept 4 influencers\n");
}

TEST_F(LoggerTest, TimestampIncludedWhenEnabled) {
    LoggerConfig config = plain_config(LogDestination::CONSOLE);
    config.include_timestamp = true;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "stamped");

    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} stamped\n)");
    EXPECT_TRUE(std::regex_match(cout_buffer.str(), pattern)) << cout_buffer.str();
}

TEST_F(LoggerTest, RotationStartsNewPart) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;
    config.max_files = 5;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");

    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_NE(files[0].filename().string().find("_part1.log"), std::string::npos);
    EXPECT_NE(files[1].filename().string().find("_part2.log"), std::string::npos);
}

TEST_F(LoggerTest, RotationKeepsAtMostMaxFiles) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 4; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, UninitializedLoggerWritesNothingToConsole) {
    Logger::instance().log(LogLevel::INFO, "dropped");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_FALSE(Logger::instance().is_initialized());
}

TEST_F(LoggerTest, ResetClosesFileHandle) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));
    Logger::reset_for_tests();

    std::error_code ec;
    std::filesystem::remove_all(test_log_dir, ec);
    EXPECT_FALSE(ec) << ec.message();
}

TEST(LoggerConfigTest, JsonRoundTripKeepsEnumsAsNames) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "report";

    nlohmann::json j = config.to_json();
    EXPECT_EQ(j["min_level"], "DEBUG");
    EXPECT_EQ(j["destination"], "BOTH");

    LoggerConfig loaded;
    loaded.from_json(j);
    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "report");
}

TEST(LoggerConfigTest, UnknownLevelNameKeepsDefault) {
    LoggerConfig config;
    config.from_json({{"min_level", "VERBOSE"}});
    EXPECT_EQ(config.min_level, LogLevel::INFO);
    EXPECT_FALSE(level_from_string("VERBOSE").has_value());
    EXPECT_EQ(level_from_string("ERROR"), LogLevel::ERR);
}

TEST(LoggerConfigTest, ValidationRejectsZeroFileLimits) {
    LoggerConfig config;
    config.max_files = 0;
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
