// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "campaign_analytics/core/config_base.hpp"

using namespace campaign_analytics;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "campaign_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path test_dir;
};

namespace {

class BenchmarkConfig : public ConfigBase {
public:
    std::string label = "default";
    int window_days = 30;
    double target = 200.0;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["label"] = label;
        j["window_days"] = window_days;
        j["target"] = target;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("label"))
            label = j.at("label").get<std::string>();
        if (j.contains("window_days"))
            window_days = j.at("window_days").get<int>();
        if (j.contains("target"))
            target = j.at("target").get<double>();
    }

    Result<void> validate() const override {
        if (window_days <= 0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT, "window_days must be positive",
                                    "BenchmarkConfig");
        }
        return Result<void>();
    }
};

}  // namespace

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    BenchmarkConfig config;
    config.label = "festive";
    config.window_days = 14;
    config.target = 250.0;

    auto path = test_dir / "benchmark.json";
    auto save_result = config.save_to_file(path.string());
    ASSERT_TRUE(save_result.is_ok()) << save_result.error()->what();
    ASSERT_TRUE(std::filesystem::exists(path));

    BenchmarkConfig loaded;
    auto load_result = loaded.load_from_file(path.string());
    ASSERT_TRUE(load_result.is_ok()) << load_result.error()->what();
    EXPECT_EQ(loaded.label, "festive");
    EXPECT_EQ(loaded.window_days, 14);
    EXPECT_DOUBLE_EQ(loaded.target, 250.0);
}

TEST_F(ConfigBaseTest, PartialJsonKeepsDefaults) {
    BenchmarkConfig config;
    config.from_json({{"label", "partial"}});

    EXPECT_EQ(config.label, "partial");
    EXPECT_EQ(config.window_days, 30);
    EXPECT_DOUBLE_EQ(config.target, 200.0);
}

TEST_F(ConfigBaseTest, MissingFile) {
    BenchmarkConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, InvalidJson) {
    auto path = test_dir / "invalid.json";
    write_file(path, "{ this is not valid JSON }");

    BenchmarkConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, WrongValueType) {
    auto path = test_dir / "wrong_type.json";
    write_file(path, R"({"window_days": "thirty"})");

    BenchmarkConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, LoadRunsValidation) {
    auto path = test_dir / "invalid_value.json";
    write_file(path, R"({"window_days": 0})");

    BenchmarkConfig config;
    auto result = config.load_from_file(path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(result.error()->component(), "BenchmarkConfig");
}

TEST_F(ConfigBaseTest, SaveToUnwritablePath) {
    BenchmarkConfig config;
    auto result = config.save_to_file((test_dir / "missing_dir" / "out.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}
