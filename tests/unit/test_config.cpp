/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace taskweave;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "tw_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_TRUE(config.graph.normalize_relates_to);
    EXPECT_EQ(config.graph.reporting_chain_max_depth, 100u);
    EXPECT_FALSE(config.pour.default_ephemeral);
    EXPECT_EQ(config.pour.max_extends_depth, 10u);
    EXPECT_EQ(config.telemetry.log_level, "info");
    EXPECT_EQ(config.telemetry.audit_file_prefix, "audit");
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [graph]
        normalize_relates_to = false
        reporting_chain_max_depth = 25

        [pour]
        default_ephemeral = true
        max_extends_depth = 3

        [telemetry]
        log_dir = "/tmp/tw_logs"
        log_level = "debug"
        max_file_size_mb = 8
        rotate_count = 2
        audit_file_prefix = "events"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_FALSE(config.graph.normalize_relates_to);
    EXPECT_EQ(config.graph.reporting_chain_max_depth, 25u);
    EXPECT_TRUE(config.pour.default_ephemeral);
    EXPECT_EQ(config.pour.max_extends_depth, 3u);
    EXPECT_EQ(config.telemetry.log_dir, std::filesystem::path{"/tmp/tw_logs"});
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.max_file_size_mb, 8u);
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
    EXPECT_EQ(config.telemetry.audit_file_prefix, "events");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [pour]
        default_ephemeral = true
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_TRUE(result->pour.default_ephemeral);
    // Defaults for everything else
    EXPECT_TRUE(result->graph.normalize_relates_to);
    EXPECT_EQ(result->pour.max_extends_depth, 10u);
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, UnknownLogLevel) {
    auto path = write_toml(R"(
        [telemetry]
        log_level = "verbose"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("verbose"), std::string::npos);
}

TEST_F(ConfigTest, ZeroChainDepthRejected) {
    auto path = write_toml(R"(
        [graph]
        reporting_chain_max_depth = 0
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, NegativeCountsRejected) {
    auto depth = load_config(write_toml(R"(
        [graph]
        reporting_chain_max_depth = -1
    )"));
    ASSERT_FALSE(depth.has_value());
    EXPECT_EQ(depth.error().code, ErrorCode::ConfigError);
    EXPECT_NE(depth.error().message.find("reporting_chain_max_depth"), std::string::npos);

    EXPECT_FALSE(load_config(write_toml(R"(
        [pour]
        max_extends_depth = -3
    )")).has_value());
    EXPECT_FALSE(load_config(write_toml(R"(
        [telemetry]
        rotate_count = -1
    )")).has_value());
    EXPECT_FALSE(load_config(write_toml(R"(
        [telemetry]
        max_file_size_mb = 0
    )")).has_value());
}

TEST_F(ConfigTest, ZeroRotateCountAllowed) {
    auto result = load_config(write_toml(R"(
        [telemetry]
        rotate_count = 0
    )"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->telemetry.rotate_count, 0u);
}
