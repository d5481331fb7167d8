/**
 * @file test_coordinator_config.cpp
 * @brief Unit tests for coordinator configuration and validation
 *
 * Tests configuration including:
 * - Constants and defaults
 * - Identifier validation
 * - Environment overlay
 * - JSON loading, serialization and range checks
 */

#include <gtest/gtest.h>
#include "fedguard/coordinator_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace fedguard;
namespace fs = std::filesystem;

// Test fixture for coordinator config tests
class CoordinatorConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "fedguard_config_test";
        fs::create_directories(test_dir_);
        clear_env();
    }

    void TearDown() override {
        clear_env();
        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    static void clear_env() {
        for (const char* name : {"FEDGUARD_LOG_LEVEL", "FEDGUARD_LOG_FILE", "FEDGUARD_TRUST_LEDGER",
                                 "FEDGUARD_PRIVACY_BUDGET", "FEDGUARD_CONSENSUS_THRESHOLD",
                                 "FEDGUARD_ROUND_DURATION_SECONDS"}) {
            unsetenv(name);
        }
    }

    fs::path test_dir_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(CoordinatorConfigTest, DefaultsMatchConstants) {
    CoordinatorConfig cfg;

    EXPECT_DOUBLE_EQ(cfg.initial_trust_score, 0.8);
    EXPECT_DOUBLE_EQ(cfg.privacy_budget_total, 10.0);
    EXPECT_DOUBLE_EQ(cfg.byzantine_tolerance_threshold, 0.33);
    EXPECT_DOUBLE_EQ(cfg.consensus_threshold, 0.67);
    EXPECT_EQ(cfg.min_round_participants, 3);
    EXPECT_EQ(cfg.min_submitted_updates, 3);
    EXPECT_EQ(cfg.min_valid_updates, 2);
    EXPECT_EQ(cfg.round_duration.count(), 3600);
    EXPECT_TRUE(cfg.trust_ledger_path.empty());
    EXPECT_TRUE(cfg.validate().empty());
}

// ============================================================================
// Identifier Validation
// ============================================================================

TEST_F(CoordinatorConfigTest, ValidateIdentifierValid) {
    EXPECT_TRUE(config::validate_identifier("agent_1"));
    EXPECT_TRUE(config::validate_identifier("vision-model.v2"));
    EXPECT_TRUE(config::validate_identifier(std::string(config::MAX_IDENTIFIER_LENGTH, 'a')));
}

TEST_F(CoordinatorConfigTest, ValidateIdentifierInvalid) {
    EXPECT_FALSE(config::validate_identifier(""));
    EXPECT_FALSE(config::validate_identifier("agent 1"));
    EXPECT_FALSE(config::validate_identifier("agent/../1"));
    EXPECT_FALSE(config::validate_identifier("agent;rm"));
    EXPECT_FALSE(config::validate_identifier(std::string(config::MAX_IDENTIFIER_LENGTH + 1, 'a')));
}

// ============================================================================
// Environment
// ============================================================================

TEST_F(CoordinatorConfigTest, FromEnvOverlaysValues) {
    setenv("FEDGUARD_LOG_LEVEL", "debug", 1);
    setenv("FEDGUARD_TRUST_LEDGER", "/tmp/ledger.db", 1);
    setenv("FEDGUARD_PRIVACY_BUDGET", "5.5", 1);
    setenv("FEDGUARD_CONSENSUS_THRESHOLD", "0.75", 1);
    setenv("FEDGUARD_ROUND_DURATION_SECONDS", "120", 1);

    CoordinatorConfig cfg = CoordinatorConfig::from_env();

    EXPECT_EQ(cfg.log_level, utilities::LogLevel::DEBUG);
    EXPECT_EQ(cfg.trust_ledger_path, "/tmp/ledger.db");
    EXPECT_DOUBLE_EQ(cfg.privacy_budget_total, 5.5);
    EXPECT_DOUBLE_EQ(cfg.consensus_threshold, 0.75);
    EXPECT_EQ(cfg.round_duration.count(), 120);
}

TEST_F(CoordinatorConfigTest, FromEnvIgnoresMalformedValues) {
    setenv("FEDGUARD_LOG_LEVEL", "chatty", 1);
    setenv("FEDGUARD_PRIVACY_BUDGET", "-1", 1);
    setenv("FEDGUARD_CONSENSUS_THRESHOLD", "1.5", 1);
    setenv("FEDGUARD_ROUND_DURATION_SECONDS", "soon", 1);

    CoordinatorConfig cfg = CoordinatorConfig::from_env();
    CoordinatorConfig defaults;

    EXPECT_EQ(cfg.log_level, defaults.log_level);
    EXPECT_DOUBLE_EQ(cfg.privacy_budget_total, defaults.privacy_budget_total);
    EXPECT_DOUBLE_EQ(cfg.consensus_threshold, defaults.consensus_threshold);
    EXPECT_EQ(cfg.round_duration, defaults.round_duration);
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(CoordinatorConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    auto cfg = CoordinatorConfig::from_json("{\"privacy_budget_total\": 4.0, \"log_level\": \"warn\"}");

    ASSERT_TRUE(cfg.has_value());
    EXPECT_DOUBLE_EQ(cfg->privacy_budget_total, 4.0);
    EXPECT_EQ(cfg->log_level, utilities::LogLevel::WARN);
    EXPECT_DOUBLE_EQ(cfg->initial_trust_score, 0.8);
}

TEST_F(CoordinatorConfigTest, FromJsonRejectsInvalidDocuments) {
    EXPECT_FALSE(CoordinatorConfig::from_json("not json").has_value());
    EXPECT_FALSE(CoordinatorConfig::from_json("[1, 2]").has_value());
    EXPECT_FALSE(CoordinatorConfig::from_json("{\"log_level\": \"chatty\"}").has_value());
    EXPECT_FALSE(CoordinatorConfig::from_json("{\"initial_trust_score\": 1.5}").has_value());
}

TEST_F(CoordinatorConfigTest, JsonRoundTrip) {
    CoordinatorConfig cfg;
    cfg.privacy_budget_total = 3.0;
    cfg.round_duration = std::chrono::seconds(60);
    cfg.trust_ledger_path = "ledger.db";

    auto parsed = CoordinatorConfig::from_json(cfg.to_json());

    ASSERT_TRUE(parsed.has_value());
    EXPECT_DOUBLE_EQ(parsed->privacy_budget_total, 3.0);
    EXPECT_EQ(parsed->round_duration.count(), 60);
    EXPECT_EQ(parsed->trust_ledger_path, "ledger.db");
}

TEST_F(CoordinatorConfigTest, FromJsonFile) {
    fs::path path = test_dir_ / "coordinator.json";
    {
        std::ofstream file(path);
        file << "{\"min_round_participants\": 5, \"consensus_threshold\": 0.5}";
    }

    auto cfg = CoordinatorConfig::from_json_file(path);

    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->min_round_participants, 5);
    EXPECT_DOUBLE_EQ(cfg->consensus_threshold, 0.5);
}

TEST_F(CoordinatorConfigTest, FromJsonFileMissing) {
    EXPECT_FALSE(CoordinatorConfig::from_json_file(test_dir_ / "missing.json").has_value());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(CoordinatorConfigTest, ValidateReportsFirstProblem) {
    CoordinatorConfig cfg;
    cfg.privacy_budget_total = 0.0;
    EXPECT_NE(cfg.validate().find("privacy_budget_total"), std::string::npos);

    cfg = CoordinatorConfig();
    cfg.byzantine_tolerance_threshold = 1.0;
    EXPECT_NE(cfg.validate().find("byzantine_tolerance_threshold"), std::string::npos);

    cfg = CoordinatorConfig();
    cfg.min_valid_updates = 4;
    EXPECT_NE(cfg.validate().find("min_valid_updates"), std::string::npos);

    cfg = CoordinatorConfig();
    cfg.round_duration = std::chrono::seconds(0);
    EXPECT_NE(cfg.validate().find("round_duration_seconds"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
