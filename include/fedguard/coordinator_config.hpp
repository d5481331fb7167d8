/**
 * @file coordinator_config.hpp
 * @brief Tunable constants and configuration loading for the coordinator
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "fedguard/utilities.hpp"

#include <cstdint>
#include <chrono>
#include <string>
#include <optional>
#include <filesystem>

namespace fedguard {
namespace config {

// ============================================================================
// Agent Defaults
// ============================================================================

/// Trust score assigned at registration
constexpr double INITIAL_TRUST_SCORE = 0.8;

/// Process-wide privacy budget (epsilon) granted to each agent
constexpr double PRIVACY_BUDGET_TOTAL = 10.0;

/// Simulated latency when the caller provides no network profile (ms)
constexpr double DEFAULT_NETWORK_LATENCY_MS = 55.0;

/// Simulated bandwidth when the caller provides no network profile (MB/s)
constexpr double DEFAULT_BANDWIDTH_MBPS = 505.0;

/// Maximum identifier length (agent ID, model ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

// ============================================================================
// Round Selection
// ============================================================================

/// Minimum number of eligible agents to open a round
constexpr size_t MIN_ROUND_PARTICIPANTS = 3;

/// Eligibility floor on remaining privacy budget
constexpr double MIN_PRIVACY_BUDGET = 0.1;

/// Eligibility floor on trust score
constexpr double MIN_TRUST_SCORE = 0.5;

/// Fraction of participants that may be Byzantine
constexpr double BYZANTINE_TOLERANCE_THRESHOLD = 0.33;

/// Round submission window
constexpr auto ROUND_DURATION = std::chrono::seconds(3600);

// ============================================================================
// Ingestion and Aggregation
// ============================================================================

/// L2 sensitivity used to scale differential-privacy noise
constexpr double DP_SENSITIVITY = 1.0;

/// Per-element noise added by secure aggregation
constexpr double SECURE_AGGREGATION_NOISE = 0.01;

/// Computation proof timestamp tolerance
constexpr auto PROOF_TIMESTAMP_TOLERANCE = std::chrono::seconds(3600);

/// Minimum submitted updates before aggregation
constexpr size_t MIN_SUBMITTED_UPDATES = 3;

/// Minimum updates surviving detection
constexpr size_t MIN_VALID_UPDATES = 2;

/// Quality score at which consensus is declared
constexpr double CONSENSUS_THRESHOLD = 0.67;

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric plus underscore, hyphen, dot)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

} // namespace config

/**
 * @brief Runtime configuration of a LearningCoordinator
 *
 * Defaults mirror the constants in fedguard::config. Values can be overlaid
 * from FEDGUARD_* environment variables or a JSON file with the same keys.
 */
struct CoordinatorConfig {
    double initial_trust_score = config::INITIAL_TRUST_SCORE;
    double privacy_budget_total = config::PRIVACY_BUDGET_TOTAL;
    double byzantine_tolerance_threshold = config::BYZANTINE_TOLERANCE_THRESHOLD;
    double consensus_threshold = config::CONSENSUS_THRESHOLD;
    double dp_sensitivity = config::DP_SENSITIVITY;
    double secure_aggregation_noise = config::SECURE_AGGREGATION_NOISE;
    double min_privacy_budget = config::MIN_PRIVACY_BUDGET;
    double min_trust_score = config::MIN_TRUST_SCORE;
    double default_latency_ms = config::DEFAULT_NETWORK_LATENCY_MS;
    double default_bandwidth_mbps = config::DEFAULT_BANDWIDTH_MBPS;
    size_t min_round_participants = config::MIN_ROUND_PARTICIPANTS;
    size_t min_submitted_updates = config::MIN_SUBMITTED_UPDATES;
    size_t min_valid_updates = config::MIN_VALID_UPDATES;
    std::chrono::seconds round_duration = config::ROUND_DURATION;
    std::chrono::seconds proof_timestamp_tolerance = config::PROOF_TIMESTAMP_TOLERANCE;

    utilities::LogLevel log_level = utilities::LogLevel::INFO;
    std::string log_file;            ///< Empty for console only
    std::string trust_ledger_path;   ///< Empty disables the SQLite audit ledger

    /**
     * @brief Defaults overlaid with FEDGUARD_* environment variables
     *
     * Recognized: FEDGUARD_LOG_LEVEL, FEDGUARD_LOG_FILE, FEDGUARD_TRUST_LEDGER,
     * FEDGUARD_PRIVACY_BUDGET, FEDGUARD_CONSENSUS_THRESHOLD,
     * FEDGUARD_ROUND_DURATION_SECONDS. Malformed values are logged and ignored.
     */
    static CoordinatorConfig from_env();

    /**
     * @brief Load configuration from a JSON file
     * @param path Path to JSON file
     * @return Config or std::nullopt if unreadable, malformed, or invalid
     */
    static std::optional<CoordinatorConfig> from_json_file(const std::filesystem::path& path);

    /**
     * @brief Parse configuration from JSON text (missing keys keep defaults)
     */
    static std::optional<CoordinatorConfig> from_json(const std::string& json_str);

    /**
     * @brief Serialize to JSON text
     */
    std::string to_json() const;

    /**
     * @brief Check value ranges
     * @return Empty string if valid, otherwise description of the first problem
     */
    std::string validate() const;
};

} // namespace fedguard
