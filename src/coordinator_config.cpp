/**
 * @file coordinator_config.cpp
 * @brief Implementation of coordinator configuration and validation functions
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/coordinator_config.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace fedguard {

namespace config {

bool validate_identifier(const std::string& identifier, size_t max_length) {
    // Check length
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Alphanumeric plus underscore, hyphen and dot only
    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }

    return true;
}

} // namespace config

namespace {

std::string log_level_name(utilities::LogLevel level) {
    switch (level) {
        case utilities::LogLevel::DEBUG:    return "debug";
        case utilities::LogLevel::INFO:     return "info";
        case utilities::LogLevel::WARN:     return "warn";
        case utilities::LogLevel::ERROR:    return "error";
        case utilities::LogLevel::CRITICAL: return "critical";
        default:                            return "info";
    }
}

std::optional<double> parse_double(const std::string& text) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

// ============================================================================
// Environment
// ============================================================================

CoordinatorConfig CoordinatorConfig::from_env() {
    CoordinatorConfig cfg;

    std::string level = utilities::get_env("FEDGUARD_LOG_LEVEL");
    if (!level.empty()) {
        auto parsed = utilities::parse_log_level(level);
        if (parsed) {
            cfg.log_level = *parsed;
        } else {
            utilities::log_warn("Config: Ignoring unknown FEDGUARD_LOG_LEVEL '" + level + "'");
        }
    }

    cfg.log_file = utilities::get_env("FEDGUARD_LOG_FILE", cfg.log_file);
    cfg.trust_ledger_path = utilities::get_env("FEDGUARD_TRUST_LEDGER", cfg.trust_ledger_path);

    std::string budget = utilities::get_env("FEDGUARD_PRIVACY_BUDGET");
    if (!budget.empty()) {
        auto value = parse_double(budget);
        if (value && *value > 0.0) {
            cfg.privacy_budget_total = *value;
        } else {
            utilities::log_warn("Config: Ignoring invalid FEDGUARD_PRIVACY_BUDGET '" + budget + "'");
        }
    }

    std::string consensus = utilities::get_env("FEDGUARD_CONSENSUS_THRESHOLD");
    if (!consensus.empty()) {
        auto value = parse_double(consensus);
        if (value && *value >= 0.0 && *value <= 1.0) {
            cfg.consensus_threshold = *value;
        } else {
            utilities::log_warn("Config: Ignoring invalid FEDGUARD_CONSENSUS_THRESHOLD '" + consensus + "'");
        }
    }

    std::string duration = utilities::get_env("FEDGUARD_ROUND_DURATION_SECONDS");
    if (!duration.empty()) {
        auto value = parse_double(duration);
        if (value && *value > 0.0) {
            cfg.round_duration = std::chrono::seconds(static_cast<int64_t>(*value));
        } else {
            utilities::log_warn("Config: Ignoring invalid FEDGUARD_ROUND_DURATION_SECONDS '" + duration + "'");
        }
    }

    return cfg;
}

// ============================================================================
// JSON
// ============================================================================

std::optional<CoordinatorConfig> CoordinatorConfig::from_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        utilities::log_error("Config: Failed to open " + path.string());
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return from_json(content.str());
}

std::optional<CoordinatorConfig> CoordinatorConfig::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        CoordinatorConfig cfg;
        cfg.initial_trust_score = j.value("initial_trust_score", cfg.initial_trust_score);
        cfg.privacy_budget_total = j.value("privacy_budget_total", cfg.privacy_budget_total);
        cfg.byzantine_tolerance_threshold = j.value("byzantine_tolerance_threshold", cfg.byzantine_tolerance_threshold);
        cfg.consensus_threshold = j.value("consensus_threshold", cfg.consensus_threshold);
        cfg.dp_sensitivity = j.value("dp_sensitivity", cfg.dp_sensitivity);
        cfg.secure_aggregation_noise = j.value("secure_aggregation_noise", cfg.secure_aggregation_noise);
        cfg.min_privacy_budget = j.value("min_privacy_budget", cfg.min_privacy_budget);
        cfg.min_trust_score = j.value("min_trust_score", cfg.min_trust_score);
        cfg.default_latency_ms = j.value("default_latency_ms", cfg.default_latency_ms);
        cfg.default_bandwidth_mbps = j.value("default_bandwidth_mbps", cfg.default_bandwidth_mbps);
        cfg.min_round_participants = j.value("min_round_participants", cfg.min_round_participants);
        cfg.min_submitted_updates = j.value("min_submitted_updates", cfg.min_submitted_updates);
        cfg.min_valid_updates = j.value("min_valid_updates", cfg.min_valid_updates);
        cfg.round_duration = std::chrono::seconds(
            j.value("round_duration_seconds", static_cast<int64_t>(cfg.round_duration.count())));
        cfg.proof_timestamp_tolerance = std::chrono::seconds(
            j.value("proof_timestamp_tolerance_seconds",
                    static_cast<int64_t>(cfg.proof_timestamp_tolerance.count())));
        cfg.log_file = j.value("log_file", cfg.log_file);
        cfg.trust_ledger_path = j.value("trust_ledger_path", cfg.trust_ledger_path);

        if (j.contains("log_level")) {
            auto level = utilities::parse_log_level(j["log_level"].get<std::string>());
            if (!level) {
                return std::nullopt;
            }
            cfg.log_level = *level;
        }

        std::string problem = cfg.validate();
        if (!problem.empty()) {
            utilities::log_error("Config: " + problem);
            return std::nullopt;
        }

        return cfg;

    } catch (const std::exception& e) {
        utilities::log_error("Config: Failed to parse JSON: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::string CoordinatorConfig::to_json() const {
    json j;
    j["initial_trust_score"] = initial_trust_score;
    j["privacy_budget_total"] = privacy_budget_total;
    j["byzantine_tolerance_threshold"] = byzantine_tolerance_threshold;
    j["consensus_threshold"] = consensus_threshold;
    j["dp_sensitivity"] = dp_sensitivity;
    j["secure_aggregation_noise"] = secure_aggregation_noise;
    j["min_privacy_budget"] = min_privacy_budget;
    j["min_trust_score"] = min_trust_score;
    j["default_latency_ms"] = default_latency_ms;
    j["default_bandwidth_mbps"] = default_bandwidth_mbps;
    j["min_round_participants"] = min_round_participants;
    j["min_submitted_updates"] = min_submitted_updates;
    j["min_valid_updates"] = min_valid_updates;
    j["round_duration_seconds"] = round_duration.count();
    j["proof_timestamp_tolerance_seconds"] = proof_timestamp_tolerance.count();
    j["log_level"] = log_level_name(log_level);
    j["log_file"] = log_file;
    j["trust_ledger_path"] = trust_ledger_path;
    return j.dump(2);
}

std::string CoordinatorConfig::validate() const {
    if (initial_trust_score < 0.0 || initial_trust_score > 1.0) {
        return "initial_trust_score must be within [0, 1]";
    }
    if (privacy_budget_total <= 0.0) {
        return "privacy_budget_total must be positive";
    }
    if (byzantine_tolerance_threshold < 0.0 || byzantine_tolerance_threshold >= 1.0) {
        return "byzantine_tolerance_threshold must be within [0, 1)";
    }
    if (consensus_threshold < 0.0 || consensus_threshold > 1.0) {
        return "consensus_threshold must be within [0, 1]";
    }
    if (dp_sensitivity <= 0.0) {
        return "dp_sensitivity must be positive";
    }
    if (secure_aggregation_noise < 0.0) {
        return "secure_aggregation_noise must not be negative";
    }
    if (min_round_participants < 1) {
        return "min_round_participants must be at least 1";
    }
    if (min_valid_updates < 1 || min_valid_updates > min_submitted_updates) {
        return "min_valid_updates must be within [1, min_submitted_updates]";
    }
    if (round_duration.count() <= 0) {
        return "round_duration_seconds must be positive";
    }
    if (proof_timestamp_tolerance.count() < 0) {
        return "proof_timestamp_tolerance_seconds must not be negative";
    }
    return "";
}

} // namespace fedguard
