/**
 * @file learning_types.hpp
 * @brief Records exchanged between coordinator components
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Agents, learning rounds, model updates, detection verdicts and aggregation
 * results, with JSON rendering for reporting.
 */

#pragma once

#include "fedguard/model_weights.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fedguard {

/**
 * @brief Role an agent plays in the learning network
 */
enum class AgentRole {
    COORDINATOR,
    PARTICIPANT,
    VALIDATOR,
    AGGREGATOR,
    OBSERVER
};

/**
 * @brief How updates of a round are combined
 */
enum class LearningStrategy {
    FEDERATED_AVERAGING,     ///< Validation-score weighted mean
    SECURE_AGGREGATION,      ///< Weighted mean plus per-element masking noise
    BYZANTINE_ROBUST,        ///< Element-wise median
    DIFFERENTIAL_PRIVATE,    ///< Gaussian noise at ingestion, weighted mean
    CONTINUAL_LEARNING,      ///< Weighted mean
    PERSONALIZED_FL          ///< Weighted mean
};

/**
 * @brief Round lifecycle phase
 */
enum class LearningPhase {
    INITIALIZATION,
    TRAINING,
    AGGREGATION,
    VALIDATION,
    COMPLETION,
    ROLLBACK
};

std::string agent_role_to_string(AgentRole role);
std::optional<AgentRole> string_to_agent_role(const std::string& str);

std::string learning_strategy_to_string(LearningStrategy strategy);
std::optional<LearningStrategy> string_to_learning_strategy(const std::string& str);

std::string learning_phase_to_string(LearningPhase phase);
std::optional<LearningPhase> string_to_learning_phase(const std::string& str);

/**
 * @brief Simulated network characteristics of an agent
 */
struct NetworkProfile {
    double latency_ms;          ///< Round-trip latency in milliseconds
    double bandwidth_mbps;      ///< Bandwidth in MB/s
};

/**
 * @brief Registered learning agent and its reputation state
 */
struct Agent {
    std::string agent_id;
    AgentRole role;
    std::vector<std::string> networks;          ///< Network affiliations (non-empty)
    std::vector<std::string> specialization;
    double computational_capacity;              ///< 0.0-1.0
    double trust_score;                         ///< 0.0-1.0, higher is better
    double byzantine_score;                     ///< 0.0-1.0, lower is better
    double privacy_budget;                      ///< Remaining epsilon
    uint64_t last_contribution;                 ///< Unix timestamp, 0 if never
    uint64_t total_contributions;
    std::vector<double> performance_history;    ///< Reported validation scores, oldest first
    NetworkProfile network;
    uint64_t registered_at;

    std::string to_json() const;
};

/**
 * @brief One round of distributed learning
 */
struct LearningRound {
    std::string round_id;
    std::string model_id;
    std::string coordinator_id;
    LearningStrategy strategy;
    std::vector<std::string> participants;      ///< Selected agents, highest score first
    double target_accuracy;
    uint32_t max_iterations;
    double privacy_epsilon;
    size_t byzantine_tolerance;                 ///< Maximum agents that may be excluded
    uint64_t start_time;
    uint64_t deadline;
    LearningPhase phase;
    std::map<std::string, std::string> metadata;

    /// byzantine_tolerance / participants.size() (0 for an empty round)
    double tolerance_fraction() const;

    bool is_participant(const std::string& agent_id) const;

    /// COMPLETION and ROLLBACK are terminal
    bool is_finished() const;

    std::string to_json() const;
};

/**
 * @brief Model update submitted by one agent for one round
 */
struct ModelUpdate {
    std::string update_id;
    std::string agent_id;
    std::string round_id;
    ModelWeights weights;               ///< As stored (after privacy noise)
    std::string weight_hash;            ///< SHA-256 of canonical weights
    double differential_noise;          ///< Gaussian noise scale applied, 0 if none
    double epsilon_spent;               ///< Privacy budget charged for this update
    double validation_score;            ///< Agent-reported, 0.0-1.0
    std::string computation_proof;      ///< JSON proof document
    std::string signature;              ///< Coordinator Ed25519 signature (hex)
    uint64_t timestamp;
    double bandwidth_used;              ///< Serialized size in KB

    std::string to_json() const;
};

/**
 * @brief Verdict of the Byzantine detection ensemble for a round
 */
struct ByzantineDetectionResult {
    std::string detection_id;
    std::string round_id;
    std::vector<std::string> suspected_agents;
    double detection_confidence;                             ///< Max per-agent suspicion
    double threshold;                                        ///< Adaptive threshold applied
    std::string detection_method;
    std::string recommended_action;
    std::map<std::string, double> scores;                    ///< Suspicion per agent
    std::map<std::string, std::vector<std::string>> evidence; ///< Signals fired per agent
    uint64_t timestamp;

    bool is_suspected(const std::string& agent_id) const;

    std::string to_json() const;
};

/**
 * @brief Outcome of aggregating a round
 */
struct AggregationResult {
    std::string aggregation_id;
    std::string round_id;
    ModelWeights aggregated_weights;
    std::vector<std::string> participating_updates;
    std::vector<std::string> byzantine_agents;
    LearningStrategy strategy;
    double quality_score;
    double privacy_loss;                ///< Sum of noise scales of contributing updates
    double computation_time;            ///< Seconds spent in detection and aggregation
    bool consensus_achieved;
    std::map<std::string, std::string> metadata;

    std::string to_json() const;
};

/**
 * @brief Coordinator-wide health and progress figures
 */
struct CoordinatorMetrics {
    std::string coordinator_id;
    size_t registered_agents;
    size_t active_learning_rounds;
    size_t completed_rounds;
    size_t successful_aggregations;
    double success_rate;
    size_t byzantine_detected_count;
    size_t total_model_updates;
    double average_trust;
    double privacy_budget_utilization;
    double network_health;

    std::string to_json() const;
};

} // namespace fedguard
