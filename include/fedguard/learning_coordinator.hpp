/**
 * @file learning_coordinator.hpp
 * @brief Byzantine-tolerant distributed learning coordinator
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Round flow:
 * - Register agents
 * - Create a round (participant selection)
 * - Agents submit updates
 * - Detect Byzantine participants
 * - Aggregate surviving updates
 * - Adjust trust scores
 */

#pragma once

#include "fedguard/agent_registry.hpp"
#include "fedguard/aggregator.hpp"
#include "fedguard/byzantine_detector.hpp"
#include "fedguard/coordinator_config.hpp"
#include "fedguard/coordinator_store.hpp"
#include "fedguard/learning_types.hpp"
#include "fedguard/noise_source.hpp"
#include "fedguard/privacy_ledger.hpp"
#include "fedguard/round_manager.hpp"
#include "fedguard/trust_ledger.hpp"
#include "fedguard/trust_score_updater.hpp"
#include "fedguard/update_crypto.hpp"
#include "fedguard/update_ingestion.hpp"
#include "fedguard/utilities.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fedguard {

/**
 * @brief LearningCoordinator - Public entry point of FedGuard
 *
 * Owns the round components and wires them to one store. Registration and
 * submission may be called concurrently from many threads; aggregation
 * blocks the caller until the round is settled.
 *
 * Thread-safe for concurrent access
 */
class LearningCoordinator {
public:
    /**
     * @brief Construct coordinator
     *
     * @param config Configuration (validated)
     * @param store State store, defaults to an InMemoryCoordinatorStore
     * @param noise Noise source, defaults to an unseeded GaussianNoiseSource
     * @param clock Time source, defaults to the system clock
     * @param coordinator_id Coordinator ID, generated if empty
     * @throws std::invalid_argument if the configuration is invalid
     * @throws std::runtime_error if libsodium or the trust ledger cannot be initialized
     */
    explicit LearningCoordinator(
        const CoordinatorConfig& config = CoordinatorConfig(),
        std::shared_ptr<CoordinatorStore> store = nullptr,
        std::shared_ptr<NoiseSource> noise = nullptr,
        utilities::Clock clock = nullptr,
        const std::string& coordinator_id = ""
    );

    ~LearningCoordinator();

    // Disable copy and move
    LearningCoordinator(const LearningCoordinator&) = delete;
    LearningCoordinator& operator=(const LearningCoordinator&) = delete;
    LearningCoordinator(LearningCoordinator&&) = delete;
    LearningCoordinator& operator=(LearningCoordinator&&) = delete;

    // ========================================================================
    // Coordinator Operations
    // ========================================================================

    /**
     * @brief Register an agent
     * @return true if registered, false (logged) if rejected
     */
    bool register_agent(
        const std::string& agent_id,
        AgentRole role,
        const std::vector<std::string>& networks,
        double computational_capacity = 1.0,
        const std::vector<std::string>& specialization = {},
        const std::optional<NetworkProfile>& network = std::nullopt
    );

    /**
     * @brief Create a learning round
     * @throws CoordinatorError INVALID_ARGUMENT, INSUFFICIENT_PARTICIPANTS
     */
    LearningRound create_learning_round(
        const std::string& model_id,
        LearningStrategy strategy,
        double target_accuracy = 0.9,
        uint32_t max_iterations = 100,
        double privacy_epsilon = 1.0
    );

    /**
     * @brief Submit a model update
     * @throws CoordinatorError NOT_FOUND, INVALID_ARGUMENT, ROUND_CLOSED
     */
    ModelUpdate submit_model_update(
        const std::string& agent_id,
        const std::string& round_id,
        const ModelWeights& weights,
        double validation_score
    );

    /**
     * @brief Detect Byzantine agents, aggregate and settle a round
     *
     * @throws CoordinatorError NOT_FOUND for an unknown round,
     *         ROUND_CLOSED if the round is finished or already aggregating,
     *         INSUFFICIENT_PARTICIPANTS if too few updates were submitted or survive,
     *         TOO_MANY_FAULTY_AGENTS if suspects exceed the tolerance
     */
    AggregationResult aggregate_model_updates(const std::string& round_id);

    /**
     * @brief Snapshot of coordinator health and progress
     */
    CoordinatorMetrics get_coordinator_metrics() const;

    /**
     * @brief Verify that an update was accepted and signed by this coordinator
     */
    bool verify_update_signature(const ModelUpdate& update) const;

    // ========================================================================
    // Accessors
    // ========================================================================

    const std::string& get_coordinator_id() const { return coordinator_id_; }

    const CoordinatorConfig& get_config() const { return config_; }

    /**
     * @brief Coordinator Ed25519 public key used for update signatures
     */
    const PublicKey& get_public_key() const {
        return signing_key_.public_key;
    }

    std::optional<Agent> get_agent(const std::string& agent_id) const;

    std::optional<LearningRound> get_round(const std::string& round_id) const;

    std::vector<ModelUpdate> get_round_updates(const std::string& round_id) const;

    std::optional<AggregationResult> get_aggregation_result(const std::string& aggregation_id) const;

    /**
     * @brief All detection verdicts, oldest first
     */
    std::vector<ByzantineDetectionResult> get_detection_history() const;

    /**
     * @brief Epsilon charges of one agent, oldest first
     */
    std::vector<PrivacyCharge> get_privacy_history(const std::string& agent_id) const;

    /**
     * @brief Trust adjustment ledger, nullptr if not configured
     */
    const TrustLedger* get_trust_ledger() const { return trust_ledger_.get(); }

private:
    /// Put a round into ROLLBACK and log why
    void roll_back(const std::string& round_id, const std::string& reason);

    CoordinatorConfig config_;
    SignatureKeyPair signing_key_;
    std::string coordinator_id_;
    utilities::Clock clock_;

    std::shared_ptr<CoordinatorStore> store_;
    std::shared_ptr<NoiseSource> noise_;

    PrivacyLedger privacy_ledger_;
    std::unique_ptr<TrustLedger> trust_ledger_;

    AgentRegistry registry_;
    RoundManager rounds_;
    UpdateIngestion ingestion_;
    ByzantineDetector detector_;
    Aggregator aggregator_;
    TrustScoreUpdater trust_updater_;

    std::atomic<size_t> completed_rounds_{0};
    std::atomic<size_t> successful_aggregations_{0};
    std::atomic<size_t> byzantine_detected_{0};
};

} // namespace fedguard
