/**
 * @file update_ingestion.hpp
 * @brief Acceptance of model updates into learning rounds
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Each selected agent may submit exactly one update per round. For
 * differentially private rounds Gaussian noise of scale sensitivity/epsilon
 * is added to every weight and epsilon is charged to the agent's budget.
 * The weight hash is computed over the stored (post-noise) weights.
 */

#pragma once

#include "fedguard/coordinator_config.hpp"
#include "fedguard/coordinator_store.hpp"
#include "fedguard/learning_types.hpp"
#include "fedguard/noise_source.hpp"
#include "fedguard/privacy_ledger.hpp"
#include "fedguard/update_crypto.hpp"
#include "fedguard/utilities.hpp"

#include <string>

namespace fedguard {

/**
 * @brief UpdateIngestion - Validates, perturbs and stores model updates
 *
 * Submissions from distinct agents proceed concurrently; all state changes
 * for one submission happen under the submitting agent's lock, and the
 * append under the round's lock.
 *
 * Thread-safe for concurrent access
 */
class UpdateIngestion {
public:
    /**
     * @brief Construct ingestion component
     *
     * All references must outlive the component.
     *
     * @param store Backing store
     * @param config Coordinator configuration (copied)
     * @param privacy_ledger Epsilon accountant
     * @param noise Noise source for differential privacy
     * @param signing_key Coordinator key used to sign accepted updates
     * @param clock Time source
     */
    UpdateIngestion(
        CoordinatorStore& store,
        const CoordinatorConfig& config,
        PrivacyLedger& privacy_ledger,
        NoiseSource& noise,
        const SignatureKeyPair& signing_key,
        utilities::Clock clock
    );

    /**
     * @brief Submit an update
     * @param agent_id Submitting agent
     * @param round_id Target round
     * @param weights Model weights as trained by the agent
     * @param validation_score Agent-reported validation score in [0, 1]
     * @return The stored update
     * @throws CoordinatorError NOT_FOUND for an unknown agent or round,
     *         INVALID_ARGUMENT for malformed input, a non-participant,
     *         a resubmission, a structure mismatch or an exhausted budget,
     *         ROUND_CLOSED if the round no longer accepts updates
     */
    ModelUpdate submit_update(
        const std::string& agent_id,
        const std::string& round_id,
        const ModelWeights& weights,
        double validation_score
    );

    /**
     * @brief Text covered by an update's signature
     * @return "update_id|agent_id|round_id|weight_hash"
     */
    static std::string signing_payload(const ModelUpdate& update);

    /**
     * @brief Verify an update's coordinator signature
     */
    static bool verify_signature(
        const ModelUpdate& update,
        const PublicKey& public_key
    );

private:
    /// Throws ROUND_CLOSED unless the round is open for submissions at `now`
    static void ensure_accepting(const LearningRound& round, uint64_t now);

    CoordinatorStore& store_;
    CoordinatorConfig config_;
    PrivacyLedger& privacy_ledger_;
    NoiseSource& noise_;
    const SignatureKeyPair& signing_key_;
    utilities::Clock clock_;
};

} // namespace fedguard
