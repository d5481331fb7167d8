/**
 * @file update_ingestion.cpp
 * @brief Implementation of model update ingestion
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/update_ingestion.hpp"
#include "fedguard/computation_proof.hpp"
#include "fedguard/errors.hpp"

#include <algorithm>
#include <cmath>

namespace fedguard {

UpdateIngestion::UpdateIngestion(
    CoordinatorStore& store,
    const CoordinatorConfig& config,
    PrivacyLedger& privacy_ledger,
    NoiseSource& noise,
    const SignatureKeyPair& signing_key,
    utilities::Clock clock
)
    : store_(store)
    , config_(config)
    , privacy_ledger_(privacy_ledger)
    , noise_(noise)
    , signing_key_(signing_key)
    , clock_(std::move(clock))
{
}

// ============================================================================
// Submission
// ============================================================================

void UpdateIngestion::ensure_accepting(const LearningRound& round, uint64_t now) {
    if (round.phase != LearningPhase::INITIALIZATION && round.phase != LearningPhase::TRAINING) {
        throw CoordinatorError(
            ErrorCode::ROUND_CLOSED,
            "round " + round.round_id + " is in phase " + learning_phase_to_string(round.phase)
        );
    }
    if (now > round.deadline) {
        throw CoordinatorError(ErrorCode::ROUND_CLOSED, "round " + round.round_id + " deadline has passed");
    }
}

ModelUpdate UpdateIngestion::submit_update(
    const std::string& agent_id,
    const std::string& round_id,
    const ModelWeights& weights,
    double validation_score
) {
    if (!(validation_score >= 0.0 && validation_score <= 1.0)) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "validation score must be in [0, 1]");
    }
    if (weights.empty() || weights::element_count(weights) == 0) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "model weights are empty");
    }
    if (!weights::is_well_formed(weights)) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "model weights contain non-finite or ragged values");
    }

    auto round = store_.get_round(round_id);
    if (!round) {
        throw CoordinatorError(ErrorCode::NOT_FOUND, "unknown learning round " + round_id);
    }
    if (!store_.get_agent(agent_id)) {
        throw CoordinatorError(ErrorCode::NOT_FOUND, "unknown agent " + agent_id);
    }
    if (!round->is_participant(agent_id)) {
        throw CoordinatorError(
            ErrorCode::INVALID_ARGUMENT,
            "agent " + agent_id + " is not a participant of round " + round_id
        );
    }

    uint64_t now = clock_();
    ensure_accepting(*round, now);

    bool differential = round->strategy == LearningStrategy::DIFFERENTIAL_PRIVATE;
    ModelUpdate update;

    bool found = store_.with_agent(agent_id, [&](Agent& agent) {
        double noise_scale = 0.0;
        if (differential) {
            privacy_ledger_.ensure_budget(agent, round->privacy_epsilon);
            noise_scale = privacy_ledger_.noise_scale(round->privacy_epsilon);
        }

        update.update_id = "update_" + std::to_string(now) + "_" + UpdateCrypto::random_hex(4);
        update.agent_id = agent_id;
        update.round_id = round_id;
        update.weights = differential
            ? weights::transform(weights, [&](double value) { return value + noise_.gaussian(noise_scale); })
            : weights;
        update.weight_hash = weights::compute_hash(update.weights);
        update.differential_noise = noise_scale;
        update.epsilon_spent = differential ? round->privacy_epsilon : 0.0;
        update.validation_score = validation_score;
        update.computation_proof = ComputationProof::generate(
            agent_id, update.weight_hash, validation_score, now
        );
        update.timestamp = now;
        update.bandwidth_used =
            static_cast<double>(weights::to_canonical_json(update.weights).size()) / 1024.0;
        update.signature = UpdateCrypto::sign_hex(signing_payload(update), signing_key_.secret_key);

        bool round_found = store_.with_round(round_id, [&](LearningRound& current, std::vector<ModelUpdate>& updates) {
            ensure_accepting(current, now);

            bool resubmission = std::any_of(updates.begin(), updates.end(), [&](const ModelUpdate& existing) {
                return existing.agent_id == agent_id;
            });
            if (resubmission) {
                throw CoordinatorError(
                    ErrorCode::INVALID_ARGUMENT,
                    "agent " + agent_id + " already submitted an update for round " + round_id
                );
            }

            if (!updates.empty() && !weights::same_structure(updates.front().weights, update.weights)) {
                throw CoordinatorError(
                    ErrorCode::INVALID_ARGUMENT,
                    "weight structure from " + agent_id + " does not match round " + round_id
                );
            }

            updates.push_back(update);
            if (current.phase == LearningPhase::INITIALIZATION) {
                current.phase = LearningPhase::TRAINING;
            }
        });
        if (!round_found) {
            throw CoordinatorError(ErrorCode::NOT_FOUND, "unknown learning round " + round_id);
        }

        if (differential) {
            privacy_ledger_.charge(agent, round_id, round->privacy_epsilon, now);
        }
        agent.last_contribution = now;
        agent.total_contributions++;
        agent.performance_history.push_back(validation_score);
    });

    if (!found) {
        throw CoordinatorError(ErrorCode::NOT_FOUND, "unknown agent " + agent_id);
    }

    utilities::log_info("Model update " + update.update_id + " from " + agent_id +
                        " accepted for " + round_id + " (score " +
                        utilities::format_double(validation_score) + ", noise " +
                        utilities::format_double(update.differential_noise) + ")");
    return update;
}

// ============================================================================
// Signatures
// ============================================================================

std::string UpdateIngestion::signing_payload(const ModelUpdate& update) {
    return update.update_id + "|" + update.agent_id + "|" + update.round_id + "|" + update.weight_hash;
}

bool UpdateIngestion::verify_signature(
    const ModelUpdate& update,
    const PublicKey& public_key
) {
    return UpdateCrypto::verify_hex(signing_payload(update), update.signature, public_key);
}

} // namespace fedguard
