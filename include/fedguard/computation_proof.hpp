/**
 * @file computation_proof.hpp
 * @brief Integrity artifact binding an agent to the weights it submitted
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A proof is a JSON document:
 *
 *   {
 *     "agent_id": "...",
 *     "weights_hash": "<sha256 of canonical weights>",
 *     "validation_score": 0.91,
 *     "timestamp": 1731250245,
 *     "computation_signature": "<sha256 of the four fields above>"
 *   }
 *
 * The signature is SHA-256 over the compact, key-sorted serialization of the
 * object without the signature field.
 */

#pragma once

#include "fedguard/learning_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace fedguard {

/**
 * @brief Outcome of checking a computation proof
 */
struct ProofValidation {
    bool valid;
    std::string reason;     ///< "proof_validated" or the first failure
};

/**
 * @brief ComputationProof - Generation and validation of update proofs
 */
class ComputationProof {
public:
    /**
     * @brief Build a proof document
     * @param agent_id Submitting agent
     * @param weights_hash Hash of the weights as stored
     * @param validation_score Agent-reported score
     * @param timestamp Submission time
     * @return Compact JSON text
     */
    static std::string generate(
        const std::string& agent_id,
        const std::string& weights_hash,
        double validation_score,
        uint64_t timestamp
    );

    /**
     * @brief Check a stored update's proof
     *
     * Failure reasons, in the order they are checked: invalid_json_format,
     * missing_field_<name>, invalid_field_<name>, agent_id_mismatch,
     * weights_hash_mismatch, timestamp_out_of_range,
     * computation_signature_mismatch.
     *
     * @param update Update carrying the proof
     * @param now Current Unix time
     * @param tolerance Maximum distance between proof timestamp and now
     */
    static ProofValidation validate(
        const ModelUpdate& update,
        uint64_t now,
        std::chrono::seconds tolerance
    );

    /**
     * @brief Check a proof against a submission window
     *
     * Same checks as validate(update, now, tolerance), except that the proof
     * timestamp must lie within [window_start - tolerance, window_end + tolerance].
     */
    static ProofValidation validate(
        const ModelUpdate& update,
        uint64_t window_start,
        uint64_t window_end,
        std::chrono::seconds tolerance
    );
};

} // namespace fedguard
