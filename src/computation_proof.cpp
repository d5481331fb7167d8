/**
 * @file computation_proof.cpp
 * @brief Implementation of computation proofs
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/computation_proof.hpp"
#include "fedguard/update_crypto.hpp"

#include <nlohmann/json.hpp>

#include <vector>

using json = nlohmann::json;

namespace fedguard {

namespace {

std::string proof_signature(const json& body) {
    // nlohmann::json objects keep keys sorted
    return UpdateCrypto::sha256_hex(body.dump());
}

} // anonymous namespace

std::string ComputationProof::generate(
    const std::string& agent_id,
    const std::string& weights_hash,
    double validation_score,
    uint64_t timestamp
) {
    json body;
    body["agent_id"] = agent_id;
    body["weights_hash"] = weights_hash;
    body["validation_score"] = validation_score;
    body["timestamp"] = timestamp;

    json proof = body;
    proof["computation_signature"] = proof_signature(body);
    return proof.dump();
}

ProofValidation ComputationProof::validate(
    const ModelUpdate& update,
    uint64_t now,
    std::chrono::seconds tolerance
) {
    return validate(update, now, now, tolerance);
}

ProofValidation ComputationProof::validate(
    const ModelUpdate& update,
    uint64_t window_start,
    uint64_t window_end,
    std::chrono::seconds tolerance
) {
    json proof = json::parse(update.computation_proof, nullptr, false);
    if (proof.is_discarded() || !proof.is_object()) {
        return {false, "invalid_json_format"};
    }

    for (const char* field : {"agent_id", "weights_hash", "validation_score",
                              "timestamp", "computation_signature"}) {
        if (!proof.contains(field)) {
            return {false, std::string("missing_field_") + field};
        }
    }

    if (!proof["agent_id"].is_string()) {
        return {false, "invalid_field_agent_id"};
    }
    if (!proof["weights_hash"].is_string()) {
        return {false, "invalid_field_weights_hash"};
    }
    if (!proof["validation_score"].is_number()) {
        return {false, "invalid_field_validation_score"};
    }
    if (!proof["timestamp"].is_number()) {
        return {false, "invalid_field_timestamp"};
    }
    if (!proof["computation_signature"].is_string()) {
        return {false, "invalid_field_computation_signature"};
    }

    if (proof["agent_id"].get<std::string>() != update.agent_id) {
        return {false, "agent_id_mismatch"};
    }

    if (proof["weights_hash"].get<std::string>() != weights::compute_hash(update.weights)) {
        return {false, "weights_hash_mismatch"};
    }

    double proof_time = proof["timestamp"].get<double>();
    double slack = static_cast<double>(tolerance.count());
    if (proof_time < static_cast<double>(window_start) - slack ||
        proof_time > static_cast<double>(window_end) + slack) {
        return {false, "timestamp_out_of_range"};
    }

    json body = proof;
    body.erase("computation_signature");
    std::string claimed = proof["computation_signature"].get<std::string>();
    std::string expected = proof_signature(body);
    if (!UpdateCrypto::constant_time_compare(
            std::vector<uint8_t>(claimed.begin(), claimed.end()),
            std::vector<uint8_t>(expected.begin(), expected.end()))) {
        return {false, "computation_signature_mismatch"};
    }

    return {true, "proof_validated"};
}

} // namespace fedguard
