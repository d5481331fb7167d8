/**
 * @file test_update_ingestion.cpp
 * @brief Unit tests for update ingestion, computation proofs and privacy accounting
 *
 * Tests the submission path including:
 * - Update construction (hash, proof, signature, bandwidth)
 * - Input and membership validation
 * - Resubmission and structure checks
 * - Round phase and deadline enforcement
 * - Differential privacy noise and budget charges
 * - Computation proof failure reasons
 * - Thread safety
 */

#include <gtest/gtest.h>
#include "fedguard/agent_registry.hpp"
#include "fedguard/computation_proof.hpp"
#include "fedguard/errors.hpp"
#include "fedguard/round_manager.hpp"
#include "fedguard/update_ingestion.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <thread>
#include <vector>

using namespace fedguard;
using json = nlohmann::json;

namespace {

ModelWeights sample_weights(double value = 0.1) {
    ModelWeights model;
    model["dense"] = WeightVector{value, value + 0.1, value + 0.2, value + 0.3};
    model["bias"] = value;
    return model;
}

} // namespace

// Test fixture for update ingestion tests
class UpdateIngestionTest : public ::testing::Test {
protected:
    void SetUp() override {
        utilities::set_log_level(utilities::LogLevel::ERROR);
        ASSERT_TRUE(UpdateCrypto::initialize());

        now_ = 1700000000;
        auto clock = [this] { return now_.load(); };
        signing_key_ = UpdateCrypto::generate_signature_keypair();

        registry_ = std::make_unique<AgentRegistry>(store_, config_, clock);
        rounds_ = std::make_unique<RoundManager>(store_, config_, clock);
        ingestion_ = std::make_unique<UpdateIngestion>(
            store_, config_, privacy_ledger_, noise_, signing_key_, clock
        );

        for (int i = 0; i < 4; i++) {
            registry_->register_agent("agent_" + std::to_string(i), AgentRole::PARTICIPANT, {"lab"}, 0.8, {});
        }
    }

    LearningRound open_round(LearningStrategy strategy = LearningStrategy::FEDERATED_AVERAGING,
                             double epsilon = 1.0) {
        return rounds_->create_round("coordinator_test", "model", strategy, 0.9, 10, epsilon);
    }

    ErrorCode submit_error(const std::string& agent_id, const std::string& round_id,
                           const ModelWeights& weights, double score) {
        try {
            ingestion_->submit_update(agent_id, round_id, weights, score);
        } catch (const CoordinatorError& e) {
            return e.code();
        }
        ADD_FAILURE() << "submit_update did not throw";
        return ErrorCode::NOT_FOUND;
    }

    std::atomic<uint64_t> now_{0};
    InMemoryCoordinatorStore store_;
    CoordinatorConfig config_;
    PrivacyLedger privacy_ledger_{config::DP_SENSITIVITY};
    GaussianNoiseSource noise_{42};
    SignatureKeyPair signing_key_;
    std::unique_ptr<AgentRegistry> registry_;
    std::unique_ptr<RoundManager> rounds_;
    std::unique_ptr<UpdateIngestion> ingestion_;
};

// ============================================================================
// Submission Tests
// ============================================================================

TEST_F(UpdateIngestionTest, SubmitUpdate) {
    auto round = open_round();
    ModelWeights weights = sample_weights();

    ModelUpdate update = ingestion_->submit_update("agent_0", round.round_id, weights, 0.9);

    EXPECT_EQ(update.update_id.rfind("update_1700000000_", 0), 0);
    EXPECT_EQ(update.update_id.size(), std::string("update_1700000000_").size() + 8);
    EXPECT_EQ(update.agent_id, "agent_0");
    EXPECT_EQ(update.round_id, round.round_id);
    EXPECT_TRUE(update.weights == weights);
    EXPECT_EQ(update.weight_hash, weights::compute_hash(weights));
    EXPECT_DOUBLE_EQ(update.differential_noise, 0.0);
    EXPECT_DOUBLE_EQ(update.epsilon_spent, 0.0);
    EXPECT_DOUBLE_EQ(update.validation_score, 0.9);
    EXPECT_EQ(update.timestamp, 1700000000);
    EXPECT_DOUBLE_EQ(update.bandwidth_used,
                     static_cast<double>(weights::to_canonical_json(weights).size()) / 1024.0);

    EXPECT_TRUE(UpdateIngestion::verify_signature(update, signing_key_.public_key));
    EXPECT_TRUE(ComputationProof::validate(update, now_, config_.proof_timestamp_tolerance).valid);

    auto stored = store_.get_round_updates(round.round_id);
    ASSERT_EQ(stored.size(), 1);
    EXPECT_EQ(stored[0].update_id, update.update_id);
    EXPECT_EQ(store_.update_count(), 1);
}

TEST_F(UpdateIngestionTest, FirstUpdateStartsTraining) {
    auto round = open_round();
    EXPECT_EQ(store_.get_round(round.round_id)->phase, LearningPhase::INITIALIZATION);

    ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.9);
    EXPECT_EQ(store_.get_round(round.round_id)->phase, LearningPhase::TRAINING);

    ingestion_->submit_update("agent_1", round.round_id, sample_weights(), 0.8);
    EXPECT_EQ(store_.get_round(round.round_id)->phase, LearningPhase::TRAINING);
}

TEST_F(UpdateIngestionTest, SubmitRecordsContribution) {
    auto round = open_round();
    now_ = 1700000100;

    ingestion_->submit_update("agent_2", round.round_id, sample_weights(), 0.75);

    auto agent = store_.get_agent("agent_2");
    ASSERT_TRUE(agent.has_value());
    EXPECT_EQ(agent->last_contribution, 1700000100);
    EXPECT_EQ(agent->total_contributions, 1);
    EXPECT_EQ(agent->performance_history, std::vector<double>{0.75});
    EXPECT_DOUBLE_EQ(agent->privacy_budget, 10.0);
}

TEST_F(UpdateIngestionTest, UnknownRoundOrAgent) {
    auto round = open_round();

    EXPECT_EQ(submit_error("agent_0", "round_missing", sample_weights(), 0.9), ErrorCode::NOT_FOUND);
    EXPECT_EQ(submit_error("ghost", round.round_id, sample_weights(), 0.9), ErrorCode::NOT_FOUND);
}

TEST_F(UpdateIngestionTest, NonParticipantRejected) {
    auto round = open_round();
    registry_->register_agent("latecomer", AgentRole::PARTICIPANT, {"lab"}, 0.8, {});

    EXPECT_EQ(submit_error("latecomer", round.round_id, sample_weights(), 0.9), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(UpdateIngestionTest, MalformedInputRejected) {
    auto round = open_round();

    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(), 1.1), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(), -0.1), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(),
                           std::numeric_limits<double>::quiet_NaN()), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(submit_error("agent_0", round.round_id, ModelWeights(), 0.9), ErrorCode::INVALID_ARGUMENT);

    ModelWeights empty_layer;
    empty_layer["dense"] = WeightVector{};
    EXPECT_EQ(submit_error("agent_0", round.round_id, empty_layer, 0.9), ErrorCode::INVALID_ARGUMENT);

    ModelWeights non_finite = sample_weights();
    non_finite["bias"] = std::numeric_limits<double>::infinity();
    EXPECT_EQ(submit_error("agent_0", round.round_id, non_finite, 0.9), ErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE(store_.get_round_updates(round.round_id).empty());
}

TEST_F(UpdateIngestionTest, ScoreBoundsAreInclusive) {
    auto round = open_round();

    EXPECT_NO_THROW(ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.0));
    EXPECT_NO_THROW(ingestion_->submit_update("agent_1", round.round_id, sample_weights(), 1.0));
}

TEST_F(UpdateIngestionTest, ResubmissionRejected) {
    auto round = open_round();
    ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.9);

    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(0.2), 0.8), ErrorCode::INVALID_ARGUMENT);

    EXPECT_EQ(store_.get_round_updates(round.round_id).size(), 1);
    EXPECT_EQ(store_.get_agent("agent_0")->total_contributions, 1);
}

TEST_F(UpdateIngestionTest, StructureMismatchRejected) {
    auto round = open_round();
    ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.9);

    ModelWeights other;
    other["dense"] = WeightVector{0.1, 0.2};
    EXPECT_EQ(submit_error("agent_1", round.round_id, other, 0.9), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(store_.get_agent("agent_1")->total_contributions, 0);
}

TEST_F(UpdateIngestionTest, DeadlinePassed) {
    auto round = open_round();
    now_ = round.deadline + 1;

    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(), 0.9), ErrorCode::ROUND_CLOSED);
}

TEST_F(UpdateIngestionTest, SubmissionAtDeadlineAccepted) {
    auto round = open_round();
    now_ = round.deadline;

    EXPECT_NO_THROW(ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.9));
}

TEST_F(UpdateIngestionTest, ClosedRoundRejected) {
    auto round = open_round();
    rounds_->set_phase(round.round_id, LearningPhase::AGGREGATION);
    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(), 0.9), ErrorCode::ROUND_CLOSED);

    rounds_->set_phase(round.round_id, LearningPhase::ROLLBACK);
    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(), 0.9), ErrorCode::ROUND_CLOSED);
}

// ============================================================================
// Differential Privacy Tests
// ============================================================================

TEST_F(UpdateIngestionTest, DifferentialPrivateAddsNoiseAndCharges) {
    auto round = open_round(LearningStrategy::DIFFERENTIAL_PRIVATE, 2.0);
    ModelWeights weights = sample_weights();

    ModelUpdate update = ingestion_->submit_update("agent_0", round.round_id, weights, 0.9);

    EXPECT_DOUBLE_EQ(update.differential_noise, 0.5);
    EXPECT_DOUBLE_EQ(update.epsilon_spent, 2.0);
    EXPECT_TRUE(weights::same_structure(update.weights, weights));
    EXPECT_NE(weights::flatten(update.weights), weights::flatten(weights));

    // Hash and proof cover the noised weights
    EXPECT_EQ(update.weight_hash, weights::compute_hash(update.weights));
    EXPECT_TRUE(ComputationProof::validate(update, now_, config_.proof_timestamp_tolerance).valid);

    EXPECT_DOUBLE_EQ(store_.get_agent("agent_0")->privacy_budget, 8.0);

    auto charges = privacy_ledger_.history("agent_0");
    ASSERT_EQ(charges.size(), 1);
    EXPECT_EQ(charges[0].round_id, round.round_id);
    EXPECT_EQ(charges[0].mechanism, "gaussian");
    EXPECT_DOUBLE_EQ(charges[0].epsilon, 2.0);
    EXPECT_DOUBLE_EQ(charges[0].noise_scale, 0.5);
    EXPECT_DOUBLE_EQ(charges[0].remaining_budget, 8.0);
    EXPECT_DOUBLE_EQ(privacy_ledger_.total_spent(), 2.0);
}

TEST_F(UpdateIngestionTest, ExhaustedBudgetRejected) {
    auto round = open_round(LearningStrategy::DIFFERENTIAL_PRIVATE, 1.0);
    store_.with_agent("agent_0", [](Agent& agent) { agent.privacy_budget = 0.5; });

    EXPECT_EQ(submit_error("agent_0", round.round_id, sample_weights(), 0.9), ErrorCode::INVALID_ARGUMENT);

    EXPECT_TRUE(store_.get_round_updates(round.round_id).empty());
    EXPECT_DOUBLE_EQ(store_.get_agent("agent_0")->privacy_budget, 0.5);
    EXPECT_TRUE(privacy_ledger_.history("agent_0").empty());
}

TEST_F(UpdateIngestionTest, BudgetSpentDownExactly) {
    auto round = open_round(LearningStrategy::DIFFERENTIAL_PRIVATE, 1.0);
    store_.with_agent("agent_0", [](Agent& agent) { agent.privacy_budget = 1.0; });

    EXPECT_NO_THROW(ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.9));
    EXPECT_DOUBLE_EQ(store_.get_agent("agent_0")->privacy_budget, 0.0);
}

TEST_F(UpdateIngestionTest, PrivacyLedgerNoiseScale) {
    PrivacyLedger ledger(2.0);
    EXPECT_DOUBLE_EQ(ledger.noise_scale(4.0), 0.5);
    EXPECT_DOUBLE_EQ(ledger.noise_scale(0.0), 0.0);
}

// ============================================================================
// Signature Tests
// ============================================================================

TEST_F(UpdateIngestionTest, TamperedUpdateFailsSignature) {
    auto round = open_round();
    ModelUpdate update = ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.9);

    EXPECT_EQ(UpdateIngestion::signing_payload(update),
              update.update_id + "|agent_0|" + round.round_id + "|" + update.weight_hash);

    ModelUpdate forged = update;
    forged.agent_id = "agent_1";
    EXPECT_FALSE(UpdateIngestion::verify_signature(forged, signing_key_.public_key));

    forged = update;
    forged.signature = "not-hex";
    EXPECT_FALSE(UpdateIngestion::verify_signature(forged, signing_key_.public_key));

    auto other_key = UpdateCrypto::generate_signature_keypair();
    EXPECT_FALSE(UpdateIngestion::verify_signature(update, other_key.public_key));
}

// ============================================================================
// Computation Proof Tests
// ============================================================================

class ComputationProofTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(UpdateCrypto::initialize());

        update_.agent_id = "agent_0";
        update_.weights = sample_weights();
        update_.weight_hash = weights::compute_hash(update_.weights);
        update_.validation_score = 0.9;
        update_.timestamp = NOW;
        update_.computation_proof = ComputationProof::generate(
            update_.agent_id, update_.weight_hash, update_.validation_score, NOW
        );
    }

    std::string reason(uint64_t now = NOW) const {
        return ComputationProof::validate(update_, now, std::chrono::seconds(3600)).reason;
    }

    static constexpr uint64_t NOW = 1700000000;
    ModelUpdate update_;
};

TEST_F(ComputationProofTest, ValidProof) {
    auto validation = ComputationProof::validate(update_, NOW, std::chrono::seconds(3600));
    EXPECT_TRUE(validation.valid);
    EXPECT_EQ(validation.reason, "proof_validated");

    json proof = json::parse(update_.computation_proof);
    EXPECT_EQ(proof["agent_id"].get<std::string>(), "agent_0");
    EXPECT_EQ(proof["weights_hash"].get<std::string>(), update_.weight_hash);
    EXPECT_EQ(proof["computation_signature"].get<std::string>().size(), 64);
}

TEST_F(ComputationProofTest, InvalidJson) {
    update_.computation_proof = "{not json";
    EXPECT_EQ(reason(), "invalid_json_format");

    update_.computation_proof = "[1, 2]";
    EXPECT_EQ(reason(), "invalid_json_format");
}

TEST_F(ComputationProofTest, MissingField) {
    json proof = json::parse(update_.computation_proof);
    proof.erase("weights_hash");
    update_.computation_proof = proof.dump();

    EXPECT_EQ(reason(), "missing_field_weights_hash");
}

TEST_F(ComputationProofTest, InvalidFieldType) {
    json proof = json::parse(update_.computation_proof);
    proof["timestamp"] = "yesterday";
    update_.computation_proof = proof.dump();

    EXPECT_EQ(reason(), "invalid_field_timestamp");
}

TEST_F(ComputationProofTest, AgentMismatch) {
    update_.agent_id = "agent_1";
    EXPECT_EQ(reason(), "agent_id_mismatch");
}

TEST_F(ComputationProofTest, WeightsMismatch) {
    update_.weights["bias"] = 9.0;
    EXPECT_EQ(reason(), "weights_hash_mismatch");
}

TEST_F(ComputationProofTest, TimestampOutOfRange) {
    EXPECT_EQ(reason(NOW + 3600), "proof_validated");
    EXPECT_EQ(reason(NOW + 3601), "timestamp_out_of_range");
    EXPECT_EQ(reason(NOW - 3601), "timestamp_out_of_range");
}

TEST_F(ComputationProofTest, SignatureMismatch) {
    json proof = json::parse(update_.computation_proof);
    proof["validation_score"] = 0.99;
    update_.computation_proof = proof.dump();

    EXPECT_EQ(reason(), "computation_signature_mismatch");
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST_F(UpdateIngestionTest, ConcurrentSubmissionsFromDistinctAgents) {
    auto round = open_round();
    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};

    for (const auto& agent_id : round.participants) {
        threads.emplace_back([&, agent_id]() {
            ingestion_->submit_update(agent_id, round.round_id, sample_weights(), 0.9);
            accepted++;
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), static_cast<int>(round.participants.size()));
    EXPECT_EQ(store_.get_round_updates(round.round_id).size(), round.participants.size());
}

TEST_F(UpdateIngestionTest, ConcurrentResubmissionAcceptsOne) {
    auto round = open_round(LearningStrategy::DIFFERENTIAL_PRIVATE, 1.0);
    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};

    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&]() {
            try {
                ingestion_->submit_update("agent_0", round.round_id, sample_weights(), 0.9);
                accepted++;
            } catch (const CoordinatorError& e) {
                if (e.code() == ErrorCode::INVALID_ARGUMENT) {
                    rejected++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(rejected.load(), 7);
    EXPECT_EQ(store_.get_round_updates(round.round_id).size(), 1);
    EXPECT_DOUBLE_EQ(store_.get_agent("agent_0")->privacy_budget, 9.0);
    EXPECT_EQ(privacy_ledger_.history("agent_0").size(), 1);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
