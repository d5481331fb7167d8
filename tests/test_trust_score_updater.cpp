/**
 * @file test_trust_score_updater.cpp
 * @brief Unit tests for TrustScoreUpdater
 *
 * Tests post-round reputation adjustment including:
 * - Contribution rewards
 * - Detection penalties
 * - Clamping to [0, 1]
 * - Audit ledger recording
 */

#include <gtest/gtest.h>
#include "fedguard/agent_registry.hpp"
#include "fedguard/trust_score_updater.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace fedguard;

namespace {

constexpr uint64_t NOW = 1700000000;

ModelUpdate contribution(const std::string& agent_id, double score) {
    ModelUpdate update;
    update.update_id = "update_" + agent_id;
    update.agent_id = agent_id;
    update.round_id = "round_1";
    update.weights = {{"bias", 0.5}};
    update.differential_noise = 0.0;
    update.epsilon_spent = 0.0;
    update.validation_score = score;
    update.timestamp = NOW;
    update.bandwidth_used = 0.0;
    return update;
}

ByzantineDetectionResult verdict(const std::vector<std::string>& suspects, double confidence) {
    ByzantineDetectionResult detection;
    detection.detection_id = "detection_1";
    detection.round_id = "round_1";
    detection.suspected_agents = suspects;
    detection.detection_confidence = confidence;
    detection.threshold = 0.5;
    detection.timestamp = NOW;
    return detection;
}

} // namespace

// Test fixture for trust score updater tests
class TrustScoreUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        utilities::set_log_level(utilities::LogLevel::ERROR);
        registry_ = std::make_unique<AgentRegistry>(store_, config_, [] { return NOW; });
        for (const char* agent_id : {"agent_1", "agent_2", "agent_3"}) {
            registry_->register_agent(agent_id, AgentRole::PARTICIPANT, {"lab"}, 0.8, {});
        }
    }

    double trust(const std::string& agent_id) {
        return store_.get_agent(agent_id)->trust_score;
    }

    double byzantine(const std::string& agent_id) {
        return store_.get_agent(agent_id)->byzantine_score;
    }

    InMemoryCoordinatorStore store_;
    CoordinatorConfig config_;
    std::unique_ptr<AgentRegistry> registry_;
};

// ============================================================================
// Formula Tests
// ============================================================================

TEST_F(TrustScoreUpdaterTest, RewardFormula) {
    EXPECT_NEAR(TrustScoreUpdater::rewarded_trust(0.8, 0.9), 0.845, 1e-12);
    EXPECT_NEAR(TrustScoreUpdater::rewarded_trust(0.5, 0.0), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(TrustScoreUpdater::rewarded_trust(0.99, 1.0), 1.0);
}

TEST_F(TrustScoreUpdaterTest, PenaltyFormula) {
    EXPECT_NEAR(TrustScoreUpdater::penalized_trust(0.8, 0.65), 0.67, 1e-12);
    EXPECT_DOUBLE_EQ(TrustScoreUpdater::penalized_trust(0.1, 1.0), 0.0);
    EXPECT_NEAR(TrustScoreUpdater::penalized_byzantine(0.0), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(TrustScoreUpdater::penalized_byzantine(0.95), 1.0);
}

// ============================================================================
// Apply Tests
// ============================================================================

TEST_F(TrustScoreUpdaterTest, RewardsContributors) {
    TrustScoreUpdater updater(store_);

    auto adjustments = updater.apply(
        "round_1",
        {contribution("agent_1", 0.9), contribution("agent_2", 0.5)},
        verdict({}, 0.0),
        NOW
    );

    ASSERT_EQ(adjustments.size(), 2);
    EXPECT_EQ(adjustments[0].agent_id, "agent_1");
    EXPECT_EQ(adjustments[0].reason, "contribution");
    EXPECT_DOUBLE_EQ(adjustments[0].trust_before, 0.8);
    EXPECT_NEAR(adjustments[0].trust_after, 0.845, 1e-12);
    EXPECT_NEAR(trust("agent_1"), 0.845, 1e-12);
    EXPECT_NEAR(trust("agent_2"), 0.825, 1e-12);
    EXPECT_DOUBLE_EQ(trust("agent_3"), 0.8);
    EXPECT_DOUBLE_EQ(byzantine("agent_1"), 0.0);
}

TEST_F(TrustScoreUpdaterTest, PenalizesSuspects) {
    TrustScoreUpdater updater(store_);

    auto adjustments = updater.apply(
        "round_1",
        {contribution("agent_1", 0.9)},
        verdict({"agent_3"}, 0.65),
        NOW
    );

    ASSERT_EQ(adjustments.size(), 2);
    EXPECT_EQ(adjustments[1].agent_id, "agent_3");
    EXPECT_EQ(adjustments[1].reason, "byzantine_detection");
    EXPECT_NEAR(adjustments[1].trust_after, 0.67, 1e-12);
    EXPECT_DOUBLE_EQ(adjustments[1].byzantine_before, 0.0);
    EXPECT_NEAR(adjustments[1].byzantine_after, 0.1, 1e-12);
    EXPECT_NEAR(trust("agent_3"), 0.67, 1e-12);
    EXPECT_NEAR(byzantine("agent_3"), 0.1, 1e-12);
}

TEST_F(TrustScoreUpdaterTest, RepeatedPenaltiesClamp) {
    TrustScoreUpdater updater(store_);

    for (int i = 0; i < 12; i++) {
        updater.apply("round_" + std::to_string(i), {}, verdict({"agent_2"}, 1.0), NOW + i);
    }

    EXPECT_DOUBLE_EQ(trust("agent_2"), 0.0);
    EXPECT_DOUBLE_EQ(byzantine("agent_2"), 1.0);
}

TEST_F(TrustScoreUpdaterTest, UnknownAgentsSkipped) {
    TrustScoreUpdater updater(store_);

    auto adjustments = updater.apply(
        "round_1",
        {contribution("ghost", 0.9)},
        verdict({"phantom"}, 0.8),
        NOW
    );

    EXPECT_TRUE(adjustments.empty());
}

// ============================================================================
// Ledger Tests
// ============================================================================

TEST_F(TrustScoreUpdaterTest, RecordsToLedger) {
    TrustLedger ledger(":memory:", "coordinator_test");
    TrustScoreUpdater updater(store_, &ledger);

    updater.apply(
        "round_7",
        {contribution("agent_1", 0.9), contribution("agent_2", 0.7)},
        verdict({"agent_3"}, 0.65),
        NOW
    );

    EXPECT_EQ(ledger.get_chain_length(), 4);
    EXPECT_TRUE(ledger.verify_integrity());

    auto history = ledger.get_agent_history("agent_3");
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history[0].round_id, "round_7");
    EXPECT_EQ(history[0].reason, "byzantine_detection");
    EXPECT_DOUBLE_EQ(history[0].trust_before, 0.8);
    EXPECT_NEAR(history[0].trust_after, 0.67, 1e-12);
    EXPECT_NEAR(history[0].byzantine_after, 0.1, 1e-12);
    EXPECT_EQ(history[0].coordinator_id, "coordinator_test");
    EXPECT_EQ(history[0].timestamp, NOW);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
