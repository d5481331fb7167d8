/**
 * @file learning_types.cpp
 * @brief Implementation of coordinator record helpers and JSON rendering
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/learning_types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

using json = nlohmann::json;

namespace fedguard {

// ============================================================================
// Enum String Conversion
// ============================================================================

std::string agent_role_to_string(AgentRole role) {
    switch (role) {
        case AgentRole::COORDINATOR: return "coordinator";
        case AgentRole::PARTICIPANT: return "participant";
        case AgentRole::VALIDATOR: return "validator";
        case AgentRole::AGGREGATOR: return "aggregator";
        case AgentRole::OBSERVER: return "observer";
        default: return "unknown";
    }
}

std::optional<AgentRole> string_to_agent_role(const std::string& str) {
    if (str == "coordinator") return AgentRole::COORDINATOR;
    if (str == "participant") return AgentRole::PARTICIPANT;
    if (str == "validator") return AgentRole::VALIDATOR;
    if (str == "aggregator") return AgentRole::AGGREGATOR;
    if (str == "observer") return AgentRole::OBSERVER;
    return std::nullopt;
}

std::string learning_strategy_to_string(LearningStrategy strategy) {
    switch (strategy) {
        case LearningStrategy::FEDERATED_AVERAGING: return "federated_averaging";
        case LearningStrategy::SECURE_AGGREGATION: return "secure_aggregation";
        case LearningStrategy::BYZANTINE_ROBUST: return "byzantine_robust";
        case LearningStrategy::DIFFERENTIAL_PRIVATE: return "differential_private";
        case LearningStrategy::CONTINUAL_LEARNING: return "continual_learning";
        case LearningStrategy::PERSONALIZED_FL: return "personalized_fl";
        default: return "unknown";
    }
}

std::optional<LearningStrategy> string_to_learning_strategy(const std::string& str) {
    if (str == "federated_averaging") return LearningStrategy::FEDERATED_AVERAGING;
    if (str == "secure_aggregation") return LearningStrategy::SECURE_AGGREGATION;
    if (str == "byzantine_robust") return LearningStrategy::BYZANTINE_ROBUST;
    if (str == "differential_private") return LearningStrategy::DIFFERENTIAL_PRIVATE;
    if (str == "continual_learning") return LearningStrategy::CONTINUAL_LEARNING;
    if (str == "personalized_fl") return LearningStrategy::PERSONALIZED_FL;
    return std::nullopt;
}

std::string learning_phase_to_string(LearningPhase phase) {
    switch (phase) {
        case LearningPhase::INITIALIZATION: return "initialization";
        case LearningPhase::TRAINING: return "training";
        case LearningPhase::AGGREGATION: return "aggregation";
        case LearningPhase::VALIDATION: return "validation";
        case LearningPhase::COMPLETION: return "completion";
        case LearningPhase::ROLLBACK: return "rollback";
        default: return "unknown";
    }
}

std::optional<LearningPhase> string_to_learning_phase(const std::string& str) {
    if (str == "initialization") return LearningPhase::INITIALIZATION;
    if (str == "training") return LearningPhase::TRAINING;
    if (str == "aggregation") return LearningPhase::AGGREGATION;
    if (str == "validation") return LearningPhase::VALIDATION;
    if (str == "completion") return LearningPhase::COMPLETION;
    if (str == "rollback") return LearningPhase::ROLLBACK;
    return std::nullopt;
}

// ============================================================================
// Agent
// ============================================================================

std::string Agent::to_json() const {
    json j;
    j["agent_id"] = agent_id;
    j["role"] = agent_role_to_string(role);
    j["networks"] = networks;
    j["specialization"] = specialization;
    j["computational_capacity"] = computational_capacity;
    j["trust_score"] = trust_score;
    j["byzantine_score"] = byzantine_score;
    j["privacy_budget"] = privacy_budget;
    j["last_contribution"] = last_contribution;
    j["total_contributions"] = total_contributions;
    j["performance_history"] = performance_history;
    j["network_latency_ms"] = network.latency_ms;
    j["bandwidth_mbps"] = network.bandwidth_mbps;
    j["registered_at"] = registered_at;
    return j.dump();
}

// ============================================================================
// LearningRound
// ============================================================================

double LearningRound::tolerance_fraction() const {
    if (participants.empty()) {
        return 0.0;
    }
    return static_cast<double>(byzantine_tolerance) / static_cast<double>(participants.size());
}

bool LearningRound::is_participant(const std::string& agent_id) const {
    return std::find(participants.begin(), participants.end(), agent_id) != participants.end();
}

bool LearningRound::is_finished() const {
    return phase == LearningPhase::COMPLETION || phase == LearningPhase::ROLLBACK;
}

std::string LearningRound::to_json() const {
    json j;
    j["round_id"] = round_id;
    j["model_id"] = model_id;
    j["coordinator_id"] = coordinator_id;
    j["strategy"] = learning_strategy_to_string(strategy);
    j["participants"] = participants;
    j["target_accuracy"] = target_accuracy;
    j["max_iterations"] = max_iterations;
    j["privacy_epsilon"] = privacy_epsilon;
    j["byzantine_tolerance"] = byzantine_tolerance;
    j["start_time"] = start_time;
    j["deadline"] = deadline;
    j["phase"] = learning_phase_to_string(phase);
    j["metadata"] = metadata;
    return j.dump();
}

// ============================================================================
// ModelUpdate
// ============================================================================

std::string ModelUpdate::to_json() const {
    json j;
    j["update_id"] = update_id;
    j["agent_id"] = agent_id;
    j["round_id"] = round_id;
    j["weights"] = json::parse(weights::to_canonical_json(weights));
    j["weight_hash"] = weight_hash;
    j["differential_noise"] = differential_noise;
    j["epsilon_spent"] = epsilon_spent;
    j["validation_score"] = validation_score;
    j["computation_proof"] = computation_proof;
    j["signature"] = signature;
    j["timestamp"] = timestamp;
    j["bandwidth_used"] = bandwidth_used;
    return j.dump();
}

// ============================================================================
// ByzantineDetectionResult
// ============================================================================

bool ByzantineDetectionResult::is_suspected(const std::string& agent_id) const {
    return std::find(suspected_agents.begin(), suspected_agents.end(), agent_id)
        != suspected_agents.end();
}

std::string ByzantineDetectionResult::to_json() const {
    json j;
    j["detection_id"] = detection_id;
    j["round_id"] = round_id;
    j["suspected_agents"] = suspected_agents;
    j["detection_confidence"] = detection_confidence;
    j["threshold"] = threshold;
    j["detection_method"] = detection_method;
    j["recommended_action"] = recommended_action;
    j["scores"] = scores;
    j["evidence"] = evidence;
    j["timestamp"] = timestamp;
    return j.dump();
}

// ============================================================================
// AggregationResult
// ============================================================================

std::string AggregationResult::to_json() const {
    json j;
    j["aggregation_id"] = aggregation_id;
    j["round_id"] = round_id;
    j["aggregated_weights"] = json::parse(weights::to_canonical_json(aggregated_weights));
    j["participating_updates"] = participating_updates;
    j["byzantine_agents"] = byzantine_agents;
    j["strategy"] = learning_strategy_to_string(strategy);
    j["quality_score"] = quality_score;
    j["privacy_loss"] = privacy_loss;
    j["computation_time"] = computation_time;
    j["consensus_achieved"] = consensus_achieved;
    j["metadata"] = metadata;
    return j.dump();
}

// ============================================================================
// CoordinatorMetrics
// ============================================================================

std::string CoordinatorMetrics::to_json() const {
    json j;
    j["coordinator_id"] = coordinator_id;
    j["registered_agents"] = registered_agents;
    j["active_learning_rounds"] = active_learning_rounds;
    j["completed_rounds"] = completed_rounds;
    j["successful_aggregations"] = successful_aggregations;
    j["success_rate"] = success_rate;
    j["byzantine_detected_count"] = byzantine_detected_count;
    j["total_model_updates"] = total_model_updates;
    j["average_trust"] = average_trust;
    j["privacy_budget_utilization"] = privacy_budget_utilization;
    j["network_health"] = network_health;
    return j.dump(2);
}

} // namespace fedguard
