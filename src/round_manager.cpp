/**
 * @file round_manager.cpp
 * @brief Implementation of round creation and participant selection
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/round_manager.hpp"
#include "fedguard/errors.hpp"
#include "fedguard/model_weights.hpp"
#include "fedguard/update_crypto.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace fedguard {

RoundManager::RoundManager(
    CoordinatorStore& store,
    const CoordinatorConfig& config,
    utilities::Clock clock
)
    : store_(store)
    , config_(config)
    , clock_(std::move(clock))
{
}

// ============================================================================
// Selection
// ============================================================================

bool RoundManager::is_eligible(const Agent& agent) const {
    if (agent.role != AgentRole::PARTICIPANT && agent.role != AgentRole::VALIDATOR) {
        return false;
    }
    return agent.privacy_budget > config_.min_privacy_budget &&
           agent.trust_score > config_.min_trust_score;
}

double RoundManager::selection_score(const Agent& agent) {
    double history = agent.performance_history.empty()
        ? 0.5
        : stats::mean(agent.performance_history);

    return 0.3 * agent.trust_score +
           0.3 * agent.computational_capacity +
           0.2 * (1.0 - agent.byzantine_score) +
           0.1 * (1.0 / (1.0 + agent.network.latency_ms)) +
           0.1 * history;
}

size_t RoundManager::participant_cap(LearningStrategy strategy) {
    switch (strategy) {
        case LearningStrategy::FEDERATED_AVERAGING:  return 10;
        case LearningStrategy::SECURE_AGGREGATION:   return 8;
        case LearningStrategy::BYZANTINE_ROBUST:     return 15;
        case LearningStrategy::DIFFERENTIAL_PRIVATE: return 12;
        default:                                     return 10;
    }
}

size_t RoundManager::byzantine_tolerance(size_t participant_count, double threshold) {
    auto by_threshold = static_cast<size_t>(std::floor(static_cast<double>(participant_count) * threshold));
    return std::min(by_threshold, participant_count / 3);
}

std::vector<std::string> RoundManager::select_participants(LearningStrategy strategy) const {
    std::vector<std::pair<double, std::string>> ranked;
    for (const auto& agent : store_.list_agents()) {
        if (is_eligible(agent)) {
            ranked.emplace_back(selection_score(agent), agent.agent_id);
        }
    }

    // Highest score first, ties by agent ID
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second < b.second;
    });

    size_t count = std::min(participant_cap(strategy), ranked.size());

    std::vector<std::string> selected;
    selected.reserve(count);
    for (size_t i = 0; i < count; i++) {
        selected.push_back(ranked[i].second);
    }
    return selected;
}

// ============================================================================
// Round Creation
// ============================================================================

LearningRound RoundManager::create_round(
    const std::string& coordinator_id,
    const std::string& model_id,
    LearningStrategy strategy,
    double target_accuracy,
    uint32_t max_iterations,
    double privacy_epsilon
) {
    if (!config::validate_identifier(model_id)) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "invalid model ID '" + model_id + "'");
    }
    if (!(target_accuracy >= 0.0 && target_accuracy <= 1.0)) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "target accuracy must be in [0, 1]");
    }
    if (max_iterations == 0) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "max iterations must be positive");
    }
    if (!(privacy_epsilon > 0.0) || !std::isfinite(privacy_epsilon)) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "privacy epsilon must be positive and finite");
    }

    auto participants = select_participants(strategy);
    if (participants.size() < config_.min_round_participants) {
        throw CoordinatorError(
            ErrorCode::INSUFFICIENT_PARTICIPANTS,
            "at least " + std::to_string(config_.min_round_participants) +
            " eligible agents required, found " + std::to_string(participants.size())
        );
    }

    uint64_t now = clock_();

    LearningRound round;
    round.round_id = "round_" + std::to_string(now) + "_" + UpdateCrypto::random_hex(6);
    round.model_id = model_id;
    round.coordinator_id = coordinator_id;
    round.strategy = strategy;
    round.participants = std::move(participants);
    round.target_accuracy = target_accuracy;
    round.max_iterations = max_iterations;
    round.privacy_epsilon = privacy_epsilon;
    round.byzantine_tolerance = byzantine_tolerance(
        round.participants.size(), config_.byzantine_tolerance_threshold
    );
    round.start_time = now;
    round.deadline = now + static_cast<uint64_t>(config_.round_duration.count());
    round.phase = LearningPhase::INITIALIZATION;
    round.metadata["selected_agents"] = std::to_string(round.participants.size());
    round.metadata["byzantine_tolerance"] = std::to_string(round.byzantine_tolerance);
    round.metadata["privacy_budget_allocated"] = utilities::format_double(privacy_epsilon, 6);

    if (!store_.insert_round(round)) {
        // Random suffix collision
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "duplicate round ID " + round.round_id);
    }

    utilities::log_info("Created learning round " + round.round_id + " (" +
                        learning_strategy_to_string(strategy) + ") with " +
                        std::to_string(round.participants.size()) + " agents, tolerance " +
                        std::to_string(round.byzantine_tolerance));
    return round;
}

// ============================================================================
// Lifecycle
// ============================================================================

std::optional<LearningRound> RoundManager::get_round(const std::string& round_id) const {
    return store_.get_round(round_id);
}

std::vector<LearningRound> RoundManager::list_rounds() const {
    return store_.list_rounds();
}

bool RoundManager::set_phase(const std::string& round_id, LearningPhase phase) {
    LearningPhase previous = phase;
    bool found = store_.with_round(round_id, [&](LearningRound& round, std::vector<ModelUpdate>&) {
        previous = round.phase;
        round.phase = phase;
    });

    if (found && previous != phase) {
        utilities::log_debug("Round " + round_id + ": " + learning_phase_to_string(previous) +
                             " -> " + learning_phase_to_string(phase));
    }
    return found;
}

} // namespace fedguard
