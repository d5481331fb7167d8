/**
 * @file round_manager.hpp
 * @brief Learning round creation, participant selection and phase tracking
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Eligible agents (participants or validators with budget and trust above
 * the configured floors) are ranked by a composite score:
 *
 *   0.3 trust + 0.3 capacity + 0.2 (1 - byzantine) + 0.1 / (1 + latency_ms)
 *   + 0.1 mean(performance history, 0.5 if empty)
 *
 * and the top K are selected, K capped per strategy.
 */

#pragma once

#include "fedguard/coordinator_config.hpp"
#include "fedguard/coordinator_store.hpp"
#include "fedguard/learning_types.hpp"
#include "fedguard/utilities.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fedguard {

/**
 * @brief RoundManager - Creates learning rounds and tracks their lifecycle
 *
 * Thread-safe for concurrent access
 */
class RoundManager {
public:
    /**
     * @brief Construct round manager
     * @param store Backing store (must outlive the manager)
     * @param config Coordinator configuration (copied)
     * @param clock Time source for start times and deadlines
     */
    RoundManager(CoordinatorStore& store, const CoordinatorConfig& config, utilities::Clock clock);

    /**
     * @brief Create a round and select its participants
     *
     * @param coordinator_id Owning coordinator
     * @param model_id Model being trained (identifier rules apply)
     * @param strategy Aggregation strategy
     * @param target_accuracy Target accuracy in [0, 1]
     * @param max_iterations Iteration limit (> 0)
     * @param privacy_epsilon Privacy parameter (> 0)
     * @return The stored round, phase INITIALIZATION
     * @throws CoordinatorError INVALID_ARGUMENT on malformed parameters,
     *         INSUFFICIENT_PARTICIPANTS if fewer eligible agents than the minimum
     */
    LearningRound create_round(
        const std::string& coordinator_id,
        const std::string& model_id,
        LearningStrategy strategy,
        double target_accuracy,
        uint32_t max_iterations,
        double privacy_epsilon
    );

    std::optional<LearningRound> get_round(const std::string& round_id) const;

    std::vector<LearningRound> list_rounds() const;

    /**
     * @brief Move a round to a new phase
     * @return false if the round is unknown
     */
    bool set_phase(const std::string& round_id, LearningPhase phase);

    /**
     * @brief Check whether an agent passes the selection filter
     */
    bool is_eligible(const Agent& agent) const;

    /**
     * @brief Composite selection score of an agent
     */
    static double selection_score(const Agent& agent);

    /**
     * @brief Maximum participants selected for a strategy
     */
    static size_t participant_cap(LearningStrategy strategy);

    /**
     * @brief Byzantine tolerance for a round of n participants
     * @return min(floor(n * threshold), floor(n / 3))
     */
    static size_t byzantine_tolerance(size_t participant_count, double threshold);

private:
    std::vector<std::string> select_participants(LearningStrategy strategy) const;

    CoordinatorStore& store_;
    CoordinatorConfig config_;
    utilities::Clock clock_;
};

} // namespace fedguard
