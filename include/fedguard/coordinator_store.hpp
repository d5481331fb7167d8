/**
 * @file coordinator_store.hpp
 * @brief Storage of agents, rounds, updates and verdicts
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Components receive the store by reference instead of sharing global
 * registries. Mutation goes through per-key callbacks so each agent record
 * and each round (with its update collection) has a single writer at a time.
 *
 * Lock order: an agent callback may enter a round callback, never the reverse.
 */

#pragma once

#include "fedguard/learning_types.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fedguard {

/**
 * @brief CoordinatorStore - Abstract state store for the coordinator
 */
class CoordinatorStore {
public:
    using AgentMutator = std::function<void(Agent&)>;
    using RoundMutator = std::function<void(LearningRound&, std::vector<ModelUpdate>&)>;

    virtual ~CoordinatorStore() = default;

    // ========================================================================
    // Agents
    // ========================================================================

    /**
     * @brief Insert a new agent
     * @return false if an agent with the same ID exists
     */
    virtual bool insert_agent(const Agent& agent) = 0;

    virtual std::optional<Agent> get_agent(const std::string& agent_id) const = 0;

    /**
     * @brief Mutate one agent under its exclusive lock
     * @return false if the agent is unknown (mutator not called)
     */
    virtual bool with_agent(const std::string& agent_id, const AgentMutator& mutator) = 0;

    /**
     * @brief Snapshot of all agents, ordered by ID
     */
    virtual std::vector<Agent> list_agents() const = 0;

    virtual size_t agent_count() const = 0;

    // ========================================================================
    // Rounds and their updates
    // ========================================================================

    /**
     * @brief Insert a new round with an empty update collection
     * @return false if a round with the same ID exists
     */
    virtual bool insert_round(const LearningRound& round) = 0;

    virtual std::optional<LearningRound> get_round(const std::string& round_id) const = 0;

    /**
     * @brief Mutate a round and its update collection under the round's lock
     * @return false if the round is unknown (mutator not called)
     */
    virtual bool with_round(const std::string& round_id, const RoundMutator& mutator) = 0;

    /**
     * @brief Snapshot of all rounds, ordered by ID
     */
    virtual std::vector<LearningRound> list_rounds() const = 0;

    /**
     * @brief Updates of a round in submission order (empty if unknown)
     */
    virtual std::vector<ModelUpdate> get_round_updates(const std::string& round_id) const = 0;

    virtual size_t update_count() const = 0;

    // ========================================================================
    // Verdicts
    // ========================================================================

    virtual void insert_detection(const ByzantineDetectionResult& detection) = 0;

    virtual std::vector<ByzantineDetectionResult> list_detections() const = 0;

    virtual void insert_aggregation_result(const AggregationResult& result) = 0;

    virtual std::optional<AggregationResult> get_aggregation_result(const std::string& aggregation_id) const = 0;
};

/**
 * @brief InMemoryCoordinatorStore - Process-local store
 *
 * Collection maps are guarded by short-lived mutexes; each agent and each
 * round owns its own mutex held for the duration of a mutator call.
 *
 * Thread-safe for concurrent access
 */
class InMemoryCoordinatorStore : public CoordinatorStore {
public:
    InMemoryCoordinatorStore() = default;
    ~InMemoryCoordinatorStore() override = default;

    // Disable copy and move
    InMemoryCoordinatorStore(const InMemoryCoordinatorStore&) = delete;
    InMemoryCoordinatorStore& operator=(const InMemoryCoordinatorStore&) = delete;

    bool insert_agent(const Agent& agent) override;
    std::optional<Agent> get_agent(const std::string& agent_id) const override;
    bool with_agent(const std::string& agent_id, const AgentMutator& mutator) override;
    std::vector<Agent> list_agents() const override;
    size_t agent_count() const override;

    bool insert_round(const LearningRound& round) override;
    std::optional<LearningRound> get_round(const std::string& round_id) const override;
    bool with_round(const std::string& round_id, const RoundMutator& mutator) override;
    std::vector<LearningRound> list_rounds() const override;
    std::vector<ModelUpdate> get_round_updates(const std::string& round_id) const override;
    size_t update_count() const override;

    void insert_detection(const ByzantineDetectionResult& detection) override;
    std::vector<ByzantineDetectionResult> list_detections() const override;
    void insert_aggregation_result(const AggregationResult& result) override;
    std::optional<AggregationResult> get_aggregation_result(const std::string& aggregation_id) const override;

private:
    struct AgentSlot {
        Agent agent;
        mutable std::mutex mutex;
    };

    struct RoundSlot {
        LearningRound round;
        std::vector<ModelUpdate> updates;
        mutable std::mutex mutex;
    };

    std::shared_ptr<AgentSlot> find_agent_slot(const std::string& agent_id) const;
    std::shared_ptr<RoundSlot> find_round_slot(const std::string& round_id) const;

    /// Agent slots by ID
    std::map<std::string, std::shared_ptr<AgentSlot>> agents_;
    mutable std::mutex agents_mutex_;

    /// Round slots by ID
    std::map<std::string, std::shared_ptr<RoundSlot>> rounds_;
    mutable std::mutex rounds_mutex_;

    /// Total updates across rounds
    std::atomic<size_t> update_count_{0};

    std::vector<ByzantineDetectionResult> detections_;
    std::map<std::string, AggregationResult> aggregation_results_;
    mutable std::mutex verdicts_mutex_;
};

} // namespace fedguard
