/**
 * @file agent_registry.hpp
 * @brief Registration and lookup of learning agents
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
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
 * @brief AgentRegistry - Owns the set of known agents
 *
 * Agents are created once and never removed. Reputation fields are changed
 * afterwards only by update ingestion and the trust score updater, through
 * the store's per-agent lock.
 *
 * Thread-safe for concurrent access
 */
class AgentRegistry {
public:
    /**
     * @brief Construct registry over a store
     * @param store Backing store (must outlive the registry)
     * @param config Coordinator configuration (copied)
     * @param clock Time source for registration timestamps
     */
    AgentRegistry(CoordinatorStore& store, const CoordinatorConfig& config, utilities::Clock clock);

    /**
     * @brief Register a new agent
     *
     * Rejected (logged, returns false) when the ID is malformed or already
     * registered, capacity is outside [0, 1], or networks is empty.
     *
     * @param agent_id Unique agent identifier
     * @param role Role in the learning network
     * @param networks Network affiliations (non-empty)
     * @param computational_capacity Capacity in [0, 1]
     * @param specialization Free-form specialization tags ("general" if empty)
     * @param network Simulated network profile, defaults from config if omitted
     * @return true if registered
     */
    bool register_agent(
        const std::string& agent_id,
        AgentRole role,
        const std::vector<std::string>& networks,
        double computational_capacity,
        const std::vector<std::string>& specialization,
        const std::optional<NetworkProfile>& network = std::nullopt
    );

    std::optional<Agent> get_agent(const std::string& agent_id) const;

    /**
     * @brief All agents, ordered by ID
     */
    std::vector<Agent> list_agents() const;

    size_t agent_count() const;

private:
    CoordinatorStore& store_;
    CoordinatorConfig config_;
    utilities::Clock clock_;
};

} // namespace fedguard
