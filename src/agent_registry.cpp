/**
 * @file agent_registry.cpp
 * @brief Implementation of agent registration
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/agent_registry.hpp"

#include <cmath>

namespace fedguard {

AgentRegistry::AgentRegistry(
    CoordinatorStore& store,
    const CoordinatorConfig& config,
    utilities::Clock clock
)
    : store_(store)
    , config_(config)
    , clock_(std::move(clock))
{
}

bool AgentRegistry::register_agent(
    const std::string& agent_id,
    AgentRole role,
    const std::vector<std::string>& networks,
    double computational_capacity,
    const std::vector<std::string>& specialization,
    const std::optional<NetworkProfile>& network
) {
    if (!config::validate_identifier(agent_id)) {
        utilities::log_warn("Agent registration rejected: invalid agent ID '" + agent_id + "'");
        return false;
    }

    // Also rejects NaN
    if (!(computational_capacity >= 0.0 && computational_capacity <= 1.0)) {
        utilities::log_warn("Agent registration rejected for " + agent_id +
                            ": computational capacity " +
                            utilities::format_double(computational_capacity) +
                            " outside [0, 1]");
        return false;
    }

    if (networks.empty()) {
        utilities::log_warn("Agent registration rejected for " + agent_id + ": no network affiliations");
        return false;
    }

    Agent agent;
    agent.agent_id = agent_id;
    agent.role = role;
    agent.networks = networks;
    agent.specialization = specialization.empty()
        ? std::vector<std::string>{"general"}
        : specialization;
    agent.computational_capacity = computational_capacity;
    agent.trust_score = config_.initial_trust_score;
    agent.byzantine_score = 0.0;
    agent.privacy_budget = config_.privacy_budget_total;
    agent.last_contribution = 0;
    agent.total_contributions = 0;
    agent.network = network.value_or(
        NetworkProfile{config_.default_latency_ms, config_.default_bandwidth_mbps}
    );
    agent.registered_at = clock_();

    if (!store_.insert_agent(agent)) {
        utilities::log_warn("Agent registration rejected: " + agent_id + " already registered");
        return false;
    }

    utilities::log_info("Registered agent " + agent_id + " (" + agent_role_to_string(role) +
                        ", capacity " + utilities::format_double(computational_capacity, 2) +
                        ", networks: " + utilities::join_strings(networks, ",") + ")");
    return true;
}

std::optional<Agent> AgentRegistry::get_agent(const std::string& agent_id) const {
    return store_.get_agent(agent_id);
}

std::vector<Agent> AgentRegistry::list_agents() const {
    return store_.list_agents();
}

size_t AgentRegistry::agent_count() const {
    return store_.agent_count();
}

} // namespace fedguard
