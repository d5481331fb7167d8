/**
 * @file coordinator_store.cpp
 * @brief Implementation of the in-memory coordinator store
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/coordinator_store.hpp"

namespace fedguard {

// ============================================================================
// Slot Lookup
// ============================================================================

std::shared_ptr<InMemoryCoordinatorStore::AgentSlot>
InMemoryCoordinatorStore::find_agent_slot(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    auto it = agents_.find(agent_id);
    return it == agents_.end() ? nullptr : it->second;
}

std::shared_ptr<InMemoryCoordinatorStore::RoundSlot>
InMemoryCoordinatorStore::find_round_slot(const std::string& round_id) const {
    std::lock_guard<std::mutex> lock(rounds_mutex_);
    auto it = rounds_.find(round_id);
    return it == rounds_.end() ? nullptr : it->second;
}

// ============================================================================
// Agents
// ============================================================================

bool InMemoryCoordinatorStore::insert_agent(const Agent& agent) {
    auto slot = std::make_shared<AgentSlot>();
    slot->agent = agent;

    std::lock_guard<std::mutex> lock(agents_mutex_);
    return agents_.emplace(agent.agent_id, std::move(slot)).second;
}

std::optional<Agent> InMemoryCoordinatorStore::get_agent(const std::string& agent_id) const {
    auto slot = find_agent_slot(agent_id);
    if (!slot) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->agent;
}

bool InMemoryCoordinatorStore::with_agent(const std::string& agent_id, const AgentMutator& mutator) {
    auto slot = find_agent_slot(agent_id);
    if (!slot) {
        return false;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    mutator(slot->agent);
    return true;
}

std::vector<Agent> InMemoryCoordinatorStore::list_agents() const {
    std::vector<std::shared_ptr<AgentSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(agents_mutex_);
        slots.reserve(agents_.size());
        for (const auto& entry : agents_) {
            slots.push_back(entry.second);
        }
    }

    std::vector<Agent> agents;
    agents.reserve(slots.size());
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        agents.push_back(slot->agent);
    }
    return agents;
}

size_t InMemoryCoordinatorStore::agent_count() const {
    std::lock_guard<std::mutex> lock(agents_mutex_);
    return agents_.size();
}

// ============================================================================
// Rounds
// ============================================================================

bool InMemoryCoordinatorStore::insert_round(const LearningRound& round) {
    auto slot = std::make_shared<RoundSlot>();
    slot->round = round;

    std::lock_guard<std::mutex> lock(rounds_mutex_);
    return rounds_.emplace(round.round_id, std::move(slot)).second;
}

std::optional<LearningRound> InMemoryCoordinatorStore::get_round(const std::string& round_id) const {
    auto slot = find_round_slot(round_id);
    if (!slot) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->round;
}

bool InMemoryCoordinatorStore::with_round(const std::string& round_id, const RoundMutator& mutator) {
    auto slot = find_round_slot(round_id);
    if (!slot) {
        return false;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    size_t before = slot->updates.size();
    try {
        mutator(slot->round, slot->updates);
    } catch (...) {
        if (slot->updates.size() > before) {
            update_count_ += slot->updates.size() - before;
        }
        throw;
    }
    if (slot->updates.size() > before) {
        update_count_ += slot->updates.size() - before;
    }
    return true;
}

std::vector<LearningRound> InMemoryCoordinatorStore::list_rounds() const {
    std::vector<std::shared_ptr<RoundSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(rounds_mutex_);
        slots.reserve(rounds_.size());
        for (const auto& entry : rounds_) {
            slots.push_back(entry.second);
        }
    }

    std::vector<LearningRound> rounds;
    rounds.reserve(slots.size());
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        rounds.push_back(slot->round);
    }
    return rounds;
}

std::vector<ModelUpdate> InMemoryCoordinatorStore::get_round_updates(const std::string& round_id) const {
    auto slot = find_round_slot(round_id);
    if (!slot) {
        return {};
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->updates;
}

size_t InMemoryCoordinatorStore::update_count() const {
    return update_count_.load();
}

// ============================================================================
// Verdicts
// ============================================================================

void InMemoryCoordinatorStore::insert_detection(const ByzantineDetectionResult& detection) {
    std::lock_guard<std::mutex> lock(verdicts_mutex_);
    detections_.push_back(detection);
}

std::vector<ByzantineDetectionResult> InMemoryCoordinatorStore::list_detections() const {
    std::lock_guard<std::mutex> lock(verdicts_mutex_);
    return detections_;
}

void InMemoryCoordinatorStore::insert_aggregation_result(const AggregationResult& result) {
    std::lock_guard<std::mutex> lock(verdicts_mutex_);
    aggregation_results_[result.aggregation_id] = result;
}

std::optional<AggregationResult> InMemoryCoordinatorStore::get_aggregation_result(
    const std::string& aggregation_id
) const {
    std::lock_guard<std::mutex> lock(verdicts_mutex_);
    auto it = aggregation_results_.find(aggregation_id);
    if (it == aggregation_results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace fedguard
