/**
 * @file privacy_ledger.cpp
 * @brief Implementation of differential privacy accounting
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/privacy_ledger.hpp"
#include "fedguard/errors.hpp"
#include "fedguard/utilities.hpp"

#include <algorithm>

namespace fedguard {

namespace {

/// Absorbs rounding when a budget is spent down exactly
constexpr double BUDGET_EPSILON = 1e-9;

} // anonymous namespace

PrivacyLedger::PrivacyLedger(double sensitivity)
    : sensitivity_(sensitivity)
{
}

double PrivacyLedger::noise_scale(double epsilon) const {
    if (epsilon <= 0.0) {
        return 0.0;
    }
    return sensitivity_ / epsilon;
}

void PrivacyLedger::ensure_budget(const Agent& agent, double epsilon) const {
    if (epsilon > agent.privacy_budget + BUDGET_EPSILON) {
        throw CoordinatorError(
            ErrorCode::INVALID_ARGUMENT,
            "privacy budget exhausted for " + agent.agent_id + ": requested epsilon " +
            utilities::format_double(epsilon) + ", remaining " +
            utilities::format_double(agent.privacy_budget)
        );
    }
}

PrivacyCharge PrivacyLedger::charge(
    Agent& agent,
    const std::string& round_id,
    double epsilon,
    uint64_t timestamp
) {
    ensure_budget(agent, epsilon);

    agent.privacy_budget = std::max(0.0, agent.privacy_budget - epsilon);

    PrivacyCharge entry;
    entry.agent_id = agent.agent_id;
    entry.round_id = round_id;
    entry.mechanism = "gaussian";
    entry.epsilon = epsilon;
    entry.noise_scale = noise_scale(epsilon);
    entry.remaining_budget = agent.privacy_budget;
    entry.timestamp = timestamp;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        charges_[agent.agent_id].push_back(entry);
    }

    utilities::log_debug("Privacy charge for " + agent.agent_id + " in " + round_id +
                         ": epsilon " + utilities::format_double(epsilon) +
                         ", remaining " + utilities::format_double(agent.privacy_budget));
    return entry;
}

std::vector<PrivacyCharge> PrivacyLedger::history(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = charges_.find(agent_id);
    if (it == charges_.end()) {
        return {};
    }
    return it->second;
}

double PrivacyLedger::total_spent(const std::string& agent_id) const {
    double total = 0.0;
    for (const auto& entry : history(agent_id)) {
        total += entry.epsilon;
    }
    return total;
}

double PrivacyLedger::total_spent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double total = 0.0;
    for (const auto& agent_charges : charges_) {
        for (const auto& entry : agent_charges.second) {
            total += entry.epsilon;
        }
    }
    return total;
}

} // namespace fedguard
