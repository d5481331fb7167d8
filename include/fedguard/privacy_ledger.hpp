/**
 * @file privacy_ledger.hpp
 * @brief Per-agent differential privacy accounting
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Budgets are denominated in epsilon. Each differentially private
 * submission charges the round's epsilon against the agent's remaining
 * budget; the Gaussian noise scale (sensitivity / epsilon) is recorded
 * alongside but never subtracted.
 */

#pragma once

#include "fedguard/learning_types.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace fedguard {

/**
 * @brief One epsilon charge against an agent's budget
 */
struct PrivacyCharge {
    std::string agent_id;
    std::string round_id;
    std::string mechanism;      ///< "gaussian"
    double epsilon;             ///< Budget consumed
    double noise_scale;         ///< Standard deviation of the injected noise
    double remaining_budget;    ///< Agent budget after the charge
    uint64_t timestamp;
};

/**
 * @brief PrivacyLedger - Epsilon accountant for differentially private rounds
 *
 * Thread-safe for concurrent access. Callers mutate the Agent record under
 * the store's per-agent lock.
 */
class PrivacyLedger {
public:
    /**
     * @brief Construct ledger
     * @param sensitivity L2 sensitivity of a single update
     */
    explicit PrivacyLedger(double sensitivity);

    /**
     * @brief Gaussian noise scale for a given epsilon (sensitivity / epsilon)
     */
    double noise_scale(double epsilon) const;

    /**
     * @brief Check that an agent can afford a charge
     * @throws CoordinatorError INVALID_ARGUMENT if epsilon exceeds the remaining budget
     */
    void ensure_budget(const Agent& agent, double epsilon) const;

    /**
     * @brief Deduct epsilon from the agent and record the charge
     * @param agent Agent record (caller holds its lock)
     * @param round_id Round the charge belongs to
     * @param epsilon Budget consumed
     * @param timestamp Charge time
     * @return The recorded charge
     * @throws CoordinatorError INVALID_ARGUMENT if epsilon exceeds the remaining budget
     */
    PrivacyCharge charge(Agent& agent, const std::string& round_id, double epsilon, uint64_t timestamp);

    /**
     * @brief Charges of one agent, oldest first
     */
    std::vector<PrivacyCharge> history(const std::string& agent_id) const;

    /**
     * @brief Total epsilon charged to one agent
     */
    double total_spent(const std::string& agent_id) const;

    /**
     * @brief Total epsilon charged across all agents
     */
    double total_spent() const;

private:
    double sensitivity_;

    std::map<std::string, std::vector<PrivacyCharge>> charges_;
    mutable std::mutex mutex_;
};

} // namespace fedguard
