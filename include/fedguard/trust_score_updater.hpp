/**
 * @file trust_score_updater.hpp
 * @brief Post-round reputation adjustment
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "fedguard/coordinator_store.hpp"
#include "fedguard/learning_types.hpp"
#include "fedguard/trust_ledger.hpp"

#include <string>
#include <vector>

namespace fedguard {

/**
 * @brief One applied reputation change
 */
struct TrustAdjustment {
    std::string agent_id;
    std::string reason;         ///< "contribution" or "byzantine_detection"
    double trust_before;
    double trust_after;
    double byzantine_before;
    double byzantine_after;
};

/**
 * @brief TrustScoreUpdater - Rewards contributors and penalizes suspects
 *
 * Contributors: trust += 0.05 * validation_score.
 * Suspects: trust -= 0.2 * detection_confidence, byzantine += 0.1.
 * Both scores are clamped to [0, 1].
 */
class TrustScoreUpdater {
public:
    /**
     * @brief Construct updater
     * @param store Backing store (must outlive the updater)
     * @param ledger Optional audit ledger, nullptr to disable
     */
    TrustScoreUpdater(CoordinatorStore& store, TrustLedger* ledger = nullptr);

    /**
     * @brief Apply the adjustments of one aggregated round
     * @param round_id Round being settled
     * @param valid_updates Updates that contributed to the aggregate
     * @param detection Detection verdict of the round
     * @param timestamp Adjustment time
     * @return Adjustments in application order
     */
    std::vector<TrustAdjustment> apply(
        const std::string& round_id,
        const std::vector<ModelUpdate>& valid_updates,
        const ByzantineDetectionResult& detection,
        uint64_t timestamp
    );

    /// Trust after rewarding a contribution
    static double rewarded_trust(double trust, double validation_score);

    /// Trust after a detection penalty
    static double penalized_trust(double trust, double detection_confidence);

    /// Byzantine score after a detection penalty
    static double penalized_byzantine(double byzantine_score);

private:
    void record(const std::string& round_id, const TrustAdjustment& adjustment, uint64_t timestamp);

    CoordinatorStore& store_;
    TrustLedger* ledger_;
};

} // namespace fedguard
