/**
 * @file trust_score_updater.cpp
 * @brief Implementation of post-round reputation adjustment
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/trust_score_updater.hpp"
#include "fedguard/utilities.hpp"

#include <algorithm>

namespace fedguard {

TrustScoreUpdater::TrustScoreUpdater(CoordinatorStore& store, TrustLedger* ledger)
    : store_(store)
    , ledger_(ledger)
{
}

double TrustScoreUpdater::rewarded_trust(double trust, double validation_score) {
    return std::clamp(trust + 0.05 * validation_score, 0.0, 1.0);
}

double TrustScoreUpdater::penalized_trust(double trust, double detection_confidence) {
    return std::clamp(trust - 0.2 * detection_confidence, 0.0, 1.0);
}

double TrustScoreUpdater::penalized_byzantine(double byzantine_score) {
    return std::clamp(byzantine_score + 0.1, 0.0, 1.0);
}

std::vector<TrustAdjustment> TrustScoreUpdater::apply(
    const std::string& round_id,
    const std::vector<ModelUpdate>& valid_updates,
    const ByzantineDetectionResult& detection,
    uint64_t timestamp
) {
    std::vector<TrustAdjustment> adjustments;

    for (const auto& update : valid_updates) {
        TrustAdjustment adjustment;
        bool found = store_.with_agent(update.agent_id, [&](Agent& agent) {
            adjustment = {agent.agent_id, "contribution",
                          agent.trust_score, rewarded_trust(agent.trust_score, update.validation_score),
                          agent.byzantine_score, agent.byzantine_score};
            agent.trust_score = adjustment.trust_after;
        });
        if (found) {
            adjustments.push_back(adjustment);
        }
    }

    for (const auto& agent_id : detection.suspected_agents) {
        TrustAdjustment adjustment;
        bool found = store_.with_agent(agent_id, [&](Agent& agent) {
            adjustment = {agent.agent_id, "byzantine_detection",
                          agent.trust_score, penalized_trust(agent.trust_score, detection.detection_confidence),
                          agent.byzantine_score, penalized_byzantine(agent.byzantine_score)};
            agent.trust_score = adjustment.trust_after;
            agent.byzantine_score = adjustment.byzantine_after;
        });
        if (found) {
            adjustments.push_back(adjustment);
        }
    }

    for (const auto& adjustment : adjustments) {
        record(round_id, adjustment, timestamp);
    }

    return adjustments;
}

void TrustScoreUpdater::record(const std::string& round_id, const TrustAdjustment& adjustment, uint64_t timestamp) {
    utilities::log_debug("Trust " + adjustment.agent_id + " (" + adjustment.reason + "): " +
                         utilities::format_double(adjustment.trust_before) + " -> " +
                         utilities::format_double(adjustment.trust_after) + ", byzantine " +
                         utilities::format_double(adjustment.byzantine_after));

    if (!ledger_) {
        return;
    }

    bool recorded = ledger_->record_adjustment(
        adjustment.agent_id,
        round_id,
        adjustment.trust_before,
        adjustment.trust_after,
        adjustment.byzantine_after,
        adjustment.reason,
        timestamp
    );
    if (!recorded) {
        utilities::log_error("Failed to record trust adjustment for " + adjustment.agent_id +
                             " in trust ledger");
    }
}

} // namespace fedguard
