/**
 * @file byzantine_detector.hpp
 * @brief Multi-method ensemble detection of faulty or malicious updates
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Detection runs a fixed pipeline of independent signals over a round's
 * updates. Each signal is a pure function that returns, per agent it fires
 * for, an additive suspicion contribution and an evidence tag. Scores are
 * summed and compared against an adaptive threshold:
 *
 *   byzantine_robust:      max(0.5, mean + 0.5 stddev)
 *   differential_private:  max(0.8, mean + 1.5 stddev)
 *   other strategies:      max(0.7, mean + stddev)
 *
 * capped at 1 - tolerance_fraction. Agents at or above the threshold are
 * suspects; at most byzantine_tolerance of them are kept, highest score
 * first with ties broken by agent ID.
 */

#pragma once

#include "fedguard/learning_types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace fedguard {

/**
 * @brief Suspicion added by one signal for one agent
 */
struct SignalContribution {
    double score;
    std::string evidence;
};

/**
 * @brief Inputs shared by all detection signals
 */
struct DetectionContext {
    const std::vector<ModelUpdate>& updates;
    const LearningRound& round;
    const std::map<std::string, Agent>& agents;     ///< Agent snapshots by ID
    std::vector<std::vector<double>> flattened;     ///< Flattened weights, parallel to updates
    uint64_t now;
    std::chrono::seconds proof_tolerance;
};

/// Contributions keyed by agent ID; agents the signal does not fire for are absent
using SignalResult = std::map<std::string, SignalContribution>;

using DetectionSignal = std::function<SignalResult(const DetectionContext&)>;

namespace signals {

/// |validation score - mean| > 2 stddev: +0.3
SignalResult validation_outlier(const DetectionContext& ctx);

/// Mean cosine similarity to the other updates < 0.5: +0.4
SignalResult weight_similarity(const DetectionContext& ctx);

/// Average feature-space distance > mean + 2 stddev (3+ updates): +0.3
SignalResult cluster_outlier(const DetectionContext& ctx);

/// |z-score| of the weight L2 norm > 2.5 (2+ updates): +0.25
SignalResult gradient_norm(const DetectionContext& ctx);

/// Stored Byzantine score > 0.5: +0.2
SignalResult historical_reputation(const DetectionContext& ctx);

/// Computation proof fails validation: +0.5
SignalResult computation_proof(const DetectionContext& ctx);

/// 0.7 reported + 0.3 historical average < 0.6: +0.35
SignalResult cross_validation(const DetectionContext& ctx);

/// Consistency of the last 5 historical scores < 0.4: +0.2
SignalResult temporal_consistency(const DetectionContext& ctx);

/// L2 distance to the ensemble mean / dimension > 0.5: +0.3
SignalResult model_divergence(const DetectionContext& ctx);

/**
 * @brief Ten summary statistics of a flattened weight vector
 *
 * mean, range, variance, positive ratio, near-zero ratio (|x| < 0.01),
 * then the values at sorted index floor(q n) for q = 0.25, 0.5, 0.75, 0.9, 0.95.
 */
std::vector<double> weight_features(const std::vector<double>& values);

/**
 * @brief Cross-validation estimate for an agent
 * @return clamp(0.7 reported + 0.3 mean(history)), reported alone if history is empty
 */
double cross_validation_score(double reported, const std::vector<double>& history);

/**
 * @brief Consistency of recent performance
 * @return 0.8 with fewer than 2 entries, 0.5 for non-positive mean,
 *         otherwise max(0, 1 - stddev / mean) over the last 5 entries
 */
double temporal_consistency_score(const std::vector<double>& history);

} // namespace signals

/**
 * @brief ByzantineDetector - Runs the signal ensemble and selects suspects
 *
 * Stateless apart from configuration; detect() never throws for well-formed
 * input and returns an empty suspect list when there is nothing to judge.
 */
class ByzantineDetector {
public:
    /**
     * @brief Construct detector
     * @param proof_tolerance Allowed age of a computation proof timestamp
     */
    explicit ByzantineDetector(std::chrono::seconds proof_tolerance);

    /**
     * @brief Judge the updates of a round
     * @param updates Updates of the round (one per agent)
     * @param round The round
     * @param agents Snapshots of the submitting agents by ID
     * @param now Current Unix time
     * @return Detection verdict (detection_id is left empty)
     */
    ByzantineDetectionResult detect(
        const std::vector<ModelUpdate>& updates,
        const LearningRound& round,
        const std::map<std::string, Agent>& agents,
        uint64_t now
    ) const;

    /**
     * @brief Adaptive threshold for a set of suspicion scores
     */
    static double adaptive_threshold(const std::vector<double>& scores, const LearningRound& round);

    /**
     * @brief Agents at or above threshold, truncated to max_suspects
     *
     * Returned highest score first, ties by agent ID.
     */
    static std::vector<std::string> select_suspects(
        const std::map<std::string, double>& scores,
        double threshold,
        size_t max_suspects
    );

    /**
     * @brief The signal pipeline, in evaluation order
     */
    static const std::vector<std::pair<std::string, DetectionSignal>>& default_signals();

private:
    std::chrono::seconds proof_tolerance_;
};

} // namespace fedguard
