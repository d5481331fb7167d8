/**
 * @file aggregator.hpp
 * @brief Combination of surviving model updates into one model
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "fedguard/coordinator_config.hpp"
#include "fedguard/learning_types.hpp"
#include "fedguard/noise_source.hpp"

#include <optional>
#include <vector>

namespace fedguard {

/**
 * @brief Aggregator - Strategy-driven element-wise aggregation
 *
 * Federated averaging weights each update by validation_score / sum of
 * scores (uniform when the sum is zero). Byzantine-robust aggregation takes
 * the element-wise median. Secure aggregation adds Gaussian masking noise
 * to the federated average. Remaining strategies use federated averaging.
 *
 * Thread-safe if the noise source is.
 */
class Aggregator {
public:
    /**
     * @brief Construct aggregator
     * @param config Coordinator configuration (copied)
     * @param noise Noise source for secure aggregation (must outlive the aggregator)
     */
    Aggregator(const CoordinatorConfig& config, NoiseSource& noise);

    /**
     * @brief Refuse aggregation that would violate round guarantees
     * @param round The round being aggregated
     * @param detection Detection verdict for the round
     * @param valid_updates Number of updates surviving detection
     * @throws CoordinatorError TOO_MANY_FAULTY_AGENTS if suspects exceed the
     *         round's tolerance, INSUFFICIENT_PARTICIPANTS if too few updates survive
     */
    void check_preconditions(
        const LearningRound& round,
        const ByzantineDetectionResult& detection,
        size_t valid_updates
    ) const;

    /**
     * @brief Aggregate valid updates
     *
     * Fills aggregated_weights, participating_updates, strategy,
     * quality_score, privacy_loss, consensus_achieved and the
     * aggregation_method / epsilon_spent metadata.
     *
     * @throws CoordinatorError INSUFFICIENT_PARTICIPANTS with fewer than the
     *         minimum valid updates, INVALID_ARGUMENT if structures differ
     */
    AggregationResult aggregate(const std::vector<ModelUpdate>& valid_updates, LearningStrategy strategy);

    /**
     * @brief Validation-score weighted mean
     * @return std::nullopt if the list is empty or structures differ
     */
    static std::optional<ModelWeights> federated_average(const std::vector<ModelUpdate>& updates);

    /**
     * @brief Element-wise median
     * @return std::nullopt if the list is empty or structures differ
     */
    static std::optional<ModelWeights> median(const std::vector<ModelUpdate>& updates);

    /**
     * @brief 0.6 mean(validation scores) + 0.4 mean(pairwise cosine), clamped to [0, 1]
     *
     * The cosine term is 0.5 when there are no pairs.
     */
    static double quality_score(const std::vector<ModelUpdate>& updates);

private:
    CoordinatorConfig config_;
    NoiseSource& noise_;
};

} // namespace fedguard
