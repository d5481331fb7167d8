/**
 * @file aggregator.cpp
 * @brief Implementation of aggregation strategies
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/aggregator.hpp"
#include "fedguard/errors.hpp"
#include "fedguard/utilities.hpp"

#include <algorithm>

namespace fedguard {

namespace {

std::vector<const ModelWeights*> weight_pointers(const std::vector<ModelUpdate>& updates) {
    std::vector<const ModelWeights*> models;
    models.reserve(updates.size());
    for (const auto& update : updates) {
        models.push_back(&update.weights);
    }
    return models;
}

std::string aggregation_method(LearningStrategy strategy) {
    switch (strategy) {
        case LearningStrategy::BYZANTINE_ROBUST:   return "byzantine_robust_median";
        case LearningStrategy::SECURE_AGGREGATION: return "secure_aggregation";
        default:                                   return "federated_averaging";
    }
}

} // anonymous namespace

Aggregator::Aggregator(const CoordinatorConfig& config, NoiseSource& noise)
    : config_(config)
    , noise_(noise)
{
}

// ============================================================================
// Preconditions
// ============================================================================

void Aggregator::check_preconditions(
    const LearningRound& round,
    const ByzantineDetectionResult& detection,
    size_t valid_updates
) const {
    if (detection.suspected_agents.size() > round.byzantine_tolerance) {
        throw CoordinatorError(
            ErrorCode::TOO_MANY_FAULTY_AGENTS,
            std::to_string(detection.suspected_agents.size()) + " suspected agents exceed tolerance " +
            std::to_string(round.byzantine_tolerance) + " for round " + round.round_id
        );
    }

    if (valid_updates < config_.min_valid_updates) {
        throw CoordinatorError(
            ErrorCode::INSUFFICIENT_PARTICIPANTS,
            "only " + std::to_string(valid_updates) + " valid updates remain for round " +
            round.round_id + ", " + std::to_string(config_.min_valid_updates) + " required"
        );
    }
}

// ============================================================================
// Strategies
// ============================================================================

std::optional<ModelWeights> Aggregator::federated_average(const std::vector<ModelUpdate>& updates) {
    if (updates.empty()) {
        return std::nullopt;
    }

    double total = 0.0;
    for (const auto& update : updates) {
        total += update.validation_score;
    }

    std::vector<double> coefficients;
    coefficients.reserve(updates.size());
    for (const auto& update : updates) {
        coefficients.push_back(total > 0.0
            ? update.validation_score / total
            : 1.0 / static_cast<double>(updates.size()));
    }

    // Accumulate offsets from the first update so identical inputs come back exactly
    return weights::combine(weight_pointers(updates), [&](const std::vector<double>& values) {
        double base = values.front();
        double offset = 0.0;
        for (size_t i = 0; i < values.size(); i++) {
            offset += coefficients[i] * (values[i] - base);
        }
        return base + offset;
    });
}

std::optional<ModelWeights> Aggregator::median(const std::vector<ModelUpdate>& updates) {
    if (updates.empty()) {
        return std::nullopt;
    }

    return weights::combine(weight_pointers(updates), [](const std::vector<double>& values) {
        return stats::median(values);
    });
}

double Aggregator::quality_score(const std::vector<ModelUpdate>& updates) {
    if (updates.empty()) {
        return 0.0;
    }

    std::vector<double> scores;
    std::vector<std::vector<double>> flattened;
    for (const auto& update : updates) {
        scores.push_back(update.validation_score);
        flattened.push_back(weights::flatten(update.weights));
    }

    std::vector<double> similarities;
    for (size_t i = 0; i < flattened.size(); i++) {
        for (size_t j = i + 1; j < flattened.size(); j++) {
            similarities.push_back(weights::cosine_similarity(flattened[i], flattened[j]));
        }
    }
    double similarity = similarities.empty() ? 0.5 : stats::mean(similarities);

    return std::clamp(0.6 * stats::mean(scores) + 0.4 * similarity, 0.0, 1.0);
}

// ============================================================================
// Aggregation
// ============================================================================

AggregationResult Aggregator::aggregate(const std::vector<ModelUpdate>& valid_updates, LearningStrategy strategy) {
    if (valid_updates.size() < config_.min_valid_updates) {
        throw CoordinatorError(
            ErrorCode::INSUFFICIENT_PARTICIPANTS,
            "at least " + std::to_string(config_.min_valid_updates) + " valid updates required, got " +
            std::to_string(valid_updates.size())
        );
    }

    std::optional<ModelWeights> combined;
    switch (strategy) {
        case LearningStrategy::BYZANTINE_ROBUST:
            combined = median(valid_updates);
            break;
        case LearningStrategy::SECURE_AGGREGATION:
            combined = federated_average(valid_updates);
            if (combined) {
                double scale = config_.secure_aggregation_noise;
                combined = weights::transform(*combined, [&](double value) {
                    return value + noise_.gaussian(scale);
                });
            }
            break;
        default:
            combined = federated_average(valid_updates);
            break;
    }

    if (!combined) {
        throw CoordinatorError(ErrorCode::INVALID_ARGUMENT, "model updates have mismatched weight structures");
    }

    AggregationResult result;
    result.aggregated_weights = std::move(*combined);
    result.strategy = strategy;
    result.privacy_loss = 0.0;
    double epsilon_spent = 0.0;
    for (const auto& update : valid_updates) {
        result.participating_updates.push_back(update.update_id);
        result.privacy_loss += update.differential_noise;
        epsilon_spent += update.epsilon_spent;
    }
    result.quality_score = quality_score(valid_updates);
    result.consensus_achieved = result.quality_score >= config_.consensus_threshold;
    result.computation_time = 0.0;
    result.metadata["aggregation_method"] = aggregation_method(strategy);
    result.metadata["epsilon_spent"] = utilities::format_double(epsilon_spent, 6);

    utilities::log_debug("Aggregated " + std::to_string(valid_updates.size()) + " updates with " +
                         aggregation_method(strategy) + ", quality " +
                         utilities::format_double(result.quality_score));
    return result;
}

} // namespace fedguard
