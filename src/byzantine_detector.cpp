/**
 * @file byzantine_detector.cpp
 * @brief Implementation of the Byzantine detection ensemble
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/byzantine_detector.hpp"
#include "fedguard/computation_proof.hpp"
#include "fedguard/model_weights.hpp"
#include "fedguard/utilities.hpp"

#include <algorithm>
#include <cmath>

namespace fedguard {

namespace signals {

// ============================================================================
// Score Helpers
// ============================================================================

std::vector<double> weight_features(const std::vector<double>& values) {
    if (values.empty()) {
        return std::vector<double>(10, 0.0);
    }

    double n = static_cast<double>(values.size());
    double mean = stats::mean(values);
    auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());

    double variance = 0.0;
    double positive = 0.0;
    double near_zero = 0.0;
    for (double value : values) {
        variance += (value - mean) * (value - mean);
        if (value > 0.0) {
            positive += 1.0;
        }
        if (std::fabs(value) < 0.01) {
            near_zero += 1.0;
        }
    }

    std::vector<double> features = {
        mean,
        *max_it - *min_it,
        variance / n,
        positive / n,
        near_zero / n
    };

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    for (double q : {0.25, 0.5, 0.75, 0.9, 0.95}) {
        auto index = static_cast<size_t>(q * n);
        features.push_back(sorted[std::min(index, sorted.size() - 1)]);
    }

    return features;
}

double cross_validation_score(double reported, const std::vector<double>& history) {
    double score = history.empty()
        ? reported
        : 0.7 * reported + 0.3 * stats::mean(history);
    return std::clamp(score, 0.0, 1.0);
}

double temporal_consistency_score(const std::vector<double>& history) {
    if (history.size() < 2) {
        return 0.8;
    }

    size_t window = std::min<size_t>(history.size(), 5);
    std::vector<double> recent(history.end() - static_cast<std::ptrdiff_t>(window), history.end());

    double mean = stats::mean(recent);
    if (mean <= 0.0) {
        return 0.5;
    }
    return std::max(0.0, 1.0 - stats::stddev(recent) / mean);
}

// ============================================================================
// Signals
// ============================================================================

SignalResult validation_outlier(const DetectionContext& ctx) {
    std::vector<double> scores;
    for (const auto& update : ctx.updates) {
        scores.push_back(update.validation_score);
    }

    double mean = stats::mean(scores);
    double stddev = stats::stddev(scores);

    SignalResult result;
    for (const auto& update : ctx.updates) {
        if (std::fabs(update.validation_score - mean) > 2.0 * stddev) {
            result[update.agent_id] = {0.3, "validation_score_outlier"};
        }
    }
    return result;
}

SignalResult weight_similarity(const DetectionContext& ctx) {
    SignalResult result;
    if (ctx.updates.size() < 2) {
        return result;
    }

    for (size_t i = 0; i < ctx.updates.size(); i++) {
        double total = 0.0;
        for (size_t j = 0; j < ctx.updates.size(); j++) {
            if (i != j) {
                total += weights::cosine_similarity(ctx.flattened[i], ctx.flattened[j]);
            }
        }
        double similarity = total / static_cast<double>(ctx.updates.size() - 1);
        if (similarity < 0.5) {
            result[ctx.updates[i].agent_id] = {0.4, "low_weight_similarity"};
        }
    }
    return result;
}

SignalResult cluster_outlier(const DetectionContext& ctx) {
    SignalResult result;
    size_t count = ctx.updates.size();
    if (count < 3) {
        return result;
    }

    std::vector<std::vector<double>> features;
    features.reserve(count);
    for (const auto& flat : ctx.flattened) {
        features.push_back(weight_features(flat));
    }

    // Average over all points, self included
    std::vector<double> avg_distances;
    for (size_t i = 0; i < count; i++) {
        double total = 0.0;
        for (size_t j = 0; j < count; j++) {
            total += weights::euclidean_distance(features[i], features[j]);
        }
        avg_distances.push_back(total / static_cast<double>(count));
    }

    double mean = stats::mean(avg_distances);
    double stddev = stats::stddev(avg_distances);

    for (size_t i = 0; i < count; i++) {
        if (avg_distances[i] > mean + 2.0 * stddev) {
            result[ctx.updates[i].agent_id] = {0.3, "cluster_outlier_cluster_1"};
        }
    }
    return result;
}

SignalResult gradient_norm(const DetectionContext& ctx) {
    SignalResult result;
    if (ctx.updates.size() < 2) {
        return result;
    }

    std::vector<double> norms;
    for (const auto& flat : ctx.flattened) {
        norms.push_back(weights::l2_norm(flat));
    }

    double mean = stats::mean(norms);
    double stddev = stats::stddev(norms);
    if (stddev <= 0.0) {
        return result;
    }

    for (size_t i = 0; i < norms.size(); i++) {
        double z_score = (norms[i] - mean) / stddev;
        if (std::fabs(z_score) > 2.5) {
            result[ctx.updates[i].agent_id] = {
                0.25, "anomalous_gradient_norm_" + utilities::format_double(z_score, 2)
            };
        }
    }
    return result;
}

SignalResult historical_reputation(const DetectionContext& ctx) {
    SignalResult result;
    for (const auto& update : ctx.updates) {
        auto it = ctx.agents.find(update.agent_id);
        if (it != ctx.agents.end() && it->second.byzantine_score > 0.5) {
            result[update.agent_id] = {0.2, "poor_historical_reputation"};
        }
    }
    return result;
}

SignalResult computation_proof(const DetectionContext& ctx) {
    // Proof timestamps are checked against the round submission window
    uint64_t window_end = std::min(ctx.now, ctx.round.deadline);
    uint64_t window_start = std::min(ctx.round.start_time, window_end);

    SignalResult result;
    for (const auto& update : ctx.updates) {
        auto validation = ComputationProof::validate(update, window_start, window_end, ctx.proof_tolerance);
        if (!validation.valid) {
            result[update.agent_id] = {0.5, "invalid_computation_proof: " + validation.reason};
        }
    }
    return result;
}

SignalResult cross_validation(const DetectionContext& ctx) {
    SignalResult result;
    for (const auto& update : ctx.updates) {
        auto it = ctx.agents.find(update.agent_id);
        double cv_score = it == ctx.agents.end()
            ? 0.5
            : cross_validation_score(update.validation_score, it->second.performance_history);

        if (cv_score < 0.6) {
            result[update.agent_id] = {
                0.35, "poor_cv_performance_" + utilities::format_double(cv_score, 2)
            };
        }
    }
    return result;
}

SignalResult temporal_consistency(const DetectionContext& ctx) {
    SignalResult result;
    for (const auto& update : ctx.updates) {
        auto it = ctx.agents.find(update.agent_id);
        double consistency = it == ctx.agents.end()
            ? 0.8
            : temporal_consistency_score(it->second.performance_history);

        if (consistency < 0.4) {
            result[update.agent_id] = {
                0.2, "temporal_inconsistency_" + utilities::format_double(consistency, 2)
            };
        }
    }
    return result;
}

SignalResult model_divergence(const DetectionContext& ctx) {
    SignalResult result;
    if (ctx.updates.size() < 2) {
        return result;
    }

    size_t dimension = ctx.flattened.front().size();
    for (const auto& flat : ctx.flattened) {
        if (flat.size() != dimension) {
            return result;
        }
    }
    if (dimension == 0) {
        return result;
    }

    std::vector<double> ensemble(dimension, 0.0);
    for (const auto& flat : ctx.flattened) {
        for (size_t k = 0; k < dimension; k++) {
            ensemble[k] += flat[k];
        }
    }
    for (double& value : ensemble) {
        value /= static_cast<double>(ctx.flattened.size());
    }

    for (size_t i = 0; i < ctx.updates.size(); i++) {
        double divergence = weights::euclidean_distance(ctx.flattened[i], ensemble) /
                            static_cast<double>(dimension);
        if (divergence > 0.5) {
            result[ctx.updates[i].agent_id] = {
                0.3, "model_divergence_" + utilities::format_double(divergence, 3)
            };
        }
    }
    return result;
}

} // namespace signals

// ============================================================================
// ByzantineDetector
// ============================================================================

ByzantineDetector::ByzantineDetector(std::chrono::seconds proof_tolerance)
    : proof_tolerance_(proof_tolerance)
{
}

const std::vector<std::pair<std::string, DetectionSignal>>& ByzantineDetector::default_signals() {
    static const std::vector<std::pair<std::string, DetectionSignal>> pipeline = {
        {"validation_outlier", signals::validation_outlier},
        {"weight_similarity", signals::weight_similarity},
        {"cluster_outlier", signals::cluster_outlier},
        {"gradient_norm", signals::gradient_norm},
        {"historical_reputation", signals::historical_reputation},
        {"computation_proof", signals::computation_proof},
        {"cross_validation", signals::cross_validation},
        {"temporal_consistency", signals::temporal_consistency},
        {"model_divergence", signals::model_divergence}
    };
    return pipeline;
}

double ByzantineDetector::adaptive_threshold(const std::vector<double>& scores, const LearningRound& round) {
    double cap = 1.0 - round.tolerance_fraction();
    if (scores.empty()) {
        return std::min(0.7, cap);
    }

    double mean = stats::mean(scores);
    double stddev = stats::stddev(scores);

    double threshold;
    switch (round.strategy) {
        case LearningStrategy::BYZANTINE_ROBUST:
            threshold = std::max(0.5, mean + 0.5 * stddev);
            break;
        case LearningStrategy::DIFFERENTIAL_PRIVATE:
            threshold = std::max(0.8, mean + 1.5 * stddev);
            break;
        default:
            threshold = std::max(0.7, mean + stddev);
            break;
    }

    return std::min(threshold, cap);
}

std::vector<std::string> ByzantineDetector::select_suspects(
    const std::map<std::string, double>& scores,
    double threshold,
    size_t max_suspects
) {
    std::vector<std::pair<double, std::string>> flagged;
    for (const auto& [agent_id, score] : scores) {
        if (score >= threshold) {
            flagged.emplace_back(score, agent_id);
        }
    }

    std::sort(flagged.begin(), flagged.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second < b.second;
    });

    if (flagged.size() > max_suspects) {
        flagged.resize(max_suspects);
    }

    std::vector<std::string> suspects;
    for (const auto& entry : flagged) {
        suspects.push_back(entry.second);
    }
    return suspects;
}

ByzantineDetectionResult ByzantineDetector::detect(
    const std::vector<ModelUpdate>& updates,
    const LearningRound& round,
    const std::map<std::string, Agent>& agents,
    uint64_t now
) const {
    DetectionContext ctx{updates, round, agents, {}, now, proof_tolerance_};
    ctx.flattened.reserve(updates.size());
    for (const auto& update : updates) {
        ctx.flattened.push_back(weights::flatten(update.weights));
    }

    ByzantineDetectionResult result;
    result.round_id = round.round_id;
    result.detection_method = "multi_method_ensemble";
    result.timestamp = now;

    for (const auto& update : updates) {
        result.scores[update.agent_id] = 0.0;
    }

    for (const auto& [name, signal] : default_signals()) {
        for (const auto& [agent_id, contribution] : signal(ctx)) {
            result.scores[agent_id] += contribution.score;
            result.evidence[agent_id].push_back(contribution.evidence);
        }
    }

    std::vector<double> all_scores;
    double confidence = 0.0;
    for (const auto& entry : result.scores) {
        all_scores.push_back(entry.second);
        confidence = std::max(confidence, entry.second);
    }

    result.threshold = adaptive_threshold(all_scores, round);
    result.suspected_agents = select_suspects(result.scores, result.threshold, round.byzantine_tolerance);
    result.detection_confidence = confidence;
    result.recommended_action = result.suspected_agents.empty() ? "proceed" : "exclude_from_aggregation";

    utilities::log_info("Byzantine detection for " + round.round_id + ": " +
                        std::to_string(result.suspected_agents.size()) + " suspect(s) among " +
                        std::to_string(updates.size()) + " updates, threshold " +
                        utilities::format_double(result.threshold) + ", confidence " +
                        utilities::format_double(confidence));
    for (const auto& agent_id : result.suspected_agents) {
        utilities::log_warn("Suspected Byzantine agent " + agent_id + " in " + round.round_id +
                            ": " + utilities::join_strings(result.evidence[agent_id], ", "));
    }

    return result;
}

} // namespace fedguard
