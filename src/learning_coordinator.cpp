/**
 * @file learning_coordinator.cpp
 * @brief Implementation of the distributed learning coordinator
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "fedguard/learning_coordinator.hpp"
#include "fedguard/errors.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace fedguard {

namespace {

CoordinatorConfig validated(const CoordinatorConfig& config) {
    std::string problem = config.validate();
    if (!problem.empty()) {
        throw std::invalid_argument("Invalid coordinator configuration: " + problem);
    }
    return config;
}

SignatureKeyPair create_signing_key() {
    if (!UpdateCrypto::initialize()) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
    return UpdateCrypto::generate_signature_keypair();
}

std::unique_ptr<TrustLedger> open_trust_ledger(const CoordinatorConfig& config, const std::string& coordinator_id) {
    if (config.trust_ledger_path.empty()) {
        return nullptr;
    }
    return std::make_unique<TrustLedger>(config.trust_ledger_path, coordinator_id);
}

} // anonymous namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

LearningCoordinator::LearningCoordinator(
    const CoordinatorConfig& config,
    std::shared_ptr<CoordinatorStore> store,
    std::shared_ptr<NoiseSource> noise,
    utilities::Clock clock,
    const std::string& coordinator_id
)
    : config_(validated(config))
    , signing_key_(create_signing_key())
    , coordinator_id_(coordinator_id.empty() ? "coordinator_" + UpdateCrypto::random_hex(8) : coordinator_id)
    , clock_(clock ? std::move(clock) : utilities::system_clock())
    , store_(store ? std::move(store) : std::make_shared<InMemoryCoordinatorStore>())
    , noise_(noise ? std::move(noise) : std::make_shared<GaussianNoiseSource>())
    , privacy_ledger_(config_.dp_sensitivity)
    , trust_ledger_(open_trust_ledger(config_, coordinator_id_))
    , registry_(*store_, config_, clock_)
    , rounds_(*store_, config_, clock_)
    , ingestion_(*store_, config_, privacy_ledger_, *noise_, signing_key_, clock_)
    , detector_(config_.proof_timestamp_tolerance)
    , aggregator_(config_, *noise_)
    , trust_updater_(*store_, trust_ledger_.get())
{
    if (!config_.log_file.empty()) {
        utilities::initialize_logging(config_.log_file, config_.log_level);
    } else {
        utilities::set_log_level(config_.log_level);
    }

    utilities::log_info("Learning coordinator " + coordinator_id_ + " initialized" +
                        (trust_ledger_ ? " with trust ledger " + config_.trust_ledger_path : ""));
}

LearningCoordinator::~LearningCoordinator() {
    utilities::log_debug("Learning coordinator " + coordinator_id_ + " shut down");
}

// ============================================================================
// Coordinator Operations
// ============================================================================

bool LearningCoordinator::register_agent(
    const std::string& agent_id,
    AgentRole role,
    const std::vector<std::string>& networks,
    double computational_capacity,
    const std::vector<std::string>& specialization,
    const std::optional<NetworkProfile>& network
) {
    return registry_.register_agent(agent_id, role, networks, computational_capacity, specialization, network);
}

LearningRound LearningCoordinator::create_learning_round(
    const std::string& model_id,
    LearningStrategy strategy,
    double target_accuracy,
    uint32_t max_iterations,
    double privacy_epsilon
) {
    try {
        return rounds_.create_round(
            coordinator_id_, model_id, strategy, target_accuracy, max_iterations, privacy_epsilon
        );
    } catch (const CoordinatorError& e) {
        utilities::log_error(std::string("Learning round creation failed: ") + e.what());
        throw;
    }
}

ModelUpdate LearningCoordinator::submit_model_update(
    const std::string& agent_id,
    const std::string& round_id,
    const ModelWeights& weights,
    double validation_score
) {
    try {
        return ingestion_.submit_update(agent_id, round_id, weights, validation_score);
    } catch (const CoordinatorError& e) {
        utilities::log_error("Model update from " + agent_id + " rejected: " + e.what());
        throw;
    }
}

void LearningCoordinator::roll_back(const std::string& round_id, const std::string& reason) {
    rounds_.set_phase(round_id, LearningPhase::ROLLBACK);
    utilities::log_warn("Round " + round_id + " rolled back: " + reason);
}

AggregationResult LearningCoordinator::aggregate_model_updates(const std::string& round_id) {
    auto started = std::chrono::steady_clock::now();
    uint64_t now = clock_();

    LearningRound round;
    std::vector<ModelUpdate> updates;

    bool found = store_->with_round(round_id, [&](LearningRound& current, std::vector<ModelUpdate>& submitted) {
        if (current.phase != LearningPhase::INITIALIZATION && current.phase != LearningPhase::TRAINING) {
            throw CoordinatorError(
                ErrorCode::ROUND_CLOSED,
                "round " + round_id + " is in phase " + learning_phase_to_string(current.phase)
            );
        }

        if (submitted.size() < config_.min_submitted_updates) {
            std::string message = "insufficient updates for aggregation of " + round_id + ": " +
                                  std::to_string(submitted.size()) + " submitted, " +
                                  std::to_string(config_.min_submitted_updates) + " required";
            if (now > current.deadline) {
                current.phase = LearningPhase::ROLLBACK;
                utilities::log_warn("Round " + round_id + " rolled back: deadline passed with " +
                                    std::to_string(submitted.size()) + " updates");
            }
            throw CoordinatorError(ErrorCode::INSUFFICIENT_PARTICIPANTS, message);
        }

        current.phase = LearningPhase::AGGREGATION;
        round = current;
        updates = submitted;
    });
    if (!found) {
        throw CoordinatorError(ErrorCode::NOT_FOUND, "unknown learning round " + round_id);
    }

    // The round is now in AGGREGATION; any failure from here rolls it back
    ByzantineDetectionResult detection;
    std::vector<ModelUpdate> valid_updates;
    AggregationResult result;
    try {
        // Detection
        std::map<std::string, Agent> agents;
        for (const auto& update : updates) {
            if (auto agent = store_->get_agent(update.agent_id)) {
                agents.emplace(update.agent_id, *agent);
            }
        }

        detection = detector_.detect(updates, round, agents, now);
        detection.detection_id = "detection_" + std::to_string(now) + "_" + UpdateCrypto::random_hex(4);
        store_->insert_detection(detection);

        for (const auto& update : updates) {
            if (!detection.is_suspected(update.agent_id)) {
                valid_updates.push_back(update);
            }
        }

        // Aggregation
        aggregator_.check_preconditions(round, detection, valid_updates.size());
        result = aggregator_.aggregate(valid_updates, round.strategy);
        rounds_.set_phase(round_id, LearningPhase::VALIDATION);

        result.aggregation_id = "agg_" + std::to_string(now) + "_" + UpdateCrypto::random_hex(4);
        result.round_id = round_id;
        result.byzantine_agents = detection.suspected_agents;
        result.metadata["total_updates_received"] = std::to_string(updates.size());
        result.metadata["valid_updates_used"] = std::to_string(valid_updates.size());
        result.metadata["byzantine_agents_filtered"] = std::to_string(detection.suspected_agents.size());
        result.computation_time = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started
        ).count();

        store_->insert_aggregation_result(result);
    } catch (const CoordinatorError& e) {
        roll_back(round_id, e.what());
        throw;
    } catch (const std::exception& e) {
        roll_back(round_id, std::string("aggregation failed: ") + e.what());
        throw;
    }

    rounds_.set_phase(round_id, LearningPhase::COMPLETION);

    completed_rounds_++;
    if (result.consensus_achieved) {
        successful_aggregations_++;
    }
    byzantine_detected_ += detection.suspected_agents.size();

    trust_updater_.apply(round_id, valid_updates, detection, now);

    utilities::log_info("Aggregation " + result.aggregation_id + " completed for " + round_id +
                        ": " + std::to_string(valid_updates.size()) + " updates, " +
                        std::to_string(detection.suspected_agents.size()) + " excluded, quality " +
                        utilities::format_double(result.quality_score) +
                        (result.consensus_achieved ? ", consensus achieved" : ", no consensus"));
    return result;
}

// ============================================================================
// Metrics
// ============================================================================

CoordinatorMetrics LearningCoordinator::get_coordinator_metrics() const {
    CoordinatorMetrics metrics;
    metrics.coordinator_id = coordinator_id_;

    auto agents = store_->list_agents();
    metrics.registered_agents = agents.size();

    metrics.active_learning_rounds = 0;
    for (const auto& round : store_->list_rounds()) {
        if (!round.is_finished()) {
            metrics.active_learning_rounds++;
        }
    }

    metrics.completed_rounds = completed_rounds_.load();
    metrics.successful_aggregations = successful_aggregations_.load();
    metrics.success_rate = static_cast<double>(metrics.successful_aggregations) /
                           static_cast<double>(std::max<size_t>(metrics.completed_rounds, 1));
    metrics.byzantine_detected_count = byzantine_detected_.load();
    metrics.total_model_updates = store_->update_count();

    metrics.average_trust = 0.0;
    metrics.privacy_budget_utilization = 0.0;
    metrics.network_health = 0.0;

    if (!agents.empty()) {
        double trust_total = 0.0;
        double remaining_budget = 0.0;
        for (const auto& agent : agents) {
            trust_total += agent.trust_score;
            remaining_budget += agent.privacy_budget;
        }

        double count = static_cast<double>(agents.size());
        metrics.average_trust = trust_total / count;

        double granted = count * config_.privacy_budget_total;
        if (granted > 0.0) {
            metrics.privacy_budget_utilization = (granted - remaining_budget) / granted;
        }

        double byzantine_ratio = std::min(static_cast<double>(metrics.byzantine_detected_count) / count, 0.5);
        metrics.network_health = metrics.average_trust * (1.0 - byzantine_ratio);
    }

    return metrics;
}

bool LearningCoordinator::verify_update_signature(const ModelUpdate& update) const {
    return UpdateIngestion::verify_signature(update, signing_key_.public_key);
}

// ============================================================================
// Accessors
// ============================================================================

std::optional<Agent> LearningCoordinator::get_agent(const std::string& agent_id) const {
    return registry_.get_agent(agent_id);
}

std::optional<LearningRound> LearningCoordinator::get_round(const std::string& round_id) const {
    return rounds_.get_round(round_id);
}

std::vector<ModelUpdate> LearningCoordinator::get_round_updates(const std::string& round_id) const {
    return store_->get_round_updates(round_id);
}

std::optional<AggregationResult> LearningCoordinator::get_aggregation_result(const std::string& aggregation_id) const {
    return store_->get_aggregation_result(aggregation_id);
}

std::vector<ByzantineDetectionResult> LearningCoordinator::get_detection_history() const {
    return store_->list_detections();
}

std::vector<PrivacyCharge> LearningCoordinator::get_privacy_history(const std::string& agent_id) const {
    return privacy_ledger_.history(agent_id);
}

} // namespace fedguard
