/**
 * @file coordinator_demo.cpp
 * @brief Coordinator example - One Byzantine-robust round with a faulty agent
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates minimal coordinator usage:
 * - Register six participants
 * - Open a Byzantine-robust round
 * - Submit honest updates plus one poisoned update
 * - Aggregate and print the verdict and metrics
 */

#include "fedguard/errors.hpp"
#include "fedguard/learning_coordinator.hpp"

#include <iostream>
#include <string>

using namespace fedguard;

namespace {

ModelWeights make_weights(double base, double scale) {
    ModelWeights model;
    WeightVector dense;
    for (int i = 0; i < 8; i++) {
        dense.push_back((base + 0.01 * i) * scale);
    }
    model["dense"] = dense;
    model["bias"] = 0.05 * scale;
    return model;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CoordinatorConfig config = CoordinatorConfig::from_env();
    if (argc >= 2) {
        auto loaded = CoordinatorConfig::from_json_file(argv[1]);
        if (!loaded) {
            std::cerr << "Failed to load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
    }

    try {
        std::cout << "\n=== FedGuard Coordinator Example ===\n\n";

        LearningCoordinator coordinator(config);
        std::cout << "Coordinator: " << coordinator.get_coordinator_id() << "\n\n";

        // Register agents
        for (int i = 1; i <= 6; i++) {
            std::string agent_id = "agent_" + std::to_string(i);
            coordinator.register_agent(agent_id, AgentRole::PARTICIPANT, {"lab"}, 0.9, {"vision"});
        }

        // Open round
        LearningRound round = coordinator.create_learning_round("vision_model", LearningStrategy::BYZANTINE_ROBUST);
        std::cout << "Round " << round.round_id << " selected "
                  << round.participants.size() << " agents (tolerance "
                  << round.byzantine_tolerance << ")\n";

        // Submit updates; the last participant is poisoned
        for (size_t i = 0; i < round.participants.size(); i++) {
            const std::string& agent_id = round.participants[i];
            bool poisoned = i + 1 == round.participants.size();

            ModelWeights weights = make_weights(0.1 + 0.002 * static_cast<double>(i), poisoned ? 50.0 : 1.0);
            double score = poisoned ? 0.3 : 0.85 + 0.02 * static_cast<double>(i % 5);

            auto update = coordinator.submit_model_update(agent_id, round.round_id, weights, score);
            std::cout << "  " << agent_id << (poisoned ? " (poisoned)" : "")
                      << " -> " << update.update_id << "\n";
        }

        // Aggregate
        AggregationResult result = coordinator.aggregate_model_updates(round.round_id);

        std::cout << "\nAggregation result:\n" << result.to_json() << "\n";

        auto detections = coordinator.get_detection_history();
        if (!detections.empty()) {
            std::cout << "\nDetection verdict:\n" << detections.back().to_json() << "\n";
        }

        std::cout << "\nCoordinator metrics:\n" << coordinator.get_coordinator_metrics().to_json() << "\n\n";

    } catch (const CoordinatorError& e) {
        std::cerr << "Coordinator error (" << error_code_to_string(e.code()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
