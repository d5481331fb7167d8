/**
 * @file model_weights.hpp
 * @brief Layered weight tensors exchanged in model updates
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * A model is a set of named layers. Each layer is a scalar, a vector or a
 * matrix of doubles. Layers are kept ordered by name so flattening, hashing
 * and aggregation are deterministic.
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fedguard {

using WeightVector = std::vector<double>;
using WeightMatrix = std::vector<std::vector<double>>;

/**
 * @brief One layer of a model: Scalar | Vector | Matrix
 */
using WeightTensor = std::variant<double, WeightVector, WeightMatrix>;

/**
 * @brief Named layers, ordered by layer name
 */
using ModelWeights = std::map<std::string, WeightTensor>;

namespace weights {

/**
 * @brief Flatten all layers into one vector (layer name order, row-major)
 */
std::vector<double> flatten(const ModelWeights& model);

/**
 * @brief Total number of scalar leaves
 */
size_t element_count(const ModelWeights& model);

/**
 * @brief Check that two models have identical layer names, kinds and dimensions
 */
bool same_structure(const ModelWeights& a, const ModelWeights& b);

/**
 * @brief Check that every leaf is finite and every matrix is rectangular
 */
bool is_well_formed(const ModelWeights& model);

/**
 * @brief Apply a function to every scalar leaf
 * @param model Input model
 * @param fn Function mapping old leaf value to new value
 * @return New model with the same structure
 */
ModelWeights transform(const ModelWeights& model, const std::function<double(double)>& fn);

/**
 * @brief Combine models element-wise
 *
 * For each leaf position of the first model, the reducer receives the values
 * at that position across all models, in input order. All models must share
 * the first model's structure.
 *
 * @param models Non-empty list of models with identical structure
 * @param reducer Function producing the combined leaf value
 * @return Combined model, or std::nullopt if the list is empty or structures differ
 */
std::optional<ModelWeights> combine(
    const std::vector<const ModelWeights*>& models,
    const std::function<double(const std::vector<double>&)>& reducer
);

/**
 * @brief Canonical JSON serialization (layer names sorted, compact)
 */
std::string to_canonical_json(const ModelWeights& model);

/**
 * @brief Parse weights from JSON (object of number / array / array of arrays)
 * @return Model or std::nullopt if the document is not a valid weight structure
 */
std::optional<ModelWeights> from_json(const std::string& json_str);

/**
 * @brief SHA-256 hex digest of the canonical serialization
 */
std::string compute_hash(const ModelWeights& model);

// ============================================================================
// Vector geometry over flattened weights
// ============================================================================

/**
 * @brief Cosine similarity; 0 when lengths differ, are empty, or a norm is zero
 */
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

/**
 * @brief Euclidean distance; +infinity when lengths differ
 */
double euclidean_distance(const std::vector<double>& a, const std::vector<double>& b);

/**
 * @brief L2 norm
 */
double l2_norm(const std::vector<double>& values);

} // namespace weights

namespace stats {

/// Arithmetic mean (0 for empty input)
double mean(const std::vector<double>& values);

/// Population standard deviation (0 for empty input)
double stddev(const std::vector<double>& values);

/// Median; the mean of the two middle values for even counts (0 for empty input)
double median(std::vector<double> values);

} // namespace stats

} // namespace fedguard
