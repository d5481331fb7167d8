/**
 * @file model_weights.cpp
 * @brief Implementation of layered weight tensor operations
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "fedguard/model_weights.hpp"
#include "fedguard/update_crypto.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace fedguard {
namespace weights {

namespace {

// Overload helper for std::visit
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

json tensor_to_json(const WeightTensor& tensor) {
    return std::visit(overloaded{
        [](double value) { return json(value); },
        [](const WeightVector& vec) { return json(vec); },
        [](const WeightMatrix& mat) { return json(mat); }
    }, tensor);
}

std::optional<WeightTensor> tensor_from_json(const json& j) {
    if (j.is_number()) {
        return WeightTensor(j.get<double>());
    }

    if (!j.is_array()) {
        return std::nullopt;
    }

    // Empty arrays and arrays of numbers are vectors
    bool all_numbers = std::all_of(j.begin(), j.end(),
        [](const json& e) { return e.is_number(); });
    if (all_numbers) {
        return WeightTensor(j.get<WeightVector>());
    }

    WeightMatrix matrix;
    matrix.reserve(j.size());
    for (const auto& row : j) {
        if (!row.is_array()) {
            return std::nullopt;
        }
        WeightVector values;
        values.reserve(row.size());
        for (const auto& e : row) {
            if (!e.is_number()) {
                return std::nullopt;
            }
            values.push_back(e.get<double>());
        }
        matrix.push_back(std::move(values));
    }
    return WeightTensor(std::move(matrix));
}

bool same_tensor_shape(const WeightTensor& a, const WeightTensor& b) {
    if (a.index() != b.index()) {
        return false;
    }
    if (const auto* va = std::get_if<WeightVector>(&a)) {
        return va->size() == std::get<WeightVector>(b).size();
    }
    if (const auto* ma = std::get_if<WeightMatrix>(&a)) {
        const auto& mb = std::get<WeightMatrix>(b);
        if (ma->size() != mb.size()) {
            return false;
        }
        for (size_t i = 0; i < ma->size(); ++i) {
            if ((*ma)[i].size() != mb[i].size()) {
                return false;
            }
        }
    }
    return true;
}

} // namespace

// ============================================================================
// Structure
// ============================================================================

std::vector<double> flatten(const ModelWeights& model) {
    std::vector<double> flat;
    flat.reserve(element_count(model));

    for (const auto& [name, tensor] : model) {
        std::visit(overloaded{
            [&flat](double value) { flat.push_back(value); },
            [&flat](const WeightVector& vec) { flat.insert(flat.end(), vec.begin(), vec.end()); },
            [&flat](const WeightMatrix& mat) {
                for (const auto& row : mat) {
                    flat.insert(flat.end(), row.begin(), row.end());
                }
            }
        }, tensor);
    }

    return flat;
}

size_t element_count(const ModelWeights& model) {
    size_t count = 0;
    for (const auto& [name, tensor] : model) {
        count += std::visit(overloaded{
            [](double) -> size_t { return 1; },
            [](const WeightVector& vec) -> size_t { return vec.size(); },
            [](const WeightMatrix& mat) -> size_t {
                size_t n = 0;
                for (const auto& row : mat) {
                    n += row.size();
                }
                return n;
            }
        }, tensor);
    }
    return count;
}

bool same_structure(const ModelWeights& a, const ModelWeights& b) {
    if (a.size() != b.size()) {
        return false;
    }

    auto it_a = a.begin();
    auto it_b = b.begin();
    for (; it_a != a.end(); ++it_a, ++it_b) {
        if (it_a->first != it_b->first || !same_tensor_shape(it_a->second, it_b->second)) {
            return false;
        }
    }
    return true;
}

bool is_well_formed(const ModelWeights& model) {
    for (const auto& [name, tensor] : model) {
        if (const auto* mat = std::get_if<WeightMatrix>(&tensor)) {
            for (const auto& row : *mat) {
                if (row.size() != mat->front().size()) {
                    return false;
                }
            }
        }
    }

    auto flat = flatten(model);
    return std::all_of(flat.begin(), flat.end(), [](double v) { return std::isfinite(v); });
}

ModelWeights transform(const ModelWeights& model, const std::function<double(double)>& fn) {
    ModelWeights result;

    for (const auto& [name, tensor] : model) {
        result[name] = std::visit(overloaded{
            [&fn](double value) { return WeightTensor(fn(value)); },
            [&fn](const WeightVector& vec) {
                WeightVector out;
                out.reserve(vec.size());
                for (double v : vec) {
                    out.push_back(fn(v));
                }
                return WeightTensor(std::move(out));
            },
            [&fn](const WeightMatrix& mat) {
                WeightMatrix out;
                out.reserve(mat.size());
                for (const auto& row : mat) {
                    WeightVector out_row;
                    out_row.reserve(row.size());
                    for (double v : row) {
                        out_row.push_back(fn(v));
                    }
                    out.push_back(std::move(out_row));
                }
                return WeightTensor(std::move(out));
            }
        }, tensor);
    }

    return result;
}

std::optional<ModelWeights> combine(
    const std::vector<const ModelWeights*>& models,
    const std::function<double(const std::vector<double>&)>& reducer
) {
    if (models.empty() || models.front() == nullptr) {
        return std::nullopt;
    }

    const ModelWeights& first = *models.front();
    for (const auto* model : models) {
        if (model == nullptr || !same_structure(first, *model)) {
            return std::nullopt;
        }
    }

    ModelWeights result;
    std::vector<double> column(models.size());

    for (const auto& [name, tensor] : first) {
        if (std::holds_alternative<double>(tensor)) {
            for (size_t k = 0; k < models.size(); ++k) {
                column[k] = std::get<double>(models[k]->at(name));
            }
            result[name] = reducer(column);

        } else if (const auto* vec = std::get_if<WeightVector>(&tensor)) {
            WeightVector out(vec->size());
            for (size_t i = 0; i < vec->size(); ++i) {
                for (size_t k = 0; k < models.size(); ++k) {
                    column[k] = std::get<WeightVector>(models[k]->at(name))[i];
                }
                out[i] = reducer(column);
            }
            result[name] = std::move(out);

        } else {
            const auto& mat = std::get<WeightMatrix>(tensor);
            WeightMatrix out(mat.size());
            for (size_t i = 0; i < mat.size(); ++i) {
                out[i].resize(mat[i].size());
                for (size_t j = 0; j < mat[i].size(); ++j) {
                    for (size_t k = 0; k < models.size(); ++k) {
                        column[k] = std::get<WeightMatrix>(models[k]->at(name))[i][j];
                    }
                    out[i][j] = reducer(column);
                }
            }
            result[name] = std::move(out);
        }
    }

    return result;
}

// ============================================================================
// Serialization
// ============================================================================

std::string to_canonical_json(const ModelWeights& model) {
    json j = json::object();
    for (const auto& [name, tensor] : model) {
        j[name] = tensor_to_json(tensor);
    }
    return j.dump();
}

std::optional<ModelWeights> from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        ModelWeights model;
        for (auto it = j.begin(); it != j.end(); ++it) {
            auto tensor = tensor_from_json(it.value());
            if (!tensor) {
                return std::nullopt;
            }
            model[it.key()] = std::move(*tensor);
        }
        return model;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string compute_hash(const ModelWeights& model) {
    return UpdateCrypto::sha256_hex(to_canonical_json(model));
}

// ============================================================================
// Geometry
// ============================================================================

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

double euclidean_distance(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        return std::numeric_limits<double>::infinity();
    }

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double d = a[i] - b[i];
        sum += d * d;
    }
    return std::sqrt(sum);
}

double l2_norm(const std::vector<double>& values) {
    double sum = 0.0;
    for (double v : values) {
        sum += v * v;
    }
    return std::sqrt(sum);
}

} // namespace weights

namespace stats {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

double stddev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - m) * (v - m);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    size_t n = values.size();
    if (n % 2 == 1) {
        return values[n / 2];
    }
    return (values[n / 2 - 1] + values[n / 2]) / 2.0;
}

} // namespace stats

} // namespace fedguard
