/**
 * @file test_model_weights.cpp
 * @brief Unit tests for layered model weights
 *
 * Tests weight handling including:
 * - Flattening and element counts
 * - Structure comparison and well-formedness
 * - Element-wise transform and combine
 * - Canonical JSON and hashing
 * - Vector geometry and summary statistics
 */

#include <gtest/gtest.h>
#include "fedguard/model_weights.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace fedguard;

// Test fixture for model weight tests
class ModelWeightsTest : public ::testing::Test {
protected:
    void SetUp() override {
        model_["bias"] = 0.5;
        model_["dense"] = WeightVector{1.0, 2.0, 3.0};
        model_["conv"] = WeightMatrix{{1.0, 2.0}, {3.0, 4.0}};
    }

    ModelWeights model_;
};

// ============================================================================
// Structure Tests
// ============================================================================

TEST_F(ModelWeightsTest, FlattenUsesLayerNameOrder) {
    auto flat = weights::flatten(model_);

    // bias, conv (row-major), dense
    std::vector<double> expected = {0.5, 1.0, 2.0, 3.0, 4.0, 1.0, 2.0, 3.0};
    EXPECT_EQ(flat, expected);
}

TEST_F(ModelWeightsTest, ElementCount) {
    EXPECT_EQ(weights::element_count(model_), 8);
    EXPECT_EQ(weights::element_count(ModelWeights()), 0);
}

TEST_F(ModelWeightsTest, SameStructureIgnoresValues) {
    ModelWeights other = weights::transform(model_, [](double v) { return v * 10.0; });
    EXPECT_TRUE(weights::same_structure(model_, other));
}

TEST_F(ModelWeightsTest, SameStructureDetectsDifferences) {
    ModelWeights renamed = model_;
    renamed.erase("bias");
    renamed["offset"] = 0.5;
    EXPECT_FALSE(weights::same_structure(model_, renamed));

    ModelWeights resized = model_;
    resized["dense"] = WeightVector{1.0, 2.0};
    EXPECT_FALSE(weights::same_structure(model_, resized));

    ModelWeights rekinded = model_;
    rekinded["bias"] = WeightVector{0.5};
    EXPECT_FALSE(weights::same_structure(model_, rekinded));
}

TEST_F(ModelWeightsTest, WellFormedRejectsNonFinite) {
    EXPECT_TRUE(weights::is_well_formed(model_));

    ModelWeights bad = model_;
    bad["bias"] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(weights::is_well_formed(bad));

    bad["bias"] = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(weights::is_well_formed(bad));
}

TEST_F(ModelWeightsTest, WellFormedRejectsRaggedMatrix) {
    ModelWeights ragged = model_;
    ragged["conv"] = WeightMatrix{{1.0, 2.0}, {3.0}};
    EXPECT_FALSE(weights::is_well_formed(ragged));
}

// ============================================================================
// Transform / Combine Tests
// ============================================================================

TEST_F(ModelWeightsTest, TransformAppliesToEveryLeaf) {
    auto doubled = weights::transform(model_, [](double v) { return 2.0 * v; });

    EXPECT_DOUBLE_EQ(std::get<double>(doubled["bias"]), 1.0);
    EXPECT_EQ(std::get<WeightVector>(doubled["dense"]), (WeightVector{2.0, 4.0, 6.0}));
    EXPECT_EQ(std::get<WeightMatrix>(doubled["conv"]), (WeightMatrix{{2.0, 4.0}, {6.0, 8.0}}));
}

TEST_F(ModelWeightsTest, CombineReducesColumns) {
    ModelWeights other = weights::transform(model_, [](double v) { return v + 2.0; });

    auto summed = weights::combine({&model_, &other}, [](const std::vector<double>& values) {
        double total = 0.0;
        for (double v : values) {
            total += v;
        }
        return total;
    });

    ASSERT_TRUE(summed.has_value());
    EXPECT_DOUBLE_EQ(std::get<double>((*summed)["bias"]), 3.0);
    EXPECT_EQ(std::get<WeightVector>((*summed)["dense"]), (WeightVector{4.0, 6.0, 8.0}));
    EXPECT_EQ(std::get<WeightMatrix>((*summed)["conv"]), (WeightMatrix{{4.0, 6.0}, {8.0, 10.0}}));
}

TEST_F(ModelWeightsTest, CombineRejectsMismatchedStructure) {
    ModelWeights other = model_;
    other["dense"] = WeightVector{1.0};

    auto reducer = [](const std::vector<double>& values) { return values.front(); };
    EXPECT_FALSE(weights::combine({&model_, &other}, reducer).has_value());
    EXPECT_FALSE(weights::combine({}, reducer).has_value());
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST_F(ModelWeightsTest, CanonicalJsonSortsLayers) {
    ModelWeights model;
    model["b"] = 1.0;
    model["a"] = WeightVector{2.0};

    EXPECT_EQ(weights::to_canonical_json(model), "{\"a\":[2.0],\"b\":1.0}");
}

TEST_F(ModelWeightsTest, FromJsonParsesAllKinds) {
    auto parsed = weights::from_json(weights::to_canonical_json(model_));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(weights::same_structure(*parsed, model_));
    EXPECT_EQ(weights::flatten(*parsed), weights::flatten(model_));
}

TEST_F(ModelWeightsTest, FromJsonRejectsInvalidDocuments) {
    EXPECT_FALSE(weights::from_json("not json").has_value());
    EXPECT_FALSE(weights::from_json("[1, 2, 3]").has_value());
    EXPECT_FALSE(weights::from_json("{\"layer\": \"text\"}").has_value());
    EXPECT_FALSE(weights::from_json("{\"layer\": [[1, 2], 3]}").has_value());
}

TEST_F(ModelWeightsTest, HashTracksContent) {
    std::string hash = weights::compute_hash(model_);
    EXPECT_EQ(hash.size(), 64);
    EXPECT_EQ(hash, weights::compute_hash(model_));

    ModelWeights changed = model_;
    changed["bias"] = 0.6;
    EXPECT_NE(hash, weights::compute_hash(changed));
}

// ============================================================================
// Geometry / Statistics Tests
// ============================================================================

TEST_F(ModelWeightsTest, CosineSimilarity) {
    EXPECT_NEAR(weights::cosine_similarity({1.0, 0.0}, {1.0, 0.0}), 1.0, 1e-12);
    EXPECT_NEAR(weights::cosine_similarity({1.0, 0.0}, {0.0, 1.0}), 0.0, 1e-12);
    EXPECT_NEAR(weights::cosine_similarity({1.0, 1.0}, {-1.0, -1.0}), -1.0, 1e-12);
}

TEST_F(ModelWeightsTest, CosineSimilarityDegenerateInputs) {
    EXPECT_DOUBLE_EQ(weights::cosine_similarity({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(weights::cosine_similarity({1.0}, {1.0, 2.0}), 0.0);
    EXPECT_DOUBLE_EQ(weights::cosine_similarity({0.0, 0.0}, {1.0, 2.0}), 0.0);
}

TEST_F(ModelWeightsTest, EuclideanDistanceAndNorm) {
    EXPECT_DOUBLE_EQ(weights::euclidean_distance({0.0, 0.0}, {3.0, 4.0}), 5.0);
    EXPECT_TRUE(std::isinf(weights::euclidean_distance({0.0}, {3.0, 4.0})));
    EXPECT_DOUBLE_EQ(weights::l2_norm({3.0, 4.0}), 5.0);
}

TEST_F(ModelWeightsTest, Statistics) {
    EXPECT_DOUBLE_EQ(stats::mean({1.0, 2.0, 3.0, 4.0}), 2.5);
    EXPECT_DOUBLE_EQ(stats::stddev({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}), 2.0);
    EXPECT_DOUBLE_EQ(stats::median({3.0, 1.0, 2.0}), 2.0);
    EXPECT_DOUBLE_EQ(stats::median({4.0, 1.0, 3.0, 2.0}), 2.5);

    EXPECT_DOUBLE_EQ(stats::mean({}), 0.0);
    EXPECT_DOUBLE_EQ(stats::stddev({}), 0.0);
    EXPECT_DOUBLE_EQ(stats::median({}), 0.0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
