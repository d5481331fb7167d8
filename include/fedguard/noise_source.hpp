/**
 * @file noise_source.hpp
 * @brief Injectable Gaussian noise for privacy and secure aggregation
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

namespace fedguard {

/**
 * @brief Source of zero-mean Gaussian samples
 *
 * Implementations must be safe to call from multiple threads.
 */
class NoiseSource {
public:
    virtual ~NoiseSource() = default;

    /**
     * @brief Draw one sample from N(0, stddev^2)
     * @param stddev Standard deviation (0 yields 0)
     */
    virtual double gaussian(double stddev) = 0;
};

/**
 * @brief Pseudo-random Gaussian noise (std::mt19937_64)
 */
class GaussianNoiseSource : public NoiseSource {
public:
    /**
     * @brief Construct noise source
     * @param seed Fixed seed for reproducible runs, std::nullopt for a random seed
     */
    explicit GaussianNoiseSource(std::optional<uint64_t> seed = std::nullopt);

    double gaussian(double stddev) override;

private:
    std::mt19937_64 generator_;
    std::mutex mutex_;
};

/**
 * @brief Noise source that always returns 0
 */
class ZeroNoiseSource : public NoiseSource {
public:
    double gaussian(double) override { return 0.0; }
};

} // namespace fedguard
