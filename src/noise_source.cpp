/**
 * @file noise_source.cpp
 * @brief Implementation of Gaussian noise sources
 *
 * FedGuard - Byzantine-tolerant distributed learning coordinator
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "fedguard/noise_source.hpp"

namespace fedguard {

GaussianNoiseSource::GaussianNoiseSource(std::optional<uint64_t> seed)
    : generator_(seed ? *seed : std::random_device{}())
{
}

double GaussianNoiseSource::gaussian(double stddev) {
    if (stddev <= 0.0) {
        return 0.0;
    }

    std::normal_distribution<double> distribution(0.0, stddev);
    std::lock_guard<std::mutex> lock(mutex_);
    return distribution(generator_);
}

} // namespace fedguard
