// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file robust_stats.hpp
 * @brief Median/MAD location-scale estimation for intensity samples
 * @details Foreground ("tumor") and background statistics used by the seed
 *          sampler and the step cost models are estimated here. The estimator
 *          refuses to answer for small samples so that callers apply their
 *          own documented fallback instead of trusting a noisy estimate.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "segmentation_types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace seedgrow::services {

/// Minimum sample count accepted by estimateRobustStats()
inline constexpr std::size_t kMinRobustSamples = 16;

/// Normal-consistency factor converting MAD to a standard deviation
inline constexpr double kMadToSigma = 1.4826;

/**
 * @brief Median of a sample set
 *
 * Even counts return the mean of the two middle values. Empty input returns 0.
 */
[[nodiscard]] double medianOf(std::span<const double> values);

/**
 * @brief Estimate {mu, sigma} with median and MAD
 *
 * mu = median(samples), sigma = max(sigmaFloor, 1.4826 * median(|s - mu|)).
 *
 * @param samples Intensity samples
 * @param sigmaFloor Lower bound for sigma
 * @return Statistics, or nullopt for fewer than 16 samples or non-finite results
 */
[[nodiscard]] std::optional<RobustStats> estimateRobustStats(
    std::span<const double> samples,
    double sigmaFloor
);

/**
 * @brief Low/high quantiles of a sample set
 */
struct SampleQuantiles {
    double low = 0.0;
    double high = 0.0;
    double q99 = 0.0;
};

/**
 * @brief Read quantiles at floor(q * (n - 1)) of the sorted samples
 *
 * @param samples Samples (copied and sorted internally)
 * @param lowQ Quantile for SampleQuantiles::low
 * @param highQ Quantile for SampleQuantiles::high
 * @param minSamples Minimum sample count; fewer returns nullopt
 */
[[nodiscard]] std::optional<SampleQuantiles> sampleQuantiles(
    std::span<const double> samples,
    double lowQ,
    double highQ,
    std::size_t minSamples
);

} // namespace seedgrow::services
