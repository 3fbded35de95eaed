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

#include "services/segmentation/robust_stats.hpp"

#include <algorithm>
#include <cmath>

namespace seedgrow::services {

namespace {

double medianOfSorted(const std::vector<double>& sorted) {
    if (sorted.empty()) {
        return 0.0;
    }
    const std::size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1) {
        return sorted[mid];
    }
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

} // anonymous namespace

double medianOf(std::span<const double> values) {
    std::vector<double> sorted(values.begin(), values.end());
    std::sort(sorted.begin(), sorted.end());
    return medianOfSorted(sorted);
}

std::optional<RobustStats> estimateRobustStats(
    std::span<const double> samples,
    double sigmaFloor
) {
    if (samples.size() < kMinRobustSamples) {
        return std::nullopt;
    }

    const double mu = medianOf(samples);

    std::vector<double> deviations;
    deviations.reserve(samples.size());
    for (double v : samples) {
        deviations.push_back(std::abs(v - mu));
    }
    std::sort(deviations.begin(), deviations.end());
    const double mad = medianOfSorted(deviations);

    const double sigma = std::max(sigmaFloor, kMadToSigma * mad);

    if (!std::isfinite(mu) || !std::isfinite(sigma)) {
        return std::nullopt;
    }
    return RobustStats{mu, sigma};
}

std::optional<SampleQuantiles> sampleQuantiles(
    std::span<const double> samples,
    double lowQ,
    double highQ,
    std::size_t minSamples
) {
    if (samples.empty() || samples.size() < minSamples) {
        return std::nullopt;
    }

    std::vector<double> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());

    const double last = static_cast<double>(sorted.size() - 1);
    auto at = [&](double q) {
        auto i = static_cast<std::size_t>(std::floor(q * last));
        return sorted[std::min(i, sorted.size() - 1)];
    };

    return SampleQuantiles{at(lowQ), at(highQ), at(0.99)};
}

} // namespace seedgrow::services
