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

#include "services/segmentation/threshold_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <itkImageRegionIterator.h>

namespace seedgrow::services {

QuantileSummary buildQuantileLut(
    std::span<const float> distance,
    int width,
    const Roi2D& roi
) {
    QuantileSummary summary;

    const double area = static_cast<double>(roi.width()) * static_cast<double>(roi.height());
    constexpr double kTargetSamples = 20000.0;
    const int stride = std::clamp(static_cast<int>(std::floor(std::sqrt(area / kTargetSamples))), 1, 8);

    std::vector<float> samples;
    samples.reserve(static_cast<std::size_t>(area / (stride * stride)) + 1);

    for (int y = roi.y0; y <= roi.y1; y += stride) {
        for (int x = roi.x0; x <= roi.x1; x += stride) {
            const std::size_t i = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                                  static_cast<std::size_t>(x);
            if (i >= distance.size()) {
                continue;
            }
            const float v = distance[i];
            if (!std::isfinite(v)) {
                continue;
            }
            summary.maxFiniteDistance = std::max(summary.maxFiniteDistance, static_cast<double>(v));
            samples.push_back(v);
        }
    }

    if (samples.empty()) {
        for (std::size_t i = 0; i < summary.lut.size(); ++i) {
            summary.lut[i] = static_cast<float>(i);
        }
        return summary;
    }

    std::sort(samples.begin(), samples.end());

    const std::size_t n = samples.size();
    for (std::size_t i = 0; i < summary.lut.size(); ++i) {
        const double pos = (static_cast<double>(i) / 255.0) * static_cast<double>(n - 1);
        const auto lo = static_cast<std::size_t>(std::floor(pos));
        const std::size_t hi = std::min(n - 1, lo + 1);
        const double t = pos - static_cast<double>(lo);
        const double a = samples[lo];
        const double b = samples[hi];
        summary.lut[i] = static_cast<float>(a * (1.0 - t) + b * t);
    }

    return summary;
}

double distThresholdFromSlider(const QuantileLut& lut, double slider, double gamma) {
    const double s = std::clamp(std::isfinite(slider) ? slider : 0.0, 0.0, 1.0);
    const double g = std::isfinite(gamma) ? std::clamp(gamma, 0.2, 5.0) : kDefaultSliderGamma;

    const double f = std::pow(s, g) * 255.0;
    const int i0 = std::clamp(static_cast<int>(std::floor(f)), 0, 255);
    const int i1 = std::clamp(i0 + 1, 0, 255);
    const double t = f - i0;

    const double a = lut[static_cast<std::size_t>(i0)];
    const double b = lut[static_cast<std::size_t>(i1)];
    return a * (1.0 - t) + b * t;
}

std::expected<BinaryMask2D::Pointer, SegmentationError> thresholdDistanceMap(
    std::span<const float> distance,
    int width,
    int height,
    double threshold
) {
    if (width <= 0 || height <= 0 ||
        distance.size() != static_cast<std::size_t>(width) * static_cast<std::size_t>(height)) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Distance field size does not match the grid dimensions"
        });
    }

    auto mask = allocateGrayImage(width, height, 0);

    // Buffer order of a zero-origin image matches the row-major field
    itk::ImageRegionIterator<BinaryMask2D> it(mask, mask->GetLargestPossibleRegion());
    std::size_t i = 0;
    for (it.GoToBegin(); !it.IsAtEnd(); ++it, ++i) {
        it.Set(distance[i] <= threshold ? 1 : 0);
    }

    return mask;
}

} // namespace seedgrow::services
