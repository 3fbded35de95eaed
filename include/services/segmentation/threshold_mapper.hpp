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
 * @file threshold_mapper.hpp
 * @brief Slider-to-threshold mapping over a 2D cost-distance field
 * @details Raw distances vary by orders of magnitude between images. A
 *          256-entry empirical quantile table turns a [0, 1] slider into a
 *          distance threshold whose masks feel alike from case to case.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "image_types.hpp"
#include "segmentation_types.hpp"

#include <array>
#include <expected>
#include <span>

namespace seedgrow::services {

/// Quantile table of finite distances (entry i holds quantile i / 255)
using QuantileLut = std::array<float, 256>;

/// Default slider warp exponent
inline constexpr double kDefaultSliderGamma = 1.6;

/**
 * @brief Quantile table and largest finite distance inside an ROI
 */
struct QuantileSummary {
    QuantileLut lut{};
    double maxFiniteDistance = 0.0;
};

/**
 * @brief Build the quantile table from finite distances inside roi
 *
 * Samples on a stride of clamp(floor(sqrt(area / 20000)), 1, 8). With no
 * finite sample the table is the identity (lut[i] = i).
 *
 * @param distance Dense distance field (width * height)
 * @param width Grid width
 * @param roi Region sampled
 */
[[nodiscard]] QuantileSummary buildQuantileLut(
    std::span<const float> distance,
    int width,
    const Roi2D& roi
);

/**
 * @brief Map a slider position to a distance threshold
 *
 * slider is clamped to [0, 1] and gamma to [0.2, 5] (non-finite gamma uses
 * the default); slider^gamma * 255 is interpolated linearly in the table.
 * Non-decreasing in slider.
 */
[[nodiscard]] double distThresholdFromSlider(
    const QuantileLut& lut,
    double slider,
    double gamma = kDefaultSliderGamma
);

/**
 * @brief Binary mask (1 where distance <= threshold) as an ITK image
 *
 * @return Mask on success, InvalidInput on size mismatch
 */
[[nodiscard]] std::expected<BinaryMask2D::Pointer, SegmentationError> thresholdDistanceMap(
    std::span<const float> distance,
    int width,
    int height,
    double threshold
);

} // namespace seedgrow::services
