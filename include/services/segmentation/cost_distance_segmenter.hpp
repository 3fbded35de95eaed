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
 * @file cost_distance_segmenter.hpp
 * @brief Interactive 2D seeded segmentation by cost distance
 * @details Computes, for every pixel of an ROI, the cheapest accumulated step
 *          cost from a seed set. The caller thresholds the field (usually via
 *          the quantile table and a slider) to obtain the mask, so moving the
 *          slider never requires re-running the solver.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "gradient_field.hpp"
#include "image_types.hpp"
#include "seed_random.hpp"
#include "segmentation_types.hpp"
#include "step_cost_model.hpp"
#include "threshold_mapper.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace seedgrow::services {

/**
 * @brief Parameters of a 2D cost-distance run
 */
struct CostDistanceParameters2D {
    /// Anchor seed; clamped into the grid
    PixelPoint seed;

    /// Solver domain; defaults to a box around the seed
    std::optional<Roi2D> roi;

    CostWeights2D weights;
    CostTuning2D tuning;

    /// Total seeds including the anchor, clamped to [1, 64]
    int seedCount = 1;

    /// Box for extra seeds and tumour statistics; defaults to a small box around the anchor
    std::optional<Roi2D> seedBox;

    /// Explicit PRNG seed for extra-seed sampling
    std::optional<std::uint32_t> seedRngSeed;

    /// Random source overriding seedRngSeed (not owned)
    RandomSource* random = nullptr;

    /// Gradient cache (not owned); the field is computed per call when null
    GradientFieldCache* gradientCache = nullptr;

    /// Cache key; defaults to a content hash of the slice
    std::optional<GridKey> gridKey;

    /// Run onYield every N finalized pixels; 0 disables yielding
    std::size_t yieldEvery = 0;
    YieldCallback onYield;

    std::optional<CancellationToken> cancelToken;

    /// Log resolved seeds, ROI, statistics and weights at info level
    bool debug = false;

    /**
     * @brief Validate parameters
     * @return true if every weight is finite, strengths are non-negative and
     *         the sigma floor is positive
     */
    [[nodiscard]] bool isValid() const noexcept {
        const auto& w = weights;
        const bool finite = std::isfinite(w.edgeCostStrength) && std::isfinite(w.edgeBarrierGrad) &&
                            std::isfinite(w.crossCostStrength) && std::isfinite(w.tumorCostStrength) &&
                            std::isfinite(w.bgCostStrength) && std::isfinite(w.bgRejectMarginZ) &&
                            std::isfinite(w.sigmaFloor);
        return finite &&
               w.edgeCostStrength >= 0.0 && w.crossCostStrength >= 0.0 &&
               w.tumorCostStrength >= 0.0 && w.bgCostStrength >= 0.0 &&
               w.sigmaFloor > 0.0;
    }
};

/**
 * @brief Statistics resolved during a 2D run
 */
struct CostDistanceStats2D {
    RobustStats tumor;

    /// Absent when too few background samples were found
    std::optional<RobustStats> background;

    /// Gradient at which edge cost starts
    double edgeBarrier = 25.0;
};

/**
 * @brief Output of a 2D cost-distance run
 */
struct CostDistanceResult2D {
    int width = 0;
    int height = 0;

    /// Anchor seed after clamping
    PixelPoint seed;

    /// Every seed that initialized the field, anchor first
    std::vector<PixelPoint> seeds;

    Roi2D seedBox;
    Roi2D roi;

    /// Distance per pixel (width * height), +inf outside the ROI or unreached
    std::vector<float> dist;

    QuantileLut quantileLut{};
    double maxFiniteDist = 0.0;

    CostDistanceStats2D stats;
    CostWeights2D weights;
    CostTuning2D tuning;

    [[nodiscard]] float distanceAt(int x, int y) const noexcept {
        return dist[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                    static_cast<std::size_t>(x)];
    }

    /// Threshold for a slider position
    [[nodiscard]] double thresholdForSlider(double slider,
                                            double gamma = kDefaultSliderGamma) const {
        return distThresholdFromSlider(quantileLut, slider, gamma);
    }
};

/**
 * @brief Seeded cost-distance segmentation of 8-bit slices
 *
 * @example
 * @code
 * CostDistanceSegmenter2D segmenter;
 * CostDistanceParameters2D params;
 * params.seed = {120, 96};
 * params.seedCount = 8;
 *
 * auto result = segmenter.computeCostDistanceMap(slice, params);
 * if (result) {
 *     double t = result->thresholdForSlider(0.4);
 *     auto mask = thresholdDistanceMap(result->dist, result->width, result->height, t);
 * }
 * @endcode
 */
class CostDistanceSegmenter2D {
public:
    CostDistanceSegmenter2D() = default;
    ~CostDistanceSegmenter2D() = default;

    CostDistanceSegmenter2D(const CostDistanceSegmenter2D&) = default;
    CostDistanceSegmenter2D& operator=(const CostDistanceSegmenter2D&) = default;
    CostDistanceSegmenter2D(CostDistanceSegmenter2D&&) noexcept = default;
    CostDistanceSegmenter2D& operator=(CostDistanceSegmenter2D&&) noexcept = default;

    /**
     * @brief Compute the cost-distance field from the seed set
     *
     * @param gray Slice view
     * @param params Run parameters
     * @return Result, InvalidInput for a bad grid, InvalidParameters for bad
     *         weights, Cancelled when the token fires
     */
    [[nodiscard]] std::expected<CostDistanceResult2D, SegmentationError>
    computeCostDistanceMap(const GrayView2D& gray, const CostDistanceParameters2D& params) const;

    /**
     * @brief Compute the cost-distance field of an ITK slice
     */
    [[nodiscard]] std::expected<CostDistanceResult2D, SegmentationError>
    computeCostDistanceMap(GrayImage2D::Pointer gray, const CostDistanceParameters2D& params) const;

    /**
     * @brief Default ROI: radius clamp(round(0.45 * minDim), 80, round(0.9 * minDim))
     *        around the seed, clamped to the grid
     */
    [[nodiscard]] static Roi2D defaultRoi(const PixelPoint& seed, int width, int height) noexcept;
};

} // namespace seedgrow::services
