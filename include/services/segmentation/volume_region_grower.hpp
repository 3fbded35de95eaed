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
 * @file volume_region_grower.hpp
 * @brief Seeded 3D region growing over normalized intensity volumes
 * @details Two growers share one parameter vocabulary:
 *          - connectedThreshold: breadth-first flood fill of voxels whose
 *            intensity lies in [min, max]
 *          - costGuided: multi-source Dijkstra with the direction-aware step
 *            cost model, stopped by a path-cost budget derived from the
 *            tolerance implied by [min, max]
 *
 *          Both return the included voxels as global indices in discovery
 *          order, capped at maxVoxels.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "image_types.hpp"
#include "segmentation_types.hpp"
#include "step_cost_model.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

namespace seedgrow::services {

/// Volumes larger than this need an ROI for the cost-guided grow
inline constexpr std::size_t kMaxVoxelsWithoutRoi = 5'000'000;

/// Default cooperative yield interval (finalized voxels)
inline constexpr std::size_t kDefaultYieldEvery = 120'000;

/**
 * @brief Scheduling and budget options shared by both growers
 */
struct VolumeGrowOptions {
    /// Cap on included voxels; defaults to the volume size
    std::optional<std::size_t> maxVoxels;

    Connectivity3D connectivity = Connectivity3D::Six;

    /// Run the callbacks every N processed voxels; 0 disables them
    std::size_t yieldEvery = kDefaultYieldEvery;

    /// Defaults to std::this_thread::yield when empty
    YieldCallback onYield;

    GrowProgressCallback onProgress;

    std::optional<CancellationToken> cancelToken;

    /// Log resolved bounds, statistics and counts at info level
    bool debug = false;
};

/**
 * @brief Parameters of the threshold flood fill
 */
struct ThresholdGrowParameters {
    SeedPoint seed;

    /// Acceptance band; swapped if given in reverse
    double min = 0.0;
    double max = 1.0;

    /// Hard: domain limited to the box. Guide: outside the box the band
    /// shrinks to [seed - tolLo * s, seed + tolHi * s], s = outsideToleranceScale
    std::optional<VolumeRoi> roi;

    VolumeGrowOptions options;

    [[nodiscard]] bool isValid() const noexcept {
        return std::isfinite(min) && std::isfinite(max);
    }
};

/**
 * @brief Parameters of the cost-guided grow
 */
struct GuidedGrowParameters {
    SeedPoint seed;

    /// Additional seeds as global voxel indices
    std::vector<std::uint32_t> seedIndices;

    /// Tolerance band around the seed value; swapped if given in reverse
    double min = 0.0;
    double max = 1.0;

    std::optional<VolumeRoi> roi;

    /// Path-cost budget; defaults to 18 + 220 * tolerance width
    std::optional<double> maxCost;

    VolumeCostTuning tuning;
    VolumeGrowOptions options;

    [[nodiscard]] bool isValid() const noexcept {
        return std::isfinite(min) && std::isfinite(max) &&
               (!maxCost || std::isfinite(*maxCost));
    }
};

/**
 * @brief Values resolved by the cost-guided grow
 */
struct GuidedGrowDiagnostics {
    /// Band after bright inclusion may have raised max
    double minValue = 0.0;
    double maxValue = 1.0;
    double maxCost = 0.0;

    RobustStats tumor;
    std::optional<RobustStats> background;
    double edgeBarrier = 0.0;

    /// Solver domain (ROI, ROI +/- margin, or the whole volume)
    VolumeRoiBounds domain;
    int roiMarginVoxels = 0;

    std::size_t insideRoiCount = 0;
    std::size_t outsideRoiCount = 0;
};

/**
 * @brief Output of a 3D grow
 */
struct RegionGrowResult3D {
    /// Included global voxel indices in discovery order
    std::vector<std::uint32_t> indices;

    /// Intensity at the primary seed
    double seedValue = 0.0;

    /// Growth stopped because maxVoxels was reached
    bool hitMaxVoxels = false;

    /// Present for the cost-guided grow
    std::optional<GuidedGrowDiagnostics> diagnostics;

    [[nodiscard]] std::size_t count() const noexcept { return indices.size(); }
};

/**
 * @brief Seeded region growing in 3D
 *
 * @example
 * @code
 * VolumeRegionGrower grower;
 *
 * GuidedGrowParameters params;
 * params.seed = {64, 64, 40};
 * auto range = computeSeedRange01(volume.voxels[volume.index(64, 64, 40)], 0.15);
 * params.min = range.min;
 * params.max = range.max;
 * params.roi = VolumeRoi{{40, 40, 20}, {90, 90, 60}, RoiMode::Guide, 0.25};
 *
 * auto result = grower.costGuided(volume, params);
 * if (result) {
 *     auto mask = indicesToMask(result->indices, volume.dims);
 * }
 * @endcode
 */
class VolumeRegionGrower {
public:
    VolumeRegionGrower() = default;
    ~VolumeRegionGrower() = default;

    VolumeRegionGrower(const VolumeRegionGrower&) = default;
    VolumeRegionGrower& operator=(const VolumeRegionGrower&) = default;
    VolumeRegionGrower(VolumeRegionGrower&&) noexcept = default;
    VolumeRegionGrower& operator=(VolumeRegionGrower&&) noexcept = default;

    /**
     * @brief Flood fill voxels in [min, max] connected to the seed
     *
     * A seed outside [min, max] yields an empty result.
     *
     * @return Result, InvalidInput for a bad volume or seed, Cancelled when
     *         the token fires
     */
    [[nodiscard]] std::expected<RegionGrowResult3D, SegmentationError>
    connectedThreshold(const VolumeView& volume, const ThresholdGrowParameters& params) const;

    [[nodiscard]] std::expected<RegionGrowResult3D, SegmentationError>
    connectedThreshold(IntensityVolume::Pointer volume, const ThresholdGrowParameters& params) const;

    /**
     * @brief Cost-distance grow bounded by a path-cost budget
     *
     * A seed outside a hard ROI yields an empty result. When the ROI holds a
     * non-trivial share of voxels brighter than max, max is raised to the
     * ROI 99th percentile.
     *
     * @return Result, InvalidInput for a bad volume or seed,
     *         InvalidParameters for a large volume without ROI, Cancelled
     *         when the token fires
     */
    [[nodiscard]] std::expected<RegionGrowResult3D, SegmentationError>
    costGuided(const VolumeView& volume, const GuidedGrowParameters& params) const;

    [[nodiscard]] std::expected<RegionGrowResult3D, SegmentationError>
    costGuided(IntensityVolume::Pointer volume, const GuidedGrowParameters& params) const;

    /**
     * @brief Clamp an ROI to the volume and order its corners
     */
    [[nodiscard]] static VolumeRoiBounds clampRoi(const VolumeRoi& roi,
                                                  const std::array<int, 3>& dims) noexcept;

    /**
     * @brief Default guide margin: clamp(round(0.1 * largest ROI extent), 2, 12)
     */
    [[nodiscard]] static int defaultRoiMargin(const VolumeRoiBounds& roi) noexcept;

private:
    [[nodiscard]] static std::optional<SegmentationError> validateInput(
        const VolumeView& volume,
        const SeedPoint& seed
    );
};

} // namespace seedgrow::services
