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
 * @file seed_sampler.hpp
 * @brief Working seed set resolution for the 2D and 3D grows
 * @details A single clicked pixel is fragile when it lands on noise. The 2D
 *          grow can plant extra seeds drawn from a small box around the
 *          anchor, keeping only tumour-like, low-gradient candidates. The 3D
 *          grow accepts caller-supplied seed indices instead.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "cost_distance_solver.hpp"
#include "gradient_field.hpp"
#include "seed_random.hpp"
#include "segmentation_types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace seedgrow::services {

/// Upper bound on the 2D seed count
inline constexpr int kMaxSeedCount2D = 64;

/**
 * @brief Default sampling box: half size clamp(round(0.07 * min(roiW, roiH)), 6, 24)
 *        around the anchor, clamped into the ROI
 */
[[nodiscard]] Roi2D defaultSeedBox(const PixelPoint& anchor, const Roi2D& roi) noexcept;

/**
 * @brief Clamp an explicit sampling box into the ROI and order its corners
 */
[[nodiscard]] Roi2D clampSeedBox(const Roi2D& box, const Roi2D& roi) noexcept;

/**
 * @brief PRNG seed derived from the anchor index and the ROI/seed-box corners
 *
 * Used when the caller does not pass an explicit seed so that repeated runs
 * on the same inputs choose the same seeds.
 */
[[nodiscard]] std::uint32_t deriveSeedRngSeed(
    std::size_t anchorIndex,
    const Roi2D& roi,
    const Roi2D& seedBox
) noexcept;

/**
 * @brief Inputs of 2D seed sampling
 */
struct SeedSamplingRequest2D {
    GrayView2D gray;
    const GradientField* gradient = nullptr;
    PixelPoint anchor;
    Roi2D seedBox;

    /// Total seeds wanted including the anchor, clamped to [1, 64]
    int seedCount = 1;

    RobustStats tumor;
    std::optional<RobustStats> background;
    double edgeBarrier = 25.0;
    double bgRejectMarginZ = 0.75;
};

/**
 * @brief Pick the anchor plus up to seedCount - 1 extra seeds
 *
 * Three rejection-sampling passes with relaxing (z-score, gradient) ceilings
 * of (0.9, barrier + 80), (1.4, barrier + 120) and (2.2, 255), each with
 * 220 attempts per wanted seed. Candidates follow a triangular distribution
 * centred on the box. Counts that cannot be filled are left unfilled. When
 * more than one extra seed was found the extras are ordered by ascending
 * badness.
 *
 * @return Seeds, anchor first
 */
[[nodiscard]] std::vector<PixelPoint> sampleSeeds2D(
    const SeedSamplingRequest2D& request,
    RandomSource& rng
);

/**
 * @brief Badness of a candidate seed: zT + 0.15 * grad / 255 + 0.75 * bg excess
 */
[[nodiscard]] double seedBadness(
    double value,
    double gradient,
    const RobustStats& tumor,
    const std::optional<RobustStats>& background,
    double bgRejectMarginZ
) noexcept;

/**
 * @brief Resolve the 3D working seed set
 *
 * The anchor comes first, followed by decoded extra global indices. Indices
 * outside the volume, outside the solver domain or (with a hard ROI) outside
 * the ROI are skipped. Duplicates are kept; the solver ignores them.
 */
[[nodiscard]] std::vector<std::array<int, 3>> resolveVolumeSeeds(
    const std::array<int, 3>& dims,
    const SeedPoint& anchor,
    std::span<const std::uint32_t> extraIndices,
    const SolverDomain& domain,
    const std::optional<VolumeRoiBounds>& hardRoi
);

} // namespace seedgrow::services
