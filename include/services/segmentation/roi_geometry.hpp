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
 * @file roi_geometry.hpp
 * @brief ROI and tolerance helpers for 3D seeded growth
 * @details Builds the intensity band passed to the growers from a seed value,
 *          and turns a rectangle dragged on one slice plane into a 3D box.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "segmentation_types.hpp"

#include <array>
#include <optional>

namespace seedgrow::services {

/**
 * @brief Slice plane a 2D drag was made on
 */
enum class SlicePlane {
    Axial,      // XY plane, depth along z
    Coronal,    // XZ plane, depth along y
    Sagittal    // YZ plane, depth along x
};

/**
 * @brief Intensity band in normalized [0, 1] units
 */
struct SeedRange {
    double min = 0.0;
    double max = 1.0;
};

/**
 * @brief Band seedValue +/- tolerance clamped to [0, 1]
 *
 * A negative tolerance is treated as zero.
 */
[[nodiscard]] SeedRange computeSeedRange01(double seedValue, double tolerance) noexcept;

/// Inclusive index window
struct CenteredSpan {
    int lo = 0;
    int hi = 0;
};

/**
 * @brief Window of count cells centred on center
 *
 * Odd leftovers go to the + side. A window that crosses [min, max] is shifted
 * back inside, keeping its size where the range allows.
 */
[[nodiscard]] CenteredSpan computeCenteredSpan(int center, int count, int min, int max) noexcept;

/**
 * @brief Convert a rectangle dragged on a slice into a 3D ROI box
 *
 * The two in-plane axes come from the clamped corners a and b. The depth
 * along the plane normal is round(sideMm / normalVoxelMm * depthScale)
 * slices, sideMm being the larger rectangle side in millimetres, centred on
 * sliceIndex. The result is therefore close to a cube in physical space.
 *
 * @param plane Plane of the drag
 * @param dims Volume dimensions (x, y, z)
 * @param voxelSizeMm Voxel spacing in mm; signs are ignored
 * @param sliceIndex Slice index along the plane normal
 * @param a First corner in voxel coordinates
 * @param b Opposite corner in voxel coordinates
 * @param depthScale Multiplier on the computed depth
 * @return Box, or nullopt for a volume with a non-positive dimension
 */
[[nodiscard]] std::optional<VolumeRoiBounds> computeRoiCubeFromSliceDrag(
    SlicePlane plane,
    const std::array<int, 3>& dims,
    const std::array<double, 3>& voxelSizeMm,
    int sliceIndex,
    const SeedPoint& a,
    const SeedPoint& b,
    double depthScale = 1.0
);

} // namespace seedgrow::services
