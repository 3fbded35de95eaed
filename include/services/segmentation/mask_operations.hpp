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
 * @file mask_operations.hpp
 * @brief Conversions and cleanup for 3D grow results
 * @details Grow results come back as voxel index lists. These helpers turn
 *          them into ITK masks and remove small islands left around the main
 *          region, or smooth them by one voxel.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "image_types.hpp"
#include "segmentation_types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace seedgrow::services {

/**
 * @brief Mask reduced to its largest connected component
 */
struct LargestComponentResult {
    BinaryMask3D::Pointer mask;

    /// Voxel count of the kept component; 0 for an empty input
    std::size_t keptSize = 0;
};

/**
 * @brief Rasterize global voxel indices into a mask (1 = included)
 *
 * @return Mask, InvalidInput for non-positive dims or an index past the volume
 */
[[nodiscard]] std::expected<BinaryMask3D::Pointer, SegmentationError>
indicesToMask(std::span<const std::uint32_t> indices, const std::array<int, 3>& dims);

/**
 * @brief Global indices of the non-zero voxels, in raster order
 */
[[nodiscard]] std::vector<std::uint32_t> maskToIndices(const BinaryMask3D* mask);

/**
 * @brief Keep only the largest connected component of a dense mask
 *
 * Any non-zero value counts as foreground. Connectivity Six joins face
 * neighbours only; TwentySix also joins edge and corner neighbours.
 *
 * @param mask Mask buffer in x-fastest order
 * @param dims Volume dimensions
 * @param connectivity Neighbourhood used for labeling
 * @return Cleaned mask, InvalidInput when mask.size() != nx * ny * nz
 */
[[nodiscard]] std::expected<LargestComponentResult, SegmentationError>
keepLargestConnectedComponent3D(std::span<const std::uint8_t> mask,
                                const std::array<int, 3>& dims,
                                Connectivity3D connectivity = Connectivity3D::Six);

[[nodiscard]] std::expected<LargestComponentResult, SegmentationError>
keepLargestConnectedComponent3D(BinaryMask3D::Pointer mask,
                                Connectivity3D connectivity = Connectivity3D::Six);

/**
 * @brief Dilate a 0/1 mask by one voxel with a full 3x3x3 box
 *
 * @return Dilated mask, InvalidInput for a null mask
 */
[[nodiscard]] std::expected<BinaryMask3D::Pointer, SegmentationError>
dilateMask3D(BinaryMask3D::Pointer mask);

/**
 * @brief Erode a 0/1 mask by one voxel with a full 3x3x3 box
 *
 * Voxels outside the volume count as background, so foreground touching the
 * volume border is eroded too.
 */
[[nodiscard]] std::expected<BinaryMask3D::Pointer, SegmentationError>
erodeMask3D(BinaryMask3D::Pointer mask);

} // namespace seedgrow::services
