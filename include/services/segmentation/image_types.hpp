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
 * @file image_types.hpp
 * @brief ITK image aliases and grid views over ITK buffers
 * @details The segmentation core works on spans so it can run on buffers
 *          owned by any caller. These helpers wrap ITK images (the format the
 *          rest of the viewer passes around) without copying.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "segmentation_types.hpp"

#include <array>
#include <expected>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace seedgrow::services {

/// 8-bit display slice used by the 2D grow
using GrayImage2D = itk::Image<unsigned char, 2>;

/// Per-pixel cost distance
using DistanceImage2D = itk::Image<float, 2>;

/// Binary 2D mask (0/1)
using BinaryMask2D = itk::Image<unsigned char, 2>;

/// Normalized [0, 1] intensity volume used by the 3D grow
using IntensityVolume = itk::Image<float, 3>;

/// Binary 3D mask (0/1)
using BinaryMask3D = itk::Image<unsigned char, 3>;

/**
 * @brief View the buffered region of a 2D slice
 *
 * @return View on success, InvalidInput if the image is null or empty
 */
[[nodiscard]] std::expected<GrayView2D, SegmentationError>
makeGrayView(const GrayImage2D* image);

/**
 * @brief View the buffered region of a volume
 *
 * @return View on success, InvalidInput if the image is null or empty
 */
[[nodiscard]] std::expected<VolumeView, SegmentationError>
makeVolumeView(const IntensityVolume* image);

/**
 * @brief Allocate a zero-origin 2D slice of the given size filled with value
 */
[[nodiscard]] GrayImage2D::Pointer allocateGrayImage(int width, int height, unsigned char value = 0);

/**
 * @brief Allocate a zero-origin volume of the given size filled with value
 */
[[nodiscard]] IntensityVolume::Pointer allocateVolume(int nx, int ny, int nz, float value = 0.0f);

/**
 * @brief Allocate a zero-filled 3D mask with the given dimensions
 */
[[nodiscard]] BinaryMask3D::Pointer allocateMask3D(const std::array<int, 3>& dims);

} // namespace seedgrow::services
