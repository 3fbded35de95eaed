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
 * @file segmentation_types.hpp
 * @brief Shared value types for seeded cost-distance segmentation
 * @details Defines the error type returned by every segmentation entry point,
 *          grid views over caller-owned intensity buffers, seed and ROI
 *          geometry, robust statistics, and the cooperative cancellation
 *          token polled by the solver loops.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace seedgrow::services {

/**
 * @brief Error information for segmentation operations
 *
 * Cancelled is a distinct outcome, not a failure. Callers should not log it
 * as an error.
 */
struct SegmentationError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ProcessingFailed,
        Cancelled,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] bool isCancelled() const noexcept {
        return code == Code::Cancelled;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::Cancelled: return "Cancelled: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief 2D pixel coordinate
 */
struct PixelPoint {
    int x = 0;
    int y = 0;

    PixelPoint() = default;
    PixelPoint(int px, int py) : x(px), y(py) {}

    [[nodiscard]] bool operator==(const PixelPoint& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

/**
 * @brief 3D seed point (voxel index coordinates)
 */
struct SeedPoint {
    int x = 0;
    int y = 0;
    int z = 0;

    SeedPoint() = default;
    SeedPoint(int px, int py, int pz) : x(px), y(py), z(pz) {}

    [[nodiscard]] bool operator==(const SeedPoint& other) const noexcept {
        return x == other.x && y == other.y && z == other.z;
    }
};

/**
 * @brief Inclusive axis-aligned rectangle in pixel coordinates
 */
struct Roi2D {
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;

    [[nodiscard]] int width() const noexcept { return std::max(1, x1 - x0 + 1); }
    [[nodiscard]] int height() const noexcept { return std::max(1, y1 - y0 + 1); }

    [[nodiscard]] bool contains(int x, int y) const noexcept {
        return x >= x0 && x <= x1 && y >= y0 && y <= y1;
    }

    [[nodiscard]] bool operator==(const Roi2D& other) const noexcept {
        return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
    }
};

/**
 * @brief How a 3D ROI constrains growth
 */
enum class RoiMode {
    Hard,   ///< Voxels outside the box are never reachable
    Guide   ///< Voxels outside the box are reachable but progressively costlier
};

/**
 * @brief Inclusive voxel box
 */
struct VolumeRoiBounds {
    SeedPoint min;
    SeedPoint max;

    [[nodiscard]] bool contains(int x, int y, int z) const noexcept {
        return x >= min.x && x <= max.x &&
               y >= min.y && y <= max.y &&
               z >= min.z && z <= max.z;
    }
};

/**
 * @brief 3D region of interest with growth mode
 */
struct VolumeRoi {
    SeedPoint min;
    SeedPoint max;
    RoiMode mode = RoiMode::Guide;

    /// Fraction of the intensity tolerance kept outside the box, in [0, 1]
    double outsideToleranceScale = 0.25;

    [[nodiscard]] VolumeRoiBounds bounds() const noexcept { return {min, max}; }
};

/**
 * @brief Neighbourhood connectivity for 3D growth
 */
enum class Connectivity3D {
    Six = 6,          ///< Faces only (less leakage)
    TwentySix = 26    ///< Faces, edges and corners
};

/**
 * @brief Location/scale pair estimated with median and MAD
 */
struct RobustStats {
    double mu = 0.0;
    double sigma = 1.0;
};

/**
 * @brief Read-only view of an 8-bit 2D grid (row-major, x fastest)
 */
struct GrayView2D {
    std::span<const std::uint8_t> pixels;
    int width = 0;
    int height = 0;

    [[nodiscard]] std::uint8_t at(int x, int y) const noexcept {
        return pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                      static_cast<std::size_t>(x)];
    }
};

/**
 * @brief Read-only view of a normalized float volume (strides 1, nx, nx*ny)
 */
struct VolumeView {
    std::span<const float> voxels;
    std::array<int, 3> dims{0, 0, 0};

    [[nodiscard]] std::size_t expectedSize() const noexcept {
        if (dims[0] <= 0 || dims[1] <= 0 || dims[2] <= 0) {
            return 0;
        }
        return static_cast<std::size_t>(dims[0]) *
               static_cast<std::size_t>(dims[1]) *
               static_cast<std::size_t>(dims[2]);
    }

    [[nodiscard]] bool inBounds(int x, int y, int z) const noexcept {
        return x >= 0 && x < dims[0] && y >= 0 && y < dims[1] && z >= 0 && z < dims[2];
    }

    [[nodiscard]] std::size_t index(int x, int y, int z) const noexcept {
        return (static_cast<std::size_t>(z) * static_cast<std::size_t>(dims[1]) +
                static_cast<std::size_t>(y)) * static_cast<std::size_t>(dims[0]) +
               static_cast<std::size_t>(x);
    }
};

/**
 * @brief Cooperative cancellation flag shared between a caller and a run
 *
 * Copies share the same flag. requestCancel() may be called from any thread;
 * the running solver observes it at its next poll point.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void requestCancel() const noexcept {
        flag_->store(true);
    }

    [[nodiscard]] bool isCancelled() const noexcept {
        return flag_->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Invoked at cooperative yield points inside solver loops
using YieldCallback = std::function<void()>;

/// Invoked at yield points with processed pops and included voxel count
using GrowProgressCallback = std::function<void(std::size_t processed, std::size_t included)>;

} // namespace seedgrow::services
