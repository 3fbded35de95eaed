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
 * @file segmentation_session.hpp
 * @brief Long-lived owner of segmentation state across interactive runs
 * @details A session holds the only state that outlives a single run: the
 *          gradient cache for 2D slices, the active settings, and the
 *          cancellation token of the preview currently in flight. Starting a
 *          new preview cancels the previous one.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "cost_distance_segmenter.hpp"
#include "gradient_field.hpp"
#include "segmentation_config.hpp"
#include "segmentation_types.hpp"
#include "volume_region_grower.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

namespace seedgrow::services {

/**
 * @brief Segmentation session shared by the interactive tools
 *
 * Runs may be started from worker threads. The session itself is
 * thread-safe; each run owns its own working buffers.
 *
 * @example
 * @code
 * SegmentationSession session;
 *
 * // Each new click supersedes the previous preview
 * auto params = session.makeCostDistanceParameters({120, 96});
 * params.gridKey = GridKey::fromHandle(sliceId);
 * auto result = session.previewCostDistance2D(slice, params);
 * if (!result && result.error().isCancelled()) {
 *     return;  // superseded by a newer click
 * }
 * @endcode
 */
class SegmentationSession {
public:
    explicit SegmentationSession(SegmentationSettings settings = {});
    ~SegmentationSession();

    SegmentationSession(const SegmentationSession&) = delete;
    SegmentationSession& operator=(const SegmentationSession&) = delete;
    SegmentationSession(SegmentationSession&&) noexcept;
    SegmentationSession& operator=(SegmentationSession&&) noexcept;

    // =========================================================================
    // Settings
    // =========================================================================

    [[nodiscard]] SegmentationSettings settings() const;

    /**
     * @brief Replace the settings and resize the gradient cache
     *
     * The process-wide log level is left alone; see applyLogLevel().
     */
    void setSettings(const SegmentationSettings& settings);

    /**
     * @brief Apply the configured log level to every registered logger
     */
    void applyLogLevel() const;

    /**
     * @brief Load settings from a JSON file; the current ones stay on failure
     */
    [[nodiscard]] std::expected<void, SegmentationError>
    loadSettings(const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, SegmentationError>
    saveSettings(const std::filesystem::path& path) const;

    // =========================================================================
    // Preview cancellation
    // =========================================================================

    /**
     * @brief Cancel the preview in flight and return the token of the next one
     *
     * The caller joins the previous worker before reusing its output.
     */
    [[nodiscard]] CancellationToken beginPreview();

    /**
     * @brief Cancel the preview in flight, if any
     */
    void cancelPreview();

    // =========================================================================
    // 2D cost distance
    // =========================================================================

    /**
     * @brief Parameters prefilled from the settings, using the session cache
     */
    [[nodiscard]] CostDistanceParameters2D makeCostDistanceParameters(const PixelPoint& seed) const;

    /**
     * @brief Run a 2D cost-distance computation
     *
     * The session cache is used when params carries no cache of its own.
     */
    [[nodiscard]] std::expected<CostDistanceResult2D, SegmentationError>
    computeCostDistance2D(const GrayView2D& gray, CostDistanceParameters2D params) const;

    /**
     * @brief Run a 2D computation under a fresh preview token
     *
     * Any preview still running is cancelled first.
     */
    [[nodiscard]] std::expected<CostDistanceResult2D, SegmentationError>
    previewCostDistance2D(const GrayView2D& gray, CostDistanceParameters2D params);

    /**
     * @brief Drop the cached gradient of a slice whose pixels changed
     * @return true if an entry was removed
     */
    bool invalidateGrid(const GridKey& key);

    void clearGradientCache();

    [[nodiscard]] const GradientFieldCache& gradientCache() const noexcept;

    // =========================================================================
    // 3D growth
    // =========================================================================

    /**
     * @brief Guided-grow parameters from the settings
     *
     * The band is seedValue +/- seedTolerance in [0, 1]. A given roi box
     * takes the configured mode and outside tolerance.
     *
     * @return Parameters, InvalidInput for a bad volume or seed
     */
    [[nodiscard]] std::expected<GuidedGrowParameters, SegmentationError>
    makeGuidedGrowParameters(const VolumeView& volume,
                             const SeedPoint& seed,
                             const std::optional<VolumeRoiBounds>& roi = std::nullopt) const;

    /**
     * @brief Threshold-grow parameters from the settings
     */
    [[nodiscard]] std::expected<ThresholdGrowParameters, SegmentationError>
    makeThresholdGrowParameters(const VolumeView& volume,
                                const SeedPoint& seed,
                                const std::optional<VolumeRoiBounds>& roi = std::nullopt) const;

    [[nodiscard]] std::expected<RegionGrowResult3D, SegmentationError>
    growVolume(const VolumeView& volume, const GuidedGrowParameters& params) const;

    [[nodiscard]] std::expected<RegionGrowResult3D, SegmentationError>
    growVolume(const VolumeView& volume, const ThresholdGrowParameters& params) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace seedgrow::services
