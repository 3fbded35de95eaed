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
 * @file segmentation_config.hpp
 * @brief JSON persistence of cost-model weights and grow defaults
 * @details Stores the tunable parts of both segmentation variants in one
 *          versioned JSON document. Loading is lenient: unknown keys are
 *          ignored, missing keys keep their defaults and out-of-range tuning
 *          values are clamped.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "core/logging.hpp"
#include "gradient_field.hpp"
#include "segmentation_types.hpp"
#include "step_cost_model.hpp"
#include "threshold_mapper.hpp"
#include "volume_region_grower.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace seedgrow::services {

/**
 * @brief Defaults applied to 3D grow requests
 */
struct VolumeGrowDefaults {
    Connectivity3D connectivity = Connectivity3D::Six;
    std::size_t yieldEvery = kDefaultYieldEvery;
    std::optional<std::size_t> maxVoxels;

    /// Half-width of the band passed to computeSeedRange01
    double seedTolerance = 0.15;

    RoiMode roiMode = RoiMode::Guide;
    double outsideToleranceScale = 0.25;

    [[nodiscard]] bool operator==(const VolumeGrowDefaults&) const = default;
};

/**
 * @brief Everything a SegmentationConfig file holds
 */
struct SegmentationSettings {
    CostWeights2D weights2D;
    CostTuning2D tuning2D;

    /// Seeds per 2D run including the anchor
    int seedCount2D = 1;
    double sliderGamma = kDefaultSliderGamma;

    /// Gradient fields a session keeps before evicting the least recently used
    std::size_t gradientCacheCapacity = kDefaultGradientCacheCapacity;

    VolumeCostTuning volumeTuning;
    VolumeGrowDefaults volume;

    logging::LogLevel logLevel = logging::LogLevel::Info;

    [[nodiscard]] bool operator==(const SegmentationSettings&) const = default;
};

/**
 * @brief Reader and writer of segmentation settings files
 *
 * Count fields (voxel caps, margins, capacities) accept non-negative whole
 * numbers only; anything else is ignored and the default kept.
 *
 * @example
 * @code
 * auto settings = SegmentationConfig::load("seedgrow.json");
 * if (!settings) {
 *     settings = SegmentationSettings{};
 * }
 * settings->weights2D.edgeCostStrength = 10.0;
 * auto saved = SegmentationConfig::save(*settings, "seedgrow.json");
 * @endcode
 */
class SegmentationConfig {
public:
    /// Version written to every file
    static constexpr const char* kCurrentVersion = "1.0";

    /**
     * @brief Read settings from a JSON file
     *
     * @return Settings, InvalidInput if the file is missing or the version
     *         is unsupported, ProcessingFailed for unreadable or malformed JSON
     */
    [[nodiscard]] static std::expected<SegmentationSettings, SegmentationError>
    load(const std::filesystem::path& path);

    /**
     * @brief Write settings as indented JSON
     *
     * @return Success, or ProcessingFailed if the file cannot be written
     */
    [[nodiscard]] static std::expected<void, SegmentationError>
    save(const SegmentationSettings& settings, const std::filesystem::path& path);

    [[nodiscard]] static nlohmann::json toJson(const SegmentationSettings& settings);

    /**
     * @brief Build settings from a parsed document
     *
     * @return Settings, InvalidInput for a non-object root or a missing or
     *         unsupported version
     */
    [[nodiscard]] static std::expected<SegmentationSettings, SegmentationError>
    fromJson(const nlohmann::json& root);
};

} // namespace seedgrow::services
