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

#include "services/segmentation/segmentation_config.hpp"
#include "services/segmentation/seed_sampler.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>

namespace seedgrow::services {

using json = nlohmann::json;

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SegmentationConfig");
    return logger;
}

std::string roiModeToString(RoiMode mode) {
    return mode == RoiMode::Hard ? "hard" : "guide";
}

RoiMode stringToRoiMode(const std::string& str) {
    if (str == "hard") return RoiMode::Hard;
    return RoiMode::Guide;
}

Connectivity3D intToConnectivity(int value) {
    return value == 26 ? Connectivity3D::TwentySix : Connectivity3D::Six;
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

/// Non-negative whole number under key, or nullopt
template <typename T>
std::optional<T> jsonToCount(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const auto& value = j[key];
    if (value.is_number_unsigned()) {
        return static_cast<T>(value.get<std::uint64_t>());
    }
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return static_cast<T>(value.get<std::int64_t>());
    }
    getLogger()->warn("Ignoring '{}': expected a non-negative integer, got {}", key, value.dump());
    return std::nullopt;
}

json weightsToJson(const CostWeights2D& w) {
    return {
        {"edgeCostStrength", w.edgeCostStrength},
        {"edgeBarrierGrad", w.edgeBarrierGrad},
        {"crossCostStrength", w.crossCostStrength},
        {"tumorCostStrength", w.tumorCostStrength},
        {"bgCostStrength", w.bgCostStrength},
        {"bgRejectMarginZ", w.bgRejectMarginZ},
        {"allowDiagonal", w.allowDiagonal},
        {"sigmaFloor", w.sigmaFloor}
    };
}

CostWeights2D jsonToWeights(const json& j) {
    CostWeights2D w;
    w.edgeCostStrength = j.value("edgeCostStrength", w.edgeCostStrength);
    w.edgeBarrierGrad = j.value("edgeBarrierGrad", w.edgeBarrierGrad);
    w.crossCostStrength = j.value("crossCostStrength", w.crossCostStrength);
    w.tumorCostStrength = j.value("tumorCostStrength", w.tumorCostStrength);
    w.bgCostStrength = j.value("bgCostStrength", w.bgCostStrength);
    w.bgRejectMarginZ = j.value("bgRejectMarginZ", w.bgRejectMarginZ);
    w.allowDiagonal = j.value("allowDiagonal", w.allowDiagonal);
    w.sigmaFloor = j.value("sigmaFloor", w.sigmaFloor);
    return w;
}

json tuning2DToJson(const CostTuning2D& t) {
    return {
        {"radialOuterW", t.radialOuterW},
        {"radialOuterCap", t.radialOuterCap},
        {"baseStepScale", t.baseStepScale},
        {"preferHighExponent", t.preferHighExponent},
        {"preferHighStrengthMul", t.preferHighStrengthMul},
        {"uphillFromLowMult", t.uphillFromLowMult}
    };
}

CostTuning2D jsonToTuning2D(const json& j) {
    CostTuning2D t;
    t.radialOuterW = j.value("radialOuterW", t.radialOuterW);
    t.radialOuterCap = j.value("radialOuterCap", t.radialOuterCap);
    t.baseStepScale = j.value("baseStepScale", t.baseStepScale);
    t.preferHighExponent = j.value("preferHighExponent", t.preferHighExponent);
    t.preferHighStrengthMul = j.value("preferHighStrengthMul", t.preferHighStrengthMul);
    t.uphillFromLowMult = j.value("uphillFromLowMult", t.uphillFromLowMult);
    return t.clamped();
}

json volumeTuningToJson(const VolumeCostTuning& t) {
    return {
        {"roiMarginVoxels", optionalToJson(t.roiMarginVoxels)},
        {"baseStepInside", t.baseStepInside},
        {"baseStepOutside", t.baseStepOutside},
        {"baseStepScale", t.baseStepScale},
        {"preferHighExponent", t.preferHighExponent},
        {"preferHighStrengthMul", t.preferHighStrengthMul},
        {"edgeWeight", t.edgeWeight},
        {"crossWeight", t.crossWeight},
        {"intensityWeight", t.intensityWeight},
        {"bgLikeWeight", t.bgLikeWeight},
        {"bgRejectMarginZ", t.bgRejectMarginZ},
        {"seedStatsRadiusVox", t.seedStatsRadiusVox},
        {"bgMaxSamples", t.bgMaxSamples},
        {"bgShellThicknessVox", t.bgShellThicknessVox}
    };
}

VolumeCostTuning jsonToVolumeTuning(const json& j) {
    VolumeCostTuning t;
    t.roiMarginVoxels = jsonToCount<int>(j, "roiMarginVoxels");
    t.baseStepInside = j.value("baseStepInside", t.baseStepInside);
    t.baseStepOutside = j.value("baseStepOutside", t.baseStepOutside);
    t.baseStepScale = j.value("baseStepScale", t.baseStepScale);
    t.preferHighExponent = j.value("preferHighExponent", t.preferHighExponent);
    t.preferHighStrengthMul = j.value("preferHighStrengthMul", t.preferHighStrengthMul);
    t.edgeWeight = j.value("edgeWeight", t.edgeWeight);
    t.crossWeight = j.value("crossWeight", t.crossWeight);
    t.intensityWeight = j.value("intensityWeight", t.intensityWeight);
    t.bgLikeWeight = j.value("bgLikeWeight", t.bgLikeWeight);
    t.bgRejectMarginZ = j.value("bgRejectMarginZ", t.bgRejectMarginZ);
    t.seedStatsRadiusVox = j.value("seedStatsRadiusVox", t.seedStatsRadiusVox);
    t.bgMaxSamples = jsonToCount<int>(j, "bgMaxSamples").value_or(t.bgMaxSamples);
    t.bgShellThicknessVox = j.value("bgShellThicknessVox", t.bgShellThicknessVox);
    return t.clamped();
}

json volumeDefaultsToJson(const VolumeGrowDefaults& v) {
    return {
        {"connectivity", static_cast<int>(v.connectivity)},
        {"yieldEvery", v.yieldEvery},
        {"maxVoxels", optionalToJson(v.maxVoxels)},
        {"seedTolerance", v.seedTolerance},
        {"roiMode", roiModeToString(v.roiMode)},
        {"outsideToleranceScale", v.outsideToleranceScale}
    };
}

VolumeGrowDefaults jsonToVolumeDefaults(const json& j) {
    VolumeGrowDefaults v;
    v.connectivity = intToConnectivity(j.value("connectivity", static_cast<int>(v.connectivity)));
    v.yieldEvery = jsonToCount<std::size_t>(j, "yieldEvery").value_or(v.yieldEvery);
    v.maxVoxels = jsonToCount<std::size_t>(j, "maxVoxels");
    v.seedTolerance = std::max(0.0, j.value("seedTolerance", v.seedTolerance));
    v.roiMode = stringToRoiMode(j.value("roiMode", roiModeToString(v.roiMode)));

    const double scale = j.value("outsideToleranceScale", v.outsideToleranceScale);
    v.outsideToleranceScale = std::isfinite(scale) ? std::clamp(scale, 0.0, 1.0) : 0.25;
    return v;
}

} // anonymous namespace

json SegmentationConfig::toJson(const SegmentationSettings& settings) {
    json root;
    root["version"] = kCurrentVersion;
    root["logLevel"] = std::string(logging::toString(settings.logLevel));
    root["costDistance2D"] = {
        {"weights", weightsToJson(settings.weights2D)},
        {"tuning", tuning2DToJson(settings.tuning2D)},
        {"seedCount", settings.seedCount2D},
        {"sliderGamma", settings.sliderGamma},
        {"gradientCacheCapacity", settings.gradientCacheCapacity}
    };
    root["volumeGrow"] = {
        {"tuning", volumeTuningToJson(settings.volumeTuning)},
        {"defaults", volumeDefaultsToJson(settings.volume)}
    };
    return root;
}

std::expected<SegmentationSettings, SegmentationError>
SegmentationConfig::fromJson(const json& root) {
    if (!root.is_object()) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Settings root must be a JSON object"
        });
    }

    if (!root.contains("version") || !root["version"].is_string()) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Missing 'version' field"
        });
    }

    const auto version = root["version"].get<std::string>();
    if (version != kCurrentVersion) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Unsupported settings version: " + version
        });
    }

    try {
        SegmentationSettings settings;

        if (root.contains("logLevel") && root["logLevel"].is_string()) {
            const auto text = root["logLevel"].get<std::string>();
            if (auto level = logging::parseLogLevel(text)) {
                settings.logLevel = *level;
            } else {
                getLogger()->warn("Unknown log level '{}', keeping {}", text,
                    logging::toString(settings.logLevel));
            }
        }

        const auto section2D = root.value("costDistance2D", json::object());
        settings.weights2D = jsonToWeights(section2D.value("weights", json::object()));
        settings.tuning2D = jsonToTuning2D(section2D.value("tuning", json::object()));
        settings.seedCount2D = std::clamp(section2D.value("seedCount", settings.seedCount2D),
                                          1, kMaxSeedCount2D);

        const double gamma = section2D.value("sliderGamma", settings.sliderGamma);
        if (std::isfinite(gamma) && gamma > 0.0) {
            settings.sliderGamma = gamma;
        }
        settings.gradientCacheCapacity = std::max<std::size_t>(
            jsonToCount<std::size_t>(section2D, "gradientCacheCapacity")
                .value_or(settings.gradientCacheCapacity), 1);

        const auto section3D = root.value("volumeGrow", json::object());
        settings.volumeTuning = jsonToVolumeTuning(section3D.value("tuning", json::object()));
        settings.volume = jsonToVolumeDefaults(section3D.value("defaults", json::object()));

        return settings;
    } catch (const json::exception& e) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            std::string("Malformed settings: ") + e.what()
        });
    }
}

std::expected<SegmentationSettings, SegmentationError>
SegmentationConfig::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        getLogger()->warn("Settings file not found: {}", path.string());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "File not found: " + path.string()
        });
    }

    json root;
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected(SegmentationError{
                SegmentationError::Code::ProcessingFailed,
                "Failed to open file: " + path.string()
            });
        }
        file >> root;
    } catch (const json::parse_error& e) {
        getLogger()->error("Failed to parse {}: {}", path.string(), e.what());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::ProcessingFailed,
            std::string("JSON parse error: ") + e.what()
        });
    }

    auto settings = fromJson(root);
    if (!settings) {
        getLogger()->error("Rejected settings from {}: {}", path.string(), settings.error().message);
        return settings;
    }

    getLogger()->info("Loaded segmentation settings from {}", path.string());
    return settings;
}

std::expected<void, SegmentationError>
SegmentationConfig::save(const SegmentationSettings& settings, const std::filesystem::path& path) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            return std::unexpected(SegmentationError{
                SegmentationError::Code::ProcessingFailed,
                "Failed to open file for writing: " + path.string()
            });
        }

        file << toJson(settings).dump(2);
        getLogger()->info("Saved segmentation settings to {}", path.string());
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(SegmentationError{
            SegmentationError::Code::ProcessingFailed,
            std::string("Failed to save settings: ") + e.what()
        });
    }
}

} // namespace seedgrow::services
