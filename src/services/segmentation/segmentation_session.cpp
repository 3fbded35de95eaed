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

#include "services/segmentation/segmentation_session.hpp"
#include "services/segmentation/roi_geometry.hpp"
#include "core/logging.hpp"

#include <mutex>
#include <string>
#include <utility>

namespace seedgrow::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SegmentationSession");
    return logger;
}

std::optional<SegmentationError> checkSeed(const VolumeView& volume, const SeedPoint& seed) {
    const std::size_t expected = volume.expectedSize();
    if (expected == 0 || volume.voxels.size() != expected) {
        return SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Volume length mismatch (expected " + std::to_string(expected) +
            ", got " + std::to_string(volume.voxels.size()) + ")"
        };
    }
    if (!volume.inBounds(seed.x, seed.y, seed.z)) {
        return SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Seed point is out of volume bounds"
        };
    }
    return std::nullopt;
}

} // anonymous namespace

class SegmentationSession::Impl {
public:
    explicit Impl(SegmentationSettings settings)
        : settings_(std::move(settings))
        , cache_(settings_.gradientCacheCapacity) {}

    mutable std::mutex mutex_;
    SegmentationSettings settings_;
    std::optional<CancellationToken> preview_;

    mutable GradientFieldCache cache_;
    CostDistanceSegmenter2D segmenter2D_;
    VolumeRegionGrower grower_;

    VolumeGrowOptions growOptions() const {
        std::lock_guard lock(mutex_);
        VolumeGrowOptions options;
        options.connectivity = settings_.volume.connectivity;
        options.yieldEvery = settings_.volume.yieldEvery;
        options.maxVoxels = settings_.volume.maxVoxels;
        return options;
    }

    std::optional<VolumeRoi> makeRoi(const std::optional<VolumeRoiBounds>& bounds) const {
        if (!bounds) {
            return std::nullopt;
        }
        std::lock_guard lock(mutex_);
        return VolumeRoi{bounds->min, bounds->max, settings_.volume.roiMode,
                         settings_.volume.outsideToleranceScale};
    }
};

SegmentationSession::SegmentationSession(SegmentationSettings settings)
    : pImpl_(std::make_unique<Impl>(std::move(settings))) {}

SegmentationSession::~SegmentationSession() = default;

SegmentationSession::SegmentationSession(SegmentationSession&&) noexcept = default;
SegmentationSession& SegmentationSession::operator=(SegmentationSession&&) noexcept = default;

// ----------------------------------------------------------------------------
// Settings
// ----------------------------------------------------------------------------

SegmentationSettings SegmentationSession::settings() const {
    std::lock_guard lock(pImpl_->mutex_);
    return pImpl_->settings_;
}

void SegmentationSession::setSettings(const SegmentationSettings& settings) {
    {
        std::lock_guard lock(pImpl_->mutex_);
        pImpl_->settings_ = settings;
    }
    pImpl_->cache_.setCapacity(settings.gradientCacheCapacity);
}

void SegmentationSession::applyLogLevel() const {
    const auto level = settings().logLevel;
    logging::LoggerFactory::setGlobalLevel(level);
    getLogger()->info("Log level set to {}", logging::toString(level));
}

std::expected<void, SegmentationError>
SegmentationSession::loadSettings(const std::filesystem::path& path) {
    auto loaded = SegmentationConfig::load(path);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    setSettings(*loaded);
    return {};
}

std::expected<void, SegmentationError>
SegmentationSession::saveSettings(const std::filesystem::path& path) const {
    return SegmentationConfig::save(settings(), path);
}

// ----------------------------------------------------------------------------
// Preview cancellation
// ----------------------------------------------------------------------------

CancellationToken SegmentationSession::beginPreview() {
    std::lock_guard lock(pImpl_->mutex_);
    if (pImpl_->preview_) {
        pImpl_->preview_->requestCancel();
        getLogger()->debug("Superseded preview cancelled");
    }
    CancellationToken token;
    pImpl_->preview_ = token;
    return token;
}

void SegmentationSession::cancelPreview() {
    std::lock_guard lock(pImpl_->mutex_);
    if (pImpl_->preview_) {
        pImpl_->preview_->requestCancel();
        pImpl_->preview_.reset();
    }
}

// ----------------------------------------------------------------------------
// 2D cost distance
// ----------------------------------------------------------------------------

CostDistanceParameters2D SegmentationSession::makeCostDistanceParameters(const PixelPoint& seed) const {
    std::lock_guard lock(pImpl_->mutex_);
    CostDistanceParameters2D params;
    params.seed = seed;
    params.weights = pImpl_->settings_.weights2D;
    params.tuning = pImpl_->settings_.tuning2D;
    params.seedCount = pImpl_->settings_.seedCount2D;
    params.gradientCache = &pImpl_->cache_;
    return params;
}

std::expected<CostDistanceResult2D, SegmentationError>
SegmentationSession::computeCostDistance2D(const GrayView2D& gray, CostDistanceParameters2D params) const {
    if (params.gradientCache == nullptr) {
        params.gradientCache = &pImpl_->cache_;
    }
    return pImpl_->segmenter2D_.computeCostDistanceMap(gray, params);
}

std::expected<CostDistanceResult2D, SegmentationError>
SegmentationSession::previewCostDistance2D(const GrayView2D& gray, CostDistanceParameters2D params) {
    params.cancelToken = beginPreview();
    return computeCostDistance2D(gray, std::move(params));
}

bool SegmentationSession::invalidateGrid(const GridKey& key) {
    return pImpl_->cache_.invalidate(key);
}

void SegmentationSession::clearGradientCache() {
    pImpl_->cache_.clear();
}

const GradientFieldCache& SegmentationSession::gradientCache() const noexcept {
    return pImpl_->cache_;
}

// ----------------------------------------------------------------------------
// 3D growth
// ----------------------------------------------------------------------------

std::expected<GuidedGrowParameters, SegmentationError>
SegmentationSession::makeGuidedGrowParameters(
    const VolumeView& volume,
    const SeedPoint& seed,
    const std::optional<VolumeRoiBounds>& roi) const
{
    if (auto error = checkSeed(volume, seed)) {
        return std::unexpected(*error);
    }

    const auto current = settings();
    const auto range = computeSeedRange01(volume.voxels[volume.index(seed.x, seed.y, seed.z)],
                                          current.volume.seedTolerance);

    GuidedGrowParameters params;
    params.seed = seed;
    params.min = range.min;
    params.max = range.max;
    params.roi = pImpl_->makeRoi(roi);
    params.tuning = current.volumeTuning;
    params.options = pImpl_->growOptions();
    return params;
}

std::expected<ThresholdGrowParameters, SegmentationError>
SegmentationSession::makeThresholdGrowParameters(
    const VolumeView& volume,
    const SeedPoint& seed,
    const std::optional<VolumeRoiBounds>& roi) const
{
    if (auto error = checkSeed(volume, seed)) {
        return std::unexpected(*error);
    }

    const auto range = computeSeedRange01(volume.voxels[volume.index(seed.x, seed.y, seed.z)],
                                          settings().volume.seedTolerance);

    ThresholdGrowParameters params;
    params.seed = seed;
    params.min = range.min;
    params.max = range.max;
    params.roi = pImpl_->makeRoi(roi);
    params.options = pImpl_->growOptions();
    return params;
}

std::expected<RegionGrowResult3D, SegmentationError>
SegmentationSession::growVolume(const VolumeView& volume, const GuidedGrowParameters& params) const {
    return pImpl_->grower_.costGuided(volume, params);
}

std::expected<RegionGrowResult3D, SegmentationError>
SegmentationSession::growVolume(const VolumeView& volume, const ThresholdGrowParameters& params) const {
    return pImpl_->grower_.connectedThreshold(volume, params);
}

} // namespace seedgrow::services
