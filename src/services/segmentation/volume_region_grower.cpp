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

#include "services/segmentation/volume_region_grower.hpp"
#include "services/segmentation/cost_distance_solver.hpp"
#include "services/segmentation/robust_stats.hpp"
#include "services/segmentation/seed_sampler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <new>
#include <string>
#include <thread>
#include <utility>

#include <itkExceptionObject.h>

namespace seedgrow::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("VolumeRegionGrower");
    return logger;
}

constexpr std::size_t kRoiMaxSamples = 8192;
constexpr std::size_t kRoiMinQuantileSamples = 64;
constexpr double kTumorSigmaFloor = 0.02;
constexpr double kFallbackTumorSigma = 0.05;
constexpr double kDefaultCostBase = 18.0;
constexpr double kDefaultCostScale = 220.0;

double clamp01(double v) noexcept {
    return std::clamp(v, 0.0, 1.0);
}

YieldCallback yieldOrDefault(const YieldCallback& callback) {
    if (callback) {
        return callback;
    }
    return [] { std::this_thread::yield(); };
}

std::size_t resolveMaxVoxels(const VolumeGrowOptions& options, std::size_t total) noexcept {
    return std::max<std::size_t>(1, std::min(options.maxVoxels.value_or(total), total));
}

bool isCancelled(const VolumeGrowOptions& options) noexcept {
    return options.cancelToken.has_value() && options.cancelToken->isCancelled();
}

SegmentationError cancelledError() {
    return SegmentationError{SegmentationError::Code::Cancelled, "Region grow cancelled"};
}

template <typename Fn>
std::expected<RegionGrowResult3D, SegmentationError> guarded(Fn&& body) {
    try {
        return body();
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::bad_alloc&) {
        getLogger()->error("Out of memory during region grow");
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InternalError,
            "Out of memory"
        });
    }
    catch (const std::exception& e) {
        getLogger()->error("Standard exception: {}", e.what());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

std::vector<double> sampleBox(const VolumeView& volume, const VolumeRoiBounds& box,
                              int stride, std::size_t maxSamples) {
    std::vector<double> samples;
    for (int z = box.min.z; z <= box.max.z; z += stride) {
        for (int y = box.min.y; y <= box.max.y; y += stride) {
            for (int x = box.min.x; x <= box.max.x; x += stride) {
                samples.push_back(volume.voxels[volume.index(x, y, z)]);
                if (samples.size() >= maxSamples) {
                    return samples;
                }
            }
        }
    }
    return samples;
}

std::size_t boxVoxelCount(const VolumeRoiBounds& box) noexcept {
    return static_cast<std::size_t>(box.max.x - box.min.x + 1) *
           static_cast<std::size_t>(box.max.y - box.min.y + 1) *
           static_cast<std::size_t>(box.max.z - box.min.z + 1);
}

VolumeRoiBounds growBox(const VolumeRoiBounds& box, int margin,
                        const std::array<int, 3>& dims) noexcept {
    VolumeRoiBounds out;
    out.min = SeedPoint{std::clamp(box.min.x - margin, 0, dims[0] - 1),
                        std::clamp(box.min.y - margin, 0, dims[1] - 1),
                        std::clamp(box.min.z - margin, 0, dims[2] - 1)};
    out.max = SeedPoint{std::clamp(box.max.x + margin, 0, dims[0] - 1),
                        std::clamp(box.max.y + margin, 0, dims[1] - 1),
                        std::clamp(box.max.z + margin, 0, dims[2] - 1)};
    return out;
}

/// Thin shell just outside the ROI, sampled with a uniform skip
std::optional<RobustStats> estimateShellBackground(const VolumeView& volume,
                                                   const VolumeRoiBounds& roi,
                                                   int thickness, std::size_t maxSamples) {
    const auto outer = growBox(roi, thickness, volume.dims);
    const std::size_t outerCount = boxVoxelCount(outer);
    const std::size_t stride = outerCount > maxSamples
        ? std::max<std::size_t>(1, outerCount / maxSamples) : 1;

    std::vector<double> samples;
    std::size_t seen = 0;
    for (int z = outer.min.z; z <= outer.max.z; ++z) {
        for (int y = outer.min.y; y <= outer.max.y; ++y) {
            for (int x = outer.min.x; x <= outer.max.x; ++x) {
                if (roi.contains(x, y, z)) {
                    continue;
                }
                if (seen % stride == 0) {
                    samples.push_back(volume.voxels[volume.index(x, y, z)]);
                    if (samples.size() >= maxSamples) {
                        return estimateRobustStats(samples, kTumorSigmaFloor);
                    }
                }
                ++seen;
            }
        }
    }
    return estimateRobustStats(samples, kTumorSigmaFloor);
}

std::vector<double> sampleSeedNeighborhood(const VolumeView& volume, const SeedPoint& seed,
                                           int radius, const VolumeRoiBounds& domain) {
    std::vector<double> samples;
    for (int dz = -radius; dz <= radius; ++dz) {
        const int z = seed.z + dz;
        if (z < domain.min.z || z > domain.max.z) continue;
        for (int dy = -radius; dy <= radius; ++dy) {
            const int y = seed.y + dy;
            if (y < domain.min.y || y > domain.max.y) continue;
            for (int dx = -radius; dx <= radius; ++dx) {
                const int x = seed.x + dx;
                if (x < domain.min.x || x > domain.max.x) continue;
                samples.push_back(volume.voxels[volume.index(x, y, z)]);
            }
        }
    }
    return samples;
}

} // anonymous namespace

// =============================================================================
// Shared helpers
// =============================================================================

VolumeRoiBounds VolumeRegionGrower::clampRoi(const VolumeRoi& roi,
                                             const std::array<int, 3>& dims) noexcept {
    auto axis = [](int a, int b, int extent) {
        const int last = std::max(0, extent - 1);
        return std::pair{std::clamp(std::min(a, b), 0, last), std::clamp(std::max(a, b), 0, last)};
    };

    const auto [x0, x1] = axis(roi.min.x, roi.max.x, dims[0]);
    const auto [y0, y1] = axis(roi.min.y, roi.max.y, dims[1]);
    const auto [z0, z1] = axis(roi.min.z, roi.max.z, dims[2]);
    return VolumeRoiBounds{SeedPoint{x0, y0, z0}, SeedPoint{x1, y1, z1}};
}

int VolumeRegionGrower::defaultRoiMargin(const VolumeRoiBounds& roi) noexcept {
    const int extent = std::max({roi.max.x - roi.min.x + 1,
                                 roi.max.y - roi.min.y + 1,
                                 roi.max.z - roi.min.z + 1});
    return std::clamp(static_cast<int>(std::lround(extent * 0.1)), 2, 12);
}

std::optional<SegmentationError> VolumeRegionGrower::validateInput(
    const VolumeView& volume,
    const SeedPoint& seed
) {
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
            "Seed point (" + std::to_string(seed.x) + ", " + std::to_string(seed.y) + ", " +
            std::to_string(seed.z) + ") is out of volume bounds"
        };
    }
    return std::nullopt;
}

// =============================================================================
// Threshold flood fill
// =============================================================================

std::expected<RegionGrowResult3D, SegmentationError>
VolumeRegionGrower::connectedThreshold(
    IntensityVolume::Pointer volume,
    const ThresholdGrowParameters& params
) const {
    auto view = makeVolumeView(volume.GetPointer());
    if (!view) {
        getLogger()->error("{}", view.error().message);
        return std::unexpected(view.error());
    }
    return connectedThreshold(*view, params);
}

std::expected<RegionGrowResult3D, SegmentationError>
VolumeRegionGrower::connectedThreshold(
    const VolumeView& volume,
    const ThresholdGrowParameters& params
) const {
    getLogger()->info("Connected threshold: seed ({}, {}, {}), range [{:.3f}, {:.3f}]",
        params.seed.x, params.seed.y, params.seed.z, params.min, params.max);

    if (auto error = validateInput(volume, params.seed)) {
        getLogger()->error("{}", error->message);
        return std::unexpected(*error);
    }

    if (!params.isValid()) {
        getLogger()->error("Invalid parameters");
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidParameters,
            "Invalid parameters: range bounds must be finite"
        });
    }

    return guarded([&]() -> std::expected<RegionGrowResult3D, SegmentationError> {
        const auto& dims = volume.dims;
        const std::size_t total = volume.expectedSize();
        const auto& options = params.options;

        const double minV = std::min(params.min, params.max);
        const double maxV = std::max(params.min, params.max);

        RegionGrowResult3D result;
        const std::size_t seedIndex = volume.index(params.seed.x, params.seed.y, params.seed.z);
        result.seedValue = volume.voxels[seedIndex];

        if (!(result.seedValue >= minV && result.seedValue <= maxV)) {
            getLogger()->info("Seed value {:.3f} outside range; nothing to grow", result.seedValue);
            return result;
        }

        std::optional<VolumeRoiBounds> roi;
        bool hard = false;
        double outsideLo = minV;
        double outsideHi = maxV;
        if (params.roi) {
            roi = clampRoi(*params.roi, dims);
            hard = params.roi->mode == RoiMode::Hard;

            const double s = std::isfinite(params.roi->outsideToleranceScale)
                ? clamp01(params.roi->outsideToleranceScale) : 0.25;
            outsideLo = result.seedValue - (result.seedValue - minV) * s;
            outsideHi = result.seedValue + (maxV - result.seedValue) * s;

            if (hard && !roi->contains(params.seed.x, params.seed.y, params.seed.z)) {
                getLogger()->info("Seed outside hard ROI; nothing to grow");
                return result;
            }
        }

        const SolverDomain domain = hard
            ? SolverDomain(dims, {roi->min.x, roi->min.y, roi->min.z},
                           {roi->max.x, roi->max.y, roi->max.z})
            : SolverDomain::fullGrid(dims);

        auto accept = [&](std::size_t i, int x, int y, int z) {
            const double v = volume.voxels[i];
            if (roi && !hard && !roi->contains(x, y, z)) {
                return v >= outsideLo && v <= outsideHi;
            }
            return v >= minV && v <= maxV;
        };

        const std::size_t maxVoxels = resolveMaxVoxels(options, total);
        const auto neighborhood = makeNeighborhood3D(options.connectivity);
        const auto onYield = yieldOrDefault(options.onYield);

        std::vector<std::uint8_t> visited(total, 0);
        auto& queue = result.indices;
        queue.reserve(std::min<std::size_t>(maxVoxels, 1u << 20));

        queue.push_back(static_cast<std::uint32_t>(seedIndex));
        visited[seedIndex] = 1;

        std::size_t head = 0;
        std::size_t processed = 0;

        while (head < queue.size() && !result.hitMaxVoxels) {
            if (isCancelled(options)) {
                getLogger()->debug("Connected threshold cancelled after {} voxels", processed);
                return std::unexpected(cancelledError());
            }

            const std::size_t i = queue[head++];
            ++processed;

            if (options.yieldEvery > 0 && processed % options.yieldEvery == 0) {
                if (options.onProgress) {
                    options.onProgress(processed, queue.size());
                }
                onYield();
            }

            const std::size_t strideZ = static_cast<std::size_t>(dims[0]) *
                                        static_cast<std::size_t>(dims[1]);
            const int z = static_cast<int>(i / strideZ);
            const std::size_t rest = i - static_cast<std::size_t>(z) * strideZ;
            const int y = static_cast<int>(rest / static_cast<std::size_t>(dims[0]));
            const int x = static_cast<int>(rest - static_cast<std::size_t>(y) *
                                                  static_cast<std::size_t>(dims[0]));

            for (const auto& offset : neighborhood) {
                const int nx = x + offset.dx;
                const int ny = y + offset.dy;
                const int nz = z + offset.dz;
                if (!domain.contains(nx, ny, nz)) {
                    continue;
                }
                const std::size_t ni = volume.index(nx, ny, nz);
                if (visited[ni] != 0 || !accept(ni, nx, ny, nz)) {
                    continue;
                }
                if (queue.size() >= maxVoxels) {
                    result.hitMaxVoxels = true;
                    break;
                }
                visited[ni] = 1;
                queue.push_back(static_cast<std::uint32_t>(ni));
            }
        }

        if (options.debug) {
            getLogger()->info("Connected threshold: processed={} included={} hitMax={}",
                processed, queue.size(), result.hitMaxVoxels);
        }
        getLogger()->info("Connected threshold grew {} voxels{}",
            queue.size(), result.hitMaxVoxels ? " (voxel cap reached)" : "");
        return result;
    });
}

// =============================================================================
// Cost-guided grow
// =============================================================================

std::expected<RegionGrowResult3D, SegmentationError>
VolumeRegionGrower::costGuided(
    IntensityVolume::Pointer volume,
    const GuidedGrowParameters& params
) const {
    auto view = makeVolumeView(volume.GetPointer());
    if (!view) {
        getLogger()->error("{}", view.error().message);
        return std::unexpected(view.error());
    }
    return costGuided(*view, params);
}

std::expected<RegionGrowResult3D, SegmentationError>
VolumeRegionGrower::costGuided(
    const VolumeView& volume,
    const GuidedGrowParameters& params
) const {
    getLogger()->info("Cost-guided grow: seed ({}, {}, {}), range [{:.3f}, {:.3f}], {} extra seeds",
        params.seed.x, params.seed.y, params.seed.z, params.min, params.max,
        params.seedIndices.size());

    if (auto error = validateInput(volume, params.seed)) {
        getLogger()->error("{}", error->message);
        return std::unexpected(*error);
    }

    if (!params.isValid()) {
        getLogger()->error("Invalid parameters");
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidParameters,
            "Invalid parameters: range bounds and cost budget must be finite"
        });
    }

    const std::size_t total = volume.expectedSize();
    if (!params.roi && total > kMaxVoxelsWithoutRoi) {
        getLogger()->error("Volume of {} voxels needs an ROI", total);
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidParameters,
            "Cost-guided grow requires an ROI for volumes above " +
            std::to_string(kMaxVoxelsWithoutRoi) + " voxels"
        });
    }

    return guarded([&]() -> std::expected<RegionGrowResult3D, SegmentationError> {
        const auto& dims = volume.dims;
        const auto& options = params.options;
        const auto tuning = params.tuning.clamped();

        GuidedGrowDiagnostics diag;
        diag.minValue = std::min(params.min, params.max);
        diag.maxValue = std::max(params.min, params.max);

        RegionGrowResult3D result;
        result.seedValue = volume.voxels[volume.index(params.seed.x, params.seed.y, params.seed.z)];

        std::optional<VolumeRoiBounds> roi;
        double outsideScale = 0.25;
        if (params.roi) {
            roi = clampRoi(*params.roi, dims);
            if (std::isfinite(params.roi->outsideToleranceScale)) {
                outsideScale = clamp01(params.roi->outsideToleranceScale);
            }
        }
        const bool hard = roi && params.roi->mode == RoiMode::Hard;

        // ROI samples feed tumour stats, gates and bright inclusion
        std::vector<double> roiSamples;
        std::optional<SampleQuantiles> roiQuantiles;
        if (roi) {
            const double roiCount = static_cast<double>(boxVoxelCount(*roi));
            const int stride = std::clamp(
                static_cast<int>(std::floor(std::cbrt(roiCount / kRoiMaxSamples))), 1, 8);
            roiSamples = sampleBox(volume, *roi, stride, kRoiMaxSamples);
            roiQuantiles = sampleQuantiles(roiSamples, 0.02, 0.995, kRoiMinQuantileSamples);
        }

        if (roiQuantiles) {
            const auto above = static_cast<std::size_t>(std::count_if(
                roiSamples.begin(), roiSamples.end(),
                [&](double v) { return v > diag.maxValue; }));
            const std::size_t minAbove = std::max<std::size_t>(
                8, static_cast<std::size_t>(std::floor(roiSamples.size() * 0.002)));
            if (above >= minAbove && std::isfinite(roiQuantiles->q99)) {
                diag.maxValue = std::max(diag.maxValue, roiQuantiles->q99);
            }
        }

        const double tolWidth = std::max(1e-6, std::max(result.seedValue - diag.minValue,
                                                        diag.maxValue - result.seedValue));

        if (roi) {
            diag.roiMarginVoxels = tuning.roiMarginVoxels.value_or(defaultRoiMargin(*roi));
        } else {
            diag.roiMarginVoxels = tuning.roiMarginVoxels.value_or(0);
        }

        if (!roi) {
            diag.domain = VolumeRoiBounds{SeedPoint{0, 0, 0},
                                          SeedPoint{dims[0] - 1, dims[1] - 1, dims[2] - 1}};
        } else if (hard || diag.roiMarginVoxels <= 0) {
            diag.domain = *roi;
        } else {
            diag.domain = growBox(*roi, diag.roiMarginVoxels, dims);
        }

        if (hard && !roi->contains(params.seed.x, params.seed.y, params.seed.z)) {
            getLogger()->info("Seed outside hard ROI; nothing to grow");
            return result;
        }

        diag.maxCost = params.maxCost && *params.maxCost >= 0.0
            ? *params.maxCost
            : kDefaultCostBase + tolWidth * kDefaultCostScale;

        if (roiQuantiles && roiSamples.size() >= kRoiMinQuantileSamples) {
            diag.tumor = estimateRobustStats(roiSamples, kTumorSigmaFloor)
                .value_or(RobustStats{result.seedValue, kFallbackTumorSigma});
        } else {
            const auto local = sampleSeedNeighborhood(volume, params.seed,
                                                      tuning.seedStatsRadiusVox, diag.domain);
            diag.tumor = estimateRobustStats(local, kTumorSigmaFloor)
                .value_or(RobustStats{result.seedValue, kFallbackTumorSigma});
        }

        if (roi) {
            diag.background = estimateShellBackground(
                volume, *roi, tuning.bgShellThicknessVox,
                static_cast<std::size_t>(tuning.bgMaxSamples));
        }

        VolumeCostContext context;
        context.tumor = diag.tumor;
        context.background = diag.background;
        context.gates = IntensityGates::fromStats(
            diag.tumor,
            roiQuantiles ? std::optional<double>(roiQuantiles->low) : std::nullopt,
            roiQuantiles ? std::optional<double>(roiQuantiles->high) : std::nullopt,
            1.0);
        context.seedValue = result.seedValue;
        context.minValue = diag.minValue;
        context.maxValue = diag.maxValue;
        context.roi = roi;
        context.roiMode = hard ? RoiMode::Hard : RoiMode::Guide;
        context.outsideScale = outsideScale;
        context.tuning = tuning;

        const StepCostModel3D costModel(volume, context);
        diag.edgeBarrier = costModel.edgeBarrier();

        const SolverDomain domain(dims,
            {diag.domain.min.x, diag.domain.min.y, diag.domain.min.z},
            {diag.domain.max.x, diag.domain.max.y, diag.domain.max.z});

        const auto seeds = resolveVolumeSeeds(dims, params.seed, params.seedIndices, domain,
                                              hard ? roi : std::nullopt);
        if (seeds.empty()) {
            getLogger()->info("No seed inside the grow domain; nothing to grow");
            result.diagnostics = diag;
            return result;
        }

        const auto neighborhood = makeNeighborhood3D(options.connectivity);

        SolverOptions solverOptions;
        solverOptions.maxCost = diag.maxCost;
        solverOptions.maxVoxels = resolveMaxVoxels(options, total);
        solverOptions.recordOrder = true;
        solverOptions.yieldEvery = options.yieldEvery;
        solverOptions.onYield = yieldOrDefault(options.onYield);
        solverOptions.onProgress = options.onProgress;
        solverOptions.cancelToken = options.cancelToken;

        auto solved = solveCostDistance(domain, seeds, neighborhood, costModel, solverOptions);
        if (!solved) {
            if (solved.error().isCancelled()) {
                getLogger()->debug("Cost-guided grow cancelled");
            } else {
                getLogger()->error("Cost-guided grow failed: {}", solved.error().message);
            }
            return std::unexpected(solved.error());
        }

        result.indices = std::move(solved->order);
        result.hitMaxVoxels = solved->hitMaxVoxels;

        if (roi) {
            const std::size_t strideZ = static_cast<std::size_t>(dims[0]) *
                                        static_cast<std::size_t>(dims[1]);
            for (std::uint32_t gi : result.indices) {
                const std::size_t z = gi / strideZ;
                const std::size_t rest = gi - z * strideZ;
                const std::size_t y = rest / static_cast<std::size_t>(dims[0]);
                const std::size_t x = rest - y * static_cast<std::size_t>(dims[0]);
                if (roi->contains(static_cast<int>(x), static_cast<int>(y), static_cast<int>(z))) {
                    ++diag.insideRoiCount;
                } else {
                    ++diag.outsideRoiCount;
                }
            }
        } else {
            diag.insideRoiCount = result.indices.size();
        }

        if (options.debug) {
            getLogger()->info(
                "dims=({}, {}, {}) seedValue={:.3f} band=[{:.3f}, {:.3f}] maxCost={:.1f} "
                "domain=[{}, {}, {}]-[{}, {}, {}] margin={} tumor(mu={:.3f}, sigma={:.3f}) "
                "bg={} edgeBarrier={:.3f} kept={} inside={} outside={}",
                dims[0], dims[1], dims[2], result.seedValue, diag.minValue, diag.maxValue,
                diag.maxCost, diag.domain.min.x, diag.domain.min.y, diag.domain.min.z,
                diag.domain.max.x, diag.domain.max.y, diag.domain.max.z, diag.roiMarginVoxels,
                diag.tumor.mu, diag.tumor.sigma,
                diag.background ? fmt::format("(mu={:.3f}, sigma={:.3f})",
                                              diag.background->mu, diag.background->sigma)
                                : std::string("none"),
                diag.edgeBarrier, result.indices.size(), diag.insideRoiCount,
                diag.outsideRoiCount);
        }

        getLogger()->info("Cost-guided grow included {} voxels{}",
            result.indices.size(), result.hitMaxVoxels ? " (voxel cap reached)" : "");

        result.diagnostics = diag;
        return result;
    });
}

} // namespace seedgrow::services
