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

#include "services/segmentation/cost_distance_segmenter.hpp"
#include "services/segmentation/cost_distance_solver.hpp"
#include "services/segmentation/robust_stats.hpp"
#include "services/segmentation/seed_sampler.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <utility>

#include <itkExceptionObject.h>

namespace seedgrow::services {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("CostDistance2D");
    return logger;
}

constexpr double kTumorDiskRadius = 5.0;
constexpr double kFallbackTumorSigma = 10.0;

constexpr std::size_t kSeedBoxMaxSamples = 2048;
constexpr int kSeedBoxEdgeExclusion = 220;
constexpr std::size_t kSeedBoxMinQuantileSamples = 32;

constexpr double kAnnulusMinRadius = 14.0;
constexpr double kAnnulusMaxRadius = 52.0;
constexpr int kAnnulusEdgeExclusion = 200;
constexpr std::size_t kAnnulusMaxSamples = 1024;

constexpr int kBarrierRingMin = 8;
constexpr int kBarrierRingMax = 22;
constexpr int kBarrierRingStride = 2;
constexpr std::size_t kBarrierMaxSamples = 256;
constexpr double kMinEdgeBarrier = 25.0;

int roundHalfUp(double v) noexcept {
    return static_cast<int>(std::floor(v + 0.5));
}

Roi2D clampRoiToGrid(const Roi2D& roi, int width, int height) noexcept {
    const int x0 = std::clamp(roi.x0, 0, width - 1);
    const int x1 = std::clamp(roi.x1, 0, width - 1);
    const int y0 = std::clamp(roi.y0, 0, height - 1);
    const int y1 = std::clamp(roi.y1, 0, height - 1);
    return Roi2D{std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
}

std::size_t indexOf(const GrayView2D& gray, int x, int y) noexcept {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(gray.width) +
           static_cast<std::size_t>(x);
}

struct TumorPrior {
    RobustStats stats;
    std::optional<double> qLo;
    std::optional<double> qHi;
};

std::vector<double> sampleDisk(const GrayView2D& gray, const PixelPoint& c, double r,
                               const Roi2D& roi) {
    std::vector<double> out;

    const int x0 = std::clamp(static_cast<int>(std::floor(c.x - r)), roi.x0, roi.x1);
    const int x1 = std::clamp(static_cast<int>(std::ceil(c.x + r)), roi.x0, roi.x1);
    const int y0 = std::clamp(static_cast<int>(std::floor(c.y - r)), roi.y0, roi.y1);
    const int y1 = std::clamp(static_cast<int>(std::ceil(c.y + r)), roi.y0, roi.y1);

    const double r2 = r * r;
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            const double dx = x - c.x;
            const double dy = y - c.y;
            if (dx * dx + dy * dy > r2) {
                continue;
            }
            out.push_back(gray.at(x, y));
        }
    }
    return out;
}

TumorPrior estimateTumorPrior(const GrayView2D& gray, const GradientField& grad,
                              const PixelPoint& seed, const Roi2D& roi,
                              const std::optional<Roi2D>& explicitBox, double sigmaFloor) {
    TumorPrior prior;

    if (explicitBox) {
        const auto& box = *explicitBox;
        const double area = static_cast<double>(box.width()) * box.height();
        const int stride = std::clamp(
            static_cast<int>(std::floor(std::sqrt(area / kSeedBoxMaxSamples))), 1, 6);

        std::vector<double> samples;
        for (int y = box.y0; y <= box.y1 && samples.size() < kSeedBoxMaxSamples; y += stride) {
            for (int x = box.x0; x <= box.x1; x += stride) {
                const std::size_t i = indexOf(gray, x, y);
                // Strong edges tend to be background boundaries
                if (grad[i] > kSeedBoxEdgeExclusion) {
                    continue;
                }
                samples.push_back(gray.pixels[i]);
                if (samples.size() >= kSeedBoxMaxSamples) {
                    break;
                }
            }
        }

        if (auto q = sampleQuantiles(samples, 0.02, 0.995, kSeedBoxMinQuantileSamples)) {
            prior.qLo = q->low;
            prior.qHi = q->high;
        }

        if (auto stats = estimateRobustStats(samples, sigmaFloor)) {
            prior.stats = *stats;
            return prior;
        }
    }

    const auto disk = sampleDisk(gray, seed, kTumorDiskRadius, roi);
    prior.stats = estimateRobustStats(disk, sigmaFloor)
        .value_or(RobustStats{static_cast<double>(gray.at(seed.x, seed.y)), kFallbackTumorSigma});
    return prior;
}

std::optional<RobustStats> estimateBackground(const GrayView2D& gray, const GradientField& grad,
                                              const PixelPoint& seed, const Roi2D& roi,
                                              double sigmaFloor) {
    const double area = static_cast<double>(roi.width()) * roi.height();
    const int stride = std::clamp(
        static_cast<int>(std::floor(std::sqrt(area / kAnnulusMaxSamples))), 1, 8);

    const double rMin2 = kAnnulusMinRadius * kAnnulusMinRadius;
    const double rMax2 = kAnnulusMaxRadius * kAnnulusMaxRadius;

    std::vector<double> samples;
    for (int y = roi.y0; y <= roi.y1 && samples.size() < kAnnulusMaxSamples; y += stride) {
        for (int x = roi.x0; x <= roi.x1; x += stride) {
            const double dx = x - seed.x;
            const double dy = y - seed.y;
            const double d2 = dx * dx + dy * dy;
            if (d2 < rMin2 || d2 > rMax2) {
                continue;
            }
            const std::size_t i = indexOf(gray, x, y);
            if (grad[i] > kAnnulusEdgeExclusion) {
                continue;
            }
            samples.push_back(gray.pixels[i]);
            if (samples.size() >= kAnnulusMaxSamples) {
                break;
            }
        }
    }

    return estimateRobustStats(samples, sigmaFloor);
}

double estimateEdgeBarrier(const GradientField& grad, const PixelPoint& seed, const Roi2D& roi,
                           double requested) {
    if (requested >= 0.0) {
        return std::clamp(roundHalfUp(requested), 0, 255);
    }

    const int rMin2 = kBarrierRingMin * kBarrierRingMin;
    const int rMax2 = kBarrierRingMax * kBarrierRingMax;

    std::vector<double> samples;
    for (int y = roi.y0; y <= roi.y1 && samples.size() < kBarrierMaxSamples;
         y += kBarrierRingStride) {
        for (int x = roi.x0; x <= roi.x1; x += kBarrierRingStride) {
            const int dx = x - seed.x;
            const int dy = y - seed.y;
            const int d2 = dx * dx + dy * dy;
            if (d2 < rMin2 || d2 > rMax2) {
                continue;
            }
            samples.push_back(grad.at(x, y));
            if (samples.size() >= kBarrierMaxSamples) {
                break;
            }
        }
    }

    const double median = samples.empty() ? 0.0 : medianOf(samples);
    return std::max(kMinEdgeBarrier, static_cast<double>(roundHalfUp(median * 1.2)));
}

} // anonymous namespace

Roi2D CostDistanceSegmenter2D::defaultRoi(const PixelPoint& seed, int width, int height) noexcept {
    const int minDim = std::max(1, std::min(width, height));

    // Upper bound may fall below 80 on small grids; the lower bound wins then
    const int r = std::max(80, std::min(roundHalfUp(minDim * 0.9), roundHalfUp(minDim * 0.45)));

    return clampRoiToGrid(Roi2D{seed.x - r, seed.y - r, seed.x + r, seed.y + r}, width, height);
}

std::expected<CostDistanceResult2D, SegmentationError>
CostDistanceSegmenter2D::computeCostDistanceMap(
    GrayImage2D::Pointer gray,
    const CostDistanceParameters2D& params
) const {
    auto view = makeGrayView(gray.GetPointer());
    if (!view) {
        getLogger()->error("{}", view.error().message);
        return std::unexpected(view.error());
    }
    return computeCostDistanceMap(*view, params);
}

std::expected<CostDistanceResult2D, SegmentationError>
CostDistanceSegmenter2D::computeCostDistanceMap(
    const GrayView2D& gray,
    const CostDistanceParameters2D& params
) const {
    const int w = gray.width;
    const int h = gray.height;

    if (w <= 0 || h <= 0) {
        getLogger()->error("Invalid image size {}x{}", w, h);
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Invalid image size"
        });
    }

    const std::size_t expected = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
    if (gray.pixels.size() != expected) {
        getLogger()->error("Pixel buffer size mismatch (expected {}, got {})",
            expected, gray.pixels.size());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidInput,
            "Pixel buffer size does not match the image dimensions"
        });
    }

    if (!params.isValid()) {
        getLogger()->error("Invalid parameters");
        return std::unexpected(SegmentationError{
            SegmentationError::Code::InvalidParameters,
            "Invalid parameters: weights must be finite and non-negative"
        });
    }

    try {
        CostDistanceResult2D result;
        result.width = w;
        result.height = h;
        result.seed = PixelPoint{std::clamp(params.seed.x, 0, w - 1),
                                 std::clamp(params.seed.y, 0, h - 1)};
        result.roi = params.roi ? clampRoiToGrid(*params.roi, w, h)
                                : defaultRoi(result.seed, w, h);

        // The anchor always seeds the field, so the ROI must contain it
        result.roi.x0 = std::min(result.roi.x0, result.seed.x);
        result.roi.y0 = std::min(result.roi.y0, result.seed.y);
        result.roi.x1 = std::max(result.roi.x1, result.seed.x);
        result.roi.y1 = std::max(result.roi.y1, result.seed.y);
        result.weights = params.weights;
        result.tuning = params.tuning.clamped();

        const auto& seed = result.seed;
        const auto& roi = result.roi;
        const auto& weights = result.weights;
        const auto& tuning = result.tuning;

        std::shared_ptr<const GradientField> grad;
        if (params.gradientCache) {
            grad = params.gradientCache->getOrCompute(
                params.gridKey.value_or(GridKey::fromContent(gray)), gray);
        } else {
            grad = std::make_shared<const GradientField>(computeSobelMagnitude(gray));
        }

        std::optional<Roi2D> explicitBox;
        if (params.seedBox) {
            explicitBox = clampSeedBox(*params.seedBox, roi);
        }
        result.seedBox = explicitBox.value_or(defaultSeedBox(seed, roi));

        const auto prior = estimateTumorPrior(gray, *grad, seed, roi, explicitBox,
                                              weights.sigmaFloor);
        result.stats.tumor = prior.stats;
        result.stats.background = estimateBackground(gray, *grad, seed, roi, weights.sigmaFloor);
        result.stats.edgeBarrier = estimateEdgeBarrier(*grad, seed, roi, weights.edgeBarrierGrad);

        const auto gates = IntensityGates::fromStats(prior.stats, prior.qLo, prior.qHi, 255.0);

        SeedSamplingRequest2D request;
        request.gray = gray;
        request.gradient = grad.get();
        request.anchor = seed;
        request.seedBox = result.seedBox;
        request.seedCount = params.seedCount;
        request.tumor = result.stats.tumor;
        request.background = result.stats.background;
        request.edgeBarrier = result.stats.edgeBarrier;
        request.bgRejectMarginZ = weights.bgRejectMarginZ;

        if (params.random) {
            result.seeds = sampleSeeds2D(request, *params.random);
        } else {
            const std::uint32_t rngSeed = params.seedRngSeed
                ? mixU32(*params.seedRngSeed)
                : deriveSeedRngSeed(indexOf(gray, seed.x, seed.y), roi, result.seedBox);
            Mulberry32 rng(rngSeed);
            result.seeds = sampleSeeds2D(request, rng);
        }

        if (params.debug) {
            const auto& bg = result.stats.background;
            getLogger()->info(
                "seed=({}, {}) seeds={} roi=[{}, {}]-[{}, {}] seedBox=[{}, {}]-[{}, {}] "
                "tumor(mu={:.2f}, sigma={:.2f}) bg={} edgeBarrier={:.0f}",
                seed.x, seed.y, result.seeds.size(),
                roi.x0, roi.y0, roi.x1, roi.y1,
                result.seedBox.x0, result.seedBox.y0, result.seedBox.x1, result.seedBox.y1,
                result.stats.tumor.mu, result.stats.tumor.sigma,
                bg ? fmt::format("(mu={:.2f}, sigma={:.2f})", bg->mu, bg->sigma)
                   : std::string("none"),
                result.stats.edgeBarrier);
            getLogger()->info(
                "weights edge={} barrierGrad={} cross={} tumor={} bg={} margin={} diagonal={} "
                "tuning radialW={} radialCap={} baseStep={} preferExp={} preferMul={} upLow={}",
                weights.edgeCostStrength, weights.edgeBarrierGrad, weights.crossCostStrength,
                weights.tumorCostStrength, weights.bgCostStrength, weights.bgRejectMarginZ,
                weights.allowDiagonal, tuning.radialOuterW, tuning.radialOuterCap,
                tuning.baseStepScale, tuning.preferHighExponent, tuning.preferHighStrengthMul,
                tuning.uphillFromLowMult);
        }

        StepCostModel2D::Inputs inputs;
        inputs.gray = gray;
        inputs.gradient = grad.get();
        inputs.tumor = result.stats.tumor;
        inputs.background = result.stats.background;
        inputs.gates = gates;
        inputs.edgeBarrier = result.stats.edgeBarrier;
        inputs.weights = weights;
        inputs.tuning = tuning;
        if (tuning.radialOuterW > 0.0 && tuning.radialOuterCap > 0.0) {
            RadialPrior2D radial;
            radial.cx = seed.x;
            radial.cy = seed.y;
            radial.hx = std::max(1e-6, (result.seedBox.x1 - result.seedBox.x0 + 1) * 0.5);
            radial.hy = std::max(1e-6, (result.seedBox.y1 - result.seedBox.y0 + 1) * 0.5);
            radial.weight = tuning.radialOuterW;
            radial.cap = tuning.radialOuterCap;
            inputs.radial = radial;
        }
        const StepCostModel2D costModel(std::move(inputs));

        const SolverDomain domain({w, h, 1}, {roi.x0, roi.y0, 0}, {roi.x1, roi.y1, 0});

        std::vector<std::array<int, 3>> seedCells;
        seedCells.reserve(result.seeds.size());
        for (const auto& s : result.seeds) {
            seedCells.push_back({s.x, s.y, 0});
        }

        const auto neighborhood = makeNeighborhood2D(weights.allowDiagonal);

        SolverOptions options;
        options.yieldEvery = params.onYield ? params.yieldEvery : 0;
        options.onYield = params.onYield;
        options.cancelToken = params.cancelToken;

        auto solved = solveCostDistance(domain, seedCells, neighborhood, costModel, options);
        if (!solved) {
            if (solved.error().isCancelled()) {
                getLogger()->debug("Cost-distance run cancelled");
            } else {
                getLogger()->error("Cost-distance solve failed: {}", solved.error().message);
            }
            return std::unexpected(solved.error());
        }

        // Scatter the ROI-local field into the full grid
        result.dist.assign(expected, std::numeric_limits<float>::infinity());
        for (int y = roi.y0; y <= roi.y1; ++y) {
            for (int x = roi.x0; x <= roi.x1; ++x) {
                result.dist[indexOf(gray, x, y)] = solved->distance[domain.toLocal(x, y, 0)];
            }
        }

        auto summary = buildQuantileLut(result.dist, w, roi);
        result.quantileLut = summary.lut;
        result.maxFiniteDist = summary.maxFiniteDistance;

        getLogger()->info("Cost-distance map: {}x{}, {} seeds, {} pixels reached, max dist {:.1f}",
            w, h, result.seeds.size(), solved->processed, result.maxFiniteDist);

        return result;
    }
    catch (const itk::ExceptionObject& e) {
        getLogger()->error("ITK exception: {}", e.GetDescription());
        return std::unexpected(SegmentationError{
            SegmentationError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::bad_alloc&) {
        getLogger()->error("Out of memory computing the cost-distance map");
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

} // namespace seedgrow::services
