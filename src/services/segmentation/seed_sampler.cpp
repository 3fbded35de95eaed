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

#include "services/segmentation/seed_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace seedgrow::services {

namespace {

int roundClamp(double v, int lo, int hi) noexcept {
    if (!std::isfinite(v)) {
        return lo;
    }
    return std::clamp(static_cast<int>(std::floor(v + 0.5)), lo, hi);
}

struct SamplingPass {
    double zMax;
    int gMax;
};

} // anonymous namespace

Roi2D defaultSeedBox(const PixelPoint& anchor, const Roi2D& roi) noexcept {
    const int minDim = std::max(1, std::min(roi.width(), roi.height()));
    const int half = roundClamp(minDim * 0.07, 6, 24);

    Roi2D box;
    box.x0 = std::clamp(anchor.x - half, roi.x0, roi.x1);
    box.x1 = std::clamp(anchor.x + half, roi.x0, roi.x1);
    box.y0 = std::clamp(anchor.y - half, roi.y0, roi.y1);
    box.y1 = std::clamp(anchor.y + half, roi.y0, roi.y1);
    return box;
}

Roi2D clampSeedBox(const Roi2D& box, const Roi2D& roi) noexcept {
    const int x0 = std::clamp(box.x0, roi.x0, roi.x1);
    const int x1 = std::clamp(box.x1, roi.x0, roi.x1);
    const int y0 = std::clamp(box.y0, roi.y0, roi.y1);
    const int y1 = std::clamp(box.y1, roi.y0, roi.y1);
    return Roi2D{std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
}

std::uint32_t deriveSeedRngSeed(
    std::size_t anchorIndex,
    const Roi2D& roi,
    const Roi2D& seedBox
) noexcept {
    auto term = [](int coord, std::uint32_t k) {
        return static_cast<std::uint32_t>(coord + 1) * k;
    };

    const std::uint32_t h = static_cast<std::uint32_t>(anchorIndex) ^
                            term(roi.x0, 0x9e3779b1U) ^
                            term(roi.y0, 0x85ebca6bU) ^
                            term(roi.x1, 0xc2b2ae35U) ^
                            term(roi.y1, 0x27d4eb2fU) ^
                            term(seedBox.x0, 0x165667b1U) ^
                            term(seedBox.y0, 0xd3a2646cU);
    return mixU32(h);
}

double seedBadness(
    double value,
    double gradient,
    const RobustStats& tumor,
    const std::optional<RobustStats>& background,
    double bgRejectMarginZ
) noexcept {
    const double zT = std::abs(value - tumor.mu) / std::max(1e-6, tumor.sigma);

    double bgExcess = 0.0;
    if (background) {
        const double zB = std::abs(value - background->mu) / std::max(1e-6, background->sigma);
        bgExcess = std::max(0.0, zT - (zB + bgRejectMarginZ));
    }

    return zT + 0.15 * (gradient / 255.0) + 0.75 * bgExcess;
}

std::vector<PixelPoint> sampleSeeds2D(
    const SeedSamplingRequest2D& request,
    RandomSource& rng
) {
    const auto& gray = request.gray;
    const auto& grad = *request.gradient;
    const auto& box = request.seedBox;

    std::vector<PixelPoint> seeds{request.anchor};

    const int seedCount = std::clamp(request.seedCount, 1, kMaxSeedCount2D);
    if (seedCount <= 1) {
        return seeds;
    }

    const auto width = static_cast<std::size_t>(gray.width);
    auto indexOf = [width](int x, int y) {
        return static_cast<std::size_t>(y) * width + static_cast<std::size_t>(x);
    };

    const std::size_t wanted = static_cast<std::size_t>(seedCount);
    const int extraWanted = seedCount - 1;

    std::unordered_set<std::size_t> chosen{indexOf(request.anchor.x, request.anchor.y)};

    const double invSigmaT = 1.0 / std::max(1e-6, request.tumor.sigma);
    const double invSigmaB = request.background
        ? 1.0 / std::max(1e-6, request.background->sigma) : 0.0;

    const int barrier = static_cast<int>(std::lround(request.edgeBarrier));
    const SamplingPass passes[] = {
        {0.9, std::clamp(barrier + 80, 0, 255)},
        {1.4, std::clamp(barrier + 120, 0, 255)},
        {2.2, 255},
    };

    const int boxW = box.x1 - box.x0 + 1;
    const int boxH = box.y1 - box.y0 + 1;

    for (const auto& pass : passes) {
        const int attempts = extraWanted * 220;
        for (int t = 0; t < attempts && seeds.size() < wanted; ++t) {
            // Triangular distribution keeps candidates away from the box edges
            const double ux = (rng.nextUniform() + rng.nextUniform()) * 0.5;
            const double uy = (rng.nextUniform() + rng.nextUniform()) * 0.5;
            const int x = box.x0 + static_cast<int>(std::floor(ux * boxW));
            const int y = box.y0 + static_cast<int>(std::floor(uy * boxH));
            const std::size_t i = indexOf(x, y);

            if (chosen.contains(i)) {
                continue;
            }
            if (grad[i] > pass.gMax) {
                continue;
            }

            const double v = gray.pixels[i];
            const double zT = std::abs(v - request.tumor.mu) * invSigmaT;
            if (zT > pass.zMax) {
                continue;
            }

            if (request.background) {
                const double zB = std::abs(v - request.background->mu) * invSigmaB;
                if (zB + request.bgRejectMarginZ < zT) {
                    continue;
                }
            }

            chosen.insert(i);
            seeds.push_back(PixelPoint{x, y});
        }
    }

    if (seeds.size() > 2) {
        auto badness = [&](const PixelPoint& p) {
            const std::size_t i = indexOf(p.x, p.y);
            return seedBadness(gray.pixels[i], grad[i], request.tumor,
                               request.background, request.bgRejectMarginZ);
        };
        std::stable_sort(seeds.begin() + 1, seeds.end(),
                         [&](const PixelPoint& a, const PixelPoint& b) {
                             return badness(a) < badness(b);
                         });
    }

    return seeds;
}

std::vector<std::array<int, 3>> resolveVolumeSeeds(
    const std::array<int, 3>& dims,
    const SeedPoint& anchor,
    std::span<const std::uint32_t> extraIndices,
    const SolverDomain& domain,
    const std::optional<VolumeRoiBounds>& hardRoi
) {
    std::vector<std::array<int, 3>> seeds;
    seeds.reserve(1 + extraIndices.size());

    auto accept = [&](int x, int y, int z) {
        if (!domain.contains(x, y, z)) {
            return;
        }
        if (hardRoi && !hardRoi->contains(x, y, z)) {
            return;
        }
        seeds.push_back({x, y, z});
    };

    accept(anchor.x, anchor.y, anchor.z);

    const std::size_t strideY = static_cast<std::size_t>(dims[0]);
    const std::size_t strideZ = strideY * static_cast<std::size_t>(dims[1]);
    const std::size_t total = strideZ * static_cast<std::size_t>(dims[2]);

    for (std::uint32_t gi : extraIndices) {
        if (gi >= total) {
            continue;
        }
        const std::size_t z = gi / strideZ;
        const std::size_t rest = gi - z * strideZ;
        const std::size_t y = rest / strideY;
        const std::size_t x = rest - y * strideY;
        accept(static_cast<int>(x), static_cast<int>(y), static_cast<int>(z));
    }

    return seeds;
}

} // namespace seedgrow::services
