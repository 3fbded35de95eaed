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

#include "services/segmentation/roi_geometry.hpp"

#include <algorithm>
#include <cmath>

namespace seedgrow::services {

namespace {

int clampFloor(double v, int lo, int hi) noexcept {
    if (!std::isfinite(v)) {
        return lo;
    }
    const double f = std::floor(v);
    if (f < lo) return lo;
    if (f > hi) return hi;
    return static_cast<int>(f);
}

double absMm(double v) noexcept {
    return std::isfinite(v) ? std::abs(v) : 0.0;
}

int depthSlices(double sideMm, double normalMm, double depthScale, int extent) noexcept {
    const double raw = normalMm > 1e-9 ? std::round(sideMm / normalMm * depthScale) : 1.0;
    return clampFloor(raw, 1, extent);
}

struct AxisRange {
    int lo;
    int hi;
};

AxisRange dragAxis(int a, int b, int extent) noexcept {
    const int last = extent - 1;
    return {std::clamp(std::min(a, b), 0, last), std::clamp(std::max(a, b), 0, last)};
}

} // anonymous namespace

SeedRange computeSeedRange01(double seedValue, double tolerance) noexcept {
    const double tol = std::max(0.0, tolerance);
    return SeedRange{
        std::clamp(seedValue - tol, 0.0, 1.0),
        std::clamp(seedValue + tol, 0.0, 1.0)
    };
}

CenteredSpan computeCenteredSpan(int center, int count, int min, int max) noexcept {
    center = std::clamp(center, min, max);
    count = std::clamp(count, 1, std::max(1, max - min + 1));

    const int halfLo = (count - 1) / 2;
    const int halfHi = (count - 1) - halfLo;

    int lo = center - halfLo;
    int hi = center + halfHi;

    if (lo < min) {
        hi += min - lo;
        lo = min;
    }
    if (hi > max) {
        lo -= hi - max;
        hi = max;
    }

    return CenteredSpan{std::clamp(lo, min, max), std::clamp(hi, min, max)};
}

std::optional<VolumeRoiBounds> computeRoiCubeFromSliceDrag(
    SlicePlane plane,
    const std::array<int, 3>& dims,
    const std::array<double, 3>& voxelSizeMm,
    int sliceIndex,
    const SeedPoint& a,
    const SeedPoint& b,
    double depthScale)
{
    const auto [nx, ny, nz] = dims;
    if (nx <= 0 || ny <= 0 || nz <= 0) {
        return std::nullopt;
    }

    const double vx = absMm(voxelSizeMm[0]);
    const double vy = absMm(voxelSizeMm[1]);
    const double vz = absMm(voxelSizeMm[2]);
    if (!std::isfinite(depthScale)) {
        depthScale = 1.0;
    }

    switch (plane) {
        case SlicePlane::Axial: {
            const auto x = dragAxis(a.x, b.x, nx);
            const auto y = dragAxis(a.y, b.y, ny);
            const double sideMm = std::max((x.hi - x.lo + 1) * vx, (y.hi - y.lo + 1) * vy);
            const auto z = computeCenteredSpan(sliceIndex, depthSlices(sideMm, vz, depthScale, nz),
                                               0, nz - 1);
            return VolumeRoiBounds{{x.lo, y.lo, z.lo}, {x.hi, y.hi, z.hi}};
        }
        case SlicePlane::Coronal: {
            const auto x = dragAxis(a.x, b.x, nx);
            const auto z = dragAxis(a.z, b.z, nz);
            const double sideMm = std::max((x.hi - x.lo + 1) * vx, (z.hi - z.lo + 1) * vz);
            const auto y = computeCenteredSpan(sliceIndex, depthSlices(sideMm, vy, depthScale, ny),
                                               0, ny - 1);
            return VolumeRoiBounds{{x.lo, y.lo, z.lo}, {x.hi, y.hi, z.hi}};
        }
        case SlicePlane::Sagittal: {
            const auto y = dragAxis(a.y, b.y, ny);
            const auto z = dragAxis(a.z, b.z, nz);
            const double sideMm = std::max((y.hi - y.lo + 1) * vy, (z.hi - z.lo + 1) * vz);
            const auto x = computeCenteredSpan(sliceIndex, depthSlices(sideMm, vx, depthScale, nx),
                                               0, nx - 1);
            return VolumeRoiBounds{{x.lo, y.lo, z.lo}, {x.hi, y.hi, z.hi}};
        }
    }
    return std::nullopt;
}

} // namespace seedgrow::services
