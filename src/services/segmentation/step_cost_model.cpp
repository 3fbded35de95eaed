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

#include "services/segmentation/step_cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace seedgrow::services {

namespace {

double clampValue(double v, double lo, double hi) noexcept {
    return std::max(lo, std::min(hi, v));
}

double tunedOr(double value, double lo, double hi, double fallback) noexcept {
    return std::isfinite(value) ? clampValue(value, lo, hi) : fallback;
}

} // anonymous namespace

// =============================================================================
// Tunables
// =============================================================================

CostTuning2D CostTuning2D::clamped() const noexcept {
    const CostTuning2D defaults;
    CostTuning2D out;
    out.radialOuterW = tunedOr(radialOuterW, 0.0, 30.0, defaults.radialOuterW);
    out.radialOuterCap = tunedOr(radialOuterCap, 0.0, 192.0, defaults.radialOuterCap);
    out.baseStepScale = tunedOr(baseStepScale, 0.25, 50.0, defaults.baseStepScale);
    out.preferHighExponent = tunedOr(preferHighExponent, 0.5, 3.0, defaults.preferHighExponent);
    out.preferHighStrengthMul = tunedOr(preferHighStrengthMul, 0.0, 20.0,
                                        defaults.preferHighStrengthMul);
    out.uphillFromLowMult = tunedOr(uphillFromLowMult, 1.0, 20.0, defaults.uphillFromLowMult);
    return out;
}

VolumeCostTuning VolumeCostTuning::clamped() const noexcept {
    const VolumeCostTuning defaults;
    VolumeCostTuning out;
    if (roiMarginVoxels) {
        out.roiMarginVoxels = std::clamp(*roiMarginVoxels, 0, 32);
    }
    out.baseStepInside = tunedOr(baseStepInside, 0.1, 10.0, defaults.baseStepInside);
    out.baseStepOutside = tunedOr(baseStepOutside, 0.1, 20.0, defaults.baseStepOutside);
    out.baseStepScale = tunedOr(baseStepScale, 0.25, 5.0, defaults.baseStepScale);
    out.preferHighExponent = tunedOr(preferHighExponent, 0.5, 3.0, defaults.preferHighExponent);
    out.preferHighStrengthMul = tunedOr(preferHighStrengthMul, 0.0, 50.0,
                                        defaults.preferHighStrengthMul);
    out.edgeWeight = tunedOr(edgeWeight, 0.0, 20.0, defaults.edgeWeight);
    out.crossWeight = tunedOr(crossWeight, 0.0, 20.0, defaults.crossWeight);
    out.intensityWeight = tunedOr(intensityWeight, 0.0, 20.0, defaults.intensityWeight);
    out.bgLikeWeight = tunedOr(bgLikeWeight, 0.0, 20.0, defaults.bgLikeWeight);
    out.bgRejectMarginZ = std::isfinite(bgRejectMarginZ) ? bgRejectMarginZ
                                                         : defaults.bgRejectMarginZ;
    out.seedStatsRadiusVox = std::clamp(seedStatsRadiusVox, 1, 6);
    out.bgMaxSamples = std::clamp(bgMaxSamples, 64, 32768);
    out.bgShellThicknessVox = std::clamp(bgShellThicknessVox, 1, 6);
    return out;
}

// =============================================================================
// Shared terms
// =============================================================================

IntensityGates IntensityGates::fromStats(
    const RobustStats& tumor,
    std::optional<double> qLo,
    std::optional<double> qHi,
    double valueMax
) noexcept {
    const double loGate = clampValue(qLo.value_or(tumor.mu - 2.0 * tumor.sigma), 0.0, valueMax);
    const double hiGate = clampValue(qHi.value_or(tumor.mu + 2.0 * tumor.sigma), 0.0, valueMax);

    IntensityGates gates;
    gates.loCore = clampValue(std::max(loGate, tumor.mu - 0.75 * tumor.sigma), 0.0, valueMax);
    gates.hiLoose = clampValue(std::min(hiGate, tumor.mu + 0.75 * tumor.sigma), 0.0, valueMax);
    gates.hiCore = clampValue(std::min(hiGate, tumor.mu + 1.25 * tumor.sigma), 0.0, valueMax);
    return gates;
}

double IntensityGates::toCore01(double v) const noexcept {
    return clampValue((v - loCore) / std::max(1e-6, hiCore - loCore), 0.0, 1.0);
}

double IntensityGates::toLoose01(double v) const noexcept {
    return clampValue((v - loCore) / std::max(1e-6, hiLoose - loCore), 0.0, 1.0);
}

DirectionFactors directionFactors(
    const StepClass& step,
    double toCore01,
    double uphillMult
) noexcept {
    const double t = toCore01;

    if (step.uphill) {
        if (step.toHigh) {
            return {0.02 * uphillMult, 0.004 * uphillMult};
        }
        if (step.toLow || step.bgLike) {
            return {2.0, 3.0};
        }
        return {(0.85 - 0.55 * t) * uphillMult, (0.30 - 0.22 * t) * uphillMult};
    }

    if (step.toHigh) {
        return {0.20, 0.06};
    }
    if (step.toLow || step.bgLike) {
        return step.fromHigh ? DirectionFactors{16.0, 45.0} : DirectionFactors{12.0, 34.0};
    }
    return step.fromHigh ? DirectionFactors{12.0 - 7.0 * t, 26.0 - 16.0 * t}
                         : DirectionFactors{9.0 - 5.0 * t, 20.0 - 12.0 * t};
}

double endLowDownhillPenalty(
    const StepClass& step,
    double loCore,
    double v1,
    double sigma
) noexcept {
    if (step.uphill || !(step.toLow || step.bgLike) || step.toHigh) {
        return 0.0;
    }

    const double zEndLow = std::max(0.0, (loCore - v1) / std::max(1e-6, sigma));
    const double t = std::min(1.0, zEndLow / 2.0);
    const double scale = step.fromHigh ? 60.0 : 48.0;
    return 2.5 + scale * t * t;
}

double preferHighPenalty(double toLoose01, double exponent, double strength) noexcept {
    return strength * std::pow(1.0 - toLoose01, exponent);
}

double RadialPrior2D::penaltyAt(int x, int y) const noexcept {
    const double dx = std::abs(static_cast<double>(x) - cx) / hx;
    const double dy = std::abs(static_cast<double>(y) - cy) / hy;
    const double rInf = std::max(dx, dy);
    if (rInf <= 1.0) {
        return 0.0;
    }
    const double t = rInf - 1.0;
    return std::min(cap, weight * t * t);
}

// =============================================================================
// 2D model
// =============================================================================

StepCostModel2D::StepCostModel2D(Inputs inputs) noexcept
    : in_(std::move(inputs))
    , invSigmaTumor_(1.0 / std::max(1e-6, in_.tumor.sigma))
    , invSigmaBg_(in_.background ? 1.0 / std::max(1e-6, in_.background->sigma) : 0.0)
    , crossSigma_(std::max(6.0, in_.tumor.sigma * 0.9))
    , invCrossSigma_(1.0 / std::max(1e-6, crossSigma_)) {}

double StepCostModel2D::operator()(const GridStep& step) const noexcept {
    const auto& w = in_.weights;
    const auto& tune = in_.tuning;
    const auto& gates = in_.gates;

    const double v0 = in_.gray.pixels[step.fromIndex];
    const double v1 = in_.gray.pixels[step.toIndex];
    const double dI = v1 - v0;

    const double grad = (*in_.gradient)[step.toIndex];
    double edgeFrac = 0.0;
    if (grad > in_.edgeBarrier) {
        const double denom = std::max(1.0, 255.0 - in_.edgeBarrier);
        edgeFrac = clampValue((grad - in_.edgeBarrier) / denom, 0.0, 1.0);
    }

    const double zT = std::abs(v1 - in_.tumor.mu) * invSigmaTumor_;

    StepClass cls;
    double bg = 0.0;
    if (in_.background) {
        const double zB = std::abs(v1 - in_.background->mu) * invSigmaBg_;
        if (zB + w.bgRejectMarginZ < zT) {
            cls.bgLike = true;
            bg = w.bgCostStrength * (zT - (zB + w.bgRejectMarginZ));
        }
    }
    if (v1 >= gates.hiLoose) {
        cls.bgLike = false;
        bg = 0.0;
    }

    cls.uphill = dI >= 0.0;
    cls.toHigh = v1 >= gates.hiCore;
    cls.toLow = v1 <= gates.loCore;
    cls.fromHigh = v0 >= gates.hiLoose;

    const double toCore01 = gates.toCore01(v1);
    const double upLowMult = v0 <= gates.loCore ? tune.uphillFromLowMult : 1.0;
    const auto factors = directionFactors(cls, toCore01, upLowMult);

    const double edge = w.edgeCostStrength * factors.edge * edgeFrac * edgeFrac;

    const double zCross = std::abs(dI) * invCrossSigma_;
    const double cross = w.crossCostStrength * factors.cross * std::min(4.0, zCross * zCross);

    const double endLow = endLowDownhillPenalty(cls, gates.loCore, v1, in_.tumor.sigma);

    // Darker-than-tumour only; bright values are left to the directional terms
    const double zLo = std::max(0.0, in_.tumor.mu - v1) * invSigmaTumor_;
    const double tumor = w.tumorCostStrength * 1.35 * std::min(9.0, zLo * zLo);

    const double preferHigh = preferHighPenalty(gates.toLoose01(v1), tune.preferHighExponent,
                                                w.edgeCostStrength * tune.preferHighStrengthMul);

    const double radial = in_.radial ? in_.radial->penaltyAt(step.toX, step.toY) : 0.0;

    return tune.baseStepScale * step.length +
           edge + cross + endLow + tumor + bg + preferHigh + radial;
}

// =============================================================================
// 3D model
// =============================================================================

StepCostModel3D::StepCostModel3D(VolumeView volume, VolumeCostContext context) noexcept
    : volume_(volume)
    , ctx_(std::move(context))
    , tolLo_(ctx_.seedValue - ctx_.minValue)
    , tolHi_(ctx_.maxValue - ctx_.seedValue)
    , edgeBarrier_(clampValue(2.5 * ctx_.tumor.sigma, 0.02, 0.2))
    , crossSigma_(std::max(0.03, ctx_.tumor.sigma * 0.9))
    , invCrossSigma_(1.0 / std::max(1e-6, crossSigma_)) {
    if (ctx_.roi) {
        const auto& r = *ctx_.roi;
        cx_ = (r.min.x + r.max.x) * 0.5;
        cy_ = (r.min.y + r.max.y) * 0.5;
        cz_ = (r.min.z + r.max.z) * 0.5;
        hx_ = std::max(1e-6, (r.max.x - r.min.x + 1) * 0.5);
        hy_ = std::max(1e-6, (r.max.y - r.min.y + 1) * 0.5);
        hz_ = std::max(1e-6, (r.max.z - r.min.z + 1) * 0.5);
    }
}

double StepCostModel3D::roiWeightAt(int x, int y, int z) const noexcept {
    if (!ctx_.roi) {
        return 1.0;
    }
    const double dx = std::abs(x - cx_) / hx_;
    const double dy = std::abs(y - cy_) / hy_;
    const double dz = std::abs(z - cz_) / hz_;
    const double rInf = std::max({dx, dy, dz});
    if (rInf <= 1.0) {
        return 1.0;
    }
    const double t = rInf - 1.0;
    return std::exp(-kRoiDecayK * t * t);
}

double StepCostModel3D::intensityPenalty(double v, double bandScale) const noexcept {
    double lo = ctx_.minValue;
    double hi = ctx_.maxValue;

    if (ctx_.roi) {
        const double s = clampValue(bandScale, 0.0, kBandScaleMax);
        const double a = ctx_.seedValue - tolLo_ * s;
        const double b = ctx_.seedValue + tolHi_ * s;
        lo = std::min(a, b);
        hi = std::max(a, b);
    }

    if (v >= lo && v <= hi) {
        return 0.0;
    }

    const double invDenom = 1.0 / std::max(1e-6, (hi - lo) + ctx_.tumor.sigma);
    if (v > hi) {
        // Bright side is penalized less to keep hyperintense regions
        return std::min(1.0, 0.35 * (v - hi) * invDenom);
    }
    return std::min(3.0, (lo - v) * invDenom);
}

double StepCostModel3D::operator()(const GridStep& step) const noexcept {
    const auto& tune = ctx_.tuning;
    const auto& gates = ctx_.gates;

    const bool inside = !ctx_.roi || ctx_.roi->contains(step.toX, step.toY, step.toZ);
    if (ctx_.roi && ctx_.roiMode == RoiMode::Hard && !inside) {
        return std::numeric_limits<double>::infinity();
    }

    const double v0 = volume_.voxels[step.fromIndex];
    const double v1 = volume_.voxels[step.toIndex];
    const double dI = v1 - v0;

    double weight = 1.0;
    double bandScale = 1.0;
    const double priorStrength = ctx_.roi ? 1.0 - ctx_.outsideScale : 0.0;
    if (ctx_.roi) {
        weight = roiWeightAt(step.toX, step.toY, step.toZ);
        if (weight < 1.0) {
            bandScale = ctx_.outsideScale + priorStrength * weight;
        }
    }
    const double priorT = priorStrength * (1.0 - weight);

    const double base = (tune.baseStepInside +
                         (tune.baseStepOutside - tune.baseStepInside) * priorT) *
                        tune.baseStepScale * step.length;

    double edgeRaw = 0.0;
    if (std::abs(dI) > edgeBarrier_) {
        edgeRaw = clampValue((std::abs(dI) - edgeBarrier_) / std::max(1e-6, 1.0 - edgeBarrier_),
                             0.0, 1.0);
    }

    double bgDelta = 0.0;
    if (ctx_.background) {
        const double zT = std::abs(v1 - ctx_.tumor.mu) / std::max(1e-6, ctx_.tumor.sigma);
        const double zB = std::abs(v1 - ctx_.background->mu) /
                          std::max(1e-6, ctx_.background->sigma);
        bgDelta = std::max(0.0, zT - zB - tune.bgRejectMarginZ);
    }
    if (v1 >= gates.hiLoose) {
        bgDelta = 0.0;
    }

    StepClass cls;
    cls.uphill = dI >= 0.0;
    cls.toHigh = v1 >= gates.hiCore;
    cls.toLow = v1 <= gates.loCore;
    cls.fromHigh = v0 >= gates.hiLoose;
    cls.bgLike = bgDelta > 0.0;

    const auto factors = directionFactors(cls, gates.toCore01(v1), 1.0);

    const double edge = tune.edgeWeight * factors.edge * edgeRaw;

    const double zCross = std::abs(dI) * invCrossSigma_;
    const double cross = tune.crossWeight * factors.cross * std::min(4.0, zCross * zCross);

    const double endLow = endLowDownhillPenalty(cls, gates.loCore, v1, ctx_.tumor.sigma);

    const double inten = tune.intensityWeight / std::max(0.05, bandScale) *
                         intensityPenalty(v1, bandScale);

    const double bg = tune.bgLikeWeight * (1.0 + 0.75 * priorT) * bgDelta;

    // Kept light inside the ROI so gentle ramps stay traversable
    const double preferHigh = preferHighPenalty(
        gates.toLoose01(v1), tune.preferHighExponent,
        tune.intensityWeight * tune.preferHighStrengthMul * (inside ? 0.15 : 1.0));

    return base + edge + cross + endLow + inten + bg + preferHigh;
}

} // namespace seedgrow::services
