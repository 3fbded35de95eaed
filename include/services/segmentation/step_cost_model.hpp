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
 * @file step_cost_model.hpp
 * @brief Direction-aware edge cost models for the 2D and 3D grows
 * @details A step from cell A (value v0) to neighbour B (value v1) costs a
 *          path-length term plus penalties for crossing edges, jumping in
 *          intensity, leaving the tumour intensity band and looking more like
 *          background than tumour. Entering brighter tissue is cheap; dropping
 *          into dark tissue is expensive, more so when leaving bright tissue.
 *
 *          Both models are immutable after construction and their call
 *          operators are pure.
 *
 * @author kcenon
 * @since 1.0.0
 */
#pragma once

#include "cost_distance_solver.hpp"
#include "gradient_field.hpp"
#include "segmentation_types.hpp"

#include <optional>

namespace seedgrow::services {

/**
 * @brief User weights of the 2D cost model
 */
struct CostWeights2D {
    /// How strongly strong edges act like distance walls
    double edgeCostStrength = 8.0;

    /// Gradient at which edge cost starts; negative selects the adaptive barrier
    double edgeBarrierGrad = -1.0;

    /// Penalty for stepping across large intensity jumps
    double crossCostStrength = 0.6;

    /// Soft penalty for tumour-unlike (darker) intensities
    double tumorCostStrength = 0.15;

    /// Penalty when a pixel is more background-like than tumour-like
    double bgCostStrength = 1.0;

    /// z-score margin before a pixel counts as background-like
    double bgRejectMarginZ = 0.75;

    /// 8-neighbourhood when true, 4-neighbourhood otherwise
    bool allowDiagonal = true;

    /// Sigma floor for tumour and background statistics (grey levels)
    double sigmaFloor = 6.0;

    [[nodiscard]] bool operator==(const CostWeights2D&) const = default;
};

/**
 * @brief Live tunables of the 2D cost model
 *
 * Out-of-range values are clamped and non-finite values fall back to the
 * defaults by clamped().
 */
struct CostTuning2D {
    /// Radial prior weight outside the seed box, in cost units [0, 30]
    double radialOuterW = 0.0;

    /// Radial prior cap outside the seed box, in cost units [0, 192]
    double radialOuterCap = 0.0;

    /// Path-length scale [0.25, 50]
    double baseStepScale = 1.65;

    /// Exponent of the low/mid intensity ramp [0.5, 3]
    double preferHighExponent = 1.15;

    /// Low/mid intensity penalty relative to edgeCostStrength [0, 20]
    double preferHighStrengthMul = 0.0;

    /// Extra factor on uphill steps that start in low intensity [1, 20]
    double uphillFromLowMult = 1.0;

    [[nodiscard]] CostTuning2D clamped() const noexcept;

    [[nodiscard]] bool operator==(const CostTuning2D&) const = default;
};

/**
 * @brief Tunables of the 3D cost model
 */
struct VolumeCostTuning {
    /// Extra voxels around a guide ROI; unset derives it from the ROI size [0, 32]
    std::optional<int> roiMarginVoxels;

    /// Base step cost inside the ROI [0.1, 10]
    double baseStepInside = 1.0;

    /// Base step cost far outside the ROI [0.1, 20]
    double baseStepOutside = 3.0;

    /// Path-length scale [0.25, 5]
    double baseStepScale = 1.65;

    /// Exponent of the low/mid intensity ramp [0.5, 3]
    double preferHighExponent = 1.15;

    /// Low/mid intensity penalty relative to intensityWeight [0, 50]
    double preferHighStrengthMul = 5.5;

    double edgeWeight = 2.5;        ///< [0, 20]
    double crossWeight = 1.4;       ///< [0, 20]
    double intensityWeight = 2.0;   ///< [0, 20]
    double bgLikeWeight = 1.25;     ///< [0, 20]

    /// z-score margin before a voxel counts as background-like
    double bgRejectMarginZ = 0.5;

    /// Seed neighbourhood radius for tumour stats without an ROI [1, 6]
    int seedStatsRadiusVox = 2;

    /// Cap on background shell samples [64, 32768]
    int bgMaxSamples = 4096;

    /// Thickness of the background shell around the ROI [1, 6]
    int bgShellThicknessVox = 2;

    [[nodiscard]] VolumeCostTuning clamped() const noexcept;

    [[nodiscard]] bool operator==(const VolumeCostTuning&) const = default;
};

/**
 * @brief Intensity gates derived from tumour statistics
 *
 * loGate/hiGate come from sampled quantiles when available, otherwise from
 * mu -/+ 2 sigma. The core gates are tighter than the quantiles so that a
 * seed box containing some background does not relax directionality.
 */
struct IntensityGates {
    double loCore = 0.0;
    double hiLoose = 0.0;
    double hiCore = 0.0;

    /**
     * @param tumor Tumour statistics
     * @param qLo Low quantile, if sampled
     * @param qHi High quantile, if sampled
     * @param valueMax Upper end of the value range (255 or 1)
     */
    [[nodiscard]] static IntensityGates fromStats(
        const RobustStats& tumor,
        std::optional<double> qLo,
        std::optional<double> qHi,
        double valueMax
    ) noexcept;

    /// (v - loCore) / (hiCore - loCore) clamped to [0, 1]
    [[nodiscard]] double toCore01(double v) const noexcept;

    /// (v - loCore) / (hiLoose - loCore) clamped to [0, 1]
    [[nodiscard]] double toLoose01(double v) const noexcept;
};

/**
 * @brief Classification of a step used to pick direction factors
 */
struct StepClass {
    bool uphill = false;    ///< v1 >= v0
    bool toHigh = false;    ///< v1 >= hiCore
    bool toLow = false;     ///< v1 <= loCore
    bool fromHigh = false;  ///< v0 >= hiLoose
    bool bgLike = false;    ///< Background-like and below hiLoose
};

/**
 * @brief Multipliers applied to the edge and cross terms
 */
struct DirectionFactors {
    double edge = 0.0;
    double cross = 0.0;
};

/**
 * @brief Direction factors for a step
 *
 * @param step Step classification
 * @param toCore01 Position of v1 between loCore and hiCore
 * @param uphillMult Factor on uphill, non-low destinations (1 disables)
 */
[[nodiscard]] DirectionFactors directionFactors(
    const StepClass& step,
    double toCore01,
    double uphillMult
) noexcept;

/**
 * @brief Penalty for a downhill step landing below the tumour core
 *
 * 2.5 + (fromHigh ? 60 : 48) * min(1, zEndLow / 2)^2, zero unless the step is
 * downhill into a low or background-like value that is not high.
 */
[[nodiscard]] double endLowDownhillPenalty(
    const StepClass& step,
    double loCore,
    double v1,
    double sigma
) noexcept;

/**
 * @brief strength * (1 - toLoose01)^exponent
 */
[[nodiscard]] double preferHighPenalty(double toLoose01, double exponent, double strength) noexcept;

/**
 * @brief Radial prior around the anchor seed of the 2D grow
 *
 * No penalty inside the box (half extents hx, hy); outside it ramps as
 * min(cap, weight * t^2) with t the L-infinity excess over the box.
 */
struct RadialPrior2D {
    double cx = 0.0;
    double cy = 0.0;
    double hx = 1.0;
    double hy = 1.0;
    double weight = 0.0;
    double cap = 0.0;

    [[nodiscard]] double penaltyAt(int x, int y) const noexcept;
};

/**
 * @brief Step cost over an 8-bit slice
 */
class StepCostModel2D {
public:
    struct Inputs {
        GrayView2D gray;
        const GradientField* gradient = nullptr;
        RobustStats tumor;
        std::optional<RobustStats> background;
        IntensityGates gates;
        double edgeBarrier = 25.0;
        CostWeights2D weights;
        CostTuning2D tuning;
        std::optional<RadialPrior2D> radial;
    };

    explicit StepCostModel2D(Inputs inputs) noexcept;

    /**
     * @brief Total cost of a step, base path length included
     */
    [[nodiscard]] double operator()(const GridStep& step) const noexcept;

    [[nodiscard]] double crossSigma() const noexcept { return crossSigma_; }

private:
    Inputs in_;
    double invSigmaTumor_;
    double invSigmaBg_;
    double crossSigma_;
    double invCrossSigma_;
};

/**
 * @brief Everything the 3D model needs besides the volume
 */
struct VolumeCostContext {
    RobustStats tumor;
    std::optional<RobustStats> background;
    IntensityGates gates;

    double seedValue = 0.0;
    double minValue = 0.0;
    double maxValue = 1.0;

    /// Present when the caller supplied an ROI (bounds already clamped)
    std::optional<VolumeRoiBounds> roi;
    RoiMode roiMode = RoiMode::Guide;
    double outsideScale = 0.25;

    VolumeCostTuning tuning;
};

/**
 * @brief Step cost over a normalized volume
 *
 * With a guide ROI the radial weight w = exp(-1.6 t^2) about the ROI centre
 * blends base cost, intensity band width and background weight between the
 * inside and outside behaviour. With a hard ROI steps leaving the box are
 * forbidden (+inf).
 */
class StepCostModel3D {
public:
    StepCostModel3D(VolumeView volume, VolumeCostContext context) noexcept;

    [[nodiscard]] double operator()(const GridStep& step) const noexcept;

    [[nodiscard]] double edgeBarrier() const noexcept { return edgeBarrier_; }
    [[nodiscard]] double crossSigma() const noexcept { return crossSigma_; }

    /// Radial ROI weight at a voxel (1 inside the ROI or without one)
    [[nodiscard]] double roiWeightAt(int x, int y, int z) const noexcept;

    /// Intensity band penalty of v for a band scale
    [[nodiscard]] double intensityPenalty(double v, double bandScale) const noexcept;

    static constexpr double kRoiDecayK = 1.6;
    static constexpr double kBandScaleMax = 1.3;

private:
    VolumeView volume_;
    VolumeCostContext ctx_;

    double tolLo_;
    double tolHi_;
    double edgeBarrier_;
    double crossSigma_;
    double invCrossSigma_;

    double cx_ = 0.0;
    double cy_ = 0.0;
    double cz_ = 0.0;
    double hx_ = 1.0;
    double hy_ = 1.0;
    double hz_ = 1.0;
};

} // namespace seedgrow::services
