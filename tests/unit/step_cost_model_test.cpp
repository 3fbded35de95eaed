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

#include <gtest/gtest.h>

#include "services/segmentation/cost_distance_solver.hpp"
#include "services/segmentation/step_cost_model.hpp"
#include "test_utils/volume_generator.hpp"

#include <cmath>
#include <limits>

using namespace seedgrow::services;
using seedgrow::test_utils::VolumeGrid;

class StepCostModelTest : public ::testing::Test {
protected:
    /// Context of a seed at 0.5 with band [0.4, 0.6] and a tight tumour estimate
    static VolumeCostContext uniformContext() {
        VolumeCostContext ctx;
        ctx.tumor = RobustStats{0.5, 0.02};
        ctx.gates = IntensityGates::fromStats(ctx.tumor, std::nullopt, std::nullopt, 1.0);
        ctx.seedValue = 0.5;
        ctx.minValue = 0.4;
        ctx.maxValue = 0.6;
        return ctx;
    }

    static GridStep stepBetween(const VolumeGrid& grid, int x0, int y0, int z0,
                                int x1, int y1, int z1, double length = 1.0) {
        GridStep step;
        step.fromIndex = grid.index(x0, y0, z0);
        step.toIndex = grid.index(x1, y1, z1);
        step.toX = x1;
        step.toY = y1;
        step.toZ = z1;
        step.length = length;
        return step;
    }
};

// =============================================================================
// Intensity gates
// =============================================================================

TEST_F(StepCostModelTest, GatesFromStatsWithoutQuantiles) {
    auto gates = IntensityGates::fromStats({100.0, 10.0}, std::nullopt, std::nullopt, 255.0);

    EXPECT_DOUBLE_EQ(gates.loCore, 92.5);
    EXPECT_DOUBLE_EQ(gates.hiLoose, 107.5);
    EXPECT_DOUBLE_EQ(gates.hiCore, 112.5);
}

TEST_F(StepCostModelTest, QuantilesTightenGates) {
    auto gates = IntensityGates::fromStats({100.0, 10.0}, 95.0, 110.0, 255.0);

    EXPECT_DOUBLE_EQ(gates.loCore, 95.0);
    EXPECT_DOUBLE_EQ(gates.hiLoose, 107.5);
    EXPECT_DOUBLE_EQ(gates.hiCore, 110.0);
}

TEST_F(StepCostModelTest, GatesClampToValueRange) {
    auto gates = IntensityGates::fromStats({0.9, 0.1}, std::nullopt, std::nullopt, 1.0);
    EXPECT_DOUBLE_EQ(gates.hiCore, 1.0);
}

TEST_F(StepCostModelTest, CorePositionIsClamped) {
    auto gates = IntensityGates::fromStats({100.0, 10.0}, std::nullopt, std::nullopt, 255.0);

    EXPECT_DOUBLE_EQ(gates.toCore01(80.0), 0.0);
    EXPECT_DOUBLE_EQ(gates.toCore01(102.5), 0.5);
    EXPECT_DOUBLE_EQ(gates.toCore01(200.0), 1.0);
    EXPECT_DOUBLE_EQ(gates.toLoose01(100.0), 0.5);
}

// =============================================================================
// Direction terms
// =============================================================================

TEST_F(StepCostModelTest, UphillIntoHighIsNearlyFree) {
    StepClass step;
    step.uphill = true;
    step.toHigh = true;

    auto factors = directionFactors(step, 1.0, 1.0);
    EXPECT_DOUBLE_EQ(factors.edge, 0.02);
    EXPECT_DOUBLE_EQ(factors.cross, 0.004);

    auto scaled = directionFactors(step, 1.0, 3.0);
    EXPECT_DOUBLE_EQ(scaled.edge, 0.06);
}

TEST_F(StepCostModelTest, DownhillIntoLowIsExpensive) {
    StepClass step;
    step.toLow = true;
    step.fromHigh = true;

    auto fromHigh = directionFactors(step, 0.0, 1.0);
    EXPECT_DOUBLE_EQ(fromHigh.edge, 16.0);
    EXPECT_DOUBLE_EQ(fromHigh.cross, 45.0);

    step.fromHigh = false;
    auto fromMid = directionFactors(step, 0.0, 1.0);
    EXPECT_DOUBLE_EQ(fromMid.edge, 12.0);
    EXPECT_DOUBLE_EQ(fromMid.cross, 34.0);
}

TEST_F(StepCostModelTest, DownhillWithinCoreInterpolates) {
    StepClass step;
    auto factors = directionFactors(step, 0.5, 1.0);

    EXPECT_DOUBLE_EQ(factors.edge, 6.5);
    EXPECT_DOUBLE_EQ(factors.cross, 14.0);
}

TEST_F(StepCostModelTest, EndLowPenaltyGrowsWithDepthBelowCore) {
    StepClass step;
    step.toLow = true;

    EXPECT_DOUBLE_EQ(endLowDownhillPenalty(step, 92.5, 72.5, 10.0), 50.5);
    EXPECT_DOUBLE_EQ(endLowDownhillPenalty(step, 92.5, 82.5, 10.0), 14.5);

    step.fromHigh = true;
    EXPECT_DOUBLE_EQ(endLowDownhillPenalty(step, 92.5, 72.5, 10.0), 62.5);

    step.uphill = true;
    EXPECT_DOUBLE_EQ(endLowDownhillPenalty(step, 92.5, 72.5, 10.0), 0.0);
}

TEST_F(StepCostModelTest, PreferHighPenaltyVanishesAtLooseGate) {
    EXPECT_DOUBLE_EQ(preferHighPenalty(0.5, 2.0, 8.0), 2.0);
    EXPECT_DOUBLE_EQ(preferHighPenalty(1.0, 1.15, 8.0), 0.0);
}

TEST_F(StepCostModelTest, RadialPriorRampsOutsideBoxAndCaps) {
    RadialPrior2D prior{10.0, 10.0, 2.0, 2.0, 4.0, 10.0};

    EXPECT_DOUBLE_EQ(prior.penaltyAt(11, 11), 0.0);
    EXPECT_DOUBLE_EQ(prior.penaltyAt(14, 10), 4.0);
    EXPECT_DOUBLE_EQ(prior.penaltyAt(16, 10), 10.0);
}

// =============================================================================
// 3D model
// =============================================================================

TEST_F(StepCostModelTest, UniformStepCostIsBasePlusPreferHigh) {
    VolumeGrid grid(4, 4, 4, 0.5f);
    const StepCostModel3D model(grid.view(), uniformContext());

    const VolumeCostTuning tuning;
    const double preferHigh = tuning.intensityWeight * tuning.preferHighStrengthMul * 0.15 *
                              std::pow(0.5, tuning.preferHighExponent);

    const double straight = model(stepBetween(grid, 1, 1, 1, 2, 1, 1));
    EXPECT_NEAR(straight, tuning.baseStepInside * tuning.baseStepScale + preferHigh, 1e-9);

    const double diagonal = model(stepBetween(grid, 1, 1, 1, 2, 2, 1, std::sqrt(2.0)));
    EXPECT_NEAR(diagonal - straight,
                tuning.baseStepInside * tuning.baseStepScale * (std::sqrt(2.0) - 1.0), 1e-9);
}

TEST_F(StepCostModelTest, DownhillIntoDarkCostsMoreThanClimbingOut) {
    VolumeGrid grid(2, 1, 1, 0.5f);
    grid.at(1, 0, 0) = 0.3f;
    const StepCostModel3D model(grid.view(), uniformContext());

    const double down = model(stepBetween(grid, 0, 0, 0, 1, 0, 0));
    const double up = model(stepBetween(grid, 1, 0, 0, 0, 0, 0));

    EXPECT_GT(down, up);
}

TEST_F(StepCostModelTest, HardRoiForbidsLeavingTheBox) {
    VolumeGrid grid(6, 6, 6, 0.5f);
    auto ctx = uniformContext();
    ctx.roi = VolumeRoiBounds{{1, 1, 1}, {3, 3, 3}};
    ctx.roiMode = RoiMode::Hard;
    const StepCostModel3D model(grid.view(), ctx);

    EXPECT_TRUE(std::isfinite(model(stepBetween(grid, 2, 2, 2, 3, 2, 2))));
    EXPECT_EQ(model(stepBetween(grid, 3, 2, 2, 4, 2, 2)),
              std::numeric_limits<double>::infinity());
}

TEST_F(StepCostModelTest, GuideRoiWeightDecaysOutside) {
    VolumeGrid grid(12, 4, 4, 0.5f);
    auto ctx = uniformContext();
    ctx.roi = VolumeRoiBounds{{0, 0, 0}, {3, 3, 3}};
    const StepCostModel3D model(grid.view(), ctx);

    EXPECT_DOUBLE_EQ(model.roiWeightAt(2, 2, 2), 1.0);

    // Centre 1.5, half extent 2: x = 7 is 2.75 half extents out
    const double t = 2.75 - 1.0;
    EXPECT_NEAR(model.roiWeightAt(7, 2, 2), std::exp(-StepCostModel3D::kRoiDecayK * t * t), 1e-12);

    // Same intensity, farther out: higher base cost
    const double near = model(stepBetween(grid, 2, 2, 2, 3, 2, 2));
    const double far = model(stepBetween(grid, 8, 2, 2, 9, 2, 2));
    EXPECT_GT(far, near);
}

TEST_F(StepCostModelTest, IntensityPenaltyFavoursBrightSide) {
    VolumeGrid grid(2, 2, 2, 0.5f);
    const StepCostModel3D model(grid.view(), uniformContext());

    EXPECT_DOUBLE_EQ(model.intensityPenalty(0.5, 1.0), 0.0);
    EXPECT_NEAR(model.intensityPenalty(0.7, 1.0), 0.35 * 0.1 / 0.22, 1e-9);
    EXPECT_NEAR(model.intensityPenalty(0.3, 1.0), 0.1 / 0.22, 1e-9);
    EXPECT_LT(model.intensityPenalty(0.7, 1.0), model.intensityPenalty(0.3, 1.0));
}

TEST_F(StepCostModelTest, EdgeBarrierFollowsTumourSigma) {
    VolumeGrid grid(2, 2, 2, 0.5f);
    auto ctx = uniformContext();

    EXPECT_DOUBLE_EQ(StepCostModel3D(grid.view(), ctx).edgeBarrier(), 0.05);

    ctx.tumor.sigma = 0.001;
    EXPECT_DOUBLE_EQ(StepCostModel3D(grid.view(), ctx).edgeBarrier(), 0.02);

    ctx.tumor.sigma = 1.0;
    EXPECT_DOUBLE_EQ(StepCostModel3D(grid.view(), ctx).edgeBarrier(), 0.2);
}
