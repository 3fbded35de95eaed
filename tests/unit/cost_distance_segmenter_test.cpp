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

#include "services/segmentation/cost_distance_segmenter.hpp"
#include "test_utils/log_capture.hpp"
#include "test_utils/volume_generator.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <vector>

using namespace seedgrow::services;
using namespace seedgrow::test_utils;

class CostDistanceSegmenterTest : public ::testing::Test {
protected:
    void SetUp() override {
        segmenter_ = std::make_unique<CostDistanceSegmenter2D>();
    }

    static CostDistanceParameters2D makeParams(PixelPoint seed, const GrayGrid& grid) {
        CostDistanceParameters2D params;
        params.seed = seed;
        params.roi = Roi2D{0, 0, grid.width - 1, grid.height - 1};
        return params;
    }

    std::unique_ptr<CostDistanceSegmenter2D> segmenter_;
};

// =============================================================================
// Input validation
// =============================================================================

TEST_F(CostDistanceSegmenterTest, RejectsEmptyImage) {
    GrayView2D empty;
    auto result = segmenter_->computeCostDistanceMap(empty, CostDistanceParameters2D{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SegmentationError::Code::InvalidInput);
}

TEST_F(CostDistanceSegmenterTest, RejectsBufferSizeMismatch) {
    GrayGrid grid(16, 16, 100);
    auto view = grid.view();
    view.height = 17;

    auto result = segmenter_->computeCostDistanceMap(view, makeParams({8, 8}, grid));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SegmentationError::Code::InvalidInput);
}

TEST_F(CostDistanceSegmenterTest, RejectsNullItkImage) {
    GrayImage2D::Pointer image;
    auto result = segmenter_->computeCostDistanceMap(image, CostDistanceParameters2D{});

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SegmentationError::Code::InvalidInput);
}

TEST_F(CostDistanceSegmenterTest, RejectsInvalidWeights) {
    GrayGrid grid(16, 16, 100);
    auto params = makeParams({8, 8}, grid);
    params.weights.sigmaFloor = 0.0;

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SegmentationError::Code::InvalidParameters);
}

TEST_F(CostDistanceSegmenterTest, CancelledTokenReturnsCancelled) {
    auto grid = createRampSlice(64, 64);
    auto params = makeParams({20, 32}, grid);
    CancellationToken token;
    token.requestCancel();
    params.cancelToken = token;

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isCancelled());
}

// =============================================================================
// Distance field properties
// =============================================================================

TEST_F(CostDistanceSegmenterTest, ThresholdMasksNestAsSliderIncreases) {
    auto grid = createRampSlice(64, 64);
    const PixelPoint seed{20, 32};

    auto result = segmenter_->computeCostDistanceMap(grid.view(), makeParams(seed, grid));
    ASSERT_TRUE(result.has_value());

    EXPECT_FLOAT_EQ(result->distanceAt(seed.x, seed.y), 0.0f);

    const double t1 = result->thresholdForSlider(0.2, 1.6);
    const double t2 = result->thresholdForSlider(0.4, 1.6);
    EXPECT_GE(t2, t1);

    for (std::size_t i = 0; i < result->dist.size(); ++i) {
        const bool inFirst = result->dist[i] <= t1;
        const bool inSecond = result->dist[i] <= t2;
        EXPECT_FALSE(inFirst && !inSecond) << "pixel " << i;
    }
}

TEST_F(CostDistanceSegmenterTest, IntensityBarrierAddsCost) {
    auto grid = createWallSlice(80, 80, 40);

    auto result = segmenter_->computeCostDistanceMap(grid.view(), makeParams({20, 40}, grid));
    ASSERT_TRUE(result.has_value());

    const float left = result->distanceAt(30, 40);
    const float right = result->distanceAt(52, 40);

    EXPECT_TRUE(std::isfinite(left));
    EXPECT_TRUE(std::isfinite(right));
    EXPECT_GT(right - left, 12.0f);
}

TEST_F(CostDistanceSegmenterTest, LeavingBrightRegionCostsMoreThanEntering) {
    auto grid = createSplitSlice(80, 40, 40);

    auto downhillParams = makeParams({20, 20}, grid);
    downhillParams.weights.tumorCostStrength = 0.0;
    downhillParams.weights.bgCostStrength = 0.0;

    auto uphillParams = downhillParams;
    uphillParams.seed = PixelPoint{60, 20};

    auto downhill = segmenter_->computeCostDistanceMap(grid.view(), downhillParams);
    auto uphill = segmenter_->computeCostDistanceMap(grid.view(), uphillParams);
    ASSERT_TRUE(downhill.has_value());
    ASSERT_TRUE(uphill.has_value());

    const float downCost = downhill->distanceAt(60, 20);
    const float upCost = uphill->distanceAt(20, 20);

    EXPECT_TRUE(std::isfinite(downCost));
    EXPECT_TRUE(std::isfinite(upCost));
    EXPECT_GT(downCost, upCost + 8.0f);
}

TEST_F(CostDistanceSegmenterTest, EverySampledSeedStartsAtZero) {
    auto grid = createRampSlice(64, 64);
    auto params = makeParams({32, 32}, grid);
    params.seedCount = 8;

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);
    ASSERT_TRUE(result.has_value());

    ASSERT_GT(result->seeds.size(), 1u);
    EXPECT_EQ(result->seeds.front(), (PixelPoint{32, 32}));
    for (const auto& s : result->seeds) {
        EXPECT_FLOAT_EQ(result->distanceAt(s.x, s.y), 0.0f);
        EXPECT_TRUE(result->seedBox.contains(s.x, s.y));
    }
}

TEST_F(CostDistanceSegmenterTest, RepeatedRunsAreIdentical) {
    auto grid = createRampSlice(64, 64);
    auto params = makeParams({32, 32}, grid);
    params.seedCount = 6;

    auto first = segmenter_->computeCostDistanceMap(grid.view(), params);
    auto second = segmenter_->computeCostDistanceMap(grid.view(), params);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first->seeds, second->seeds);
    EXPECT_EQ(first->dist, second->dist);
}

TEST_F(CostDistanceSegmenterTest, PixelsOutsideRoiStayUnreached) {
    GrayGrid grid(64, 64, 120);
    auto params = makeParams({10, 10}, grid);
    params.roi = Roi2D{0, 0, 31, 63};

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);
    ASSERT_TRUE(result.has_value());

    EXPECT_TRUE(std::isfinite(result->distanceAt(31, 10)));
    EXPECT_TRUE(std::isinf(result->distanceAt(40, 10)));
    EXPECT_LE(result->maxFiniteDist, result->quantileLut.back() + 1e-3);
}

// =============================================================================
// Seed and ROI resolution
// =============================================================================

TEST_F(CostDistanceSegmenterTest, SeedIsClampedIntoGrid) {
    GrayGrid grid(32, 32, 120);
    auto params = makeParams({-5, 100}, grid);

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->seed, (PixelPoint{0, 31}));
    EXPECT_FLOAT_EQ(result->distanceAt(0, 31), 0.0f);
}

TEST_F(CostDistanceSegmenterTest, RoiIsExtendedToContainTheSeed) {
    GrayGrid grid(64, 64, 120);
    auto params = makeParams({30, 30}, grid);
    params.roi = Roi2D{0, 0, 10, 10};

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->roi, (Roi2D{0, 0, 30, 30}));
    EXPECT_FLOAT_EQ(result->distanceAt(30, 30), 0.0f);
}

TEST_F(CostDistanceSegmenterTest, DefaultRoiCoversSmallGrids) {
    EXPECT_EQ(CostDistanceSegmenter2D::defaultRoi({10, 10}, 64, 64), (Roi2D{0, 0, 63, 63}));
}

TEST_F(CostDistanceSegmenterTest, DefaultRoiScalesWithLargeGrids) {
    // Radius round(0.45 * 512) = 230
    EXPECT_EQ(CostDistanceSegmenter2D::defaultRoi({256, 256}, 512, 512),
              (Roi2D{26, 26, 486, 486}));
}

TEST_F(CostDistanceSegmenterTest, ExplicitSeedBoxIsClampedToRoi) {
    GrayGrid grid(64, 64, 120);
    auto params = makeParams({32, 32}, grid);
    params.seedBox = Roi2D{20, 20, 100, 40};

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->seedBox, (Roi2D{20, 20, 63, 40}));
}

// =============================================================================
// Cache, callbacks and ITK input
// =============================================================================

TEST_F(CostDistanceSegmenterTest, GradientCacheIsReused) {
    auto grid = createRampSlice(64, 64);
    GradientFieldCache cache;
    auto params = makeParams({20, 32}, grid);
    params.gradientCache = &cache;
    params.gridKey = GridKey::fromHandle(11);

    ASSERT_TRUE(segmenter_->computeCostDistanceMap(grid.view(), params).has_value());
    ASSERT_TRUE(segmenter_->computeCostDistanceMap(grid.view(), params).has_value());

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.missCount(), 1u);
    EXPECT_EQ(cache.hitCount(), 1u);
}

TEST_F(CostDistanceSegmenterTest, YieldCallbackRuns) {
    auto grid = createRampSlice(64, 64);
    auto params = makeParams({20, 32}, grid);
    int yields = 0;
    params.yieldEvery = 512;
    params.onYield = [&yields]() { ++yields; };

    auto result = segmenter_->computeCostDistanceMap(grid.view(), params);
    ASSERT_TRUE(result.has_value());

    // 4096 pixels reached in total
    EXPECT_EQ(yields, 8);
}

TEST_F(CostDistanceSegmenterTest, ItkImageMatchesRawBuffer) {
    auto grid = createWallSlice(48, 48, 24);
    auto image = createGrayImage(grid);
    const auto params = makeParams({10, 24}, grid);

    auto fromView = segmenter_->computeCostDistanceMap(grid.view(), params);
    auto fromImage = segmenter_->computeCostDistanceMap(image, params);
    ASSERT_TRUE(fromView.has_value());
    ASSERT_TRUE(fromImage.has_value());

    EXPECT_EQ(fromView->dist, fromImage->dist);
}

// =============================================================================
// Diagnostics
// =============================================================================

TEST_F(CostDistanceSegmenterTest, DebugFlagPrintsDiagnosticsAtInfoLevel) {
    auto grid = createWallSlice(32, 32, 16);
    auto params = makeParams({8, 16}, grid);
    params.debug = true;

    LogCapture capture("CostDistance2D", spdlog::level::info);
    ASSERT_TRUE(segmenter_->computeCostDistanceMap(grid.view(), params).has_value());

    const auto text = capture.text();
    EXPECT_NE(text.find("seedBox="), std::string::npos);
    EXPECT_NE(text.find("weights edge="), std::string::npos);
}

TEST_F(CostDistanceSegmenterTest, DiagnosticsStayQuietWithoutDebugFlag) {
    auto grid = createWallSlice(32, 32, 16);

    LogCapture capture("CostDistance2D", spdlog::level::info);
    ASSERT_TRUE(segmenter_->computeCostDistanceMap(grid.view(), makeParams({8, 16}, grid)).has_value());

    EXPECT_EQ(capture.text().find("seedBox="), std::string::npos);
}
