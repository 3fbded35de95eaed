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

#include "services/segmentation/threshold_mapper.hpp"
#include "test_utils/volume_generator.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace seedgrow::services;

class ThresholdMapperTest : public ::testing::Test {
protected:
    /// 10x10 field with distance equal to the row-major index
    std::vector<float> createIndexField() {
        std::vector<float> field(100);
        for (std::size_t i = 0; i < field.size(); ++i) {
            field[i] = static_cast<float>(i);
        }
        return field;
    }

    const Roi2D fullRoi_{0, 0, 9, 9};
};

// =============================================================================
// Quantile LUT
// =============================================================================

TEST_F(ThresholdMapperTest, NoFiniteSamplesGivesIdentityLut) {
    std::vector<float> field(100, std::numeric_limits<float>::infinity());
    auto summary = buildQuantileLut(field, 10, fullRoi_);

    for (std::size_t i = 0; i < summary.lut.size(); ++i) {
        EXPECT_FLOAT_EQ(summary.lut[i], static_cast<float>(i));
    }
    EXPECT_DOUBLE_EQ(summary.maxFiniteDistance, 0.0);
}

TEST_F(ThresholdMapperTest, LutSpansFiniteRangeAndIsMonotone) {
    auto field = createIndexField();
    field[55] = std::numeric_limits<float>::infinity();

    auto summary = buildQuantileLut(field, 10, fullRoi_);

    EXPECT_FLOAT_EQ(summary.lut.front(), 0.0f);
    EXPECT_FLOAT_EQ(summary.lut.back(), 99.0f);
    EXPECT_DOUBLE_EQ(summary.maxFiniteDistance, 99.0);
    for (std::size_t i = 1; i < summary.lut.size(); ++i) {
        EXPECT_GE(summary.lut[i], summary.lut[i - 1]);
    }
}

TEST_F(ThresholdMapperTest, LutOnlySamplesInsideRoi) {
    auto field = createIndexField();
    auto summary = buildQuantileLut(field, 10, Roi2D{0, 0, 9, 1});

    EXPECT_FLOAT_EQ(summary.lut.back(), 19.0f);
    EXPECT_DOUBLE_EQ(summary.maxFiniteDistance, 19.0);
}

// =============================================================================
// Slider mapping
// =============================================================================

TEST_F(ThresholdMapperTest, SliderEndsMapToLutEnds) {
    auto summary = buildQuantileLut(createIndexField(), 10, fullRoi_);

    EXPECT_DOUBLE_EQ(distThresholdFromSlider(summary.lut, 0.0), summary.lut.front());
    EXPECT_DOUBLE_EQ(distThresholdFromSlider(summary.lut, 1.0), summary.lut.back());
    EXPECT_DOUBLE_EQ(distThresholdFromSlider(summary.lut, 2.0), summary.lut.back());
    EXPECT_DOUBLE_EQ(distThresholdFromSlider(summary.lut, std::nan("")), summary.lut.front());
}

TEST_F(ThresholdMapperTest, SliderInterpolatesBetweenEntries) {
    QuantileLut identity{};
    for (std::size_t i = 0; i < identity.size(); ++i) {
        identity[i] = static_cast<float>(i);
    }

    EXPECT_NEAR(distThresholdFromSlider(identity, 0.5, 1.0), 127.5, 1e-9);
    EXPECT_NEAR(distThresholdFromSlider(identity, 0.5, 2.0), 63.75, 1e-9);
}

TEST_F(ThresholdMapperTest, ThresholdIsNonDecreasingInSlider) {
    auto summary = buildQuantileLut(createIndexField(), 10, fullRoi_);

    double previous = -1.0;
    for (int step = 0; step <= 100; ++step) {
        const double t = distThresholdFromSlider(summary.lut, step / 100.0);
        EXPECT_GE(t, previous);
        previous = t;
    }
}

// =============================================================================
// Mask extraction
// =============================================================================

TEST_F(ThresholdMapperTest, MaskKeepsPixelsAtOrBelowThreshold) {
    auto field = createIndexField();
    auto mask = thresholdDistanceMap(field, 10, 10, 49.0);

    ASSERT_TRUE(mask.has_value());
    EXPECT_EQ(seedgrow::test_utils::countForeground<BinaryMask2D>(*mask), 50u);

    BinaryMask2D::IndexType inside{{9, 4}};
    BinaryMask2D::IndexType outside{{0, 5}};
    EXPECT_EQ((*mask)->GetPixel(inside), 1);
    EXPECT_EQ((*mask)->GetPixel(outside), 0);
}

TEST_F(ThresholdMapperTest, MaskRejectsSizeMismatch) {
    std::vector<float> field(99, 0.0f);
    auto mask = thresholdDistanceMap(field, 10, 10, 1.0);

    ASSERT_FALSE(mask.has_value());
    EXPECT_EQ(mask.error().code, SegmentationError::Code::InvalidInput);
}
