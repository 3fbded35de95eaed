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

#include "services/segmentation/robust_stats.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace seedgrow::services;

namespace {

std::vector<double> sequence(int count) {
    std::vector<double> values;
    for (int i = 0; i < count; ++i) {
        values.push_back(static_cast<double>(i));
    }
    return values;
}

} // anonymous namespace

// =============================================================================
// Median
// =============================================================================

TEST(RobustStatsTest, MedianOfOddCount) {
    std::vector<double> values{5.0, 1.0, 3.0};
    EXPECT_DOUBLE_EQ(medianOf(values), 3.0);
}

TEST(RobustStatsTest, MedianOfEvenCountAveragesMiddlePair) {
    std::vector<double> values{4.0, 1.0, 3.0, 2.0};
    EXPECT_DOUBLE_EQ(medianOf(values), 2.5);
}

TEST(RobustStatsTest, MedianOfEmptyIsZero) {
    std::vector<double> values;
    EXPECT_DOUBLE_EQ(medianOf(values), 0.0);
}

// =============================================================================
// Median / MAD estimate
// =============================================================================

TEST(RobustStatsTest, TooFewSamplesYieldsNothing) {
    auto values = sequence(static_cast<int>(kMinRobustSamples) - 1);
    EXPECT_FALSE(estimateRobustStats(values, 1.0).has_value());
}

TEST(RobustStatsTest, ScaledMadOfSequence) {
    // 0..16: median 8, absolute deviations have median 4
    auto values = sequence(17);
    auto stats = estimateRobustStats(values, 1.0);

    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(stats->mu, 8.0);
    EXPECT_NEAR(stats->sigma, kMadToSigma * 4.0, 1e-12);
}

TEST(RobustStatsTest, OutliersDoNotMoveTheMedian) {
    std::vector<double> values(15, 10.0);
    values.push_back(1000.0);
    values.push_back(1000.0);

    auto stats = estimateRobustStats(values, 6.0);

    ASSERT_TRUE(stats.has_value());
    EXPECT_DOUBLE_EQ(stats->mu, 10.0);
    // MAD is zero, so sigma falls back to the floor
    EXPECT_DOUBLE_EQ(stats->sigma, 6.0);
}

TEST(RobustStatsTest, NonFiniteSamplesYieldNothing) {
    std::vector<double> values(20, std::numeric_limits<double>::infinity());
    EXPECT_FALSE(estimateRobustStats(values, 1.0).has_value());
}

// =============================================================================
// Quantiles
// =============================================================================

TEST(RobustStatsTest, QuantilesUseFloorIndex) {
    auto values = sequence(100);
    auto q = sampleQuantiles(values, 0.02, 0.995, 64);

    ASSERT_TRUE(q.has_value());
    EXPECT_DOUBLE_EQ(q->low, 1.0);
    EXPECT_DOUBLE_EQ(q->high, 98.0);
    EXPECT_DOUBLE_EQ(q->q99, 98.0);
}

TEST(RobustStatsTest, QuantilesNeedMinimumSamples) {
    auto values = sequence(100);
    EXPECT_FALSE(sampleQuantiles(values, 0.02, 0.995, 200).has_value());

    std::vector<double> empty;
    EXPECT_FALSE(sampleQuantiles(empty, 0.02, 0.995, 0).has_value());
}
