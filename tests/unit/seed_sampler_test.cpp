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

#include "services/segmentation/gradient_field.hpp"
#include "services/segmentation/seed_sampler.hpp"
#include "test_utils/volume_generator.hpp"

#include <memory>
#include <set>
#include <utility>
#include <vector>

using namespace seedgrow::services;
using seedgrow::test_utils::GrayGrid;

class SeedSamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        grid_ = std::make_unique<GrayGrid>(64, 64, 120);
        gradient_ = computeSobelMagnitude(grid_->view());
    }

    SeedSamplingRequest2D makeRequest(int seedCount) {
        SeedSamplingRequest2D request;
        request.gray = grid_->view();
        request.gradient = &gradient_;
        request.anchor = PixelPoint{32, 32};
        request.seedBox = Roi2D{22, 22, 42, 42};
        request.seedCount = seedCount;
        request.tumor = RobustStats{120.0, 6.0};
        return request;
    }

    std::unique_ptr<GrayGrid> grid_;
    GradientField gradient_;
};

// =============================================================================
// Seed boxes
// =============================================================================

TEST_F(SeedSamplerTest, DefaultBoxScalesWithRoi) {
    const Roi2D roi{0, 0, 99, 99};
    const auto box = defaultSeedBox(PixelPoint{50, 50}, roi);

    EXPECT_EQ(box, (Roi2D{43, 43, 57, 57}));
}

TEST_F(SeedSamplerTest, DefaultBoxHasMinimumHalfSizeAndClamps) {
    const Roi2D roi{0, 0, 9, 9};
    const auto box = defaultSeedBox(PixelPoint{0, 0}, roi);

    EXPECT_EQ(box, (Roi2D{0, 0, 6, 6}));
}

TEST_F(SeedSamplerTest, ClampSeedBoxOrdersCorners) {
    const Roi2D roi{10, 10, 50, 50};
    const auto box = clampSeedBox(Roi2D{60, 30, 5, 20}, roi);

    EXPECT_EQ(box, (Roi2D{10, 20, 50, 30}));
}

TEST_F(SeedSamplerTest, DerivedRngSeedIsDeterministic) {
    const Roi2D roi{0, 0, 63, 63};
    const Roi2D box{22, 22, 42, 42};

    EXPECT_EQ(deriveSeedRngSeed(100, roi, box), deriveSeedRngSeed(100, roi, box));
    EXPECT_NE(deriveSeedRngSeed(100, roi, box), deriveSeedRngSeed(101, roi, box));
}

// =============================================================================
// 2D sampling
// =============================================================================

TEST_F(SeedSamplerTest, SingleSeedIsTheAnchor) {
    Mulberry32 rng(1);
    auto seeds = sampleSeeds2D(makeRequest(1), rng);

    ASSERT_EQ(seeds.size(), 1u);
    EXPECT_EQ(seeds.front(), (PixelPoint{32, 32}));
}

TEST_F(SeedSamplerTest, ExtraSeedsAreDistinctAndInsideBox) {
    Mulberry32 rng(1);
    auto request = makeRequest(8);
    auto seeds = sampleSeeds2D(request, rng);

    ASSERT_EQ(seeds.size(), 8u);
    EXPECT_EQ(seeds.front(), request.anchor);

    std::set<std::pair<int, int>> unique;
    for (const auto& s : seeds) {
        EXPECT_TRUE(request.seedBox.contains(s.x, s.y));
        unique.insert({s.x, s.y});
    }
    EXPECT_EQ(unique.size(), seeds.size());
}

TEST_F(SeedSamplerTest, SameRngSeedSameSeeds) {
    Mulberry32 a(99);
    Mulberry32 b(99);

    auto first = sampleSeeds2D(makeRequest(6), a);
    auto second = sampleSeeds2D(makeRequest(6), b);

    EXPECT_EQ(first, second);
}

TEST_F(SeedSamplerTest, SeedCountIsCapped) {
    Mulberry32 rng(5);
    auto seeds = sampleSeeds2D(makeRequest(500), rng);

    EXPECT_LE(seeds.size(), static_cast<std::size_t>(kMaxSeedCount2D));
}

TEST_F(SeedSamplerTest, OffTumorPixelsAreRejected) {
    // Everything except the anchor is far from the tumor model
    for (auto& px : grid_->pixels) {
        px = 250;
    }
    grid_->at(32, 32) = 120;
    gradient_ = computeSobelMagnitude(grid_->view());

    Mulberry32 rng(3);
    auto seeds = sampleSeeds2D(makeRequest(8), rng);

    ASSERT_EQ(seeds.size(), 1u);
    EXPECT_EQ(seeds.front(), (PixelPoint{32, 32}));
}

TEST_F(SeedSamplerTest, BadnessPenalizesBackgroundLikeValues) {
    const RobustStats tumor{100.0, 10.0};
    const RobustStats background{50.0, 10.0};

    EXPECT_DOUBLE_EQ(seedBadness(100.0, 0.0, tumor, std::nullopt, 0.75), 0.0);
    // zT = 5, zB = 0, excess = 5 - 0.75
    EXPECT_DOUBLE_EQ(seedBadness(50.0, 0.0, tumor, background, 0.75), 5.0 + 0.75 * 4.25);
    EXPECT_GT(seedBadness(100.0, 255.0, tumor, std::nullopt, 0.75), 0.0);
}

// =============================================================================
// 3D seed resolution
// =============================================================================

TEST_F(SeedSamplerTest, VolumeSeedsDecodeIndicesAndDropOutOfRange) {
    const std::array<int, 3> dims{4, 4, 4};
    const auto domain = SolverDomain::fullGrid(dims);
    const std::vector<std::uint32_t> extras{0, 63, 1000};

    auto seeds = resolveVolumeSeeds(dims, SeedPoint{1, 1, 1}, extras, domain, std::nullopt);

    ASSERT_EQ(seeds.size(), 3u);
    EXPECT_EQ(seeds[0], (std::array<int, 3>{1, 1, 1}));
    EXPECT_EQ(seeds[1], (std::array<int, 3>{0, 0, 0}));
    EXPECT_EQ(seeds[2], (std::array<int, 3>{3, 3, 3}));
}

TEST_F(SeedSamplerTest, HardRoiFiltersVolumeSeeds) {
    const std::array<int, 3> dims{4, 4, 4};
    const auto domain = SolverDomain::fullGrid(dims);
    const std::vector<std::uint32_t> extras{0, 63};
    const VolumeRoiBounds roi{{1, 1, 1}, {2, 2, 2}};

    auto seeds = resolveVolumeSeeds(dims, SeedPoint{1, 1, 1}, extras, domain, roi);

    ASSERT_EQ(seeds.size(), 1u);
    EXPECT_EQ(seeds[0], (std::array<int, 3>{1, 1, 1}));
}
