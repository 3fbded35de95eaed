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

#include "services/segmentation/segmentation_config.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using namespace seedgrow::services;
using json = nlohmann::json;

class SegmentationConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = std::filesystem::temp_directory_path() / "segmentation_config_test";
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir_);
    }

    void writeFile(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path testDir_;
};

// =============================================================================
// File round trip
// =============================================================================

TEST_F(SegmentationConfigTest, SaveThenLoadRestoresSettings) {
    SegmentationSettings settings;
    settings.weights2D.edgeCostStrength = 10.0;
    settings.weights2D.allowDiagonal = false;
    settings.tuning2D.radialOuterW = 4.0;
    settings.seedCount2D = 8;
    settings.sliderGamma = 2.0;
    settings.gradientCacheCapacity = 5;
    settings.volumeTuning.edgeWeight = 3.0;
    settings.volumeTuning.roiMarginVoxels = 4;
    settings.volume.connectivity = Connectivity3D::TwentySix;
    settings.volume.maxVoxels = 250000;
    settings.volume.roiMode = RoiMode::Hard;
    settings.logLevel = seedgrow::logging::LogLevel::Debug;

    const auto path = testDir_ / "settings.json";
    auto saved = SegmentationConfig::save(settings, path);
    ASSERT_TRUE(saved.has_value()) << saved.error().toString();

    auto loaded = SegmentationConfig::load(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().toString();
    EXPECT_TRUE(*loaded == settings);
}

TEST_F(SegmentationConfigTest, SaveCreatesParentDirectories) {
    const auto path = testDir_ / "nested" / "dir" / "settings.json";
    auto saved = SegmentationConfig::save(SegmentationSettings{}, path);

    ASSERT_TRUE(saved.has_value());
    EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(SegmentationConfigTest, WrittenFileCarriesVersion) {
    const auto doc = SegmentationConfig::toJson(SegmentationSettings{});

    ASSERT_TRUE(doc.contains("version"));
    EXPECT_EQ(doc["version"].get<std::string>(), "1.0");
    EXPECT_TRUE(doc["volumeGrow"]["tuning"]["roiMarginVoxels"].is_null());
    EXPECT_EQ(doc["volumeGrow"]["defaults"]["connectivity"].get<int>(), 6);
}

// =============================================================================
// Parsing
// =============================================================================

TEST_F(SegmentationConfigTest, MissingSectionsKeepDefaults) {
    auto settings = SegmentationConfig::fromJson(json{{"version", "1.0"}});

    ASSERT_TRUE(settings.has_value());
    EXPECT_TRUE(*settings == SegmentationSettings{});
}

TEST_F(SegmentationConfigTest, PartialSectionOverridesOnlyListedKeys) {
    json doc = {
        {"version", "1.0"},
        {"costDistance2D", {{"weights", {{"tumorCostStrength", 1.5}}}}}
    };

    auto settings = SegmentationConfig::fromJson(doc);

    ASSERT_TRUE(settings.has_value());
    EXPECT_DOUBLE_EQ(settings->weights2D.tumorCostStrength, 1.5);
    EXPECT_DOUBLE_EQ(settings->weights2D.edgeCostStrength, CostWeights2D{}.edgeCostStrength);
}

TEST_F(SegmentationConfigTest, OutOfRangeValuesAreClamped) {
    json doc = {
        {"version", "1.0"},
        {"costDistance2D", {{"seedCount", 500}, {"sliderGamma", -1.0}}},
        {"volumeGrow", {
            {"tuning", {{"seedStatsRadiusVox", 20}, {"roiMarginVoxels", 100}}},
            {"defaults", {{"outsideToleranceScale", 3.0}, {"seedTolerance", -0.5}}}
        }}
    };

    auto settings = SegmentationConfig::fromJson(doc);

    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->seedCount2D, 64);
    EXPECT_DOUBLE_EQ(settings->sliderGamma, kDefaultSliderGamma);
    EXPECT_EQ(settings->volumeTuning.seedStatsRadiusVox, 6);
    ASSERT_TRUE(settings->volumeTuning.roiMarginVoxels.has_value());
    EXPECT_EQ(*settings->volumeTuning.roiMarginVoxels, 32);
    EXPECT_DOUBLE_EQ(settings->volume.outsideToleranceScale, 1.0);
    EXPECT_DOUBLE_EQ(settings->volume.seedTolerance, 0.0);
}

TEST_F(SegmentationConfigTest, NegativeCountsAreIgnored) {
    json doc = {
        {"version", "1.0"},
        {"costDistance2D", {{"gradientCacheCapacity", -3}}},
        {"volumeGrow", {
            {"tuning", {{"roiMarginVoxels", -4}, {"bgMaxSamples", -1}}},
            {"defaults", {{"maxVoxels", -5}, {"yieldEvery", -1}}}
        }}
    };

    auto settings = SegmentationConfig::fromJson(doc);

    ASSERT_TRUE(settings.has_value());
    EXPECT_FALSE(settings->volume.maxVoxels.has_value());
    EXPECT_EQ(settings->volume.yieldEvery, kDefaultYieldEvery);
    EXPECT_FALSE(settings->volumeTuning.roiMarginVoxels.has_value());
    EXPECT_EQ(settings->volumeTuning.bgMaxSamples, VolumeCostTuning{}.bgMaxSamples);
    EXPECT_EQ(settings->gradientCacheCapacity, kDefaultGradientCacheCapacity);
}

TEST_F(SegmentationConfigTest, FractionalCountsAreIgnored) {
    json doc = {
        {"version", "1.0"},
        {"volumeGrow", {
            {"tuning", {{"roiMarginVoxels", 2.5}}},
            {"defaults", {{"maxVoxels", 1000.5}}}
        }}
    };

    auto settings = SegmentationConfig::fromJson(doc);

    ASSERT_TRUE(settings.has_value());
    EXPECT_FALSE(settings->volumeTuning.roiMarginVoxels.has_value());
    EXPECT_FALSE(settings->volume.maxVoxels.has_value());
}

TEST_F(SegmentationConfigTest, WholeCountsAreRead) {
    json doc = {
        {"version", "1.0"},
        {"costDistance2D", {{"gradientCacheCapacity", 0}}},
        {"volumeGrow", {
            {"tuning", {{"roiMarginVoxels", 3}}},
            {"defaults", {{"maxVoxels", 250000}}}
        }}
    };

    auto settings = SegmentationConfig::fromJson(doc);

    ASSERT_TRUE(settings.has_value());
    ASSERT_TRUE(settings->volumeTuning.roiMarginVoxels.has_value());
    EXPECT_EQ(*settings->volumeTuning.roiMarginVoxels, 3);
    ASSERT_TRUE(settings->volume.maxVoxels.has_value());
    EXPECT_EQ(*settings->volume.maxVoxels, 250000u);
    EXPECT_EQ(settings->gradientCacheCapacity, 1u);
}

TEST_F(SegmentationConfigTest, UnknownLogLevelKeepsDefault) {
    auto settings = SegmentationConfig::fromJson(json{{"version", "1.0"}, {"logLevel", "loud"}});

    ASSERT_TRUE(settings.has_value());
    EXPECT_EQ(settings->logLevel, seedgrow::logging::LogLevel::Info);
}

TEST_F(SegmentationConfigTest, RejectsMissingOrUnsupportedVersion) {
    auto missing = SegmentationConfig::fromJson(json::object());
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, SegmentationError::Code::InvalidInput);

    auto future = SegmentationConfig::fromJson(json{{"version", "2.0"}});
    ASSERT_FALSE(future.has_value());
    EXPECT_EQ(future.error().code, SegmentationError::Code::InvalidInput);

    auto notObject = SegmentationConfig::fromJson(json::array());
    ASSERT_FALSE(notObject.has_value());
}

TEST_F(SegmentationConfigTest, WrongValueTypeIsRejected) {
    json doc = {
        {"version", "1.0"},
        {"costDistance2D", {{"seedCount", "many"}}}
    };

    auto settings = SegmentationConfig::fromJson(doc);

    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, SegmentationError::Code::InvalidInput);
}

// =============================================================================
// File errors
// =============================================================================

TEST_F(SegmentationConfigTest, LoadMissingFileFails) {
    auto settings = SegmentationConfig::load(testDir_ / "absent.json");

    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, SegmentationError::Code::InvalidInput);
}

TEST_F(SegmentationConfigTest, LoadMalformedJsonFails) {
    const auto path = testDir_ / "broken.json";
    writeFile(path, "{ \"version\": \"1.0\", ");

    auto settings = SegmentationConfig::load(path);

    ASSERT_FALSE(settings.has_value());
    EXPECT_EQ(settings.error().code, SegmentationError::Code::ProcessingFailed);
}
