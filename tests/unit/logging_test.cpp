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

#include "core/logging.hpp"

#include <filesystem>

using namespace seedgrow::logging;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        LoggerFactory::configure(LogConfig{});
        LoggerFactory::setGlobalLevel(LogLevel::Info);
    }
};

// =============================================================================
// Level names
// =============================================================================

TEST_F(LoggingTest, ParsesLevelNamesCaseInsensitively) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST_F(LoggingTest, LevelNamesParseBack) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parseLogLevel(toString(level)), level);
    }
}

// =============================================================================
// Factory
// =============================================================================

TEST_F(LoggingTest, CreateReturnsRegisteredLogger) {
    auto first = LoggerFactory::create("LoggingTestShared");
    auto second = LoggerFactory::create("LoggingTestShared");

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(first->name(), "LoggingTestShared");
}

TEST_F(LoggingTest, GlobalLevelAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingTestLevel");

    LoggerFactory::setGlobalLevel(LogLevel::Error);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_EQ(logger->level(), spdlog::level::err);
    EXPECT_FALSE(logger->should_log(spdlog::level::info));

    LoggerFactory::setGlobalLevel(LogLevel::Debug);
    EXPECT_TRUE(logger->should_log(spdlog::level::debug));
}

TEST_F(LoggingTest, FileLoggingWritesPerLoggerFile) {
    const auto dir = std::filesystem::temp_directory_path() / "seedgrow_logging_test";
    std::filesystem::remove_all(dir);

    LogConfig config;
    config.enableFileLogging = true;
    config.logDirectory = dir;
    LoggerFactory::configure(config);
    EXPECT_TRUE(LoggerFactory::isConfigured());

    auto logger = LoggerFactory::create("LoggingTestFile");
    logger->info("written to file");
    logger->flush();

    EXPECT_TRUE(std::filesystem::exists(dir / "LoggingTestFile.log"));

    spdlog::drop("LoggingTestFile");
    std::filesystem::remove_all(dir);
}
