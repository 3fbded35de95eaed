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

#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <system_error>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace seedgrow::logging {

namespace {

std::mutex& factoryMutex() {
    static std::mutex mutex;
    return mutex;
}

constexpr const char* kJsonPattern =
    R"({"time":"%Y-%m-%dT%H:%M:%S.%e","logger":"%n","level":"%l","message":"%v"})";

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

} // anonymous namespace

LogConfig LoggerFactory::config_ = {};
bool LoggerFactory::configured_ = false;

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string_view toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    std::lock_guard lock(factoryMutex());

    if (auto existing = spdlog::get(name)) {
        return existing;
    }

    const auto level = toSpdlog(config_.level);
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_level(level);
    sinks.push_back(consoleSink);

    if (config_.enableFileLogging && !config_.logDirectory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config_.logDirectory, ec);
        if (!ec) {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                (config_.logDirectory / (name + ".log")).string(),
                config_.maxFileSize,
                config_.maxFiles
            );
            fileSink->set_level(level);
            sinks.push_back(fileSink);
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(config_.jsonFormat ? std::string(kJsonPattern) : config_.pattern);

    spdlog::register_logger(logger);
    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    std::lock_guard lock(factoryMutex());
    config_ = config;
    configured_ = true;

    spdlog::set_level(toSpdlog(config.level));
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    std::lock_guard lock(factoryMutex());
    config_.level = level;
    spdlog::set_level(toSpdlog(level));

    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(toSpdlog(level));
        for (auto& sink : logger->sinks()) {
            sink->set_level(toSpdlog(level));
        }
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    std::lock_guard lock(factoryMutex());
    return config_.level;
}

bool LoggerFactory::isConfigured() {
    std::lock_guard lock(factoryMutex());
    return configured_;
}

void LoggerFactory::shutdown() {
    std::lock_guard lock(factoryMutex());
    spdlog::shutdown();
    configured_ = false;
}

}  // namespace seedgrow::logging
