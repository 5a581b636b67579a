// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-RTE-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of RTE (Resilient Test Engine).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Full terms: see LICENSE

#include "backends/SpdlogBackend.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace RTE {

namespace {

constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
constexpr const char *LOG_FILE_NAME = "rte.log";

}  // namespace

SpdlogBackend::SpdlogBackend(const std::string &logDir, bool logToFile)
    : SpdlogBackend(defaultSinks(logDir, logToFile)) {}

SpdlogBackend::SpdlogBackend(std::vector<spdlog::sink_ptr> sinks) {
    // Kept out of the spdlog registry so tests can create several side by side
    logger_ = std::make_shared<spdlog::logger>("rte", sinks.begin(), sinks.end());
    logger_->set_level(spdlog::level::debug);

    if (const char *envLevel = std::getenv("SPDLOG_LEVEL")) {
        logger_->set_level(toSpdlogLevel(parseLogLevel(envLevel, LogLevel::Debug)));
    }
}

std::vector<spdlog::sink_ptr> SpdlogBackend::defaultSinks(const std::string &logDir, bool logToFile) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    sinks.push_back(console);

    if (logToFile && !logDir.empty()) {
        std::filesystem::create_directories(logDir);
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (std::filesystem::path(logDir) / LOG_FILE_NAME).string(), true);
        file->set_pattern(FILE_PATTERN);
        sinks.push_back(file);
    }
    return sinks;
}

void SpdlogBackend::log(LogLevel level, const std::string &message, [[maybe_unused]] const std::source_location &loc) {
    logger_->log(toSpdlogLevel(level), message);
    if (level >= LogLevel::Error) {
        logger_->flush();
    }
}

void SpdlogBackend::setLevel(LogLevel level) {
    logger_->set_level(toSpdlogLevel(level));
}

void SpdlogBackend::flush() {
    logger_->flush();
}

spdlog::level::level_enum SpdlogBackend::toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::debug;
}

}  // namespace RTE
