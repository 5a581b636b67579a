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

#pragma once

#include "common/ILoggerBackend.h"
#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <string>

namespace RTE {

/**
 * @brief Centralized logging facade with dependency injection support
 *
 * Two usage patterns are supported:
 *
 * 1. Default mode: the spdlog backend is created lazily on first use
 * 2. Custom mode: callers inject their own ILoggerBackend implementation
 *
 * Thread-safe: the backend is created and replaced under a mutex, and each
 * call keeps its own reference, so a backend replaced mid-run finishes the
 * writes already in flight.
 *
 * @code
 * RTE::Logger::initialize();
 * LOG_INFO("Scheduled {} suites", plan.size());
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Inject custom logger backend
     *
     * Replaces the current backend; nullptr makes the next log call create the spdlog default.
     *
     * @param backend Logger backend (ownership transferred)
     */
    static void setBackend(std::unique_ptr<ILoggerBackend> backend);

    /**
     * @brief Initialize default logger (console only)
     *
     * Creates the spdlog backend if no custom backend was injected.
     */
    static void initialize();

    /**
     * @brief Initialize default logger with optional file output
     *
     * @param logDir Directory for log files
     * @param logToFile Enable file logging (writes <logDir>/rte.log)
     */
    static void initialize(const std::string &logDir, bool logToFile = true);

    static void setLevel(LogLevel level);

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void info(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current());
    static void error(const std::string &message, const std::source_location &loc = std::source_location::current());

    static void flush();

private:
    static std::shared_ptr<ILoggerBackend> backend_;
    static std::shared_ptr<ILoggerBackend> ensureBackend();
    static void write(LogLevel level, const std::string &message, const std::source_location &loc);
    static std::string extractCleanFunctionName(const std::source_location &loc);
};

}  // namespace RTE

// Format through the fmt library spdlog is built on, capturing the call site
#define LOG_TRACE(...) RTE::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) RTE::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) RTE::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) RTE::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) RTE::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
