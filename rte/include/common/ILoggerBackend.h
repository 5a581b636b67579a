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

#include <source_location>
#include <string>

namespace RTE {

/// Severity, ordered so that a backend can compare against its threshold
enum class LogLevel { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Critical = 5, Off = 6 };

/**
 * @brief Destination for everything logged through the LOG_* macros
 *
 * SpdlogBackend is the production implementation. A host that drives RTE
 * from its own process (a CI agent, an IDE plugin) installs its own through
 * Logger::setBackend() so suite progress lands in its log stream; tests
 * install a capturing one.
 *
 * log() is called from worker threads of PlanRunner concurrently.
 */
class ILoggerBackend {
public:
    virtual ~ILoggerBackend() = default;

    /**
     * @param message Already formatted, prefixed with the calling function
     * @param loc Call site of the LOG_* macro
     */
    virtual void log(LogLevel level, const std::string &message, const std::source_location &loc) = 0;

    /// Messages below level are dropped
    virtual void setLevel(LogLevel level) = 0;

    virtual void flush() = 0;
};

/**
 * @brief Parse a textual level ("trace", "debug", "info", "warn", "error", "critical", "off")
 *
 * @param text Level name, case-insensitive. "warning" and "err" are accepted aliases.
 * @param fallback Returned when text is not a known level
 */
LogLevel parseLogLevel(const std::string &text, LogLevel fallback);

}  // namespace RTE
