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
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief spdlog-based logger backend
 *
 * Logger::initialize() installs one writing to a colored stderr console
 * and, when requested, to <logDir>/rte.log. stdout stays reserved for the
 * JSON that rte_run prints.
 *
 * The starting level is debug; SPDLOG_LEVEL overrides it.
 */
class SpdlogBackend : public ILoggerBackend {
public:
    SpdlogBackend(const std::string &logDir = "", bool logToFile = false);

    /**
     * @brief Backend over caller-provided sinks (used by tests to capture output)
     */
    explicit SpdlogBackend(std::vector<spdlog::sink_ptr> sinks);

    void log(LogLevel level, const std::string &message, const std::source_location &loc) override;
    void setLevel(LogLevel level) override;
    void flush() override;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);

private:
    static std::vector<spdlog::sink_ptr> defaultSinks(const std::string &logDir, bool logToFile);

    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace RTE
