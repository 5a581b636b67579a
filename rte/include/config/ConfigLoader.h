#pragma once

#include "common/ILoggerBackend.h"
#include "common/JsonUtils.h"
#include "execution/RunnerConfig.h"
#include "scheduling/ExecutionPolicy.h"
#include <stdexcept>
#include <string>

namespace RTE {

/**
 * @brief Malformed configuration or case file (bad JSON, wrong types, unknown enum strings)
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    // Empty means console only
    std::string logDir;
    bool logToFile = false;
};

/**
 * @brief Everything rte_run reads from its configuration file
 */
struct RunConfig {
    ExecutionPolicy execution;
    RunnerConfig runner;
    LoggingConfig logging;
};

/**
 * @brief Reads RunConfig from JSON
 *
 * Sections "execution", "runner" and "logging" are all optional and every
 * missing key keeps its default. Present keys must have the documented
 * type; a mismatch raises ConfigError naming the offending path. Integers
 * must fit in int, runner.timeout_seconds must lie in (0, one week], and
 * runner.capture_dir and runner.capture_support_file must be single names.
 */
class ConfigLoader {
public:
    static RunConfig loadFromFile(const std::string &path);
    static RunConfig loadFromString(const std::string &text);
    static RunConfig fromJson(const json &root);

    static ExecutionPolicy parseExecutionPolicy(const json &section);
    static RunnerConfig parseRunnerConfig(const json &section);
    static LoggingConfig parseLoggingConfig(const json &section);
};

}  // namespace RTE
