#pragma once

#include "execution/CancellationToken.h"
#include "execution/ExecutionResult.h"
#include "execution/RunnerConfig.h"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Runs one suite's compiled code as an isolated, time-bounded runner process
 *
 * Each run():
 * 1. creates <outputDir>/<invocation id>/, a directory no other call has used
 * 2. writes the code to <suite>.<extension> inside it
 * 3. creates the capture directory and writes the capture support file
 * 4. starts the runner there in its own process group, stdin on /dev/null
 * 5. captures stdout/stderr until exit, timeout or cancellation
 * 6. loads the step captures the runner left behind
 *
 * Expected failures (nonzero exit, timeout, cancellation, launch problems)
 * are reported in the ExecutionResult, never thrown. Holds only its
 * configuration, so one instance can serve concurrent invocations.
 */
class SuiteExecutor {
public:
    /**
     * @throws std::invalid_argument when config.command is empty
     */
    explicit SuiteExecutor(RunnerConfig config);

    /**
     * @brief Run with the configured timeout
     */
    ExecutionResult run(const std::string &suiteName, const std::string &compiledCode, int workers,
                        const CancellationToken *cancel = nullptr) const;

    /**
     * @param workers Forwarded to the runner's parallel flag when > 1; values below 1 mean 1
     * @param timeout Wall-clock budget; non-positive values fall back to the configured timeout
     */
    ExecutionResult run(const std::string &suiteName, const std::string &compiledCode, int workers,
                        std::chrono::milliseconds timeout, const CancellationToken *cancel = nullptr) const;

    /**
     * @brief Runner command line for an artifact
     */
    std::vector<std::string> buildCommand(const std::filesystem::path &artifactPath, int workers) const;

    const RunnerConfig &getConfig() const {
        return config_;
    }

private:
    bool prepareCapture(const std::filesystem::path &workDir, ExecutionResult &result, std::string &error) const;

    RunnerConfig config_;
};

}  // namespace RTE
