#pragma once

#include <optional>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Lifecycle of one suite invocation
 *
 * Pending -> Running -> one of the four terminal states. A launch failure
 * goes straight from Pending to CompletedFailure.
 */
enum class ExecutionState { Pending, Running, CompletedSuccess, CompletedFailure, TimedOut, Canceled };

const char *toString(ExecutionState state);

inline bool isTerminal(ExecutionState state) {
    return state != ExecutionState::Pending && state != ExecutionState::Running;
}

/**
 * @brief What the runner recorded for one test, read back from <test>.json in the capture directory
 */
struct StepCapture {
    std::string name;
    std::optional<std::string> screenshotPath;
    // One entry per network call, each kept as compact JSON text
    std::vector<std::string> networkCalls;
    std::vector<std::string> consoleLogs;

    bool operator==(const StepCapture &) const = default;
};

/**
 * @brief Outcome of running one suite, handed to the reporting layer
 *
 * exitCode is the runner's exit status (0-255), 128+N for death by signal N,
 * or one of the negative sentinels in Constants for timeout, cancellation
 * and launch failure. Output captured before a timeout or cancellation is
 * kept.
 */
struct ExecutionResult {
    std::string suiteName;
    bool success = false;
    int exitCode = 0;
    std::string stdoutOutput;
    std::string stderrOutput;
    bool timedOut = false;
    bool canceled = false;
    double durationSeconds = 0.0;
    std::string artifactPath;
    // Empty when capture is disabled or the suite never got a working directory
    std::string captureDir;
    std::vector<StepCapture> stepCaptures;
    ExecutionState state = ExecutionState::Pending;
};

}  // namespace RTE
