#pragma once

#include "execution/ExecutionResult.h"
#include "selector/SelectorResolver.h"
#include <mutex>
#include <string>
#include <vector>

namespace RTE {

struct HealWarning {
    std::string suiteName;
    std::string message;

    bool operator==(const HealWarning &) const = default;
};

/**
 * @brief Screenshot taken during a suite, by test name
 */
struct ScreenshotRef {
    std::string suiteName;
    std::string stepName;
    std::string path;

    bool operator==(const ScreenshotRef &) const = default;
};

/**
 * @brief Summary of one test run
 */
struct RunReport {
    std::string runId;
    std::vector<ExecutionResult> results;
    std::vector<HealWarning> healWarnings;
    std::vector<ScreenshotRef> screenshots;
    size_t totalSuites = 0;
    size_t passedSuites = 0;
    size_t failedSuites = 0;
    size_t timedOutSuites = 0;
    size_t canceledSuites = 0;
    double totalDuration = 0.0;
    // "passed" when every suite succeeded (or there were none), "failed" otherwise
    std::string overallStatus = "passed";

    bool passed() const {
        return overallStatus == "passed";
    }
};

/**
 * @brief Thread-safe accumulator of suite results and heal warnings
 *
 * failedSuites counts every unsuccessful suite, timed out and canceled
 * ones included; timedOutSuites and canceledSuites break that number down.
 */
class ResultCollector {
public:
    /**
     * @brief Record a suite result and the screenshots of its step captures
     *
     * Relative screenshot paths are taken relative to the result's capture directory.
     */
    void addExecutionResult(const ExecutionResult &result);

    void addScreenshot(const std::string &suiteName, const std::string &stepName, const std::string &path);

    /**
     * @brief Record the heal warning of a resolution, if it healed
     * @return true when a warning was recorded
     */
    bool addHealWarning(const std::string &suiteName, const ResolveResult &resolution);

    void addHealWarning(const std::string &suiteName, const std::string &message);

    RunReport buildReport(const std::string &runId) const;

    size_t resultCount() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<ExecutionResult> results_;
    std::vector<HealWarning> healWarnings_;
    std::vector<ScreenshotRef> screenshots_;
};

}  // namespace RTE
