#include "reporting/ResultCollector.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include <filesystem>

namespace RTE {

void ResultCollector::addExecutionResult(const ExecutionResult &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(result);

    for (const auto &capture : result.stepCaptures) {
        if (!capture.screenshotPath || capture.screenshotPath->empty()) {
            continue;
        }
        std::filesystem::path path = *capture.screenshotPath;
        if (path.is_relative() && !result.captureDir.empty()) {
            path = std::filesystem::path(result.captureDir) / path;
        }
        screenshots_.push_back(ScreenshotRef{result.suiteName, capture.name, path.string()});
    }
}

void ResultCollector::addScreenshot(const std::string &suiteName, const std::string &stepName,
                                    const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    screenshots_.push_back(ScreenshotRef{suiteName, stepName, path});
}

bool ResultCollector::addHealWarning(const std::string &suiteName, const ResolveResult &resolution) {
    auto message = resolution.warningMessage();
    if (!message) {
        return false;
    }
    addHealWarning(suiteName, *message);
    return true;
}

void ResultCollector::addHealWarning(const std::string &suiteName, const std::string &message) {
    LOG_DEBUG("ResultCollector: Heal warning in suite '{}': {}", suiteName, Log::sanitize(message));
    std::lock_guard<std::mutex> lock(mutex_);
    healWarnings_.push_back(HealWarning{suiteName, message});
}

RunReport ResultCollector::buildReport(const std::string &runId) const {
    std::lock_guard<std::mutex> lock(mutex_);

    RunReport report;
    report.runId = runId;
    report.results = results_;
    report.healWarnings = healWarnings_;
    report.screenshots = screenshots_;
    report.totalSuites = results_.size();

    for (const auto &result : results_) {
        if (result.success) {
            report.passedSuites++;
        } else {
            report.failedSuites++;
        }
        if (result.timedOut) {
            report.timedOutSuites++;
        }
        if (result.canceled) {
            report.canceledSuites++;
        }
        report.totalDuration += result.durationSeconds;
    }

    report.overallStatus = report.failedSuites == 0 ? "passed" : "failed";
    return report;
}

size_t ResultCollector::resultCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

void ResultCollector::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.clear();
    healWarnings_.clear();
    screenshots_.clear();
}

}  // namespace RTE
