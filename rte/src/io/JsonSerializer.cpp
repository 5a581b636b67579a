#include "io/JsonSerializer.h"

namespace RTE {

json JsonSerializer::toJson(const SelectorCandidate &candidate) {
    json value = {{"strategy", toString(candidate.getStrategy())}, {"value", candidate.getValue()}};
    if (candidate.getAccessibleName()) {
        value["name"] = *candidate.getAccessibleName();
    }
    return value;
}

json JsonSerializer::toJson(const Suite &suite) {
    json cases = json::array();
    for (const auto &testCase : suite.cases) {
        cases.push_back(testCase.name);
    }

    return {{"name", suite.name},
            {"workers", suite.workers},
            {"shared_context", suite.sharedContext},
            {"cases", std::move(cases)}};
}

json JsonSerializer::toJson(const ExecutionPlan &plan) {
    json suites = json::array();
    for (const auto &suite : plan.getSuites()) {
        suites.push_back(toJson(suite));
    }
    return {{"suites", std::move(suites)}, {"total_cases", plan.totalCases()}};
}

json JsonSerializer::toJson(const StepCapture &capture) {
    json networkCalls = json::array();
    for (const auto &call : capture.networkCalls) {
        // Stored as compact JSON by StepCaptureLoader; anything else is kept as text
        auto parsed = JsonUtils::parseJson(call);
        networkCalls.push_back(parsed ? std::move(*parsed) : json(call));
    }

    return {{"name", capture.name},
            {"screenshot_path", capture.screenshotPath ? json(*capture.screenshotPath) : json(nullptr)},
            {"network_calls", std::move(networkCalls)},
            {"console", capture.consoleLogs}};
}

json JsonSerializer::toJson(const ExecutionResult &result) {
    json captures = json::array();
    for (const auto &capture : result.stepCaptures) {
        captures.push_back(toJson(capture));
    }

    return {{"suite", result.suiteName},
            {"status", toString(result.state)},
            {"success", result.success},
            {"exit_code", result.exitCode},
            {"timed_out", result.timedOut},
            {"canceled", result.canceled},
            {"duration_seconds", result.durationSeconds},
            {"artifact_path", result.artifactPath},
            {"stdout", result.stdoutOutput},
            {"stderr", result.stderrOutput},
            {"capture_dir", result.captureDir},
            {"step_captures", std::move(captures)}};
}

json JsonSerializer::toJson(const RunReport &report) {
    json results = json::array();
    for (const auto &result : report.results) {
        results.push_back(toJson(result));
    }

    json warnings = json::array();
    for (const auto &warning : report.healWarnings) {
        warnings.push_back({{"suite", warning.suiteName}, {"message", warning.message}});
    }

    json screenshots = json::array();
    for (const auto &screenshot : report.screenshots) {
        screenshots.push_back({{"suite", screenshot.suiteName}, {"step", screenshot.stepName}, {"path", screenshot.path}});
    }

    return {{"run_id", report.runId},
            {"status", report.overallStatus},
            {"total_suites", report.totalSuites},
            {"passed_suites", report.passedSuites},
            {"failed_suites", report.failedSuites},
            {"timed_out_suites", report.timedOutSuites},
            {"canceled_suites", report.canceledSuites},
            {"total_duration_seconds", report.totalDuration},
            {"heal_warnings", std::move(warnings)},
            {"screenshots", std::move(screenshots)},
            {"results", std::move(results)}};
}

}  // namespace RTE
