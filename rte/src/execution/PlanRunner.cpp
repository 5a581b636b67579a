#include "execution/PlanRunner.h"
#include "common/Constants.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "scheduling/PlanValidator.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace RTE {

namespace {

ExecutionResult notStartedResult(const Suite &suite, ExecutionState state, int exitCode, const std::string &message) {
    ExecutionResult result;
    result.suiteName = suite.name;
    result.success = false;
    result.exitCode = exitCode;
    result.stderrOutput = message;
    result.canceled = state == ExecutionState::Canceled;
    result.state = state;
    return result;
}

}  // namespace

PlanRunner::PlanRunner(const SuiteExecutor &executor, int maxConcurrentSuites)
    : executor_(executor), maxConcurrentSuites_(std::max(maxConcurrentSuites, 1)) {}

ExecutionResult PlanRunner::runSuite(const Suite &suite, const CodeProvider &codeProvider,
                                     const CancellationToken *cancel) const {
    if (cancel && cancel->isCanceled()) {
        return notStartedResult(suite, ExecutionState::Canceled, Constants::CANCELED_EXIT_CODE, "Suite canceled");
    }

    std::string code;
    try {
        code = codeProvider(suite);
    } catch (const std::exception &e) {
        LOG_ERROR("PlanRunner: Building code for suite '{}' failed: {}", suite.name, Log::sanitize(e.what()));
        return notStartedResult(suite, ExecutionState::CompletedFailure, Constants::LAUNCH_FAILURE_EXIT_CODE,
                                std::string("Failed to build code for suite ") + suite.name + ": " + e.what());
    }

    if (code.empty()) {
        LOG_WARN("PlanRunner: Suite '{}' has no compiled code", suite.name);
        return notStartedResult(suite, ExecutionState::CompletedFailure, Constants::LAUNCH_FAILURE_EXIT_CODE,
                                "No compiled code for suite " + suite.name);
    }

    return executor_.run(suite.name, code, suite.workers, cancel);
}

std::vector<ExecutionResult> PlanRunner::run(const ExecutionPlan &plan, const CodeProvider &codeProvider,
                                             const CancellationToken *cancel, const ResultCallback &onResult) const {
    if (!codeProvider) {
        throw std::invalid_argument("PlanRunner requires a code provider");
    }
    PlanValidator::validate(plan);

    const auto &suites = plan.getSuites();
    std::vector<ExecutionResult> results(suites.size());
    if (suites.empty()) {
        return results;
    }

    std::atomic<size_t> nextSuite{0};
    std::mutex callbackMutex;

    auto worker = [&]() {
        while (true) {
            size_t index = nextSuite.fetch_add(1);
            if (index >= suites.size()) {
                return;
            }

            results[index] = runSuite(suites[index], codeProvider, cancel);

            if (onResult) {
                std::lock_guard<std::mutex> lock(callbackMutex);
                onResult(results[index]);
            }
        }
    };

    size_t threadCount = std::min(suites.size(), static_cast<size_t>(maxConcurrentSuites_));
    LOG_INFO("PlanRunner: Running {} suites, at most {} at a time", suites.size(), threadCount);

    if (threadCount == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
            threads.emplace_back(worker);
        }
        for (auto &thread : threads) {
            thread.join();
        }
    }

    size_t passed = std::count_if(results.begin(), results.end(), [](const ExecutionResult &r) { return r.success; });
    LOG_INFO("PlanRunner: {}/{} suites passed", passed, results.size());

    return results;
}

}  // namespace RTE
