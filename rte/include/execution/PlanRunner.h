#pragma once

#include "execution/CancellationToken.h"
#include "execution/ExecutionResult.h"
#include "execution/SuiteExecutor.h"
#include "model/ExecutionPlan.h"
#include <functional>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Runs every suite of a plan with a cap on simultaneous suite processes
 *
 * Suites are started in plan order by up to maxConcurrentSuites worker
 * threads; each suite's own workers are handled by the runner process. A
 * failing suite never stops the others. After cancellation, suites not yet
 * started are reported as canceled without launching anything, and running
 * ones are torn down by the executor.
 *
 * The plan is validated first; an invalid plan throws
 * SchedulingInvariantViolation before any process starts.
 */
class PlanRunner {
public:
    // Compiled code for a suite; an empty string means there is nothing to run
    using CodeProvider = std::function<std::string(const Suite &)>;
    // Called once per suite as soon as its result is known (serialized, any thread)
    using ResultCallback = std::function<void(const ExecutionResult &)>;

    /**
     * @param maxConcurrentSuites Values below 1 mean 1
     */
    PlanRunner(const SuiteExecutor &executor, int maxConcurrentSuites);

    /**
     * @return One result per suite, in plan order
     */
    std::vector<ExecutionResult> run(const ExecutionPlan &plan, const CodeProvider &codeProvider,
                                     const CancellationToken *cancel = nullptr,
                                     const ResultCallback &onResult = nullptr) const;

    int getMaxConcurrentSuites() const {
        return maxConcurrentSuites_;
    }

private:
    const SuiteExecutor &executor_;
    int maxConcurrentSuites_;

    ExecutionResult runSuite(const Suite &suite, const CodeProvider &codeProvider,
                             const CancellationToken *cancel) const;
};

}  // namespace RTE
