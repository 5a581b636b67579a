#include "scheduling/SuiteScheduler.h"
#include "common/Logger.h"
#include "scheduling/PlanValidator.h"

namespace RTE {

std::unique_ptr<ISchedulingPolicy> SuiteScheduler::selectPolicy(const ExecutionPolicy &policy,
                                                                const SuiteAssignments &explicitAssignments) {
    if (!explicitAssignments.empty()) {
        return std::make_unique<ExplicitAssignmentPolicy>(explicitAssignments);
    }

    switch (policy.mode) {
    case ExecutionMode::Sequential:
        return std::make_unique<SequentialPolicy>();
    case ExecutionMode::Parallel:
        return std::make_unique<ParallelPolicy>();
    case ExecutionMode::Smart:
        return std::make_unique<SmartPolicy>();
    }
    return std::make_unique<SmartPolicy>();
}

ExecutionPlan SuiteScheduler::schedule(const std::vector<TestCase> &cases, const ExecutionPolicy &policy,
                                       const SuiteAssignments &explicitAssignments) const {
    if (cases.empty()) {
        LOG_INFO("SuiteScheduler: No test cases, empty plan");
        return ExecutionPlan();
    }

    auto grouping = selectPolicy(policy, explicitAssignments);
    ExecutionPlan plan(enforceInvariants(grouping->group(cases, policy)));

    PlanValidator::validate(plan, cases);

    LOG_INFO("SuiteScheduler: {} cases -> {} suites ({} policy)", plan.totalCases(), plan.size(),
             grouping->getName());
    for (const auto &suite : plan.getSuites()) {
        LOG_DEBUG("SuiteScheduler: Suite '{}' cases={} workers={} sharedContext={}", suite.name, suite.cases.size(),
                  suite.workers, suite.sharedContext);
    }

    return plan;
}

std::vector<Suite> SuiteScheduler::enforceInvariants(std::vector<Suite> suites) {
    std::vector<Suite> result;
    result.reserve(suites.size());

    for (auto &suite : suites) {
        if (suite.cases.empty()) {
            LOG_DEBUG("SuiteScheduler: Dropping empty suite '{}'", suite.name);
            continue;
        }

        if (suite.workers < 1) {
            LOG_WARN("SuiteScheduler: Suite '{}' has {} workers, using 1", suite.name, suite.workers);
            suite.workers = 1;
        }

        if (suite.sharedContext && suite.workers > 1) {
            LOG_WARN("SuiteScheduler: Suite '{}' shares one context, reducing workers from {} to 1", suite.name,
                     suite.workers);
            suite.workers = 1;
        }

        result.push_back(std::move(suite));
    }

    return result;
}

}  // namespace RTE
