#pragma once

#include "model/ExecutionPlan.h"
#include "scheduling/ExecutionPolicy.h"
#include "scheduling/SchedulingPolicies.h"
#include <memory>
#include <vector>

namespace RTE {

/**
 * @brief Partitions a run's test cases into suites
 *
 * Picks the grouping policy (explicit assignments when non-empty, otherwise
 * the policy's global mode), then enforces the plan invariants:
 * - empty suites are dropped
 * - workers below 1 become 1
 * - sharedContext forces workers to 1
 * and validates case conservation before returning.
 *
 * Stateless; schedule() is a pure function of its arguments and never fails
 * on malformed cases.
 */
class SuiteScheduler {
public:
    ExecutionPlan schedule(const std::vector<TestCase> &cases, const ExecutionPolicy &policy,
                           const SuiteAssignments &explicitAssignments = {}) const;

    /**
     * @brief Grouping policy schedule() would use for these settings
     */
    static std::unique_ptr<ISchedulingPolicy> selectPolicy(const ExecutionPolicy &policy,
                                                           const SuiteAssignments &explicitAssignments);

    /**
     * @brief Coerce policy output into a valid plan (drops empty suites, clamps workers)
     */
    static std::vector<Suite> enforceInvariants(std::vector<Suite> suites);
};

}  // namespace RTE
