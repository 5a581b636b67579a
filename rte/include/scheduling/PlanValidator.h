#pragma once

#include "model/ExecutionPlan.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Thrown when a plan breaks a scheduling invariant
 *
 * Only reachable when a caller builds suites by hand; SuiteScheduler coerces
 * its own output before validating it.
 */
class SchedulingInvariantViolation : public std::logic_error {
public:
    explicit SchedulingInvariantViolation(const std::vector<std::string> &violations);

    const std::vector<std::string> &getViolations() const {
        return violations_;
    }

private:
    std::vector<std::string> violations_;
};

/**
 * @brief Checks execution plan invariants
 *
 * Structural invariants: every suite has a non-empty name and at least one
 * case, workers >= 1, sharedContext implies workers == 1, suite names are
 * unique. With the input cases, additionally: the multiset of case names in
 * the plan equals the multiset of input case names.
 */
class PlanValidator {
public:
    /**
     * @return One message per violation, empty when the plan is valid
     */
    static std::vector<std::string> findViolations(const ExecutionPlan &plan);
    static std::vector<std::string> findViolations(const ExecutionPlan &plan, const std::vector<TestCase> &inputCases);

    /**
     * @throws SchedulingInvariantViolation when findViolations() reports anything
     */
    static void validate(const ExecutionPlan &plan);
    static void validate(const ExecutionPlan &plan, const std::vector<TestCase> &inputCases);
};

}  // namespace RTE
