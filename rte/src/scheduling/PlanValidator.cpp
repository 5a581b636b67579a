#include "scheduling/PlanValidator.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <map>
#include <set>

namespace RTE {

SchedulingInvariantViolation::SchedulingInvariantViolation(const std::vector<std::string> &violations)
    : std::logic_error("Execution plan violates scheduling invariants: " + join(violations, "; ")),
      violations_(violations) {}

std::vector<std::string> PlanValidator::findViolations(const ExecutionPlan &plan) {
    std::vector<std::string> violations;
    std::set<std::string> names;

    for (const auto &suite : plan.getSuites()) {
        if (suite.name.empty()) {
            violations.push_back("suite with empty name");
        } else if (!names.insert(suite.name).second) {
            violations.push_back("duplicate suite name '" + suite.name + "'");
        }

        if (suite.cases.empty()) {
            violations.push_back("suite '" + suite.name + "' has no cases");
        }

        if (suite.workers < 1) {
            violations.push_back("suite '" + suite.name + "' has " + std::to_string(suite.workers) + " workers");
        }

        if (suite.sharedContext && suite.workers > 1) {
            violations.push_back("suite '" + suite.name + "' shares one context but has " +
                                 std::to_string(suite.workers) + " workers");
        }
    }

    return violations;
}

std::vector<std::string> PlanValidator::findViolations(const ExecutionPlan &plan,
                                                       const std::vector<TestCase> &inputCases) {
    auto violations = findViolations(plan);

    // Positive: missing from the plan, negative: extra or duplicated in the plan
    std::map<std::string, int> balance;
    for (const auto &testCase : inputCases) {
        balance[testCase.name]++;
    }
    for (const auto &suite : plan.getSuites()) {
        for (const auto &testCase : suite.cases) {
            balance[testCase.name]--;
        }
    }

    for (const auto &[name, count] : balance) {
        if (count > 0) {
            violations.push_back("case '" + name + "' missing from plan");
        } else if (count < 0) {
            violations.push_back("case '" + name + "' scheduled " + std::to_string(-count) + " extra time(s)");
        }
    }

    return violations;
}

void PlanValidator::validate(const ExecutionPlan &plan) {
    auto violations = findViolations(plan);
    if (!violations.empty()) {
        LOG_ERROR("PlanValidator: {} invariant violation(s): {}", violations.size(), join(violations, "; "));
        throw SchedulingInvariantViolation(violations);
    }
}

void PlanValidator::validate(const ExecutionPlan &plan, const std::vector<TestCase> &inputCases) {
    auto violations = findViolations(plan, inputCases);
    if (!violations.empty()) {
        LOG_ERROR("PlanValidator: {} invariant violation(s): {}", violations.size(), join(violations, "; "));
        throw SchedulingInvariantViolation(violations);
    }
}

}  // namespace RTE
