#pragma once

#include "model/TestCase.h"
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Named group of test cases run as one external process invocation
 *
 * A plain aggregate so callers may build suites directly; PlanValidator
 * rejects the combinations that are not allowed (empty cases, workers < 1,
 * sharedContext with workers > 1).
 */
struct Suite {
    std::string name;
    std::vector<TestCase> cases;
    int workers = 1;
    bool sharedContext = false;
};

/**
 * @brief Ordered partition of one run's test cases into suites
 *
 * Built once per run and not modified afterwards.
 */
class ExecutionPlan {
public:
    ExecutionPlan() = default;

    explicit ExecutionPlan(std::vector<Suite> suites) : suites_(std::move(suites)) {}

    const std::vector<Suite> &getSuites() const {
        return suites_;
    }

    size_t size() const {
        return suites_.size();
    }

    bool empty() const {
        return suites_.empty();
    }

    /**
     * @brief Sum of case counts over all suites
     */
    size_t totalCases() const;

    /**
     * @brief Look up a suite by name
     * @return Pointer into the plan, or nullptr when absent
     */
    const Suite *findSuite(const std::string &name) const;

private:
    std::vector<Suite> suites_;
};

}  // namespace RTE
