#pragma once

#include "scheduling/ISchedulingPolicy.h"
#include <map>
#include <string>

namespace RTE {

/**
 * @brief Case name -> suite name, as produced by the generator or the user
 */
using SuiteAssignments = std::map<std::string, std::string>;

/**
 * @brief Everything in suite "all", one worker, input order
 */
class SequentialPolicy : public ISchedulingPolicy {
public:
    std::vector<Suite> group(const std::vector<TestCase> &cases, const ExecutionPolicy &policy) const override;

    const char *getName() const override {
        return "sequential";
    }
};

/**
 * @brief Everything in suite "all" with min(caseCount, maxWorkers) workers
 */
class ParallelPolicy : public ISchedulingPolicy {
public:
    std::vector<Suite> group(const std::vector<TestCase> &cases, const ExecutionPolicy &policy) const override;

    const char *getName() const override {
        return "parallel";
    }
};

/**
 * @brief Category and route based grouping
 *
 * Api cases are stateless and share suite "api-tests" with
 * min(apiCount, maxWorkers) workers. Every other case is grouped by route
 * into "ui-<slug>" with one worker, since same-route UI tests may share page
 * and navigation state. Route suites keep first-seen order. A configured
 * override with the same suite name replaces the proposed settings.
 */
class SmartPolicy : public ISchedulingPolicy {
public:
    std::vector<Suite> group(const std::vector<TestCase> &cases, const ExecutionPolicy &policy) const override;

    const char *getName() const override {
        return "smart";
    }

    /**
     * @brief Suite name for a route: "ui-" + slug, "ui-root" for "/" and ""
     */
    static std::string suiteNameForRoute(const std::string &route);
};

/**
 * @brief Routes each case to its explicitly assigned suite
 *
 * Suites appear in first-seen order and take workers and sharedContext from
 * the matching override (one worker without one). Cases without an
 * assignment, or assigned to an empty name, go to "unassigned" with one
 * worker, emitted last.
 */
class ExplicitAssignmentPolicy : public ISchedulingPolicy {
public:
    explicit ExplicitAssignmentPolicy(SuiteAssignments assignments) : assignments_(std::move(assignments)) {}

    std::vector<Suite> group(const std::vector<TestCase> &cases, const ExecutionPolicy &policy) const override;

    const char *getName() const override {
        return "explicit";
    }

private:
    SuiteAssignments assignments_;
};

/**
 * @brief Apply a configured override to a proposed suite
 *
 * Sequential mode gives one worker; otherwise the configured worker count
 * (maxWorkers when unset). Values below 1 are coerced to 1.
 */
void applySuiteOverride(Suite &suite, const SuiteOverride &suiteOverride, int maxWorkers);

}  // namespace RTE
