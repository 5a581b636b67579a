#pragma once

#include "model/ExecutionPlan.h"
#include "scheduling/ExecutionPolicy.h"
#include <vector>

namespace RTE {

/**
 * @brief Grouping rule of one scheduling mode
 *
 * A policy only partitions cases and proposes worker counts. SuiteScheduler
 * drops empty groups, coerces worker counts and validates the result, so
 * policies stay small and can be tested in isolation.
 */
class ISchedulingPolicy {
public:
    virtual ~ISchedulingPolicy() = default;

    virtual std::vector<Suite> group(const std::vector<TestCase> &cases, const ExecutionPolicy &policy) const = 0;

    virtual const char *getName() const = 0;
};

}  // namespace RTE
