#pragma once

#include "common/JsonUtils.h"
#include "execution/ExecutionResult.h"
#include "model/ExecutionPlan.h"
#include "reporting/ResultCollector.h"

namespace RTE {

/**
 * @brief JSON output of plans, results and reports
 *
 * Keys use snake_case, matching the configuration and case file formats.
 */
class JsonSerializer {
public:
    static json toJson(const SelectorCandidate &candidate);
    static json toJson(const Suite &suite);
    static json toJson(const ExecutionPlan &plan);
    static json toJson(const StepCapture &capture);
    static json toJson(const ExecutionResult &result);
    static json toJson(const RunReport &report);
};

}  // namespace RTE
