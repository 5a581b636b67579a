#pragma once

#include "RTETypes.h"
#include "model/SelectorCandidate.h"
#include <optional>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief One step of a generated test (navigate, click, fill, assert_url, assert_text, api_call, screenshot)
 */
struct TestStep {
    std::string action;
    SelectorChain selectors;
    std::optional<std::string> targetUrl;
    // Expected value for assertions, JSON text when the generator produced a non-string value
    std::optional<std::string> expected;
    std::optional<std::string> method;
    std::optional<std::string> name;
    std::string description;
};

/**
 * @brief Generated test case, consumed read-only by scheduling and execution
 *
 * The name is unique within a run. code holds the compiled test source for
 * this case; it may be empty when only a plan is requested.
 */
struct TestCase {
    std::string name;
    TestCategory category = TestCategory::Functional;
    std::string route;
    std::vector<TestStep> steps;
    std::string code;
};

}  // namespace RTE
