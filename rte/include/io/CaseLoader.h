#pragma once

#include "common/JsonUtils.h"
#include "model/TestCase.h"
#include "scheduling/SchedulingPolicies.h"
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Contents of a case file
 */
struct CaseFile {
    std::vector<TestCase> cases;
    // Case name -> suite name; empty unless the file carries "assignments"
    SuiteAssignments assignments;
};

/**
 * @brief Reads generated test cases from JSON
 *
 * Accepts either a bare array of cases or an object
 * {"cases": [...], "assignments": {"case": "suite"}}. Shape errors raise
 * ConfigError with the index of the offending case.
 */
class CaseLoader {
public:
    static CaseFile loadFromFile(const std::string &path);
    static CaseFile loadFromString(const std::string &text);
    static CaseFile fromJson(const json &root);

    static TestCase parseCase(const json &value);
    static TestStep parseStep(const json &value);
    static SelectorCandidate parseCandidate(const json &value);
};

}  // namespace RTE
