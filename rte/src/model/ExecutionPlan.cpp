#include "model/ExecutionPlan.h"

namespace RTE {

size_t ExecutionPlan::totalCases() const {
    size_t total = 0;
    for (const auto &suite : suites_) {
        total += suite.cases.size();
    }
    return total;
}

const Suite *ExecutionPlan::findSuite(const std::string &name) const {
    for (const auto &suite : suites_) {
        if (suite.name == name) {
            return &suite;
        }
    }
    return nullptr;
}

}  // namespace RTE
