#pragma once

#include "model/TestCase.h"
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief Joins per-case compiled code into one suite artifact
 *
 * Layout: header (when non-empty), then each case's code in order, separated
 * by a blank line. Cases without code are skipped. The result is empty when
 * no case carries code.
 */
class SuiteCodeAssembler {
public:
    explicit SuiteCodeAssembler(std::string header = "") : header_(std::move(header)) {}

    std::string assemble(const std::vector<TestCase> &cases) const;

private:
    std::string header_;
};

}  // namespace RTE
