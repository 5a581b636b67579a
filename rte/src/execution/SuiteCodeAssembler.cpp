#include "execution/SuiteCodeAssembler.h"
#include "common/Logger.h"

namespace RTE {

namespace {

void appendBlock(std::string &out, const std::string &block) {
    if (!out.empty()) {
        out += "\n\n";
    }
    out += block;
    // Trailing newlines of each block collapse into the separator
    while (!out.empty() && out.back() == '\n') {
        out.pop_back();
    }
}

}  // namespace

std::string SuiteCodeAssembler::assemble(const std::vector<TestCase> &cases) const {
    std::string code;
    size_t included = 0;

    for (const auto &testCase : cases) {
        if (testCase.code.empty()) {
            LOG_DEBUG("SuiteCodeAssembler: Case '{}' has no compiled code, skipping", testCase.name);
            continue;
        }
        appendBlock(code, testCase.code);
        included++;
    }

    if (included == 0) {
        return "";
    }

    if (!header_.empty()) {
        std::string withHeader;
        appendBlock(withHeader, header_);
        appendBlock(withHeader, code);
        code = std::move(withHeader);
    }

    return code + "\n";
}

}  // namespace RTE
