#include "RTETypes.h"

namespace RTE {

const char *toString(SelectorStrategy strategy) {
    switch (strategy) {
    case SelectorStrategy::TestId:
        return "test_id";
    case SelectorStrategy::Role:
        return "role";
    case SelectorStrategy::Text:
        return "text";
    case SelectorStrategy::Semantic:
        return "semantic";
    case SelectorStrategy::Structural:
        return "structural";
    case SelectorStrategy::Css:
        return "css";
    }
    return "unknown";
}

const char *toString(TestCategory category) {
    switch (category) {
    case TestCategory::Functional:
        return "functional";
    case TestCategory::Api:
        return "api";
    case TestCategory::Visual:
        return "visual";
    }
    return "unknown";
}

const char *toString(ExecutionMode mode) {
    switch (mode) {
    case ExecutionMode::Sequential:
        return "sequential";
    case ExecutionMode::Parallel:
        return "parallel";
    case ExecutionMode::Smart:
        return "smart";
    }
    return "unknown";
}

std::optional<SelectorStrategy> parseSelectorStrategy(const std::string &text) {
    for (auto strategy : {SelectorStrategy::TestId, SelectorStrategy::Role, SelectorStrategy::Text,
                          SelectorStrategy::Semantic, SelectorStrategy::Structural, SelectorStrategy::Css}) {
        if (text == toString(strategy)) {
            return strategy;
        }
    }
    return std::nullopt;
}

std::optional<TestCategory> parseTestCategory(const std::string &text) {
    for (auto category : {TestCategory::Functional, TestCategory::Api, TestCategory::Visual}) {
        if (text == toString(category)) {
            return category;
        }
    }
    return std::nullopt;
}

std::optional<ExecutionMode> parseExecutionMode(const std::string &text) {
    for (auto mode : {ExecutionMode::Sequential, ExecutionMode::Parallel, ExecutionMode::Smart}) {
        if (text == toString(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

}  // namespace RTE
