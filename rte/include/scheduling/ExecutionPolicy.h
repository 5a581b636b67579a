#pragma once

#include "RTETypes.h"
#include <map>
#include <optional>
#include <string>

namespace RTE {

/**
 * @brief Per-suite execution settings from configuration
 *
 * mode Sequential forces one worker. Otherwise workers is used (the policy's
 * maxWorkers when unset), clamped to at least 1.
 */
struct SuiteOverride {
    ExecutionMode mode = ExecutionMode::Smart;
    std::optional<int> workers;
    bool sharedContext = false;
};

/**
 * @brief Parsed execution configuration consumed by SuiteScheduler
 */
struct ExecutionPolicy {
    ExecutionMode mode = ExecutionMode::Smart;
    // Concurrency ceiling for parallel suites; values below 1 are treated as 1
    int maxWorkers = defaultMaxWorkers();
    std::map<std::string, SuiteOverride> suites;

    const SuiteOverride *findOverride(const std::string &suiteName) const {
        auto it = suites.find(suiteName);
        return it == suites.end() ? nullptr : &it->second;
    }

    /**
     * @brief Hardware concurrency, or Constants::DEFAULT_MAX_WORKERS when unknown
     */
    static int defaultMaxWorkers();
};

}  // namespace RTE
