#pragma once

#include "common/Constants.h"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief How to invoke the external test runner for one suite
 *
 * Produces: <command...> <artifact> [<verboseFlag>] [<extraArgs...>] [<parallelFlag> <workers>]
 * The parallel pair is only added when workers > 1. Empty flags are omitted.
 *
 * The default capture support file is a pytest conftest that records each
 * test's name, screenshot path, network calls and console lines.
 */
struct RunnerConfig {
    std::vector<std::string> command = {"python3", "-m", "pytest"};
    std::string verboseFlag = "-v";
    std::vector<std::string> extraArgs = {"--tb=short"};
    std::string parallelFlag = "-n";
    // Extension of the materialized suite file, without the dot
    std::string artifactExtension = "py";
    // Root of the per-invocation working directories
    std::filesystem::path outputDir = "rte-output";
    std::chrono::milliseconds timeout = Constants::DEFAULT_SUITE_TIMEOUT;
    // Suites executed at the same time by PlanRunner
    int maxConcurrentSuites = 1;

    // Subdirectory of the working directory where the runner drops one <test>.json per test.
    // Empty disables step capture.
    std::string captureDirName = "captures";
    // Written into the working directory before launch with "{captures_dir}" replaced by the
    // capture directory's absolute path. An empty file name writes nothing.
    std::string captureSupportFile = "conftest.py";
    std::string captureSupportTemplate = Constants::DEFAULT_CAPTURE_SUPPORT_TEMPLATE;
};

}  // namespace RTE
