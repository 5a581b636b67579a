#pragma once

#include <chrono>

namespace RTE {
namespace Constants {

// Suite names produced by the scheduling policies
constexpr const char *SUITE_ALL = "all";
constexpr const char *SUITE_API_TESTS = "api-tests";
constexpr const char *SUITE_UNASSIGNED = "unassigned";
constexpr const char *UI_SUITE_PREFIX = "ui-";
constexpr const char *ROOT_ROUTE_PLACEHOLDER = "root";

// Fallback when std::thread::hardware_concurrency() reports 0
constexpr int DEFAULT_MAX_WORKERS = 4;

// Exit code sentinels; real process exit codes are 0-255
constexpr int TIMEOUT_EXIT_CODE = -1;
constexpr int CANCELED_EXIT_CODE = -2;
constexpr int LAUNCH_FAILURE_EXIT_CODE = -3;
// Reported by the child when exec of the runner binary fails (shell convention)
constexpr int EXEC_FAILURE_EXIT_CODE = 127;
// Death by signal N is reported as 128 + N
constexpr int SIGNAL_EXIT_CODE_BASE = 128;

constexpr auto DEFAULT_SUITE_TIMEOUT = std::chrono::seconds(300);
// Time between SIGTERM and SIGKILL when tearing down a process group
constexpr auto TERMINATE_GRACE_PERIOD = std::chrono::milliseconds(500);
// poll() granularity while waiting for the runner process
constexpr int PROCESS_POLL_INTERVAL_MS = 20;

// Placeholder in the capture support template
constexpr const char *CAPTURE_DIR_PLACEHOLDER = "{captures_dir}";

// Default capture support file for the pytest runner: one JSON file per test.
// Tests fill request.node.rte_capture (screenshot_path, network_calls, console).
constexpr const char *DEFAULT_CAPTURE_SUPPORT_TEMPLATE = R"PY(import json
from pathlib import Path

import pytest

CAPTURES_DIR = Path("{captures_dir}")


@pytest.fixture(autouse=True)
def _rte_capture_step(request):
    step = {"name": request.node.name, "screenshot_path": None, "network_calls": [], "console": []}
    request.node.rte_capture = step
    yield
    (CAPTURES_DIR / f"{request.node.name}.json").write_text(json.dumps(step, default=str))
)PY";

// Attempts at finding an unused invocation directory name
constexpr int MAX_WORKDIR_ATTEMPTS = 8;

}  // namespace Constants
}  // namespace RTE
