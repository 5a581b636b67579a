#pragma once

#include "execution/CancellationToken.h"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace RTE {

/**
 * @brief What to start: argv[0] is looked up in PATH
 */
struct ProcessSpec {
    std::vector<std::string> argv;
    std::filesystem::path workingDirectory;
};

/**
 * @brief Raw result of one child process run
 *
 * exitCode is the exit status, or 128+N when the process died from signal N.
 * It is only meaningful when launched is true and neither timedOut nor
 * canceled is set.
 */
struct ProcessOutcome {
    bool launched = false;
    bool timedOut = false;
    bool canceled = false;
    int exitCode = -1;
    std::string stdoutOutput;
    std::string stderrOutput;
    // Why the process could not be started (pipe/fork/chdir/exec failure)
    std::string launchError;
};

/**
 * @brief Runs one child process with captured output and a wall-clock limit (POSIX)
 *
 * The child becomes leader of a new process group, so everything it spawns
 * can be terminated together. stdout and stderr are drained with poll()
 * while the child runs, so a chatty child never blocks on a full pipe.
 *
 * On timeout or cancellation the group receives SIGTERM, then SIGKILL after
 * Constants::TERMINATE_GRACE_PERIOD, and the child is reaped before run()
 * returns. After a normal exit, group members still alive are killed as
 * well. All descriptors are closed on every path.
 *
 * Reentrant: concurrent calls share no state.
 */
class ProcessRunner {
public:
    /**
     * @param timeout Must be positive
     * @param cancel Optional run-wide abort flag, checked every poll interval
     * @throws std::invalid_argument for an empty argv or a non-positive timeout
     */
    static ProcessOutcome run(const ProcessSpec &spec, std::chrono::milliseconds timeout,
                              const CancellationToken *cancel = nullptr);
};

}  // namespace RTE
