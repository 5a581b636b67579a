#include "execution/ProcessRunner.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace RTE {

namespace {

using Clock = std::chrono::steady_clock;

// Once the child has exited, how long grandchildren may keep its pipes open
constexpr auto DRAIN_AFTER_EXIT = std::chrono::milliseconds(200);

// Failure stages reported by the child through the status pipe
enum class ChildStage : int { Chdir = 1, Exec = 2 };

struct ChildError {
    int stage;
    int error;
};

/**
 * @brief Owning file descriptor
 */
class UniqueFd {
public:
    UniqueFd() = default;

    explicit UniqueFd(int fd) : fd_(fd) {}

    ~UniqueFd() {
        reset();
    }

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}

    UniqueFd &operator=(UniqueFd &&other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const {
        return fd_;
    }

    bool valid() const {
        return fd_ >= 0;
    }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool makePipe(UniqueFd &readEnd, UniqueFd &writeEnd) {
    int fds[2];
    // Close-on-exec: children forked concurrently by other invocations must not inherit our pipes
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

/**
 * @brief Append everything currently readable
 * @return false once the descriptor reached EOF or failed (it is closed then)
 */
bool drainAvailable(UniqueFd &fd, std::string &out) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        fd.reset();
        return false;
    }
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return Constants::SIGNAL_EXIT_CODE_BASE + WTERMSIG(status);
    }
    return -1;
}

/**
 * @brief Forked child that leads its own process group
 *
 * The destructor kills and reaps the group if run() leaves early, so no
 * zombie or orphaned runner survives an exception.
 */
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    ~ChildProcess() {
        if (!reaped_) {
            ::killpg(pid_, SIGKILL);
            waitBlocking();
        }
    }

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    pid_t pid() const {
        return pid_;
    }

    bool isReaped() const {
        return reaped_;
    }

    bool tryReap() {
        if (reaped_) {
            return true;
        }
        int status = 0;
        pid_t ret = ::waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            status_ = status;
            reaped_ = true;
        } else if (ret < 0 && errno != EINTR) {
            LOG_ERROR("ProcessRunner: waitpid({}) failed: {}", pid_, std::strerror(errno));
            reaped_ = true;
        }
        return reaped_;
    }

    void waitBlocking() {
        while (!reaped_) {
            int status = 0;
            pid_t ret = ::waitpid(pid_, &status, 0);
            if (ret == pid_) {
                status_ = status;
                reaped_ = true;
            } else if (ret < 0 && errno != EINTR) {
                reaped_ = true;
            }
        }
    }

    /**
     * @brief SIGTERM the whole group, SIGKILL after the grace period, reap the leader
     */
    void terminateGroup() {
        ::killpg(pid_, SIGTERM);

        auto graceDeadline = Clock::now() + Constants::TERMINATE_GRACE_PERIOD;
        while (Clock::now() < graceDeadline && !tryReap()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        // Also reaches members that outlived a leader which honoured SIGTERM
        ::killpg(pid_, SIGKILL);
        waitBlocking();
    }

    /**
     * @brief Kill group members left behind by a leader that already exited
     */
    void killStragglers() {
        if (::killpg(pid_, SIGKILL) == 0) {
            LOG_DEBUG("ProcessRunner: Killed leftover processes of group {}", pid_);
        }
    }

    int exitCode() const {
        return decodeWaitStatus(status_);
    }

private:
    pid_t pid_;
    int status_ = 0;
    bool reaped_ = false;
};

}  // namespace

ProcessOutcome ProcessRunner::run(const ProcessSpec &spec, std::chrono::milliseconds timeout,
                                  const CancellationToken *cancel) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        throw std::invalid_argument("ProcessRunner requires a program to run");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("ProcessRunner requires a positive timeout");
    }

    ProcessOutcome outcome;

    UniqueFd stdoutRead, stdoutWrite, stderrRead, stderrWrite, statusRead, statusWrite;
    if (!makePipe(stdoutRead, stdoutWrite) || !makePipe(stderrRead, stderrWrite) ||
        !makePipe(statusRead, statusWrite)) {
        outcome.launchError = std::string("Failed to create pipes: ") + std::strerror(errno);
        return outcome;
    }

    // The child runs in a background process group: a terminal read would stop it with SIGTTIN
    UniqueFd nullInput(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (nullInput.get() < 0) {
        outcome.launchError = std::string("Failed to open /dev/null: ") + std::strerror(errno);
        return outcome;
    }

    // Everything the child touches is prepared before fork(): only async-signal-safe calls after it
    std::vector<char *> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto &arg : spec.argv) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string workingDirectory = spec.workingDirectory.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.launchError = std::string("Failed to fork: ") + std::strerror(errno);
        return outcome;
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        ChildError childError{0, 0};
        if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) != 0) {
            childError = {static_cast<int>(ChildStage::Chdir), errno};
        } else {
            ::dup2(nullInput.get(), STDIN_FILENO);
            ::dup2(stdoutWrite.get(), STDOUT_FILENO);
            ::dup2(stderrWrite.get(), STDERR_FILENO);
            ::execvp(argv[0], argv.data());
            childError = {static_cast<int>(ChildStage::Exec), errno};
        }

        ssize_t ignored = ::write(statusWrite.get(), &childError, sizeof(childError));
        (void)ignored;
        ::_exit(Constants::EXEC_FAILURE_EXIT_CODE);
    }

    // Also set from the parent so killpg() cannot race the child's own setpgid()
    ::setpgid(pid, pid);
    ChildProcess child(pid);

    nullInput.reset();
    stdoutWrite.reset();
    stderrWrite.reset();
    statusWrite.reset();

    // EOF means exec succeeded (close-on-exec), a record means the child reports a failure
    ChildError childError{0, 0};
    ssize_t statusBytes;
    do {
        statusBytes = ::read(statusRead.get(), &childError, sizeof(childError));
    } while (statusBytes < 0 && errno == EINTR);
    statusRead.reset();

    if (statusBytes == static_cast<ssize_t>(sizeof(childError))) {
        child.waitBlocking();
        const char *stage = childError.stage == static_cast<int>(ChildStage::Chdir) ? "enter working directory"
                                                                                     : "execute";
        outcome.launchError = std::string("Failed to ") + stage + " '" +
                              (childError.stage == static_cast<int>(ChildStage::Chdir) ? workingDirectory
                                                                                       : spec.argv.front()) +
                              "': " + std::strerror(childError.error);
        outcome.exitCode = Constants::EXEC_FAILURE_EXIT_CODE;
        return outcome;
    }

    outcome.launched = true;
    LOG_DEBUG("ProcessRunner: Started pid {}: {}", pid, join(spec.argv, " "));

    ::fcntl(stdoutRead.get(), F_SETFL, O_NONBLOCK);
    ::fcntl(stderrRead.get(), F_SETFL, O_NONBLOCK);

    const auto deadline = Clock::now() + timeout;
    std::optional<Clock::time_point> exitedAt;

    while (true) {
        if (!child.isReaped() && cancel && cancel->isCanceled()) {
            outcome.canceled = true;
            break;
        }

        auto now = Clock::now();
        if (!child.isReaped() && now >= deadline) {
            outcome.timedOut = true;
            break;
        }

        if (child.tryReap()) {
            if (!stdoutRead.valid() && !stderrRead.valid()) {
                break;
            }
            if (!exitedAt) {
                exitedAt = now;
            } else if (now - *exitedAt > DRAIN_AFTER_EXIT) {
                break;
            }
        }

        int waitMs = Constants::PROCESS_POLL_INTERVAL_MS;
        if (!child.isReaped()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            waitMs = static_cast<int>(std::clamp<long long>(remaining, 1, Constants::PROCESS_POLL_INTERVAL_MS));
        }

        pollfd fds[2];
        UniqueFd *owners[2];
        nfds_t count = 0;
        for (UniqueFd *fd : {&stdoutRead, &stderrRead}) {
            if (fd->valid()) {
                fds[count] = pollfd{fd->get(), POLLIN, 0};
                owners[count] = fd;
                count++;
            }
        }

        if (count == 0) {
            // Child closed its output but is still running
            std::this_thread::sleep_for(std::chrono::milliseconds(waitMs));
            continue;
        }

        int ready = ::poll(fds, count, waitMs);
        if (ready < 0) {
            if (errno != EINTR) {
                LOG_WARN("ProcessRunner: poll() failed: {}", std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(waitMs));
            }
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                drainAvailable(*owners[i], owners[i] == &stdoutRead ? outcome.stdoutOutput : outcome.stderrOutput);
            }
        }
    }

    if (outcome.timedOut || outcome.canceled) {
        LOG_DEBUG("ProcessRunner: Terminating process group {} ({})", pid,
                  outcome.timedOut ? "timeout" : "canceled");
        child.terminateGroup();
    } else {
        child.killStragglers();
    }

    // Keep whatever was written before the group went away
    if (stdoutRead.valid()) {
        drainAvailable(stdoutRead, outcome.stdoutOutput);
    }
    if (stderrRead.valid()) {
        drainAvailable(stderrRead, outcome.stderrOutput);
    }

    outcome.exitCode = child.exitCode();
    return outcome;
}

}  // namespace RTE
