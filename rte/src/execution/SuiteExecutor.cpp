#include "execution/SuiteExecutor.h"
#include "common/Constants.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "common/StringUtils.h"
#include "common/UniqueIdGenerator.h"
#include "common/WorkspaceHelper.h"
#include "execution/ProcessRunner.h"
#include "execution/StepCaptureLoader.h"

#include <stdexcept>
#include <system_error>

namespace RTE {

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void appendLine(std::string &text, const std::string &line) {
    if (!text.empty() && text.back() != '\n') {
        text += '\n';
    }
    text += line;
}

}  // namespace

SuiteExecutor::SuiteExecutor(RunnerConfig config) : config_(std::move(config)) {
    if (config_.command.empty() || config_.command.front().empty()) {
        throw std::invalid_argument("SuiteExecutor requires a runner command");
    }
    if (config_.timeout.count() <= 0) {
        config_.timeout = Constants::DEFAULT_SUITE_TIMEOUT;
    }
}

std::vector<std::string> SuiteExecutor::buildCommand(const std::filesystem::path &artifactPath, int workers) const {
    std::vector<std::string> command(config_.command);
    command.push_back(artifactPath.string());

    if (!config_.verboseFlag.empty()) {
        command.push_back(config_.verboseFlag);
    }
    command.insert(command.end(), config_.extraArgs.begin(), config_.extraArgs.end());

    if (workers > 1 && !config_.parallelFlag.empty()) {
        command.push_back(config_.parallelFlag);
        command.push_back(std::to_string(workers));
    }

    return command;
}

ExecutionResult SuiteExecutor::run(const std::string &suiteName, const std::string &compiledCode, int workers,
                                   const CancellationToken *cancel) const {
    return run(suiteName, compiledCode, workers, config_.timeout, cancel);
}

ExecutionResult SuiteExecutor::run(const std::string &suiteName, const std::string &compiledCode, int workers,
                                   std::chrono::milliseconds timeout, const CancellationToken *cancel) const {
    const auto start = Clock::now();

    ExecutionResult result;
    result.suiteName = suiteName;
    result.state = ExecutionState::Pending;

    if (workers < 1) {
        LOG_WARN("SuiteExecutor: Suite '{}' requested {} workers, using 1", suiteName, workers);
        workers = 1;
    }
    if (timeout.count() <= 0) {
        timeout = config_.timeout;
    }

    auto failLaunch = [&](int exitCode, const std::string &message) {
        LOG_ERROR("SuiteExecutor: Suite '{}' could not be started: {}", suiteName, Log::sanitize(message));
        appendLine(result.stderrOutput, message);
        result.exitCode = exitCode;
        result.success = false;
        result.state = ExecutionState::CompletedFailure;
        result.durationSeconds = secondsSince(start);
        return result;
    };

    if (cancel && cancel->isCanceled()) {
        LOG_INFO("SuiteExecutor: Run canceled, not starting suite '{}'", suiteName);
        appendLine(result.stderrOutput, "Suite canceled");
        result.canceled = true;
        result.exitCode = Constants::CANCELED_EXIT_CODE;
        result.state = ExecutionState::Canceled;
        return result;
    }

    // Exclusive to this invocation: concurrent runs of the same suite never share files
    std::string dirError;
    auto createdDir = WorkspaceHelper::createExclusiveDirectory(
        config_.outputDir, [&suiteName] { return UniqueIdGenerator::generateInvocationId(suiteName); },
        Constants::MAX_WORKDIR_ATTEMPTS, dirError);
    if (!createdDir) {
        return failLaunch(Constants::LAUNCH_FAILURE_EXIT_CODE, dirError);
    }
    const std::filesystem::path workDir = *createdDir;

    std::filesystem::path artifact = workDir / (slugify(suiteName, "suite") + "." + config_.artifactExtension);
    if (!WorkspaceHelper::writeTextFile(artifact, compiledCode)) {
        return failLaunch(Constants::LAUNCH_FAILURE_EXIT_CODE, "Failed to write suite artifact " + artifact.string());
    }
    result.artifactPath = artifact.string();

    std::string captureError;
    if (!prepareCapture(workDir, result, captureError)) {
        return failLaunch(Constants::LAUNCH_FAILURE_EXIT_CODE, captureError);
    }

    std::error_code ec;
    ProcessSpec spec{buildCommand(std::filesystem::absolute(artifact, ec), workers), workDir};
    if (ec) {
        spec.argv = buildCommand(artifact, workers);
    }

    LOG_INFO("SuiteExecutor: Running suite '{}' with {} worker(s), timeout {}ms", suiteName, workers, timeout.count());
    LOG_DEBUG("SuiteExecutor: Command: {}", Log::sanitize(join(spec.argv, " ")));

    ProcessOutcome outcome = ProcessRunner::run(spec, timeout, cancel);
    if (!outcome.launched) {
        result.stdoutOutput = std::move(outcome.stdoutOutput);
        result.stderrOutput = std::move(outcome.stderrOutput);
        return failLaunch(outcome.exitCode >= 0 ? outcome.exitCode : Constants::LAUNCH_FAILURE_EXIT_CODE,
                          outcome.launchError);
    }

    result.state = ExecutionState::Running;
    result.stdoutOutput = std::move(outcome.stdoutOutput);
    result.stderrOutput = std::move(outcome.stderrOutput);

    // Tests finished before a timeout or cancellation still left their captures
    if (!result.captureDir.empty()) {
        result.stepCaptures = StepCaptureLoader::load(result.captureDir);
        LOG_DEBUG("SuiteExecutor: Suite '{}' recorded {} step captures", suiteName, result.stepCaptures.size());
    }
    result.durationSeconds = secondsSince(start);

    if (outcome.timedOut) {
        auto seconds = std::chrono::duration<double>(timeout).count();
        appendLine(result.stderrOutput, fmt::format("Suite timed out after {}s", seconds));
        result.timedOut = true;
        result.success = false;
        result.exitCode = Constants::TIMEOUT_EXIT_CODE;
        result.state = ExecutionState::TimedOut;
        LOG_WARN("SuiteExecutor: Suite '{}' timed out after {}s", suiteName, seconds);
    } else if (outcome.canceled) {
        appendLine(result.stderrOutput, "Suite canceled");
        result.canceled = true;
        result.success = false;
        result.exitCode = Constants::CANCELED_EXIT_CODE;
        result.state = ExecutionState::Canceled;
        LOG_WARN("SuiteExecutor: Suite '{}' canceled after {:.2f}s", suiteName, result.durationSeconds);
    } else {
        result.exitCode = outcome.exitCode;
        result.success = outcome.exitCode == 0;
        result.state = result.success ? ExecutionState::CompletedSuccess : ExecutionState::CompletedFailure;
        if (result.success) {
            LOG_INFO("SuiteExecutor: Suite '{}' passed in {:.2f}s", suiteName, result.durationSeconds);
        } else {
            LOG_WARN("SuiteExecutor: Suite '{}' failed with exit code {} in {:.2f}s: {}", suiteName, result.exitCode,
                     result.durationSeconds, Log::tail(result.stderrOutput, 256));
        }
    }

    return result;
}

bool SuiteExecutor::prepareCapture(const std::filesystem::path &workDir, ExecutionResult &result,
                                   std::string &error) const {
    if (config_.captureDirName.empty()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::path captureDir = workDir / config_.captureDirName;
    std::filesystem::create_directory(captureDir, ec);
    if (ec) {
        error = "Failed to create capture directory " + captureDir.string() + ": " + ec.message();
        return false;
    }
    // The runner resolves the path from its own working directory
    auto absoluteDir = std::filesystem::absolute(captureDir, ec);
    result.captureDir = ec ? captureDir.string() : absoluteDir.string();

    if (config_.captureSupportFile.empty()) {
        return true;
    }

    std::string content = config_.captureSupportTemplate;
    const std::string placeholder = Constants::CAPTURE_DIR_PLACEHOLDER;
    for (size_t pos = content.find(placeholder); pos != std::string::npos;
         pos = content.find(placeholder, pos + result.captureDir.size())) {
        content.replace(pos, placeholder.size(), result.captureDir);
    }

    std::filesystem::path supportFile = workDir / config_.captureSupportFile;
    if (!WorkspaceHelper::writeTextFile(supportFile, content)) {
        error = "Failed to write capture support file " + supportFile.string();
        return false;
    }
    return true;
}

}  // namespace RTE
