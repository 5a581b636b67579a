#include "common/Constants.h"
#include "common/TestUtils.h"
#include "execution/SuiteExecutor.h"
#include <fstream>
#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace RTE {
namespace Test {

class SuiteExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.command = {"/bin/sh"};
        config_.verboseFlag = "";
        config_.extraArgs = {};
        config_.parallelFlag = "-n";
        config_.artifactExtension = "sh";
        config_.outputDir = tempDir_.path();
        config_.timeout = Utils::LONG_TIMEOUT_MS;
    }

    static std::string readFile(const std::filesystem::path &path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    Utils::TempDirectory tempDir_{"rte-executor"};
    RunnerConfig config_;
};

TEST_F(SuiteExecutorTest, BuildCommandWithDefaults) {
    SuiteExecutor executor{RunnerConfig{}};

    auto single = executor.buildCommand("/work/ui-root.py", 1);
    EXPECT_EQ(single, (std::vector<std::string>{"python3", "-m", "pytest", "/work/ui-root.py", "-v", "--tb=short"}));

    auto parallel = executor.buildCommand("/work/api-tests.py", 3);
    EXPECT_EQ(parallel, (std::vector<std::string>{"python3", "-m", "pytest", "/work/api-tests.py", "-v", "--tb=short",
                                                  "-n", "3"}));
}

TEST_F(SuiteExecutorTest, BuildCommandOmitsEmptyFlags) {
    config_.parallelFlag = "";
    SuiteExecutor executor(config_);

    EXPECT_EQ(executor.buildCommand("suite.sh", 4), (std::vector<std::string>{"/bin/sh", "suite.sh"}));
}

TEST_F(SuiteExecutorTest, EmptyCommandIsRejected) {
    config_.command.clear();
    EXPECT_THROW(SuiteExecutor{config_}, std::invalid_argument);

    config_.command = {""};
    EXPECT_THROW(SuiteExecutor{config_}, std::invalid_argument);
}

TEST_F(SuiteExecutorTest, PassingSuiteWritesArtifactInItsOwnDirectory) {
    SuiteExecutor executor(config_);
    const std::string code = "echo \"args:$*\"\npwd -P\n";

    auto result = executor.run("ui-products", code, 2);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.state, ExecutionState::CompletedSuccess);
    EXPECT_FALSE(result.timedOut);
    EXPECT_FALSE(result.canceled);
    EXPECT_GE(result.durationSeconds, 0.0);

    std::filesystem::path artifact = result.artifactPath;
    ASSERT_TRUE(std::filesystem::exists(artifact));
    EXPECT_EQ(artifact.filename().string(), "ui-products.sh");
    EXPECT_EQ(readFile(artifact), code);
    EXPECT_EQ(std::filesystem::canonical(artifact.parent_path().parent_path()).string(),
              std::filesystem::canonical(tempDir_.path()).string());

    EXPECT_NE(result.stdoutOutput.find("args:-n 2"), std::string::npos) << result.stdoutOutput;
    EXPECT_NE(result.stdoutOutput.find(std::filesystem::canonical(artifact.parent_path()).string()),
              std::string::npos);
}

TEST_F(SuiteExecutorTest, SingleWorkerGetsNoParallelFlag) {
    SuiteExecutor executor(config_);

    auto result = executor.run("all", "echo \"args:$*\"", 1);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdoutOutput, "args:\n");
}

TEST_F(SuiteExecutorTest, FailingSuiteReportsExitCodeAndOutput) {
    SuiteExecutor executor(config_);

    auto result = executor.run("ui-cart", "echo 'assertion failed' >&2\nexit 4\n", 1);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, 4);
    EXPECT_EQ(result.state, ExecutionState::CompletedFailure);
    EXPECT_NE(result.stderrOutput.find("assertion failed"), std::string::npos);
}

TEST_F(SuiteExecutorTest, TimeoutIsDistinguishedFromFailure) {
    SuiteExecutor executor(config_);

    auto result = executor.run("slow", "echo partial\nsleep 30\n", 1, Utils::SHORT_TIMEOUT_MS);

    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.canceled);
    EXPECT_EQ(result.exitCode, Constants::TIMEOUT_EXIT_CODE);
    EXPECT_EQ(result.state, ExecutionState::TimedOut);
    EXPECT_EQ(result.stdoutOutput, "partial\n");
    EXPECT_NE(result.stderrOutput.find("Suite timed out after 0.3s"), std::string::npos) << result.stderrOutput;
    EXPECT_LT(result.durationSeconds, 5.0);
}

TEST_F(SuiteExecutorTest, ConfiguredTimeoutApplies) {
    config_.timeout = Utils::SHORT_TIMEOUT_MS;
    SuiteExecutor executor(config_);

    auto result = executor.run("slow", "sleep 30", 1);

    EXPECT_TRUE(result.timedOut);
}

TEST_F(SuiteExecutorTest, NonPositiveTimeoutFallsBackToDefault) {
    config_.timeout = std::chrono::milliseconds(0);
    SuiteExecutor executor(config_);

    EXPECT_EQ(executor.getConfig().timeout, std::chrono::milliseconds(Constants::DEFAULT_SUITE_TIMEOUT));
    EXPECT_TRUE(executor.run("quick", "exit 0", 1, std::chrono::milliseconds(-5)).success);
}

TEST_F(SuiteExecutorTest, CanceledBeforeStartLaunchesNothing) {
    SuiteExecutor executor(config_);
    CancellationToken cancel;
    cancel.cancel();

    auto result = executor.run("never", "echo should-not-run", 1, &cancel);

    EXPECT_TRUE(result.canceled);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, Constants::CANCELED_EXIT_CODE);
    EXPECT_EQ(result.state, ExecutionState::Canceled);
    EXPECT_TRUE(result.artifactPath.empty());
    EXPECT_TRUE(std::filesystem::is_empty(tempDir_.path()));
}

TEST_F(SuiteExecutorTest, CancellationDuringRun) {
    SuiteExecutor executor(config_);
    CancellationToken cancel;
    std::thread canceler([&cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(Utils::getBaseDelay(100)));
        cancel.cancel();
    });

    auto result = executor.run("long", "echo begun\nsleep 30\n", 1, &cancel);
    canceler.join();

    EXPECT_TRUE(result.canceled);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.exitCode, Constants::CANCELED_EXIT_CODE);
    EXPECT_EQ(result.stdoutOutput, "begun\n");
    EXPECT_NE(result.stderrOutput.find("Suite canceled"), std::string::npos);
}

TEST_F(SuiteExecutorTest, MissingRunnerIsAFailureNotAnException) {
    config_.command = {"/nonexistent/runner"};
    SuiteExecutor executor(config_);

    auto result = executor.run("all", "echo hi", 1);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, Constants::EXEC_FAILURE_EXIT_CODE);
    EXPECT_EQ(result.state, ExecutionState::CompletedFailure);
    EXPECT_NE(result.stderrOutput.find("Failed to execute"), std::string::npos);
}

TEST_F(SuiteExecutorTest, UnwritableOutputDirIsALaunchFailure) {
    auto blocker = tempDir_.path() / "file";
    std::ofstream(blocker) << "not a directory";
    config_.outputDir = blocker;
    SuiteExecutor executor(config_);

    auto result = executor.run("all", "echo hi", 1);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exitCode, Constants::LAUNCH_FAILURE_EXIT_CODE);
    EXPECT_NE(result.stderrOutput.find("Failed to create directory"), std::string::npos);
}

TEST_F(SuiteExecutorTest, ConcurrentInvocationsOfOneSuiteAreIsolated) {
    SuiteExecutor executor(config_);
    constexpr int RUNS = 4;
    std::vector<ExecutionResult> results(RUNS);

    std::vector<std::thread> threads;
    for (int i = 0; i < RUNS; ++i) {
        threads.emplace_back([&executor, &results, i]() {
            results[i] = executor.run("ui-root", "sleep 0.1\necho run-" + std::to_string(i) + "\n", 1);
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    std::set<std::string> artifacts;
    for (int i = 0; i < RUNS; ++i) {
        EXPECT_TRUE(results[i].success);
        EXPECT_EQ(results[i].stdoutOutput, "run-" + std::to_string(i) + "\n");
        artifacts.insert(results[i].artifactPath);
    }
    EXPECT_EQ(artifacts.size(), static_cast<size_t>(RUNS));
}

TEST_F(SuiteExecutorTest, StepCapturesAreLoadedAfterTheRun) {
    config_.captureSupportFile = "capture_env.sh";
    config_.captureSupportTemplate = "CAPTURE_DIR='{captures_dir}'\n";
    SuiteExecutor executor(config_);

    const std::string code = R"(. ./capture_env.sh
printf '%s' '{"name": "login", "screenshot_path": "login.png", "console": ["ready"]}' > "$CAPTURE_DIR/b_login.json"
echo 'not json' > "$CAPTURE_DIR/a_broken.json"
)";
    auto result = executor.run("ui-root", code, 1);

    ASSERT_TRUE(result.success) << result.stderrOutput;
    ASSERT_FALSE(result.captureDir.empty());
    EXPECT_TRUE(std::filesystem::is_directory(result.captureDir));
    EXPECT_EQ(std::filesystem::path(result.captureDir).parent_path().string(),
              std::filesystem::absolute(std::filesystem::path(result.artifactPath)).parent_path().string());

    ASSERT_EQ(result.stepCaptures.size(), 1u);
    EXPECT_EQ(result.stepCaptures[0].name, "login");
    ASSERT_TRUE(result.stepCaptures[0].screenshotPath.has_value());
    EXPECT_EQ(*result.stepCaptures[0].screenshotPath, "login.png");
    EXPECT_EQ(result.stepCaptures[0].consoleLogs, (std::vector<std::string>{"ready"}));
}

TEST_F(SuiteExecutorTest, DefaultSupportFileNamesTheCaptureDirectory) {
    SuiteExecutor executor(config_);

    auto result = executor.run("ui-root", "true\n", 1);

    ASSERT_TRUE(result.success) << result.stderrOutput;
    auto conftest = std::filesystem::path(result.artifactPath).parent_path() / "conftest.py";
    std::string content = readFile(conftest);
    EXPECT_NE(content.find("CAPTURES_DIR = Path(\"" + result.captureDir + "\")"), std::string::npos) << content;
    EXPECT_EQ(content.find(Constants::CAPTURE_DIR_PLACEHOLDER), std::string::npos);
    EXPECT_TRUE(result.stepCaptures.empty());
}

TEST_F(SuiteExecutorTest, EmptyCaptureDirNameDisablesCapture) {
    config_.captureDirName = "";
    SuiteExecutor executor(config_);

    auto result = executor.run("ui-root", "true\n", 1);

    ASSERT_TRUE(result.success) << result.stderrOutput;
    EXPECT_TRUE(result.captureDir.empty());
    auto workDir = std::filesystem::path(result.artifactPath).parent_path();
    EXPECT_FALSE(std::filesystem::exists(workDir / "captures"));
    EXPECT_FALSE(std::filesystem::exists(workDir / "conftest.py"));
}

TEST_F(SuiteExecutorTest, CapturesWrittenBeforeATimeoutAreKept) {
    config_.captureSupportFile = "capture_env.sh";
    config_.captureSupportTemplate = "CAPTURE_DIR='{captures_dir}'\n";
    SuiteExecutor executor(config_);

    const std::string code = R"(. ./capture_env.sh
printf '%s' '{"name": "first"}' > "$CAPTURE_DIR/first.json"
sleep 10
)";
    auto result = executor.run("ui-root", code, 1, Utils::SHORT_TIMEOUT_MS);

    EXPECT_TRUE(result.timedOut);
    ASSERT_EQ(result.stepCaptures.size(), 1u);
    EXPECT_EQ(result.stepCaptures[0].name, "first");
}

}  // namespace Test
}  // namespace RTE
