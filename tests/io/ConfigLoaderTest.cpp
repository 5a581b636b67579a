#include "common/Constants.h"
#include "common/TestUtils.h"
#include "config/ConfigLoader.h"
#include <fstream>
#include <gtest/gtest.h>

namespace RTE {
namespace Test {

TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
    RunConfig config = ConfigLoader::loadFromString("{}");

    EXPECT_EQ(config.execution.mode, ExecutionMode::Smart);
    EXPECT_EQ(config.execution.maxWorkers, ExecutionPolicy::defaultMaxWorkers());
    EXPECT_TRUE(config.execution.suites.empty());
    EXPECT_EQ(config.runner.command, (std::vector<std::string>{"python3", "-m", "pytest"}));
    EXPECT_EQ(config.runner.verboseFlag, "-v");
    EXPECT_EQ(config.runner.parallelFlag, "-n");
    EXPECT_EQ(config.runner.timeout, std::chrono::milliseconds(300000));
    EXPECT_EQ(config.runner.maxConcurrentSuites, 1);
    EXPECT_EQ(config.logging.level, LogLevel::Info);
    EXPECT_FALSE(config.logging.logToFile);
}

TEST(ConfigLoaderTest, FullConfiguration) {
    RunConfig config = ConfigLoader::loadFromString(R"({
        "execution": {
            "mode": "parallel",
            "max_workers": 8,
            "suites": {
                "auth-flow": {"mode": "sequential", "shared_context": true},
                "product-pages": {"mode": "parallel", "workers": 4}
            }
        },
        "runner": {
            "command": ["npx", "playwright", "test"],
            "verbose_flag": "--reporter=list",
            "extra_args": [],
            "parallel_flag": "--workers",
            "artifact_extension": "spec.ts",
            "output_dir": "/tmp/rte-out",
            "timeout_seconds": 1.5,
            "max_concurrent_suites": 3
        },
        "logging": {"level": "debug", "log_dir": "logs", "log_to_file": true}
    })");

    EXPECT_EQ(config.execution.mode, ExecutionMode::Parallel);
    EXPECT_EQ(config.execution.maxWorkers, 8);
    ASSERT_EQ(config.execution.suites.size(), 2u);

    const SuiteOverride *auth = config.execution.findOverride("auth-flow");
    ASSERT_NE(auth, nullptr);
    EXPECT_EQ(auth->mode, ExecutionMode::Sequential);
    EXPECT_TRUE(auth->sharedContext);
    EXPECT_FALSE(auth->workers.has_value());

    const SuiteOverride *products = config.execution.findOverride("product-pages");
    ASSERT_NE(products, nullptr);
    EXPECT_EQ(products->workers, std::optional<int>(4));
    EXPECT_FALSE(products->sharedContext);

    EXPECT_EQ(config.runner.command, (std::vector<std::string>{"npx", "playwright", "test"}));
    EXPECT_EQ(config.runner.verboseFlag, "--reporter=list");
    EXPECT_TRUE(config.runner.extraArgs.empty());
    EXPECT_EQ(config.runner.parallelFlag, "--workers");
    EXPECT_EQ(config.runner.artifactExtension, "spec.ts");
    EXPECT_EQ(config.runner.outputDir.string(), "/tmp/rte-out");
    EXPECT_EQ(config.runner.timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.runner.maxConcurrentSuites, 3);

    EXPECT_EQ(config.logging.level, LogLevel::Debug);
    EXPECT_EQ(config.logging.logDir, "logs");
    EXPECT_TRUE(config.logging.logToFile);
}

TEST(ConfigLoaderTest, NonPositiveWorkersAreAcceptedForLaterCoercion) {
    RunConfig config = ConfigLoader::loadFromString(R"({"execution": {"max_workers": 0,
        "suites": {"s": {"workers": -2}}}})");

    EXPECT_EQ(config.execution.maxWorkers, 0);
    EXPECT_EQ(config.execution.findOverride("s")->workers, std::optional<int>(-2));
}

TEST(ConfigLoaderTest, UnknownModeIsRejected) {
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": {"mode": "turbo"}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": {"suites": {"s": {"mode": "x"}}}})"), ConfigError);
}

TEST(ConfigLoaderTest, WrongTypesAreRejected) {
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": {"max_workers": "four"}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": {"suites": []}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": {"suites": {"s": {"shared_context": 1}}}})"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"command": "pytest"}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"command": ["pytest", 3]}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"timeout_seconds": "60"}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"logging": {"log_to_file": "yes"}})"), ConfigError);
}

TEST(ConfigLoaderTest, EmptyRunnerCommandIsRejected) {
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"command": []}})"), ConfigError);
}

TEST(ConfigLoaderTest, UnknownLogLevelIsRejected) {
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"logging": {"level": "chatty"}})"), ConfigError);
    EXPECT_EQ(ConfigLoader::loadFromString(R"({"logging": {"level": "off"}})").logging.level, LogLevel::Off);
    EXPECT_EQ(ConfigLoader::loadFromString(R"({"logging": {"level": "trace"}})").logging.level, LogLevel::Trace);
}

TEST(ConfigLoaderTest, MalformedDocumentsAreRejected) {
    EXPECT_THROW(ConfigLoader::loadFromString(""), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString("{"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString("[]"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": 5})"), ConfigError);
}

TEST(ConfigLoaderTest, OutOfRangeIntegersAreRejected) {
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": {"max_workers": 10000000000}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"execution": {"max_workers": -10000000000}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"max_concurrent_suites": 18446744073709551615}})"),
                 ConfigError);
    EXPECT_EQ(ConfigLoader::loadFromString(R"({"execution": {"max_workers": 2147483647}})").execution.maxWorkers,
              2147483647);
}

TEST(ConfigLoaderTest, TimeoutMustBePositiveAndBounded) {
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"timeout_seconds": 1e300}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"timeout_seconds": 0}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"timeout_seconds": -5}})"), ConfigError);

    EXPECT_EQ(ConfigLoader::loadFromString(R"({"runner": {"timeout_seconds": 604800}})").runner.timeout,
              std::chrono::milliseconds(604800000));
    EXPECT_EQ(ConfigLoader::loadFromString(R"({"runner": {"timeout_seconds": 0.0001}})").runner.timeout,
              std::chrono::milliseconds(1));
}

TEST(ConfigLoaderTest, CaptureSettings) {
    RunConfig defaults = ConfigLoader::loadFromString("{}");
    EXPECT_EQ(defaults.runner.captureDirName, "captures");
    EXPECT_EQ(defaults.runner.captureSupportFile, "conftest.py");
    EXPECT_NE(defaults.runner.captureSupportTemplate.find(Constants::CAPTURE_DIR_PLACEHOLDER), std::string::npos);

    RunConfig custom = ConfigLoader::loadFromString(R"({"runner": {"capture_dir": "steps",
        "capture_support_file": "capture.env", "capture_support_template": "DIR={captures_dir}"}})");
    EXPECT_EQ(custom.runner.captureDirName, "steps");
    EXPECT_EQ(custom.runner.captureSupportFile, "capture.env");
    EXPECT_EQ(custom.runner.captureSupportTemplate, "DIR={captures_dir}");

    EXPECT_TRUE(ConfigLoader::loadFromString(R"({"runner": {"capture_dir": ""}})").runner.captureDirName.empty());
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"capture_dir": "../elsewhere"}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"capture_dir": ".."}})"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadFromString(R"({"runner": {"capture_support_file": "sub/conftest.py"}})"),
                 ConfigError);
}

TEST(ConfigLoaderTest, ErrorNamesTheOffendingKey) {
    try {
        ConfigLoader::loadFromString(R"({"execution": {"suites": {"auth": {"workers": 1.5}}}})");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("execution.suites.auth.workers"), std::string::npos) << e.what();
    }
}

TEST(ConfigLoaderTest, LoadFromFile) {
    Utils::TempDirectory dir("rte-config");
    auto path = dir.path() / "config.json";
    std::ofstream(path) << R"({"execution": {"mode": "sequential"}})";

    EXPECT_EQ(ConfigLoader::loadFromFile(path.string()).execution.mode, ExecutionMode::Sequential);
    EXPECT_THROW(ConfigLoader::loadFromFile((dir.path() / "missing.json").string()), ConfigError);
}

}  // namespace Test
}  // namespace RTE
