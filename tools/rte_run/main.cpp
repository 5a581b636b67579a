// rte_run: schedule a case file into suites, run every suite and print a JSON report

#include "backends/SpdlogBackend.h"
#include "common/Logger.h"
#include "common/UniqueIdGenerator.h"
#include "config/ConfigLoader.h"
#include "execution/PlanRunner.h"
#include "execution/SuiteCodeAssembler.h"
#include "execution/SuiteExecutor.h"
#include "io/CaseLoader.h"
#include "io/JsonSerializer.h"
#include "reporting/ResultCollector.h"
#include "scheduling/SuiteScheduler.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

constexpr int EXIT_PASSED = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_USAGE = 2;

// Set while a run is in progress; read from the signal handler
std::atomic<RTE::CancellationToken *> activeToken{nullptr};

void handleSignal(int) {
    RTE::CancellationToken *token = activeToken.load();
    if (token) {
        token->cancel();
    }
}

struct Options {
    std::string casesPath;
    std::string configPath;
    std::string outputPath;
    std::string runId;
    bool planOnly = false;
};

void printUsage(const char *programName) {
    std::cout << "Usage: " << programName
              << " --cases <cases.json> [--config <config.json>] [--output <report.json>] [--plan-only]"
                 " [--run-id <id>]\n\n";
    std::cout << "Group test cases into suites and run each suite with the configured runner.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --cases      Case file (array of cases or {\"cases\", \"assignments\"})\n";
    std::cout << "  --config     Execution, runner and logging configuration\n";
    std::cout << "  --output     Write the report JSON here instead of stdout\n";
    std::cout << "  --plan-only  Print the execution plan and exit without running\n";
    std::cout << "  --run-id     Identifier recorded in the report (generated when omitted)\n";
}

std::optional<Options> parseArguments(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto takeValue = [&](std::string &target) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--cases") {
            if (!takeValue(options.casesPath)) {
                return std::nullopt;
            }
        } else if (arg == "--config") {
            if (!takeValue(options.configPath)) {
                return std::nullopt;
            }
        } else if (arg == "--output") {
            if (!takeValue(options.outputPath)) {
                return std::nullopt;
            }
        } else if (arg == "--run-id") {
            if (!takeValue(options.runId)) {
                return std::nullopt;
            }
        } else if (arg == "--plan-only") {
            options.planOnly = true;
        } else {
            std::cerr << "Error: unknown argument " << arg << "\n";
            return std::nullopt;
        }
    }

    if (options.casesPath.empty()) {
        std::cerr << "Error: --cases is required\n";
        return std::nullopt;
    }
    return options;
}

void emit(const std::string &content, const std::string &outputPath) {
    if (outputPath.empty()) {
        std::cout << content << "\n";
        return;
    }

    std::ofstream file(outputPath, std::ios::out | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to create output file: " + outputPath);
    }
    file << content << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write to output file: " + outputPath);
    }
}

// SPDLOG_LEVEL from the environment wins over the configured level
void applyLogLevel(RTE::LogLevel level) {
    if (!std::getenv("SPDLOG_LEVEL")) {
        RTE::Logger::setLevel(level);
    }
}

}  // namespace

int main(int argc, char **argv) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    // Anything logged while the config loads uses the default level
    RTE::Logger::initialize();
    applyLogLevel(RTE::LoggingConfig{}.level);

    RTE::RunConfig config;
    RTE::CaseFile caseFile;
    try {
        if (!options->configPath.empty()) {
            config = RTE::ConfigLoader::loadFromFile(options->configPath);
        }

        if (config.logging.logToFile && !config.logging.logDir.empty()) {
            RTE::Logger::setBackend(std::make_unique<RTE::SpdlogBackend>(config.logging.logDir, true));
        }
        applyLogLevel(config.logging.level);

        caseFile = RTE::CaseLoader::loadFromFile(options->casesPath);
    } catch (const RTE::ConfigError &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::exception &e) {
        // e.g. a log directory that cannot be created or a log file that cannot be opened
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    try {
        RTE::SuiteScheduler scheduler;
        RTE::ExecutionPlan plan = scheduler.schedule(caseFile.cases, config.execution, caseFile.assignments);

        for (const auto &suite : plan.getSuites()) {
            LOG_INFO("rte_run: Suite '{}': {} cases, {} workers{}", suite.name, suite.cases.size(), suite.workers,
                     suite.sharedContext ? ", shared context" : "");
        }

        if (options->planOnly) {
            emit(RTE::JsonUtils::toPrettyString(RTE::JsonSerializer::toJson(plan)), options->outputPath);
            return EXIT_PASSED;
        }

        std::string runId = options->runId.empty() ? RTE::UniqueIdGenerator::generateRunId() : options->runId;

        RTE::SuiteExecutor executor(config.runner);
        RTE::PlanRunner runner(executor, config.runner.maxConcurrentSuites);
        RTE::SuiteCodeAssembler assembler;
        RTE::ResultCollector collector;

        RTE::CancellationToken cancel;
        activeToken.store(&cancel);
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        auto results = runner.run(
            plan, [&assembler](const RTE::Suite &suite) { return assembler.assemble(suite.cases); }, &cancel,
            [](const RTE::ExecutionResult &result) {
                LOG_INFO("rte_run: Suite '{}' {} (exit code {}, {:.2f}s)", result.suiteName,
                         RTE::toString(result.state), result.exitCode, result.durationSeconds);
            });

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        activeToken.store(nullptr);

        for (const auto &result : results) {
            collector.addExecutionResult(result);
        }

        RTE::RunReport report = collector.buildReport(runId);
        LOG_INFO("rte_run: Run {} {}: {}/{} suites passed", runId, report.overallStatus, report.passedSuites,
                 report.totalSuites);
        RTE::Logger::flush();

        emit(RTE::JsonUtils::toPrettyString(RTE::JsonSerializer::toJson(report)), options->outputPath);
        return report.passed() ? EXIT_PASSED : EXIT_FAILED;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FAILED;
    }
}
