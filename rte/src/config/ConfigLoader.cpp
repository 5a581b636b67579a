#include "config/ConfigLoader.h"
#include "common/Logger.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>

namespace RTE {

namespace {

// One week; also keeps the millisecond conversion far from overflow
constexpr double MAX_TIMEOUT_SECONDS = 7 * 24 * 3600.0;

// Names placed inside the working directory: no separators, no "." or ".."
bool isSingleComponent(const std::string &name) {
    return name.find('/') == std::string::npos && name != "." && name != "..";
}

[[noreturn]] void throwTypeError(const std::string &path, const std::string &expected, const json &actual) {
    throw ConfigError(path + " must be " + expected + ", got " + JsonUtils::typeName(actual));
}

void requireObject(const json &value, const std::string &path) {
    if (!value.is_object()) {
        throwTypeError(path, "a JSON object", value);
    }
}

std::string readString(const json &section, const std::string &key, const std::string &path,
                       const std::string &defaultValue) {
    if (!JsonUtils::hasKey(section, key)) {
        return defaultValue;
    }
    const auto &value = section[key];
    if (!value.is_string()) {
        throwTypeError(path + "." + key, "a string", value);
    }
    return value.get<std::string>();
}

int readInt(const json &section, const std::string &key, const std::string &path, int defaultValue) {
    if (!JsonUtils::hasKey(section, key)) {
        return defaultValue;
    }
    const auto &value = section[key];
    if (!value.is_number_integer()) {
        throwTypeError(path + "." + key, "an integer", value);
    }
    bool inRange = value.is_number_unsigned()
                       ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                       : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                             value.get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange) {
        throw ConfigError(path + "." + key + " is out of range: " + value.dump());
    }
    return value.get<int>();
}

bool readBool(const json &section, const std::string &key, const std::string &path, bool defaultValue) {
    if (!JsonUtils::hasKey(section, key)) {
        return defaultValue;
    }
    const auto &value = section[key];
    if (!value.is_boolean()) {
        throwTypeError(path + "." + key, "a boolean", value);
    }
    return value.get<bool>();
}

std::vector<std::string> readStringList(const json &section, const std::string &key, const std::string &path,
                                        const std::vector<std::string> &defaultValue) {
    if (!JsonUtils::hasKey(section, key)) {
        return defaultValue;
    }
    const auto &value = section[key];
    if (!value.is_array()) {
        throwTypeError(path + "." + key, "an array of strings", value);
    }

    std::vector<std::string> items;
    for (const auto &item : value) {
        if (!item.is_string()) {
            throwTypeError(path + "." + key + "[]", "a string", item);
        }
        items.push_back(item.get<std::string>());
    }
    return items;
}

ExecutionMode readMode(const json &section, const std::string &path, ExecutionMode defaultValue) {
    if (!JsonUtils::hasKey(section, "mode")) {
        return defaultValue;
    }
    std::string text = readString(section, "mode", path, "");
    auto mode = parseExecutionMode(text);
    if (!mode) {
        throw ConfigError(path + ".mode: unknown execution mode '" + text + "'");
    }
    return *mode;
}

}  // namespace

RunConfig ConfigLoader::loadFromFile(const std::string &path) {
    std::string error;
    auto root = JsonUtils::parseFile(path, &error);
    if (!root) {
        throw ConfigError("Failed to load config " + path + ": " + error);
    }
    LOG_DEBUG("ConfigLoader: Loaded {}", path);
    return fromJson(*root);
}

RunConfig ConfigLoader::loadFromString(const std::string &text) {
    std::string error;
    auto root = JsonUtils::parseJson(text, &error);
    if (!root) {
        throw ConfigError("Invalid config JSON: " + error);
    }
    return fromJson(*root);
}

RunConfig ConfigLoader::fromJson(const json &root) {
    requireObject(root, "config");

    RunConfig config;
    if (JsonUtils::hasKey(root, "execution")) {
        config.execution = parseExecutionPolicy(root["execution"]);
    }
    if (JsonUtils::hasKey(root, "runner")) {
        config.runner = parseRunnerConfig(root["runner"]);
    }
    if (JsonUtils::hasKey(root, "logging")) {
        config.logging = parseLoggingConfig(root["logging"]);
    }
    return config;
}

ExecutionPolicy ConfigLoader::parseExecutionPolicy(const json &section) {
    const std::string path = "execution";
    requireObject(section, path);

    ExecutionPolicy policy;
    policy.mode = readMode(section, path, policy.mode);
    policy.maxWorkers = readInt(section, "max_workers", path, policy.maxWorkers);

    if (const json *suites = JsonUtils::findMember(section, "suites")) {
        requireObject(*suites, path + ".suites");

        for (const auto &item : suites->items()) {
            const std::string &name = item.key();
            const json &entry = item.value();
            const std::string suitePath = path + ".suites." + name;
            requireObject(entry, suitePath);

            SuiteOverride suiteOverride;
            suiteOverride.mode = readMode(entry, suitePath, ExecutionMode::Smart);
            if (JsonUtils::hasKey(entry, "workers")) {
                suiteOverride.workers = readInt(entry, "workers", suitePath, 1);
            }
            suiteOverride.sharedContext = readBool(entry, "shared_context", suitePath, false);
            policy.suites[name] = suiteOverride;
        }
    }
    return policy;
}

RunnerConfig ConfigLoader::parseRunnerConfig(const json &section) {
    const std::string path = "runner";
    requireObject(section, path);

    RunnerConfig runner;
    runner.command = readStringList(section, "command", path, runner.command);
    if (runner.command.empty() || runner.command.front().empty()) {
        throw ConfigError(path + ".command must name a runner program");
    }
    runner.verboseFlag = readString(section, "verbose_flag", path, runner.verboseFlag);
    runner.extraArgs = readStringList(section, "extra_args", path, runner.extraArgs);
    runner.parallelFlag = readString(section, "parallel_flag", path, runner.parallelFlag);
    runner.artifactExtension = readString(section, "artifact_extension", path, runner.artifactExtension);
    runner.outputDir = readString(section, "output_dir", path, runner.outputDir.string());

    if (const json *value = JsonUtils::findMember(section, "timeout_seconds")) {
        if (!value->is_number()) {
            throwTypeError(path + ".timeout_seconds", "a number", *value);
        }
        double seconds = value->get<double>();
        if (!(seconds > 0.0) || seconds > MAX_TIMEOUT_SECONDS) {
            throw ConfigError(fmt::format("{}.timeout_seconds must be in (0, {}], got {}", path, MAX_TIMEOUT_SECONDS,
                                          value->dump()));
        }
        // Sub-millisecond values still mean "time out as soon as possible", not "use the default"
        runner.timeout = std::max(std::chrono::milliseconds(1),
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::duration<double>(seconds)));
    }

    runner.maxConcurrentSuites = readInt(section, "max_concurrent_suites", path, runner.maxConcurrentSuites);

    runner.captureDirName = readString(section, "capture_dir", path, runner.captureDirName);
    if (!runner.captureDirName.empty() && !isSingleComponent(runner.captureDirName)) {
        throw ConfigError(path + ".capture_dir must be a plain directory name, got '" + runner.captureDirName + "'");
    }
    runner.captureSupportFile = readString(section, "capture_support_file", path, runner.captureSupportFile);
    if (!runner.captureSupportFile.empty() && !isSingleComponent(runner.captureSupportFile)) {
        throw ConfigError(path + ".capture_support_file must be a plain file name, got '" +
                          runner.captureSupportFile + "'");
    }
    runner.captureSupportTemplate =
        readString(section, "capture_support_template", path, runner.captureSupportTemplate);
    return runner;
}

LoggingConfig ConfigLoader::parseLoggingConfig(const json &section) {
    const std::string path = "logging";
    requireObject(section, path);

    LoggingConfig logging;
    if (JsonUtils::hasKey(section, "level")) {
        std::string text = readString(section, "level", path, "");
        // Unknown names fall back to whichever default is passed
        LogLevel low = parseLogLevel(text, LogLevel::Trace);
        LogLevel high = parseLogLevel(text, LogLevel::Off);
        if (low != high) {
            throw ConfigError(path + ".level: unknown log level '" + text + "'");
        }
        logging.level = low;
    }
    logging.logDir = readString(section, "log_dir", path, logging.logDir);
    logging.logToFile = readBool(section, "log_to_file", path, logging.logToFile);
    return logging;
}

}  // namespace RTE
