#include "io/CaseLoader.h"
#include "common/Logger.h"
#include "config/ConfigLoader.h"

namespace RTE {

namespace {

std::string requireString(const json &object, const std::string &key, const std::string &what) {
    if (!JsonUtils::hasKey(object, key) || !object[key].is_string()) {
        throw ConfigError(what + " requires string field '" + key + "'");
    }
    return object[key].get<std::string>();
}

std::optional<std::string> optionalString(const json &object, const std::string &key, const std::string &what) {
    if (!JsonUtils::hasKey(object, key)) {
        return std::nullopt;
    }
    if (!object[key].is_string()) {
        throw ConfigError(what + " field '" + key + "' must be a string");
    }
    return object[key].get<std::string>();
}

}  // namespace

CaseFile CaseLoader::loadFromFile(const std::string &path) {
    std::string error;
    auto root = JsonUtils::parseFile(path, &error);
    if (!root) {
        throw ConfigError("Failed to load cases " + path + ": " + error);
    }
    CaseFile file = fromJson(*root);
    LOG_INFO("CaseLoader: Loaded {} cases ({} assignments) from {}", file.cases.size(), file.assignments.size(),
             path);
    return file;
}

CaseFile CaseLoader::loadFromString(const std::string &text) {
    std::string error;
    auto root = JsonUtils::parseJson(text, &error);
    if (!root) {
        throw ConfigError("Invalid case JSON: " + error);
    }
    return fromJson(*root);
}

CaseFile CaseLoader::fromJson(const json &root) {
    CaseFile file;
    const json *cases = nullptr;

    if (root.is_array()) {
        cases = &root;
    } else if (root.is_object()) {
        if (!JsonUtils::hasKey(root, "cases") || !root["cases"].is_array()) {
            throw ConfigError("Case file object requires a 'cases' array");
        }
        cases = &root["cases"];

        if (JsonUtils::hasKey(root, "assignments")) {
            const auto &assignments = root["assignments"];
            if (!assignments.is_object()) {
                throw ConfigError("'assignments' must map case names to suite names");
            }
            for (const auto &item : assignments.items()) {
                if (!item.value().is_string()) {
                    throw ConfigError("Assignment for case '" + item.key() + "' must be a suite name string");
                }
                file.assignments[item.key()] = item.value().get<std::string>();
            }
        }
    } else {
        throw ConfigError("Case file must be a JSON array or an object with 'cases'");
    }

    for (size_t i = 0; i < cases->size(); ++i) {
        try {
            file.cases.push_back(parseCase((*cases)[i]));
        } catch (const ConfigError &e) {
            throw ConfigError("cases[" + std::to_string(i) + "]: " + e.what());
        }
    }
    return file;
}

TestCase CaseLoader::parseCase(const json &value) {
    if (!value.is_object()) {
        throw ConfigError("Test case must be a JSON object");
    }

    TestCase testCase;
    testCase.name = requireString(value, "name", "Test case");

    std::string category = JsonUtils::getString(value, "category", toString(TestCategory::Functional));
    auto parsedCategory = parseTestCategory(category);
    if (!parsedCategory) {
        throw ConfigError("Test case '" + testCase.name + "' has unknown category '" + category + "'");
    }
    testCase.category = *parsedCategory;
    testCase.route = optionalString(value, "route", "Test case").value_or("/");
    testCase.code = optionalString(value, "code", "Test case").value_or("");

    if (JsonUtils::hasKey(value, "steps")) {
        if (!value["steps"].is_array()) {
            throw ConfigError("Test case '" + testCase.name + "' steps must be an array");
        }
        for (const auto &step : value["steps"]) {
            testCase.steps.push_back(parseStep(step));
        }
    }
    return testCase;
}

TestStep CaseLoader::parseStep(const json &value) {
    if (!value.is_object()) {
        throw ConfigError("Test step must be a JSON object");
    }

    TestStep step;
    step.action = requireString(value, "action", "Test step");

    if (JsonUtils::hasKey(value, "selectors")) {
        if (!value["selectors"].is_array()) {
            throw ConfigError("Test step selectors must be an array");
        }
        for (const auto &candidate : value["selectors"]) {
            step.selectors.push_back(parseCandidate(candidate));
        }
    }

    step.targetUrl = optionalString(value, "target_url", "Test step");
    if (JsonUtils::hasKey(value, "expected")) {
        const auto &expected = value["expected"];
        step.expected = expected.is_string() ? expected.get<std::string>() : JsonUtils::toCompactString(expected);
    }
    step.method = optionalString(value, "method", "Test step");
    step.name = optionalString(value, "name", "Test step");
    step.description = optionalString(value, "description", "Test step").value_or("");
    return step;
}

SelectorCandidate CaseLoader::parseCandidate(const json &value) {
    if (!value.is_object()) {
        throw ConfigError("Selector must be a JSON object");
    }

    std::string strategyText = requireString(value, "strategy", "Selector");
    auto strategy = parseSelectorStrategy(strategyText);
    if (!strategy) {
        throw ConfigError("Unknown selector strategy '" + strategyText + "'");
    }

    return SelectorCandidate(*strategy, requireString(value, "value", "Selector"),
                             optionalString(value, "name", "Selector"));
}

}  // namespace RTE
