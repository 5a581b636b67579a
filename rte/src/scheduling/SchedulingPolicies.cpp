#include "scheduling/SchedulingPolicies.h"
#include "common/Constants.h"
#include "common/Logger.h"
#include "common/StringUtils.h"

#include <algorithm>
#include <set>
#include <thread>

namespace RTE {

namespace {

int cappedWorkers(size_t caseCount, int maxWorkers) {
    int ceiling = std::max(maxWorkers, 1);
    return static_cast<int>(std::max<size_t>(1, std::min(caseCount, static_cast<size_t>(ceiling))));
}

// Suites in first-seen order with their cases in input order
class OrderedGroups {
public:
    std::vector<TestCase> &operator[](const std::string &name) {
        auto it = std::find_if(groups_.begin(), groups_.end(), [&name](const auto &g) { return g.first == name; });
        if (it == groups_.end()) {
            groups_.emplace_back(name, std::vector<TestCase>{});
            return groups_.back().second;
        }
        return it->second;
    }

    std::vector<std::pair<std::string, std::vector<TestCase>>> &entries() {
        return groups_;
    }

private:
    std::vector<std::pair<std::string, std::vector<TestCase>>> groups_;
};

}  // namespace

int ExecutionPolicy::defaultMaxWorkers() {
    unsigned int hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? static_cast<int>(hardware) : Constants::DEFAULT_MAX_WORKERS;
}

void applySuiteOverride(Suite &suite, const SuiteOverride &suiteOverride, int maxWorkers) {
    suite.sharedContext = suiteOverride.sharedContext;

    if (suiteOverride.mode == ExecutionMode::Sequential) {
        suite.workers = 1;
        return;
    }

    int requested = suiteOverride.workers.value_or(maxWorkers);
    if (requested < 1) {
        LOG_WARN("SchedulingPolicies: Suite '{}' requests {} workers, using 1", suite.name, requested);
        requested = 1;
    }
    suite.workers = requested;
}

std::vector<Suite> SequentialPolicy::group(const std::vector<TestCase> &cases,
                                           [[maybe_unused]] const ExecutionPolicy &policy) const {
    if (cases.empty()) {
        return {};
    }
    return {Suite{Constants::SUITE_ALL, cases, 1, false}};
}

std::vector<Suite> ParallelPolicy::group(const std::vector<TestCase> &cases, const ExecutionPolicy &policy) const {
    if (cases.empty()) {
        return {};
    }
    return {Suite{Constants::SUITE_ALL, cases, cappedWorkers(cases.size(), policy.maxWorkers), false}};
}

std::string SmartPolicy::suiteNameForRoute(const std::string &route) {
    return std::string(Constants::UI_SUITE_PREFIX) + slugify(route, Constants::ROOT_ROUTE_PLACEHOLDER);
}

std::vector<Suite> SmartPolicy::group(const std::vector<TestCase> &cases, const ExecutionPolicy &policy) const {
    std::vector<Suite> suites;

    std::vector<TestCase> apiCases;
    std::vector<std::string> routeOrder;
    std::map<std::string, std::vector<TestCase>> byRoute;

    for (const auto &testCase : cases) {
        if (testCase.category == TestCategory::Api) {
            apiCases.push_back(testCase);
            continue;
        }
        auto [it, inserted] = byRoute.try_emplace(testCase.route);
        if (inserted) {
            routeOrder.push_back(testCase.route);
        }
        it->second.push_back(testCase);
    }

    std::set<std::string> usedNames;
    if (!apiCases.empty()) {
        int workers = cappedWorkers(apiCases.size(), policy.maxWorkers);
        suites.push_back(Suite{Constants::SUITE_API_TESTS, std::move(apiCases), workers, false});
        usedNames.insert(Constants::SUITE_API_TESTS);
    }

    for (const auto &route : routeOrder) {
        // Distinct routes can share a slug ("/a/b" and "/a-b"); keep suite names unique
        std::string baseName = suiteNameForRoute(route);
        std::string name = baseName;
        for (int suffix = 2; usedNames.count(name) > 0; ++suffix) {
            name = baseName + "-" + std::to_string(suffix);
        }
        usedNames.insert(name);

        suites.push_back(Suite{name, std::move(byRoute[route]), 1, false});
    }

    for (auto &suite : suites) {
        if (const auto *suiteOverride = policy.findOverride(suite.name)) {
            applySuiteOverride(suite, *suiteOverride, policy.maxWorkers);
        }
    }

    LOG_DEBUG("SmartPolicy: {} cases -> {} suites ({} routes)", cases.size(), suites.size(), routeOrder.size());
    return suites;
}

std::vector<Suite> ExplicitAssignmentPolicy::group(const std::vector<TestCase> &cases,
                                                   const ExecutionPolicy &policy) const {
    OrderedGroups assigned;
    std::vector<TestCase> unassigned;

    for (const auto &testCase : cases) {
        auto it = assignments_.find(testCase.name);
        if (it == assignments_.end() || it->second.empty() || it->second == Constants::SUITE_UNASSIGNED) {
            unassigned.push_back(testCase);
        } else {
            assigned[it->second].push_back(testCase);
        }
    }

    std::vector<Suite> suites;
    for (auto &[name, suiteCases] : assigned.entries()) {
        Suite suite{name, std::move(suiteCases), 1, false};
        if (const auto *suiteOverride = policy.findOverride(name)) {
            applySuiteOverride(suite, *suiteOverride, policy.maxWorkers);
        } else {
            LOG_DEBUG("ExplicitAssignmentPolicy: No configuration for suite '{}', running with one worker", name);
        }
        suites.push_back(std::move(suite));
    }

    if (!unassigned.empty()) {
        suites.push_back(Suite{Constants::SUITE_UNASSIGNED, std::move(unassigned), 1, false});
    }

    return suites;
}

}  // namespace RTE
