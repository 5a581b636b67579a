#include "common/TestUtils.h"
#include "scheduling/PlanValidator.h"
#include "scheduling/SuiteScheduler.h"
#include <algorithm>
#include <gtest/gtest.h>
#include <map>

namespace RTE {
namespace Test {

using Utils::makeCase;

class SuiteSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_.maxWorkers = 4;

        const std::vector<std::string> routes = {"/", "/products", "/cart", "/products", "/"};
        for (int i = 0; i < 20; ++i) {
            TestCategory category = i % 3 == 0 ? TestCategory::Api
                                               : (i % 3 == 1 ? TestCategory::Functional : TestCategory::Visual);
            cases_.push_back(makeCase("case_" + std::to_string(i), category, routes[i % routes.size()]));
        }
    }

    // Every input case appears exactly once across the plan
    void expectConservation(const ExecutionPlan &plan) const {
        std::map<std::string, int> seen;
        for (const auto &suite : plan.getSuites()) {
            EXPECT_FALSE(suite.cases.empty()) << suite.name;
            EXPECT_GE(suite.workers, 1) << suite.name;
            if (suite.sharedContext) {
                EXPECT_EQ(suite.workers, 1) << suite.name;
            }
            for (const auto &testCase : suite.cases) {
                seen[testCase.name]++;
            }
        }
        EXPECT_EQ(plan.totalCases(), cases_.size());
        EXPECT_EQ(seen.size(), cases_.size());
        for (const auto &testCase : cases_) {
            EXPECT_EQ(seen[testCase.name], 1) << testCase.name;
        }
    }

    SuiteScheduler scheduler_;
    ExecutionPolicy policy_;
    std::vector<TestCase> cases_;
};

TEST_F(SuiteSchedulerTest, EveryModeConservesCases) {
    for (auto mode : {ExecutionMode::Sequential, ExecutionMode::Parallel, ExecutionMode::Smart}) {
        SCOPED_TRACE(toString(mode));
        policy_.mode = mode;
        expectConservation(scheduler_.schedule(cases_, policy_));
    }
}

TEST_F(SuiteSchedulerTest, ExplicitAssignmentsConserveCases) {
    SuiteAssignments assignments;
    for (size_t i = 0; i < cases_.size(); i += 2) {
        assignments[cases_[i].name] = i % 4 == 0 ? "even-a" : "even-b";
    }

    auto plan = scheduler_.schedule(cases_, policy_, assignments);

    expectConservation(plan);
    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan.getSuites().back().name, "unassigned");
}

TEST_F(SuiteSchedulerTest, SequentialModeGivesSingleWorkerEverywhere) {
    policy_.mode = ExecutionMode::Sequential;
    auto plan = scheduler_.schedule(cases_, policy_);

    for (const auto &suite : plan.getSuites()) {
        EXPECT_EQ(suite.workers, 1);
    }
}

TEST_F(SuiteSchedulerTest, SmartExample) {
    std::vector<TestCase> cases = {makeCase("f1", TestCategory::Functional, "/"),
                                   makeCase("f2", TestCategory::Functional, "/"),
                                   makeCase("api", TestCategory::Api, "/"),
                                   makeCase("v1", TestCategory::Visual, "/products")};
    policy_.mode = ExecutionMode::Smart;

    auto plan = scheduler_.schedule(cases, policy_);

    ASSERT_EQ(plan.size(), 3u);
    EXPECT_EQ(plan.totalCases(), 4u);

    const Suite *api = plan.findSuite("api-tests");
    const Suite *root = plan.findSuite("ui-root");
    const Suite *products = plan.findSuite("ui-products");
    ASSERT_NE(api, nullptr);
    ASSERT_NE(root, nullptr);
    ASSERT_NE(products, nullptr);
    EXPECT_EQ(api->cases.size(), 1u);
    EXPECT_EQ(api->workers, 1);
    EXPECT_EQ(root->cases.size(), 2u);
    EXPECT_EQ(root->workers, 1);
    EXPECT_EQ(products->cases.size(), 1u);
    EXPECT_EQ(products->workers, 1);
}

TEST_F(SuiteSchedulerTest, SharedContextOverrideForcesOneWorker) {
    policy_.mode = ExecutionMode::Smart;
    policy_.suites["api-tests"] = SuiteOverride{ExecutionMode::Parallel, 8, true};

    auto plan = scheduler_.schedule(cases_, policy_);

    const Suite *api = plan.findSuite("api-tests");
    ASSERT_NE(api, nullptr);
    EXPECT_TRUE(api->sharedContext);
    EXPECT_EQ(api->workers, 1);
    EXPECT_NO_THROW(PlanValidator::validate(plan, cases_));
}

TEST_F(SuiteSchedulerTest, NonPositiveWorkerSettingsAreCoerced) {
    policy_.mode = ExecutionMode::Parallel;
    policy_.maxWorkers = 0;

    auto plan = scheduler_.schedule(cases_, policy_);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan.getSuites()[0].workers, 1);

    policy_.maxWorkers = -5;
    EXPECT_EQ(scheduler_.schedule(cases_, policy_).getSuites()[0].workers, 1);
}

TEST_F(SuiteSchedulerTest, NoCasesGivesEmptyPlan) {
    for (auto mode : {ExecutionMode::Sequential, ExecutionMode::Parallel, ExecutionMode::Smart}) {
        policy_.mode = mode;
        auto plan = scheduler_.schedule({}, policy_);
        EXPECT_TRUE(plan.empty());
        EXPECT_EQ(plan.totalCases(), 0u);
    }
    EXPECT_TRUE(scheduler_.schedule({}, policy_, {{"x", "suite"}}).empty());
}

TEST_F(SuiteSchedulerTest, ScheduleIsDeterministic) {
    policy_.mode = ExecutionMode::Smart;
    auto first = scheduler_.schedule(cases_, policy_);
    auto second = scheduler_.schedule(cases_, policy_);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first.getSuites()[i].name, second.getSuites()[i].name);
        EXPECT_EQ(first.getSuites()[i].cases.size(), second.getSuites()[i].cases.size());
        EXPECT_EQ(first.getSuites()[i].workers, second.getSuites()[i].workers);
    }
}

TEST_F(SuiteSchedulerTest, SelectPolicyFollowsModeAndAssignments) {
    policy_.mode = ExecutionMode::Parallel;
    EXPECT_STREQ(SuiteScheduler::selectPolicy(policy_, {})->getName(), "parallel");
    EXPECT_STREQ(SuiteScheduler::selectPolicy(policy_, {{"a", "b"}})->getName(), "explicit");

    policy_.mode = ExecutionMode::Sequential;
    EXPECT_STREQ(SuiteScheduler::selectPolicy(policy_, {})->getName(), "sequential");
    policy_.mode = ExecutionMode::Smart;
    EXPECT_STREQ(SuiteScheduler::selectPolicy(policy_, {})->getName(), "smart");
}

TEST_F(SuiteSchedulerTest, EnforceInvariantsDropsEmptySuitesAndClampsWorkers) {
    auto suites = SuiteScheduler::enforceInvariants({Suite{"empty", {}, 1, false},
                                                     Suite{"zero", {makeCase("a")}, 0, false},
                                                     Suite{"shared", {makeCase("b")}, 6, true}});

    ASSERT_EQ(suites.size(), 2u);
    EXPECT_EQ(suites[0].name, "zero");
    EXPECT_EQ(suites[0].workers, 1);
    EXPECT_EQ(suites[1].name, "shared");
    EXPECT_EQ(suites[1].workers, 1);
}

}  // namespace Test
}  // namespace RTE
