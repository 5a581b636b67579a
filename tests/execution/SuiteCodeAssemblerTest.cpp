#include "common/TestUtils.h"
#include "execution/SuiteCodeAssembler.h"
#include <gtest/gtest.h>

namespace RTE {
namespace Test {

using Utils::makeCase;

TEST(SuiteCodeAssemblerTest, JoinsCaseCodeWithBlankLines) {
    SuiteCodeAssembler assembler;
    std::vector<TestCase> cases = {makeCase("a", TestCategory::Functional, "/", "def test_a():\n    pass\n"),
                                   makeCase("b", TestCategory::Functional, "/", "def test_b():\n    pass")};

    EXPECT_EQ(assembler.assemble(cases), "def test_a():\n    pass\n\ndef test_b():\n    pass\n");
}

TEST(SuiteCodeAssemblerTest, HeaderComesFirst) {
    SuiteCodeAssembler assembler("import pytest\n");
    std::vector<TestCase> cases = {makeCase("a", TestCategory::Api, "/", "def test_a():\n    pass")};

    EXPECT_EQ(assembler.assemble(cases), "import pytest\n\ndef test_a():\n    pass\n");
}

TEST(SuiteCodeAssemblerTest, CasesWithoutCodeAreSkipped) {
    SuiteCodeAssembler assembler;
    std::vector<TestCase> cases = {makeCase("empty"), makeCase("real", TestCategory::Functional, "/", "x = 1")};

    EXPECT_EQ(assembler.assemble(cases), "x = 1\n");
}

TEST(SuiteCodeAssemblerTest, NoCodeAtAllGivesEmptyString) {
    SuiteCodeAssembler assembler("import pytest");

    EXPECT_EQ(assembler.assemble({makeCase("a"), makeCase("b")}), "");
    EXPECT_EQ(assembler.assemble({}), "");
}

}  // namespace Test
}  // namespace RTE
