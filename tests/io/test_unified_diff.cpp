#include "unflake/io/unified_diff.hpp"
#include <gtest/gtest.h>

namespace unflake {

namespace {

auto numbered_lines(size_t count) -> std::vector<std::string> {
    std::vector<std::string> lines;
    for (size_t i = 1; i <= count; ++i) {
        lines.push_back("l" + std::to_string(i) + "\n");
    }
    return lines;
}

} // namespace

TEST(UnifiedDiffTest, IdenticalInputsGiveNoDiff)
{
    std::vector<std::string> lines = {"import os\n", "os.getcwd()\n"};
    EXPECT_EQ(unified_diff(lines, lines, "f.py"), "");
}

TEST(UnifiedDiffTest, RemovedLine)
{
    auto diff = unified_diff({"import os\n", "import sys\n", "print(sys)\n"},
                             {"import sys\n", "print(sys)\n"}, "f.py");

    EXPECT_EQ(diff, "--- original/f.py\n"
                    "+++ fixed/f.py\n"
                    "@@ -1,3 +1,2 @@\n"
                    "-import os\n"
                    " import sys\n"
                    " print(sys)\n");
}

TEST(UnifiedDiffTest, ContextIsLimitedToThreeLines)
{
    auto old_lines = numbered_lines(10);
    auto new_lines = old_lines;
    new_lines[4] = "L5\n";

    EXPECT_EQ(unified_diff(old_lines, new_lines, "m.py"), "--- original/m.py\n"
                                                          "+++ fixed/m.py\n"
                                                          "@@ -2,7 +2,7 @@\n"
                                                          " l2\n"
                                                          " l3\n"
                                                          " l4\n"
                                                          "-l5\n"
                                                          "+L5\n"
                                                          " l6\n"
                                                          " l7\n"
                                                          " l8\n");
}

TEST(UnifiedDiffTest, DistantChangesGetSeparateHunks)
{
    auto old_lines = numbered_lines(20);
    auto new_lines = old_lines;
    new_lines.erase(new_lines.begin() + 17);
    new_lines.erase(new_lines.begin() + 1);

    auto diff = unified_diff(old_lines, new_lines, "m.py");

    EXPECT_NE(diff.find("@@ -1,5 +1,4 @@\n l1\n-l2\n l3\n l4\n l5\n"), std::string::npos);
    EXPECT_NE(diff.find("@@ -15,6 +14,5 @@\n l15\n l16\n l17\n-l18\n l19\n l20\n"),
              std::string::npos);
}

TEST(UnifiedDiffTest, MissingFinalNewlineIsMarked)
{
    auto diff = unified_diff({"x = 1"}, {"pass"}, "f.py");

    EXPECT_EQ(diff, "--- original/f.py\n"
                    "+++ fixed/f.py\n"
                    "@@ -1 +1 @@\n"
                    "-x = 1\n"
                    "\\ No newline at end of file\n"
                    "+pass\n"
                    "\\ No newline at end of file\n");
}

TEST(UnifiedDiffTest, EmptyRangeStartsOneLineEarlier)
{
    auto diff = unified_diff({}, {"a\n"}, "new.py");
    EXPECT_NE(diff.find("@@ -0,0 +1 @@\n+a\n"), std::string::npos);

    diff = unified_diff({"a\n", "b\n"}, {"a\n"}, "f.py");
    EXPECT_NE(diff.find("@@ -1,2 +1 @@\n a\n-b\n"), std::string::npos);
}

TEST(UnifiedDiffTest, SplitImportIsAReplacement)
{
    auto diff = unified_diff({"import os, sys\n", "x = os\n"}, {"import os\n", "x = os\n"}, "f.py");

    EXPECT_EQ(diff, "--- original/f.py\n"
                    "+++ fixed/f.py\n"
                    "@@ -1,2 +1,2 @@\n"
                    "-import os, sys\n"
                    "+import os\n"
                    " x = os\n");
}

TEST(UnifiedDiffTest, LargeRewriteBecomesOneReplacement)
{
    std::vector<std::string> old_lines;
    std::vector<std::string> new_lines;
    for (size_t i = 1; i <= 1500; ++i) {
        old_lines.push_back("a" + std::to_string(i) + "\n");
        new_lines.push_back("b" + std::to_string(i) + "\n");
    }
    old_lines.push_back("shared\n");
    new_lines.push_back("shared\n");
    for (size_t i = 1501; i <= 3000; ++i) {
        old_lines.push_back("a" + std::to_string(i) + "\n");
        new_lines.push_back("b" + std::to_string(i) + "\n");
    }

    auto diff = unified_diff(old_lines, new_lines, "big.py");

    EXPECT_NE(diff.find("@@ -1,3001 +1,3001 @@\n-a1\n"), std::string::npos);
    EXPECT_NE(diff.find("-a3000\n+b1\n"), std::string::npos);
    EXPECT_NE(diff.find("-shared\n"), std::string::npos);
    EXPECT_NE(diff.find("+shared\n"), std::string::npos);
    EXPECT_EQ(diff.find(" shared\n"), std::string::npos);
}

} // namespace unflake
