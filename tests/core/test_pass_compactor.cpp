#include "unflake/core/pass_compactor.hpp"
#include "unflake/core/python_tokenizer.hpp"
#include <gtest/gtest.h>

namespace unflake {

TEST(PassCompactorTest, LonePassInBlockIsKept)
{
    std::string source = "def f():\n    pass\n";
    EXPECT_EQ(compact(source), source);
}

TEST(PassCompactorTest, LonePassInModuleIsKept)
{
    EXPECT_EQ(compact("pass\n"), "pass\n");
    EXPECT_EQ(compact("# header\npass\n"), "# header\npass\n");
}

TEST(PassCompactorTest, ModuleOpeningPassGoesWhenMoreCodeFollows)
{
    EXPECT_EQ(compact("pass\n\n\ndef main():\n    return 1\n"), "\n\n\ndef main():\n    return 1\n");
    EXPECT_EQ(compact("pass\n@decorate\ndef f():\n    pass\n"), "@decorate\ndef f():\n    pass\n");
    EXPECT_EQ(useless_pass_line_numbers("pass\n# c\n"), std::set<size_t>{});
}

TEST(PassCompactorTest, ModuleOfOnlyPassesKeepsOne)
{
    EXPECT_EQ(compact("pass\npass\n"), "pass\n");
}

TEST(PassCompactorTest, LeadingPassBeforeStatementIsRemoved)
{
    EXPECT_EQ(compact("def f():\n    pass\n    return 1\n"), "def f():\n    return 1\n");
}

TEST(PassCompactorTest, TrailingPassAfterStatementIsRemoved)
{
    EXPECT_EQ(compact("import os\npass\n"), "import os\n");
    EXPECT_EQ(compact("def f():\n    x()\n    pass\n"), "def f():\n    x()\n");
}

TEST(PassCompactorTest, PassBeforeDedentIsKept)
{
    std::string source = "class A:\n    pass\n\nx = 1\n";
    EXPECT_EQ(compact(source), source);

    std::string with_else = "if a:\n    pass\nelse:\n    b()\n";
    EXPECT_EQ(compact(with_else), with_else);
}

TEST(PassCompactorTest, ConsecutivePassesCollapse)
{
    EXPECT_EQ(compact("def f():\n    pass\n    pass\n"), "def f():\n    pass\n");
}

TEST(PassCompactorTest, PassWithCommentIsKept)
{
    std::string source = "def f():\n    x()\n    pass  # placeholder\n";
    EXPECT_EQ(compact(source), source);
}

TEST(PassCompactorTest, PassAfterContinuationIsKept)
{
    EXPECT_TRUE(useless_pass_line_numbers("x = 1 + \\\n    2\n").empty());
}

TEST(PassCompactorTest, UntokenizableSourceIsReturnedUnchanged)
{
    std::string source = "def f(:\n    pass\n    pass\n";
    EXPECT_EQ(compact(source), source);
    EXPECT_THROW(useless_pass_line_numbers("x = (\n"), TokenizeError);
}

TEST(PassCompactorTest, LineNumbersAreOneBased)
{
    auto marked = useless_pass_line_numbers("import os\npass\nimport sys\n");
    EXPECT_EQ(marked, (std::set<size_t>{2}));
}

TEST(PassCompactorTest, CrlfIsPreserved)
{
    EXPECT_EQ(compact("def f():\r\n    x()\r\n    pass\r\n"), "def f():\r\n    x()\r\n");
}

} // namespace unflake
