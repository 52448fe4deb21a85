#include "unflake/core/source_text.hpp"
#include "unflake/core/text_utils.hpp"
#include <gtest/gtest.h>

namespace unflake {

TEST(SourceTextTest, SplitKeepsTerminators)
{
    auto text = split_source("a\nb\r\nc");

    ASSERT_EQ(text.lines.size(), 3);
    EXPECT_EQ(text.lines[0], "a\n");
    EXPECT_EQ(text.lines[1], "b\r\n");
    EXPECT_EQ(text.lines[2], "c");
}

TEST(SourceTextTest, RenderIsExactInverse)
{
    for (const std::string source : {"", "\n", "x\n\n", "a\r\nb", "no newline"}) {
        EXPECT_EQ(render_source(split_source(source)), source);
    }
}

TEST(SourceTextTest, EmptySourceHasNoLines)
{
    EXPECT_TRUE(split_source("").lines.empty());
}

TEST(TextUtilsTest, StripUsesPythonWhitespace)
{
    EXPECT_EQ(strip(" \t x \f\v\n"), "x");
    EXPECT_EQ(lstrip("  x  "), "x  ");
    EXPECT_EQ(rstrip("  x  \n"), "  x");
    EXPECT_EQ(strip("   "), "");
}

TEST(TextUtilsTest, Splitting)
{
    EXPECT_EQ(split("a,,b", ','), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_EQ(split_by_whitespace("  from  os\timport x\n"),
              (std::vector<std::string>{"from", "os", "import", "x"}));
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ", "), "");
}

TEST(TextUtilsTest, Identifiers)
{
    EXPECT_TRUE(is_identifier("_private1"));
    EXPECT_TRUE(is_identifier("caf\xc3\xa9"));
    EXPECT_FALSE(is_identifier("1st"));
    EXPECT_FALSE(is_identifier("a.b"));
    EXPECT_FALSE(is_identifier(""));
}

} // namespace unflake
