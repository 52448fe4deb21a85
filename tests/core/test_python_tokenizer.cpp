#include "unflake/core/python_tokenizer.hpp"
#include <gtest/gtest.h>

namespace unflake {

namespace {

auto types_of(const std::vector<Token>& tokens) -> std::vector<TokenType> {
    std::vector<TokenType> types;
    for (const auto& token : tokens) {
        types.push_back(token.type);
    }
    return types;
}

} // namespace

TEST(PythonTokenizerTest, SimpleAssignment)
{
    auto tokens = tokenize("x = 1\n");

    std::vector<TokenType> expected = {TokenType::NAME, TokenType::OP, TokenType::NUMBER,
                                       TokenType::NEWLINE, TokenType::ENDMARKER};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[0].text, "x");
    EXPECT_EQ(tokens[0].row, 1);
    EXPECT_EQ(tokens[0].line, "x = 1\n");
}

TEST(PythonTokenizerTest, MissingFinalNewlineIsSupplied)
{
    auto tokens = tokenize("pass");

    ASSERT_EQ(tokens.size(), 3);
    EXPECT_EQ(tokens[1].type, TokenType::NEWLINE);
    EXPECT_EQ(tokens[1].text, "");
    EXPECT_EQ(tokens[2].type, TokenType::ENDMARKER);
}

TEST(PythonTokenizerTest, IndentAndDedent)
{
    auto tokens = tokenize("if x:\n    pass\ny\n");

    std::vector<TokenType> expected = {
        TokenType::NAME,  TokenType::NAME,   TokenType::OP,   TokenType::NEWLINE,
        TokenType::INDENT, TokenType::NAME,  TokenType::NEWLINE, TokenType::DEDENT,
        TokenType::NAME,  TokenType::NEWLINE, TokenType::ENDMARKER};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[4].row, 2);
    EXPECT_EQ(tokens[7].row, 3);
}

TEST(PythonTokenizerTest, CommentAndBlankLinesAreNonLogical)
{
    auto tokens = tokenize("# header\n\nx\n");

    std::vector<TokenType> expected = {TokenType::COMMENT, TokenType::NL,      TokenType::NL,
                                       TokenType::NAME,    TokenType::NEWLINE, TokenType::ENDMARKER};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[0].text, "# header");
}

TEST(PythonTokenizerTest, LineBreaksInsideBracketsAreNonLogical)
{
    auto tokens = tokenize("f(a,\n  b)\n");

    std::vector<TokenType> expected = {TokenType::NAME, TokenType::OP,   TokenType::NAME,
                                       TokenType::OP,   TokenType::NL,   TokenType::NAME,
                                       TokenType::OP,   TokenType::NEWLINE, TokenType::ENDMARKER};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[5].row, 2);
}

TEST(PythonTokenizerTest, BackslashContinuationJoinsLines)
{
    auto tokens = tokenize("x = 1 + \\\n    2\n");

    std::vector<TokenType> expected = {TokenType::NAME,   TokenType::OP,      TokenType::NUMBER,
                                       TokenType::OP,     TokenType::NUMBER,  TokenType::NEWLINE,
                                       TokenType::ENDMARKER};
    EXPECT_EQ(types_of(tokens), expected);
    EXPECT_EQ(tokens[4].row, 2);
}

TEST(PythonTokenizerTest, StringPrefixesAndQuotes)
{
    auto tokens = tokenize("a = rb'x' + f\"{y}\" + u'z'\n");

    ASSERT_GE(tokens.size(), 7);
    EXPECT_EQ(tokens[2].type, TokenType::STRING);
    EXPECT_EQ(tokens[2].text, "rb'x'");
    EXPECT_EQ(tokens[4].type, TokenType::STRING);
    EXPECT_EQ(tokens[4].text, "f\"{y}\"");
    EXPECT_EQ(tokens[6].text, "u'z'");
}

TEST(PythonTokenizerTest, TripleQuotedStringSpansLines)
{
    auto tokens = tokenize("s = \"\"\"one\ntwo\"\"\"\nt = 1\n");

    ASSERT_GE(tokens.size(), 4);
    EXPECT_EQ(tokens[2].type, TokenType::STRING);
    EXPECT_EQ(tokens[2].text, "\"\"\"one\ntwo\"\"\"");
    EXPECT_EQ(tokens[2].row, 1);
    EXPECT_EQ(tokens[2].line, "s = \"\"\"one\ntwo\"\"\"\n");
    EXPECT_EQ(tokens[4].text, "t");
    EXPECT_EQ(tokens[4].row, 3);
}

TEST(PythonTokenizerTest, EscapedQuoteDoesNotEndString)
{
    auto tokens = tokenize("s = 'it\\'s'\n");

    EXPECT_EQ(tokens[2].type, TokenType::STRING);
    EXPECT_EQ(tokens[2].text, "'it\\'s'");
}

TEST(PythonTokenizerTest, NumberForms)
{
    for (const std::string number : {"0x1F", "0o17", "0b101", "1_000", "3.14", "1e-5", ".5", "2j",
                                     "1.5e+3j"}) {
        auto tokens = tokenize(number + "\n");
        ASSERT_FALSE(tokens.empty()) << number;
        EXPECT_EQ(tokens[0].type, TokenType::NUMBER) << number;
        EXPECT_EQ(tokens[0].text, number);
    }
}

TEST(PythonTokenizerTest, LongestOperatorWins)
{
    auto tokens = tokenize("a **= b // c -> d\n");

    EXPECT_EQ(tokens[1].text, "**=");
    EXPECT_EQ(tokens[3].text, "//");
    EXPECT_EQ(tokens[5].text, "->");
}

TEST(PythonTokenizerTest, CrlfLineEndings)
{
    auto tokens = tokenize("x = 1\r\ny = 2\r\n");

    EXPECT_EQ(tokens[3].type, TokenType::NEWLINE);
    EXPECT_EQ(tokens[3].text, "\r\n");
    EXPECT_EQ(tokens[4].text, "y");
    EXPECT_EQ(tokens[4].row, 2);
}

TEST(PythonTokenizerTest, Utf8IdentifiersAreNames)
{
    auto tokens = tokenize("caf\xc3\xa9 = 1\n");

    EXPECT_EQ(tokens[0].type, TokenType::NAME);
    EXPECT_EQ(tokens[0].text, "caf\xc3\xa9");
}

TEST(PythonTokenizerTest, NonAsciiBytesBeforeQuoteAreNotAPrefix)
{
    auto tokens = tokenize("x = \xc3\xa9'a'\n");

    ASSERT_GE(tokens.size(), 4);
    EXPECT_EQ(tokens[2].type, TokenType::NAME);
    EXPECT_EQ(tokens[2].text, "\xc3\xa9");
    EXPECT_EQ(tokens[3].type, TokenType::STRING);
    EXPECT_EQ(tokens[3].text, "'a'");
}

TEST(PythonTokenizerTest, FailuresThrow)
{
    EXPECT_THROW(tokenize("x = (1,\n"), TokenizeError);          // Open bracket at EOF
    EXPECT_THROW(tokenize("x = 1)\n"), TokenizeError);           // Unmatched close
    EXPECT_THROW(tokenize("x = 'abc\n"), TokenizeError);         // Unterminated string
    EXPECT_THROW(tokenize("s = \"\"\"abc\n"), TokenizeError);    // EOF in triple quote
    EXPECT_THROW(tokenize("x = 1 + \\\n"), TokenizeError);       // EOF after continuation
    EXPECT_THROW(tokenize("x = $\n"), TokenizeError);            // Invalid character
    EXPECT_THROW(tokenize("if x:\n    a\n  b\n"), TokenizeError); // Inconsistent dedent
}

TEST(PythonTokenizerTest, ErrorCarriesRow)
{
    try {
        tokenize("a = 1\nb = 'oops\n");
        FAIL() << "expected TokenizeError";
    } catch (const TokenizeError& e) {
        EXPECT_EQ(e.row(), 2);
    }
}

TEST(PythonTokenizerTest, LoneFragmentsTokenize)
{
    // A single indented line still tokenizes on its own
    EXPECT_NO_THROW(tokenize("    return value\n"));
    EXPECT_NO_THROW(tokenize(""));
}

TEST(PythonTokenizerTest, AtomTypes)
{
    EXPECT_TRUE(is_atom(TokenType::NAME));
    EXPECT_TRUE(is_atom(TokenType::NUMBER));
    EXPECT_TRUE(is_atom(TokenType::STRING));
    EXPECT_FALSE(is_atom(TokenType::OP));
    EXPECT_FALSE(is_atom(TokenType::INDENT));
    EXPECT_EQ(token_type_name(TokenType::DEDENT), "DEDENT");
}

} // namespace unflake
