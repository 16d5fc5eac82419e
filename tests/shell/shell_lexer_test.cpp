#include <gtest/gtest.h>

#include "shell/shell_lexer.hpp"

namespace sandcell::shell {
namespace {

std::vector<std::string> Texts(const ShellLexResult& result) {
    std::vector<std::string> texts;
    for (const auto& token : result.tokens) {
        texts.push_back(token.text);
    }
    return texts;
}

TEST(ShellLexerTest, SplitsWordsAndOperators) {
    const auto result = ShellLexer("ls -la | grep foo && echo done").Tokenize();
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(Texts(result), (std::vector<std::string>{"ls", "-la", "|", "grep", "foo", "&&", "echo", "done"}));
    EXPECT_EQ(result.tokens[2].kind, ShellTokenKind::kOperator);
    EXPECT_EQ(result.tokens[3].kind, ShellTokenKind::kWord);
}

TEST(ShellLexerTest, RemovesQuotesButKeepsRawSpelling) {
    const auto result = ShellLexer("echo 'a b' \"c \\\"d\\\"\" e\\ f").Tokenize();
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.tokens.size(), 4u);
    EXPECT_EQ(result.tokens[1].text, "a b");
    EXPECT_EQ(result.tokens[1].raw, "'a b'");
    EXPECT_TRUE(result.tokens[1].quoted);
    EXPECT_EQ(result.tokens[2].text, "c \"d\"");
    EXPECT_EQ(result.tokens[3].text, "e f");
    EXPECT_FALSE(result.tokens[3].quoted);
}

TEST(ShellLexerTest, RecognizesRedirections) {
    const auto result = ShellLexer("cat a 2>&1 > out.txt").Tokenize();
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(Texts(result), (std::vector<std::string>{"cat", "a", "2>&1", ">", "out.txt"}));
    EXPECT_TRUE(ShellLexer::IsRedirection("2>&1"));
    EXPECT_TRUE(ShellLexer::IsRedirection(">>"));
    EXPECT_FALSE(ShellLexer::IsRedirection("&&"));
}

TEST(ShellLexerTest, KeepsSubstitutionsInsideWords) {
    auto result = ShellLexer("echo $(rm -rf /)").Tokenize();
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.tokens.size(), 2u);
    EXPECT_EQ(result.tokens[1].substitution, "$(");

    result = ShellLexer("echo \"`whoami`\"").Tokenize();
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.tokens.size(), 2u);
    EXPECT_EQ(result.tokens[1].substitution, "`");
}

TEST(ShellLexerTest, NewlineActsAsSeparatorAndCommentsAreDropped) {
    const auto result = ShellLexer("ls # list\npwd").Tokenize();
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(Texts(result), (std::vector<std::string>{"ls", ";", "pwd"}));
}

TEST(ShellLexerTest, ReportsUnterminatedQuotes) {
    EXPECT_FALSE(ShellLexer("echo 'abc").Tokenize().ok);
    EXPECT_FALSE(ShellLexer("echo \"abc").Tokenize().ok);
    EXPECT_FALSE(ShellLexer("echo $(ls").Tokenize().ok);
}

}  // namespace
}  // namespace sandcell::shell
