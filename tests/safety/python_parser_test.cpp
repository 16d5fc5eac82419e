#include <gtest/gtest.h>

#include "safety/python_parser.hpp"
#include "safety/string_folding.hpp"

namespace sandcell::safety {
namespace {

TEST(PythonParserTest, ParsesImportStatements) {
    const auto result = PythonParser::Parse("import os.path as p, json\nfrom ..pkg import a, b\n");
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.statements.size(), 2u);

    const auto& first = result.statements[0];
    EXPECT_EQ(first.kind, StatementKind::kImport);
    ASSERT_EQ(first.names.size(), 2u);
    EXPECT_EQ(first.names[0].name, "os.path");
    EXPECT_EQ(first.names[0].asname, "p");
    EXPECT_EQ(first.names[1].name, "json");

    const auto& second = result.statements[1];
    EXPECT_EQ(second.kind, StatementKind::kImportFrom);
    EXPECT_EQ(second.level, 2);
    EXPECT_EQ(second.module, "pkg");
    EXPECT_EQ(second.line, 2);
}

TEST(PythonParserTest, ParsesCallsWithAttributesAndKeywords) {
    const auto result = PythonParser::Parse("result = math.sqrt(16, key=value)\n");
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.statements.size(), 1u);
    const auto& statement = result.statements[0];
    EXPECT_EQ(statement.kind, StatementKind::kExpression);
    EXPECT_EQ(statement.target_count, 1u);
    ASSERT_EQ(statement.expressions.size(), 2u);

    const auto* call = statement.expressions[1].get();
    ASSERT_NE(call, nullptr);
    ASSERT_EQ(call->kind, NodeKind::kCall);
    EXPECT_EQ(DescribeNode(*call->Child(0)), "math.sqrt");
    EXPECT_EQ(CalleeName(*call), "sqrt");
    ASSERT_EQ(call->children.size(), 3u);
    EXPECT_EQ(call->Child(2)->kind, NodeKind::kKeyword);
    EXPECT_EQ(call->Child(2)->text, "key");
}

TEST(PythonParserTest, ParsesCompoundHeaders) {
    const auto result = PythonParser::Parse(
        "def f(a, b=eval):\n"
        "    return a\n"
        "for i in range(3):\n"
        "    print(i)\n");
    ASSERT_TRUE(result.ok);
    bool saw_range = false;
    for (const auto& statement : result.statements) {
        for (const auto& expression : statement.expressions) {
            if (expression && expression->kind == NodeKind::kCall && CalleeName(*expression) == "range") {
                saw_range = true;
            }
        }
    }
    EXPECT_TRUE(saw_range);
}

TEST(PythonParserTest, ParsesSingleExpression) {
    auto node = PythonParser::ParseExpression("'ev' + 'al'", 3);
    ASSERT_NE(node, nullptr);
    EXPECT_EQ(node->kind, NodeKind::kBinOp);
    EXPECT_EQ(node->line, 3);
    EXPECT_EQ(PythonParser::ParseExpression("import os", 1), nullptr);
}

TEST(PythonParserTest, PropagatesLexerErrors) {
    const auto result = PythonParser::Parse("x = 'open\n");
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error_line, 1);
}

TEST(PythonParserTest, DeepNestingLeavesLineUnparsed) {
    const std::string parens = "x = " + std::string(100000, '(') + "1" + std::string(100000, ')');
    std::string chain = "y = 1";
    for (int i = 0; i < 100000; ++i) {
        chain += " + 1";
    }
    std::string attributes = "z = a";
    for (int i = 0; i < 100000; ++i) {
        attributes += ".b";
    }
    const std::string unary = "w = " + std::string(100000, '-') + "1";

    const auto result = PythonParser::Parse(parens + "\n" + chain + "\n" + attributes + "\n" + unary + "\nv = 1\n");
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.statements.size(), 5u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(result.statements[i].kind, StatementKind::kUnparsed) << i;
        EXPECT_FALSE(result.statements[i].tokens.empty());
    }
    EXPECT_EQ(result.statements[4].kind, StatementKind::kExpression);
}

TEST(PythonParserTest, ModerateNestingStillParses) {
    const std::string source = "x = " + std::string(50, '(') + "f(1)" + std::string(50, ')');
    const auto result = PythonParser::Parse(source);
    ASSERT_EQ(result.statements.size(), 1u);
    EXPECT_EQ(result.statements[0].kind, StatementKind::kExpression);
}

TEST(StringFoldingTest, FoldsLiteralExpressions) {
    auto concat = PythonParser::ParseExpression("'su' + 'bprocess'", 1);
    ASSERT_NE(concat, nullptr);
    EXPECT_EQ(FoldString(*concat).value_or(""), "subprocess");

    auto repeat = PythonParser::ParseExpression("'ab' * 3", 1);
    ASSERT_NE(repeat, nullptr);
    EXPECT_EQ(FoldString(*repeat).value_or(""), "ababab");

    auto sliced = PythonParser::ParseExpression("'lave'[::-1]", 1);
    ASSERT_NE(sliced, nullptr);
    EXPECT_EQ(FoldString(*sliced).value_or(""), "eval");

    auto joined = PythonParser::ParseExpression("''.join(['o', 's'])", 1);
    ASSERT_NE(joined, nullptr);
    EXPECT_EQ(FoldString(*joined).value_or(""), "os");
}

TEST(StringFoldingTest, RepeatCountsAreBounded) {
    auto wrapping = PythonParser::ParseExpression("'abcd' * 4611686018427387904", 1);
    ASSERT_NE(wrapping, nullptr);
    EXPECT_FALSE(FoldString(*wrapping).has_value());

    auto huge_empty = PythonParser::ParseExpression("'' * 1000000000000000000", 1);
    ASSERT_NE(huge_empty, nullptr);
    EXPECT_EQ(FoldString(*huge_empty).value_or("x"), "");

    auto negative = PythonParser::ParseExpression("'ab' * -3", 1);
    ASSERT_NE(negative, nullptr);
    EXPECT_EQ(FoldString(*negative).value_or("x"), "");

    auto reversed = PythonParser::ParseExpression("2 * 'os'", 1);
    ASSERT_NE(reversed, nullptr);
    EXPECT_EQ(FoldString(*reversed).value_or(""), "osos");
}

TEST(StringFoldingTest, FoldsDecoders) {
    auto decoded = PythonParser::ParseExpression("base64.b64decode('ZXZhbA==')", 1);
    ASSERT_NE(decoded, nullptr);
    EXPECT_TRUE(IsDecodeCall(*decoded));
    EXPECT_EQ(FoldString(*decoded).value_or(""), "eval");

    auto hex = PythonParser::ParseExpression("bytes.fromhex('6f73')", 1);
    ASSERT_NE(hex, nullptr);
    EXPECT_EQ(FoldString(*hex).value_or(""), "os");
}

TEST(StringFoldingTest, LeavesRuntimeValuesAlone) {
    auto node = PythonParser::ParseExpression("prefix + 'al'", 1);
    ASSERT_NE(node, nullptr);
    EXPECT_FALSE(FoldString(*node).has_value());
}

TEST(StringFoldingTest, CountsCharacterCodes) {
    auto node = PythonParser::ParseExpression("chr(101) + chr(118) + 'al'", 1);
    ASSERT_NE(node, nullptr);
    EXPECT_GE(CountCharacterCodes(*node), 2);
    EXPECT_EQ(FoldString(*node).value_or(""), "eval");
}

}  // namespace
}  // namespace sandcell::safety
