/**
 * @file test_script_parser.cpp
 * @brief Tokenizer and syntax tree construction
 */

#include "sentrybox/analyzers/script_parser.hpp"

#include <gtest/gtest.h>

using namespace sentrybox::analyzers;

namespace {

template <typename T>
int CountNodes(const Node& root) {
    int count = 0;
    ScriptParser::Walk(root, [&](const Node& node, int) {
        if (std::holds_alternative<T>(node.data)) {
            ++count;
        }
    });
    return count;
}

} // namespace

TEST(TokenizerTest, ProducesIndentAndDedent) {
    const std::string source = "if x:\n    y = 1\nz = 2\n";
    Tokenizer tokenizer(source);
    auto tokens = tokenizer.Tokenize();
    ASSERT_TRUE(tokens.ok()) << tokens.error().message;

    int indents = 0;
    int dedents = 0;
    for (const auto& t : tokens.value()) {
        if (t.type == TokenType::INDENT) ++indents;
        if (t.type == TokenType::DEDENT) ++dedents;
    }
    EXPECT_EQ(indents, 1);
    EXPECT_EQ(dedents, 1);
    EXPECT_EQ(tokens.value().back().type, TokenType::END_OF_INPUT);
}

TEST(TokenizerTest, StringTokensKeepPrefixAndBody) {
    const std::string source = "s = rb'abc'\n";
    Tokenizer tokenizer(source);
    auto tokens = tokenizer.Tokenize();
    ASSERT_TRUE(tokens.ok());

    const Token* str = nullptr;
    for (const auto& t : tokens.value()) {
        if (t.type == TokenType::STRING) str = &t;
    }
    ASSERT_NE(str, nullptr);
    EXPECT_EQ(str->text, "abc");
    EXPECT_EQ(str->prefix, "rb");
    EXPECT_EQ(str->line, 1);
}

TEST(TokenizerTest, UnterminatedStringFails) {
    const std::string source = "x = 'abc\n";
    Tokenizer tokenizer(source);
    auto tokens = tokenizer.Tokenize();
    ASSERT_FALSE(tokens.ok());
    EXPECT_EQ(tokens.error().code, sentrybox::utils::ErrorCode::PARSE_ERROR);
}

TEST(ScriptParserTest, ParsesImportsCallsAndDefinitions) {
    const std::string source =
        "import os.path as p\n"
        "from math import sqrt\n"
        "\n"
        "class Strategy:\n"
        "    def run(self, prices, window=5):\n"
        "        total = 0\n"
        "        for x in prices[-window:]:\n"
        "            total += sqrt(x)\n"
        "        return total\n"
        "\n"
        "print(Strategy().run([1, 4, 9]))\n";

    auto parsed = ScriptParser::Parse(source);
    ASSERT_TRUE(parsed.ok()) << parsed.error().message;
    const Node& root = *parsed.value().module;

    ASSERT_TRUE(std::holds_alternative<ModuleNode>(root.data));
    EXPECT_EQ(std::get<ModuleNode>(root.data).body.size(), 4u);
    EXPECT_EQ(CountNodes<ImportNode>(root), 1);
    EXPECT_EQ(CountNodes<ImportFromNode>(root), 1);
    EXPECT_EQ(CountNodes<ClassDefNode>(root), 1);
    EXPECT_EQ(CountNodes<FunctionDefNode>(root), 1);
    EXPECT_GE(CountNodes<CallNode>(root), 3);

    const auto& import = std::get<ImportNode>(std::get<ModuleNode>(root.data).body[0]->data);
    ASSERT_EQ(import.names.size(), 1u);
    EXPECT_EQ(import.names[0].name, "os.path");
    EXPECT_EQ(import.names[0].asname, "p");
}

TEST(ScriptParserTest, NodesCarryLineNumbers) {
    auto parsed = ScriptParser::Parse("x = 1\n\ny = foo(x)\n");
    ASSERT_TRUE(parsed.ok());
    int call_line = 0;
    ScriptParser::Walk(*parsed.value().module, [&](const Node& node, int) {
        if (std::holds_alternative<CallNode>(node.data)) call_line = node.line;
    });
    EXPECT_EQ(call_line, 3);
}

TEST(ScriptParserTest, RejectsUnbalancedBrackets) {
    auto parsed = ScriptParser::Parse("values = [1, 2\n");
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, sentrybox::utils::ErrorCode::PARSE_ERROR);
}

TEST(ScriptParserTest, RejectsExcessiveNesting) {
    std::string source = "x = ";
    for (int i = 0; i < ScriptParser::kMaxNestingDepth + 10; ++i) source += "(";
    source += "1";
    for (int i = 0; i < ScriptParser::kMaxNestingDepth + 10; ++i) source += ")";
    source += "\n";

    auto parsed = ScriptParser::Parse(source);
    EXPECT_FALSE(parsed.ok());
}
