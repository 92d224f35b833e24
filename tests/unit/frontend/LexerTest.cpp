#include <gtest/gtest.h>

#include "lexer.hpp"

#include <vector>

namespace mex::frontend
{
namespace
{
    std::vector<TokenKind> kindsOf(const std::vector<Token>& tokens)
    {
        std::vector<TokenKind> kinds;
        kinds.reserve(tokens.size());
        for (const auto& token : tokens)
        {
            kinds.push_back(token.kind);
        }
        return kinds;
    }

    TEST(LexerTest, EmitsBlockStructureForFunctionBody)
    {
        const std::string source = "def register_plugin():\n    return build(a)\n";

        Lexer lexer{source, "test"};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const std::vector<TokenKind> expected{
            TokenKind::KeywordDef,
            TokenKind::Identifier,
            TokenKind::LeftParen,
            TokenKind::RightParen,
            TokenKind::Colon,
            TokenKind::Newline,
            TokenKind::Indent,
            TokenKind::KeywordReturn,
            TokenKind::Identifier,
            TokenKind::LeftParen,
            TokenKind::Identifier,
            TokenKind::RightParen,
            TokenKind::Newline,
            TokenKind::Dedent,
            TokenKind::EndOfFile,
        };
        EXPECT_EQ(kindsOf(lexer.tokens()), expected);
        EXPECT_EQ(lexer.tokens()[1].text, "register_plugin");
    }

    TEST(LexerTest, JoinsLinesInsideBrackets)
    {
        const std::string source = "x = build(\n    1,\n        2)\n";

        Lexer lexer{source, "brackets"};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const std::vector<TokenKind> expected{
            TokenKind::Identifier,
            TokenKind::Equals,
            TokenKind::Identifier,
            TokenKind::LeftParen,
            TokenKind::NumberLiteral,
            TokenKind::Comma,
            TokenKind::NumberLiteral,
            TokenKind::RightParen,
            TokenKind::Newline,
            TokenKind::EndOfFile,
        };
        EXPECT_EQ(kindsOf(lexer.tokens()), expected);
    }

    TEST(LexerTest, KeepsHashInsideStringsAndDropsComments)
    {
        const std::string source = "name = \"a # b\"  # trailing comment\n";

        Lexer lexer{source, "comments"};
        lexer.lex();

        const auto& tokens = lexer.tokens();
        ASSERT_EQ(tokens.size(), 5u);
        EXPECT_EQ(tokens[2].kind, TokenKind::StringLiteral);
        EXPECT_EQ(tokens[2].text, "\"a # b\"");
        EXPECT_EQ(tokens[3].kind, TokenKind::Newline);
    }

    TEST(LexerTest, RecognizesPrefixedAndTripleQuotedStrings)
    {
        const std::string source = "a = r'raw\\d'\nb = \"\"\"first\nsecond\"\"\"\n";

        Lexer lexer{source, "strings"};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const auto& tokens = lexer.tokens();
        ASSERT_GE(tokens.size(), 7u);
        EXPECT_EQ(tokens[2].kind, TokenKind::StringLiteral);
        EXPECT_EQ(tokens[2].text, "r'raw\\d'");
        EXPECT_EQ(tokens[6].kind, TokenKind::StringLiteral);
        EXPECT_EQ(tokens[6].text, "\"\"\"first\nsecond\"\"\"");
        EXPECT_EQ(tokens[6].span.begin.line, 2u);
    }

    TEST(LexerTest, RecognizesDecoratorAndArrowPunctuation)
    {
        const std::string source = "@step(priority=1)\ndef f(*args, **kwargs) -> int: pass\n";

        Lexer lexer{source, "punctuation"};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const auto& tokens = lexer.tokens();
        EXPECT_EQ(tokens[0].kind, TokenKind::At);
        EXPECT_EQ(tokens[4].kind, TokenKind::Equals);

        const auto hasKind = [&tokens](TokenKind kind) {
            for (const auto& token : tokens)
            {
                if (token.kind == kind)
                {
                    return true;
                }
            }
            return false;
        };
        EXPECT_TRUE(hasKind(TokenKind::Asterisk));
        EXPECT_TRUE(hasKind(TokenKind::DoubleAsterisk));
        EXPECT_TRUE(hasKind(TokenKind::Arrow));
    }

    TEST(LexerTest, SkipsBlankAndCommentOnlyLines)
    {
        const std::string source = "class A:\n\n    # note\n    x = 1\n";

        Lexer lexer{source, "blank"};
        lexer.lex();

        ASSERT_TRUE(lexer.diagnostics().empty());
        const std::vector<TokenKind> expected{
            TokenKind::KeywordClass,
            TokenKind::Identifier,
            TokenKind::Colon,
            TokenKind::Newline,
            TokenKind::Indent,
            TokenKind::Identifier,
            TokenKind::Equals,
            TokenKind::NumberLiteral,
            TokenKind::Newline,
            TokenKind::Dedent,
            TokenKind::EndOfFile,
        };
        EXPECT_EQ(kindsOf(lexer.tokens()), expected);
    }

    TEST(LexerTest, ReportsUnterminatedString)
    {
        const std::string source = "x = \"abc\ny = 1\n";

        Lexer lexer{source, "unterminated"};
        lexer.lex();

        ASSERT_EQ(lexer.diagnostics().size(), 1u);
        EXPECT_EQ(lexer.diagnostics().front().code, "MEX-E2001");
        EXPECT_EQ(lexer.diagnostics().front().message, "unterminated: Unterminated string literal.");
    }

    TEST(LexerTest, ReportsInconsistentDedent)
    {
        const std::string source = "if x:\n        a = 1\n    b = 2\n";

        Lexer lexer{source, "dedent"};
        lexer.lex();

        ASSERT_EQ(lexer.diagnostics().size(), 1u);
        EXPECT_EQ(lexer.diagnostics().front().code, "MEX-E2002");
    }

    TEST(LexerTest, ReportsUnexpectedCharacter)
    {
        const std::string source = "x = $\n";

        Lexer lexer{source};
        lexer.lex();

        ASSERT_EQ(lexer.diagnostics().size(), 1u);
        EXPECT_EQ(lexer.diagnostics().front().code, "MEX-E2000");
        EXPECT_EQ(lexer.tokens().back().kind, TokenKind::EndOfFile);
    }
} // namespace
} // namespace mex::frontend
