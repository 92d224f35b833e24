#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace mex::frontend
{
    enum class TokenKind : std::uint16_t
    {
        EndOfFile,
        Identifier,
        NumberLiteral,
        StringLiteral,

        // Layout
        Newline,
        Indent,
        Dedent,

        // Keywords the syntax tree cares about; everything else lexes as an identifier.
        KeywordDef,
        KeywordClass,
        KeywordAsync,
        KeywordFrom,
        KeywordImport,
        KeywordAs,
        KeywordReturn,
        KeywordLambda,

        // Punctuation
        LeftParen,
        RightParen,
        LeftBracket,
        RightBracket,
        LeftBrace,
        RightBrace,
        Comma,
        Colon,
        Semicolon,
        Dot,
        At,
        Arrow,
        Equals,
        Asterisk,
        DoubleAsterisk,
        Operator
    };

    struct SourceLocation
    {
        std::uint32_t line{1};
        std::uint32_t column{1};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };

    struct Token
    {
        TokenKind kind{TokenKind::EndOfFile};
        SourceSpan span{};
        std::size_t offset{0};
        std::size_t length{0};
        std::string text{};
    };

    [[nodiscard]] std::string_view toString(TokenKind kind);
} // namespace mex::frontend
