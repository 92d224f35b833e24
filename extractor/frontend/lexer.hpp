#pragma once

#include "token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mex::frontend
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        SourceSpan span;
    };

    // Tokenises the indentation-sensitive scripting grammar. Newlines inside
    // brackets are joined, comments are dropped and block structure is
    // reported through Indent/Dedent tokens.
    class Lexer
    {
    public:
        explicit Lexer(std::string_view source, std::string_view fileName = {});

        [[nodiscard]] const std::vector<Token>& tokens() const noexcept;
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

        void lex();

    private:
        void pushToken(TokenKind kind, std::size_t startIndex, SourceLocation start);
        void pushLayoutToken(TokenKind kind);
        void lexIndentation();
        void lexIdentifierOrKeyword();
        void lexNumber();
        void lexString(std::size_t startIndex, SourceLocation start);
        void lexOperator();
        void emitSingle(TokenKind kind);
        void skipComment();
        void reportError(std::string_view code, std::string_view message, SourceLocation start);
        [[nodiscard]] bool isStringPrefix(std::size_t length) const;
        bool match(char expected);
        char peek() const;
        char peekAt(std::size_t offset) const;
        char advance();
        bool isAtEnd() const;

    private:
        std::string_view m_source;
        std::string_view m_fileName;
        std::vector<Token> m_tokens;
        std::vector<Diagnostic> m_diagnostics;
        std::vector<std::size_t> m_indentStack;
        std::size_t m_current{0};
        std::size_t m_nesting{0};
        bool m_atLineStart{true};
        SourceLocation m_location{};
    };
} // namespace mex::frontend
