#pragma once

#include "lexer.hpp"
#include "syntax_tree.hpp"

#include <string_view>
#include <vector>

namespace mex::frontend
{
    // Builds the definition/call skeleton of a script. Statements that are
    // neither definitions nor decorators are only scanned for call
    // expressions; everything else in them is skipped.
    class Parser
    {
    public:
        Parser(const std::vector<Token>& tokens, std::string_view source);

        [[nodiscard]] SyntaxTree parse();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        const Token& peek() const;
        const Token& previous() const;
        const Token& advance();
        const Token& lookAhead(std::size_t offset) const;
        bool isAtEnd() const;
        bool check(TokenKind kind) const;
        bool match(TokenKind kind);
        void report(std::string_view code, std::string_view message, const SourceSpan& span);

        void parseBlock(std::vector<CallExpression>& calls, std::vector<Definition>& definitions, bool topLevel);
        Decorator parseDecorator();
        Definition parseDefinition(std::vector<Decorator> decorators);
        void parseStatement(std::vector<CallExpression>& calls);
        bool parseCallChain(std::vector<CallExpression>& calls);
        CallExpression parseCall(const Token& calleeStart, std::string callee);
        void skipBalanced();
        [[nodiscard]] std::size_t endOffsetOf(const Token& token) const;
        [[nodiscard]] const Token& lastSignificantToken() const;

    private:
        const std::vector<Token>& m_tokens;
        std::string_view m_source;
        std::size_t m_current{0};
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace mex::frontend
