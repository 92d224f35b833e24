#include "parser.hpp"

#include <utility>

namespace
{
    using mex::frontend::TokenKind;

    bool isOpening(TokenKind kind)
    {
        return kind == TokenKind::LeftParen || kind == TokenKind::LeftBracket || kind == TokenKind::LeftBrace;
    }

    bool isClosing(TokenKind kind)
    {
        return kind == TokenKind::RightParen || kind == TokenKind::RightBracket || kind == TokenKind::RightBrace;
    }

    bool isLayout(TokenKind kind)
    {
        return kind == TokenKind::Newline || kind == TokenKind::Indent || kind == TokenKind::Dedent
            || kind == TokenKind::EndOfFile;
    }
} // namespace

namespace mex::frontend
{
    Parser::Parser(const std::vector<Token>& tokens, std::string_view source)
        : m_tokens(tokens)
        , m_source(source)
    {
    }

    SyntaxTree Parser::parse()
    {
        m_current = 0;
        m_diagnostics.clear();

        SyntaxTree tree{};
        if (m_tokens.empty())
        {
            return tree;
        }

        parseBlock(tree.calls, tree.definitions, true);
        return tree;
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[m_current];
    }

    const Token& Parser::previous() const
    {
        return m_tokens[m_current == 0 ? 0 : m_current - 1];
    }

    const Token& Parser::advance()
    {
        if (!isAtEnd())
        {
            ++m_current;
        }

        const std::size_t index = (m_current == 0) ? 0 : (m_current - 1);
        return m_tokens[index];
    }

    const Token& Parser::lookAhead(std::size_t offset) const
    {
        const std::size_t index = m_current + offset;
        if (index >= m_tokens.size())
        {
            return m_tokens.back();
        }
        return m_tokens[index];
    }

    bool Parser::isAtEnd() const
    {
        return peek().kind == TokenKind::EndOfFile;
    }

    bool Parser::check(TokenKind kind) const
    {
        if (isAtEnd()) return false;
        return peek().kind == kind;
    }

    bool Parser::match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    void Parser::report(std::string_view code, std::string_view message, const SourceSpan& span)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }

    void Parser::parseBlock(std::vector<CallExpression>& calls, std::vector<Definition>& definitions, bool topLevel)
    {
        std::vector<Decorator> pendingDecorators;

        while (!isAtEnd())
        {
            if (check(TokenKind::Dedent))
            {
                advance();
                if (!topLevel)
                {
                    return;
                }
                continue;
            }

            if (match(TokenKind::Newline))
            {
                continue;
            }

            if (match(TokenKind::Indent))
            {
                // Body of a compound statement (if/for/with/try): same scope.
                parseBlock(calls, definitions, false);
                continue;
            }

            if (check(TokenKind::At))
            {
                pendingDecorators.emplace_back(parseDecorator());
                continue;
            }

            if (check(TokenKind::KeywordAsync) && lookAhead(1).kind == TokenKind::KeywordDef)
            {
                advance();
            }

            if (check(TokenKind::KeywordDef) || check(TokenKind::KeywordClass))
            {
                definitions.emplace_back(parseDefinition(std::move(pendingDecorators)));
                pendingDecorators.clear();
                continue;
            }

            if (!pendingDecorators.empty())
            {
                report("MEX-E2102", "Decorator must precede a function or class definition.", pendingDecorators.back().span);
                pendingDecorators.clear();
            }

            parseStatement(calls);
        }
    }

    Decorator Parser::parseDecorator()
    {
        const Token& at = advance();

        Decorator decorator;
        decorator.beginOffset = at.offset;
        decorator.span.begin = at.span.begin;

        while (!isAtEnd() && !check(TokenKind::Newline))
        {
            advance();
        }

        const Token& last = previous();
        decorator.endOffset = endOffsetOf(last);
        decorator.span.end = last.span.end;
        decorator.text = std::string{m_source.substr(decorator.beginOffset, decorator.endOffset - decorator.beginOffset)};

        match(TokenKind::Newline);
        return decorator;
    }

    Definition Parser::parseDefinition(std::vector<Decorator> decorators)
    {
        Definition definition;
        definition.decorators = std::move(decorators);

        const Token& keyword = advance();
        definition.kind = keyword.kind == TokenKind::KeywordClass ? DefinitionKind::Class : DefinitionKind::Function;
        if (definition.decorators.empty())
        {
            definition.beginOffset = keyword.offset;
            definition.span.begin = keyword.span.begin;
        }
        else
        {
            definition.beginOffset = definition.decorators.front().beginOffset;
            definition.span.begin = definition.decorators.front().span.begin;
        }

        if (!check(TokenKind::Identifier))
        {
            report("MEX-E2103", "Expected a name after '" + keyword.text + "'.", peek().span);
            while (!isAtEnd() && !check(TokenKind::Newline))
            {
                advance();
            }
            match(TokenKind::Newline);

            const Token& last = lastSignificantToken();
            definition.endOffset = endOffsetOf(last);
            definition.span.end = last.span.end;
            return definition;
        }

        definition.name = advance().text;

        if (check(TokenKind::LeftParen))
        {
            definition.signatureBeginOffset = peek().offset;
            skipBalanced();
            definition.signatureEndOffset = endOffsetOf(previous());
        }
        else if (definition.kind == DefinitionKind::Function)
        {
            report("MEX-E2104", "Expected '(' after function name '" + definition.name + "'.", peek().span);
        }

        if (match(TokenKind::Arrow))
        {
            const std::size_t annotationBegin = peek().offset;
            while (!isAtEnd() && !check(TokenKind::Colon) && !check(TokenKind::Newline))
            {
                if (isOpening(peek().kind))
                {
                    skipBalanced();
                }
                else
                {
                    advance();
                }
            }

            const std::size_t annotationEnd = endOffsetOf(previous());
            if (annotationEnd > annotationBegin)
            {
                definition.returnAnnotation = std::string{m_source.substr(annotationBegin, annotationEnd - annotationBegin)};
            }
        }

        if (!match(TokenKind::Colon))
        {
            report("MEX-E2105", "Expected ':' to open the body of '" + definition.name + "'.", peek().span);
            while (!isAtEnd() && !check(TokenKind::Newline))
            {
                advance();
            }
            match(TokenKind::Newline);
        }
        else
        {
            definition.bodyBeginOffset = endOffsetOf(previous());
            if (!match(TokenKind::Newline))
            {
                parseStatement(definition.calls);
            }
            else if (match(TokenKind::Indent))
            {
                parseBlock(definition.calls, definition.definitions, false);
            }
            else
            {
                report("MEX-E2106", "Expected an indented block after '" + definition.name + "'.", peek().span);
            }
        }

        const Token& last = lastSignificantToken();
        definition.endOffset = endOffsetOf(last);
        definition.span.end = last.span.end;
        return definition;
    }

    void Parser::parseStatement(std::vector<CallExpression>& calls)
    {
        while (!isAtEnd() && !check(TokenKind::Newline))
        {
            if (check(TokenKind::Indent) || check(TokenKind::Dedent))
            {
                return;
            }

            if (parseCallChain(calls))
            {
                continue;
            }

            advance();
        }

        match(TokenKind::Newline);
    }

    bool Parser::parseCallChain(std::vector<CallExpression>& calls)
    {
        if (!check(TokenKind::Identifier))
        {
            return false;
        }

        const bool isAttributeOfExpression = m_current > 0 && previous().kind == TokenKind::Dot;
        const Token& start = peek();

        std::string callee = advance().text;
        while (check(TokenKind::Dot) && lookAhead(1).kind == TokenKind::Identifier)
        {
            advance();
            callee.push_back('.');
            callee += advance().text;
        }

        if (!check(TokenKind::LeftParen))
        {
            return true;
        }

        if (isAttributeOfExpression)
        {
            callee.insert(callee.begin(), '.');
        }

        calls.emplace_back(parseCall(start, std::move(callee)));
        return true;
    }

    CallExpression Parser::parseCall(const Token& calleeStart, std::string callee)
    {
        CallExpression call;
        call.callee = std::move(callee);
        call.beginOffset = calleeStart.offset;
        call.span.begin = calleeStart.span.begin;

        advance(); // consume '('
        std::size_t depth = 1;

        while (!isAtEnd())
        {
            if (parseCallChain(call.nestedCalls))
            {
                continue;
            }

            const TokenKind kind = peek().kind;
            if (isOpening(kind))
            {
                ++depth;
            }
            else if (isClosing(kind))
            {
                --depth;
                if (depth == 0)
                {
                    const Token& close = advance();
                    call.endOffset = endOffsetOf(close);
                    call.span.end = close.span.end;
                    return call;
                }
            }

            advance();
        }

        call.isTerminated = false;
        call.endOffset = m_source.size();
        call.span.end = peek().span.end;
        report("MEX-E2107", "Unterminated call to '" + call.callee + "'.", call.span);
        return call;
    }

    void Parser::skipBalanced()
    {
        const SourceSpan openSpan = peek().span;
        std::size_t depth = 0;

        do
        {
            const TokenKind kind = peek().kind;
            if (isOpening(kind))
            {
                ++depth;
            }
            else if (isClosing(kind) && depth > 0)
            {
                --depth;
            }
            advance();
        } while (depth > 0 && !isAtEnd());

        if (depth > 0)
        {
            report("MEX-E2108", "Unbalanced brackets.", openSpan);
        }
    }

    std::size_t Parser::endOffsetOf(const Token& token) const
    {
        return token.offset + token.length;
    }

    const Token& Parser::lastSignificantToken() const
    {
        std::size_t index = m_current;
        while (index > 0 && isLayout(m_tokens[index - 1].kind))
        {
            --index;
        }
        return m_tokens[index == 0 ? 0 : index - 1];
    }
} // namespace mex::frontend
