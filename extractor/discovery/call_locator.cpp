#include "call_locator.hpp"
#include "plugin_kind.hpp"
#include "source_text.hpp"

#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"
#include "../frontend/syntax_query.hpp"

#include <utility>

namespace mex::discovery
{
    namespace
    {
        Diagnostic noRegistrations(const RegistrationConvention& convention)
        {
            return makeError("MEX-E2501",
                ErrorKind::NotFound,
                "No registrations found in '" + convention.functionName + "'.");
        }

        Diagnostic missingFunction(const RegistrationConvention& convention)
        {
            return makeError("MEX-E2500",
                ErrorKind::NotFound,
                "Registration function '" + convention.functionName + "' not found.");
        }

        Diagnostic syntaxError(const frontend::Diagnostic& diagnostic)
        {
            return makeError(diagnostic.code,
                ErrorKind::InvalidSyntax,
                diagnostic.message + " (line " + std::to_string(diagnostic.span.begin.line) + ")");
        }

        bool isSpace(char ch)
        {
            return ch == ' ' || ch == '\t';
        }

        bool startsIdentifier(std::string_view text, std::size_t index)
        {
            if (index == 0)
            {
                return true;
            }
            const char before = text[index - 1];
            return !isIdentifierChar(before) && before != '.';
        }

        // Index just past the identifier-bounded `word` at `index`, skipping
        // spaces, when it is followed by `next`.
        std::optional<std::size_t> matchWordFollowedBy(std::string_view text, std::size_t index, std::string_view word, char next)
        {
            if (text.compare(index, word.size(), word) != 0 || !startsIdentifier(text, index))
            {
                return std::nullopt;
            }

            std::size_t cursor = index + word.size();
            if (cursor < text.size() && isIdentifierChar(text[cursor]))
            {
                return std::nullopt;
            }
            while (cursor < text.size() && isSpace(text[cursor]))
            {
                ++cursor;
            }
            if (cursor >= text.size() || text[cursor] != next)
            {
                return std::nullopt;
            }
            return cursor;
        }
    } // namespace

    std::string_view toString(LocatorStrategy strategy)
    {
        switch (strategy)
        {
        case LocatorStrategy::Automatic:
            return "auto";
        case LocatorStrategy::SyntaxTree:
            return "tree";
        case LocatorStrategy::Textual:
            return "text";
        }

        return "unknown";
    }

    std::optional<LocatorStrategy> parseLocatorStrategy(std::string_view text)
    {
        if (text == "auto")
        {
            return LocatorStrategy::Automatic;
        }
        if (text == "tree")
        {
            return LocatorStrategy::SyntaxTree;
        }
        if (text == "text")
        {
            return LocatorStrategy::Textual;
        }
        return std::nullopt;
    }

    SyntaxTreeCallLocator::SyntaxTreeCallLocator(RegistrationConvention convention)
        : m_convention(std::move(convention))
    {
    }

    CallLocatorResult SyntaxTreeCallLocator::locate(std::string_view source) const
    {
        CallLocatorResult result;

        frontend::Lexer lexer{source};
        lexer.lex();
        if (!lexer.diagnostics().empty())
        {
            result.error = syntaxError(lexer.diagnostics().front());
            return result;
        }

        frontend::Parser parser{lexer.tokens(), source};
        const frontend::SyntaxTree tree = parser.parse();

        const frontend::Definition* function
            = frontend::findDefinition(tree, frontend::DefinitionKind::Function, m_convention.functionName);
        if (function == nullptr)
        {
            result.error = parser.diagnostics().empty() ? missingFunction(m_convention) : syntaxError(parser.diagnostics().front());
            return result;
        }

        frontend::CallPattern pattern;
        for (const auto& entry : registrationConstructors())
        {
            pattern.callees.emplace_back(entry.callee);
        }

        for (const frontend::CallExpression* call : frontend::queryCalls(function->calls, pattern))
        {
            if (!call->isTerminated)
            {
                result.calls.clear();
                result.error = makeError("MEX-E2502",
                    ErrorKind::InvalidSyntax,
                    "Unterminated registration call '" + call->callee + "' on line " + std::to_string(call->span.begin.line) + ".");
                return result;
            }

            LocatedCall located;
            located.callee = call->callee;
            located.offset = call->beginOffset;
            located.text = std::string{source.substr(call->beginOffset, call->endOffset - call->beginOffset)};
            result.calls.emplace_back(std::move(located));
        }

        if (!parser.diagnostics().empty())
        {
            result.calls.clear();
            result.error = syntaxError(parser.diagnostics().front());
            return result;
        }

        if (result.calls.empty())
        {
            result.error = noRegistrations(m_convention);
        }
        return result;
    }

    std::string_view SyntaxTreeCallLocator::strategyName() const noexcept
    {
        return "tree";
    }

    TextualCallLocator::TextualCallLocator(RegistrationConvention convention)
        : m_convention(std::move(convention))
    {
    }

    CallLocatorResult TextualCallLocator::locate(std::string_view source) const
    {
        CallLocatorResult result;

        const auto signatureOpen = findFunctionDefinition(source);
        if (!signatureOpen.has_value())
        {
            result.error = missingFunction(m_convention);
            return result;
        }

        const auto signatureClose = findMatchingDelimiter(source, *signatureOpen);
        if (!signatureClose.has_value())
        {
            result.error = makeError("MEX-E2502",
                ErrorKind::InvalidSyntax,
                "Unterminated signature of '" + m_convention.functionName + "'.");
            return result;
        }

        const auto colon = findTopLevel(source.substr(*signatureClose + 1), ':');
        if (!colon.has_value())
        {
            result.error = makeError("MEX-E2502",
                ErrorKind::InvalidSyntax,
                "Missing ':' after the signature of '" + m_convention.functionName + "'.");
            return result;
        }

        const TextRange body = findIndentedBody(source, *signatureClose + 1 + *colon);
        const std::string_view bodyText = source.substr(body.begin, body.end - body.begin);

        const auto listOpen = findListOpening(bodyText);
        if (!listOpen.has_value())
        {
            result.error = noRegistrations(m_convention);
            return result;
        }

        const auto listClose = findMatchingDelimiter(bodyText, *listOpen);
        if (!listClose.has_value())
        {
            result.error = makeError("MEX-E2502",
                ErrorKind::InvalidSyntax,
                "Unterminated '" + m_convention.listKeyword + "' list in '" + m_convention.functionName + "'.");
            return result;
        }

        const auto& constructors = registrationConstructors();
        std::size_t index = *listOpen + 1;
        while (index < *listClose)
        {
            const char ch = bodyText[index];
            if (isQuote(ch))
            {
                const std::size_t next = skipStringLiteral(bodyText, index);
                index = next == std::string_view::npos ? *listClose : next;
                continue;
            }
            if (ch == '#')
            {
                const auto newline = bodyText.find('\n', index);
                index = newline == std::string_view::npos ? *listClose : newline;
                continue;
            }

            bool carved = false;
            for (const auto& entry : constructors)
            {
                const auto paren = matchWordFollowedBy(bodyText, index, entry.callee, '(');
                if (!paren.has_value())
                {
                    continue;
                }

                const auto close = findMatchingDelimiter(bodyText, *paren);
                if (!close.has_value() || *close > *listClose)
                {
                    result.calls.clear();
                    result.error = makeError("MEX-E2502",
                        ErrorKind::InvalidSyntax,
                        "Unterminated registration call '" + std::string{entry.callee} + "'.");
                    return result;
                }

                LocatedCall located;
                located.callee = std::string{entry.callee};
                located.offset = body.begin + index;
                located.text = std::string{bodyText.substr(index, *close + 1 - index)};
                result.calls.emplace_back(std::move(located));

                index = *close + 1;
                carved = true;
                break;
            }

            if (!carved)
            {
                ++index;
            }
        }

        if (result.calls.empty())
        {
            result.error = noRegistrations(m_convention);
        }
        return result;
    }

    std::string_view TextualCallLocator::strategyName() const noexcept
    {
        return "text";
    }

    std::optional<std::size_t> TextualCallLocator::findFunctionDefinition(std::string_view source) const
    {
        std::size_t searchFrom = 0;
        while (true)
        {
            const auto defPosition = source.find("def", searchFrom);
            if (defPosition == std::string_view::npos)
            {
                return std::nullopt;
            }
            searchFrom = defPosition + 3;

            if (!startsIdentifier(source, defPosition) || searchFrom >= source.size() || !isSpace(source[searchFrom]))
            {
                continue;
            }

            std::size_t cursor = searchFrom;
            while (cursor < source.size() && isSpace(source[cursor]))
            {
                ++cursor;
            }

            if (const auto paren = matchWordFollowedBy(source, cursor, m_convention.functionName, '('))
            {
                return paren;
            }
        }
    }

    std::optional<std::size_t> TextualCallLocator::findListOpening(std::string_view body) const
    {
        std::size_t index = 0;
        while (index < body.size())
        {
            const char ch = body[index];
            if (isQuote(ch))
            {
                const std::size_t next = skipStringLiteral(body, index);
                if (next == std::string_view::npos)
                {
                    return std::nullopt;
                }
                index = next;
                continue;
            }
            if (ch == '#')
            {
                const auto newline = body.find('\n', index);
                index = newline == std::string_view::npos ? body.size() : newline;
                continue;
            }

            const auto equals = matchWordFollowedBy(body, index, m_convention.listKeyword, '=');
            if (equals.has_value() && (*equals + 1 >= body.size() || body[*equals + 1] != '='))
            {
                std::size_t cursor = *equals + 1;
                while (cursor < body.size() && (isSpace(body[cursor]) || body[cursor] == '\n' || body[cursor] == '\r'))
                {
                    ++cursor;
                }
                if (cursor < body.size() && body[cursor] == '[')
                {
                    return cursor;
                }
            }

            ++index;
        }

        return std::nullopt;
    }
} // namespace mex::discovery
