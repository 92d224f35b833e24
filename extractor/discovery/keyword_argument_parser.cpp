#include "keyword_argument_parser.hpp"
#include "source_text.hpp"

#include <utility>

namespace mex::discovery
{
    namespace
    {
        struct PairState
        {
            std::string key;
            std::string value;
            std::size_t begin{0};
            bool inKey{true};
            bool hasContent{false};
        };

        std::string reduceKey(std::string_view key)
        {
            const std::string_view trimmed = trim(key);
            const auto colon = trimmed.rfind(':');
            if (colon == std::string_view::npos)
            {
                return std::string{trimmed};
            }
            return std::string{trim(trimmed.substr(colon + 1))};
        }

        // Closes the pending pair. Returns an error for shapes that cannot be
        // mapped to a keyword argument.
        std::optional<Diagnostic> finishPair(PairState& state,
            std::size_t end,
            std::vector<RawKeyValue>& arguments,
            bool isLast)
        {
            if (state.inKey)
            {
                const std::string_view pending = trim(state.key);
                if (pending.empty() && !state.hasContent)
                {
                    // Trailing separator or empty argument list.
                    if (!isLast)
                    {
                        return makeError("MEX-E2305", ErrorKind::InvalidSyntax, "Empty argument between separators.");
                    }
                    return std::nullopt;
                }

                if (pending.size() >= 2 && pending.compare(0, 2, "**") == 0)
                {
                    return makeError("MEX-E2304",
                        ErrorKind::UnsupportedConstruct,
                        "Keyword splat '" + std::string{pending} + "' cannot be evaluated statically.");
                }

                return makeError("MEX-E2303",
                    ErrorKind::InvalidSyntax,
                    "Positional argument '" + std::string{pending} + "' is not supported; use keyword arguments.");
            }

            RawKeyValue pair;
            pair.key = reduceKey(state.key);
            pair.value = std::string{trim(state.value)};
            pair.begin = state.begin;
            pair.end = end;

            if (!isIdentifier(pair.key))
            {
                return makeError("MEX-E2306", ErrorKind::InvalidSyntax, "Invalid keyword '" + pair.key + "'.");
            }

            arguments.emplace_back(std::move(pair));
            return std::nullopt;
        }
    } // namespace

    KeywordArgumentParseResult parseKeywordArguments(std::string_view callText)
    {
        KeywordArgumentParseResult result;

        const auto openParen = callText.find('(');
        if (openParen == std::string_view::npos)
        {
            result.error = makeError("MEX-E2300", ErrorKind::InvalidSyntax, "Call text has no opening parenthesis.");
            return result;
        }

        result.argumentBegin = openParen + 1;

        std::size_t parenDepth = 0;
        std::size_t bracketDepth = 0;
        std::size_t braceDepth = 0;

        PairState state;
        state.begin = result.argumentBegin;

        std::size_t index = result.argumentBegin;
        while (index < callText.size())
        {
            const char ch = callText[index];

            if (state.inKey && state.key.empty() && !state.hasContent
                && (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'))
            {
                ++index;
                continue;
            }

            if (isQuote(ch))
            {
                const std::size_t close = skipStringLiteral(callText, index);
                if (close == std::string_view::npos)
                {
                    result.error = makeError("MEX-E2301", ErrorKind::InvalidSyntax, "Unterminated string literal in call arguments.");
                    return result;
                }

                std::string& target = state.inKey ? state.key : state.value;
                target.append(callText.substr(index, close - index));
                state.hasContent = true;
                index = close;
                continue;
            }

            if (ch == '#')
            {
                const auto newline = callText.find('\n', index);
                index = newline == std::string_view::npos ? callText.size() : newline;
                continue;
            }

            const bool atTopLevel = parenDepth == 0 && bracketDepth == 0 && braceDepth == 0;

            if (ch == '=' && state.inKey && atTopLevel)
            {
                state.inKey = false;
                state.hasContent = true;
                ++index;
                continue;
            }

            if (ch == ',' && atTopLevel)
            {
                if (auto error = finishPair(state, index, result.arguments, false))
                {
                    result.error = std::move(error);
                    return result;
                }
                state = PairState{};
                state.begin = index + 1;
                ++index;
                continue;
            }

            if (ch == ')' && parenDepth == 0)
            {
                if (bracketDepth != 0 || braceDepth != 0)
                {
                    result.error = makeError("MEX-E2302", ErrorKind::InvalidSyntax, "Unbalanced brackets in call arguments.");
                    return result;
                }

                result.argumentEnd = index;
                if (auto error = finishPair(state, index, result.arguments, true))
                {
                    result.error = std::move(error);
                }
                return result;
            }

            switch (ch)
            {
            case '(':
                ++parenDepth;
                break;
            case ')':
                --parenDepth;
                break;
            case '[':
                ++bracketDepth;
                break;
            case ']':
                if (bracketDepth > 0)
                {
                    --bracketDepth;
                }
                break;
            case '{':
                ++braceDepth;
                break;
            case '}':
                if (braceDepth > 0)
                {
                    --braceDepth;
                }
                break;
            default:
                break;
            }

            std::string& target = state.inKey ? state.key : state.value;
            target.push_back(ch);
            state.hasContent = true;
            ++index;
        }

        result.error = makeError("MEX-E2302", ErrorKind::InvalidSyntax, "Call text has no closing parenthesis.");
        return result;
    }
} // namespace mex::discovery
