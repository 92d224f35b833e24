#include "source_text.hpp"

#include <fstream>
#include <sstream>

namespace mex::discovery
{
    namespace
    {
        bool isOpening(char ch)
        {
            return ch == '(' || ch == '[' || ch == '{';
        }

        bool isClosing(char ch)
        {
            return ch == ')' || ch == ']' || ch == '}';
        }

        std::size_t skipComment(std::string_view text, std::size_t index)
        {
            const std::size_t newline = text.find('\n', index);
            return newline == std::string_view::npos ? text.size() : newline;
        }

        std::size_t lineEnd(std::string_view source, std::size_t index)
        {
            const std::size_t newline = source.find('\n', index);
            return newline == std::string_view::npos ? source.size() : newline;
        }

        bool isBlankOrComment(std::string_view line)
        {
            const std::string_view trimmed = trim(line);
            return trimmed.empty() || trimmed.front() == '#';
        }

        char hexDigit(unsigned value)
        {
            return static_cast<char>(value < 10 ? ('0' + value) : ('a' + (value - 10)));
        }
    } // namespace

    std::optional<std::string> loadFile(const std::filesystem::path& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        if (stream.bad())
        {
            return std::nullopt;
        }
        return buffer.str();
    }

    std::string_view trim(std::string_view text)
    {
        const auto first = text.find_first_not_of(" \t\r\n\f\v");
        if (first == std::string_view::npos)
        {
            return {};
        }
        const auto last = text.find_last_not_of(" \t\r\n\f\v");
        return text.substr(first, last - first + 1);
    }

    bool isQuote(char ch)
    {
        return ch == '"' || ch == '\'';
    }

    std::size_t skipStringLiteral(std::string_view text, std::size_t quoteIndex)
    {
        const char quote = text[quoteIndex];
        const bool isTriple = quoteIndex + 2 < text.size() && text[quoteIndex + 1] == quote && text[quoteIndex + 2] == quote;
        std::size_t index = quoteIndex + (isTriple ? 3 : 1);

        while (index < text.size())
        {
            const char ch = text[index];
            if (ch == '\\')
            {
                index += 2;
                continue;
            }

            if (ch == quote)
            {
                if (!isTriple)
                {
                    return index + 1;
                }
                if (index + 2 < text.size() && text[index + 1] == quote && text[index + 2] == quote)
                {
                    return index + 3;
                }
            }
            else if (ch == '\n' && !isTriple)
            {
                return std::string_view::npos;
            }

            ++index;
        }

        return std::string_view::npos;
    }

    std::optional<std::size_t> findMatchingDelimiter(std::string_view text, std::size_t openIndex)
    {
        if (openIndex >= text.size() || !isOpening(text[openIndex]))
        {
            return std::nullopt;
        }

        std::size_t depth = 0;
        std::size_t index = openIndex;
        while (index < text.size())
        {
            const char ch = text[index];
            if (isQuote(ch))
            {
                index = skipStringLiteral(text, index);
                if (index == std::string_view::npos)
                {
                    return std::nullopt;
                }
                continue;
            }

            if (ch == '#')
            {
                index = skipComment(text, index);
                continue;
            }

            if (isOpening(ch))
            {
                ++depth;
            }
            else if (isClosing(ch))
            {
                --depth;
                if (depth == 0)
                {
                    return index;
                }
            }

            ++index;
        }

        return std::nullopt;
    }

    std::vector<std::string_view> splitTopLevel(std::string_view text, char separator)
    {
        std::vector<std::string_view> pieces;
        std::size_t depth = 0;
        std::size_t pieceStart = 0;
        std::size_t index = 0;

        while (index < text.size())
        {
            const char ch = text[index];
            if (isQuote(ch))
            {
                const std::size_t next = skipStringLiteral(text, index);
                index = next == std::string_view::npos ? text.size() : next;
                continue;
            }

            if (isOpening(ch))
            {
                ++depth;
            }
            else if (isClosing(ch) && depth > 0)
            {
                --depth;
            }
            else if (ch == separator && depth == 0)
            {
                pieces.push_back(text.substr(pieceStart, index - pieceStart));
                pieceStart = index + 1;
            }

            ++index;
        }

        pieces.push_back(text.substr(pieceStart));
        return pieces;
    }

    std::optional<std::size_t> findTopLevel(std::string_view text, char target)
    {
        std::size_t depth = 0;
        std::size_t index = 0;

        while (index < text.size())
        {
            const char ch = text[index];
            if (isQuote(ch))
            {
                const std::size_t next = skipStringLiteral(text, index);
                if (next == std::string_view::npos)
                {
                    return std::nullopt;
                }
                index = next;
                continue;
            }

            if (ch == target && depth == 0)
            {
                return index;
            }

            if (isOpening(ch))
            {
                ++depth;
            }
            else if (isClosing(ch) && depth > 0)
            {
                --depth;
            }

            ++index;
        }

        return std::nullopt;
    }

    std::optional<std::size_t> findTopLevelAssignment(std::string_view text)
    {
        std::size_t searchFrom = 0;
        while (searchFrom < text.size())
        {
            const auto found = findTopLevel(text.substr(searchFrom), '=');
            if (!found.has_value())
            {
                return std::nullopt;
            }

            const std::size_t index = searchFrom + *found;
            const char before = index > 0 ? text[index - 1] : '\0';
            const char after = index + 1 < text.size() ? text[index + 1] : '\0';
            if (after == '=')
            {
                searchFrom = index + 2;
                continue;
            }
            if (before == '=' || before == '!' || before == '<' || before == '>' || before == ':')
            {
                searchFrom = index + 1;
                continue;
            }

            return index;
        }

        return std::nullopt;
    }

    std::string stripComments(std::string_view text)
    {
        std::string result;
        result.reserve(text.size());

        std::size_t index = 0;
        while (index < text.size())
        {
            const char ch = text[index];
            if (isQuote(ch))
            {
                const std::size_t next = skipStringLiteral(text, index);
                const std::size_t end = next == std::string_view::npos ? text.size() : next;
                result.append(text.substr(index, end - index));
                index = end;
                continue;
            }

            if (ch == '#')
            {
                index = skipComment(text, index);
                continue;
            }

            result.push_back(ch);
            ++index;
        }

        return result;
    }

    bool isQuotedString(std::string_view text)
    {
        if (text.size() < 2 || !isQuote(text.front()) || text.back() != text.front())
        {
            return false;
        }
        return skipStringLiteral(text, 0) == text.size();
    }

    std::string unquote(std::string_view text)
    {
        if (!isQuotedString(text))
        {
            return std::string{text};
        }

        const char quote = text.front();
        const std::size_t quoteWidth = (text.size() >= 6 && text[1] == quote && text[2] == quote) ? 3 : 1;
        const std::string_view body = text.substr(quoteWidth, text.size() - 2 * quoteWidth);

        std::string value;
        value.reserve(body.size());
        for (std::size_t index = 0; index < body.size(); ++index)
        {
            if (body[index] != '\\' || index + 1 == body.size())
            {
                value.push_back(body[index]);
                continue;
            }

            const char escaped = body[++index];
            switch (escaped)
            {
            case '\\':
            case '"':
            case '\'':
                value.push_back(escaped);
                break;
            case 'n':
                value.push_back('\n');
                break;
            case 't':
                value.push_back('\t');
                break;
            case 'r':
                value.push_back('\r');
                break;
            case '\n':
                // Line continuation.
                break;
            default:
                value.push_back('\\');
                value.push_back(escaped);
                break;
            }
        }
        return value;
    }

    bool isIdentifierChar(char ch)
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
    }

    bool isIdentifier(std::string_view text)
    {
        if (text.empty() || (text.front() >= '0' && text.front() <= '9'))
        {
            return false;
        }

        for (char ch : text)
        {
            if (!isIdentifierChar(ch))
            {
                return false;
            }
        }
        return true;
    }

    bool isDottedName(std::string_view text)
    {
        if (text.find('.') == std::string_view::npos)
        {
            return false;
        }

        std::size_t segmentStart = 0;
        while (true)
        {
            const std::size_t dot = text.find('.', segmentStart);
            const std::string_view segment = text.substr(segmentStart, dot == std::string_view::npos ? std::string_view::npos : dot - segmentStart);
            if (!isIdentifier(segment))
            {
                return false;
            }
            if (dot == std::string_view::npos)
            {
                return true;
            }
            segmentStart = dot + 1;
        }
    }

    std::size_t indentationOf(std::string_view line)
    {
        std::size_t width = 0;
        for (char ch : line)
        {
            if (ch == ' ')
            {
                ++width;
            }
            else if (ch == '\t')
            {
                width = (width / 8 + 1) * 8;
            }
            else
            {
                break;
            }
        }
        return width;
    }

    TextRange findIndentedBody(std::string_view source, std::size_t colonIndex)
    {
        TextRange range;
        if (colonIndex >= source.size())
        {
            range.begin = range.end = source.size();
            return range;
        }

        const std::size_t headerEnd = lineEnd(source, colonIndex);
        const std::string_view inlineBody = source.substr(colonIndex + 1, headerEnd - colonIndex - 1);
        if (!isBlankOrComment(inlineBody))
        {
            range.begin = colonIndex + 1;
            range.end = headerEnd;
            return range;
        }

        range.begin = headerEnd < source.size() ? headerEnd + 1 : source.size();
        range.end = range.begin;

        std::optional<std::size_t> baseIndent;
        std::size_t lineStart = range.begin;
        while (lineStart < source.size())
        {
            const std::size_t end = lineEnd(source, lineStart);
            const std::string_view line = source.substr(lineStart, end - lineStart);

            if (!isBlankOrComment(line))
            {
                const std::size_t indent = indentationOf(line);
                if (!baseIndent.has_value())
                {
                    if (indent == 0)
                    {
                        break;
                    }
                    baseIndent = indent;
                }
                else if (indent < *baseIndent)
                {
                    break;
                }
                range.end = end;
            }

            lineStart = end + 1;
        }

        return range;
    }

    std::string escapeJson(std::string_view value)
    {
        std::string result;
        result.reserve(value.size() + 8);

        for (unsigned char ch : value)
        {
            switch (ch)
            {
            case '\\':
                result += "\\\\";
                break;
            case '"':
                result += "\\\"";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20)
                {
                    result += "\\u00";
                    result.push_back(hexDigit((ch >> 4) & 0xF));
                    result.push_back(hexDigit(ch & 0xF));
                }
                else
                {
                    result.push_back(static_cast<char>(ch));
                }
                break;
            }
        }

        return result;
    }
} // namespace mex::discovery
