#include "lexer.hpp"

#include <cctype>

namespace
{
    using namespace mex::frontend;

    constexpr std::size_t kTabWidth = 8;

    bool isIdentifierStart(char ch)
    {
        const auto byte = static_cast<unsigned char>(ch);
        return std::isalpha(byte) || ch == '_' || byte >= 0x80;
    }

    bool isIdentifierPart(char ch)
    {
        return isIdentifierStart(ch) || std::isdigit(static_cast<unsigned char>(ch));
    }

    bool isDigit(char ch)
    {
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    }

    TokenKind keywordLookup(std::string_view text)
    {
        if (text == "def") return TokenKind::KeywordDef;
        if (text == "class") return TokenKind::KeywordClass;
        if (text == "async") return TokenKind::KeywordAsync;
        if (text == "from") return TokenKind::KeywordFrom;
        if (text == "import") return TokenKind::KeywordImport;
        if (text == "as") return TokenKind::KeywordAs;
        if (text == "return") return TokenKind::KeywordReturn;
        if (text == "lambda") return TokenKind::KeywordLambda;
        return TokenKind::Identifier;
    }
} // namespace

namespace mex::frontend
{
    Lexer::Lexer(std::string_view source, std::string_view fileName)
        : m_source(source)
        , m_fileName(fileName)
        , m_location{1, 1}
    {
    }

    const std::vector<Token>& Lexer::tokens() const noexcept
    {
        return m_tokens;
    }

    const std::vector<Diagnostic>& Lexer::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void Lexer::lex()
    {
        m_tokens.clear();
        m_diagnostics.clear();
        m_indentStack.assign(1, 0);
        m_current = 0;
        m_nesting = 0;
        m_atLineStart = true;
        m_location = {1, 1};

        while (!isAtEnd())
        {
            if (m_atLineStart && m_nesting == 0)
            {
                lexIndentation();
                continue;
            }

            const char ch = peek();
            const SourceLocation startLocation = m_location;
            const std::size_t startIndex = m_current;

            if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\f')
            {
                advance();
                continue;
            }

            if (ch == '\\' && (peekAt(1) == '\n' || (peekAt(1) == '\r' && peekAt(2) == '\n')))
            {
                // Explicit line joining.
                advance();
                if (peek() == '\r')
                {
                    advance();
                }
                advance();
                continue;
            }

            if (ch == '\n')
            {
                advance();
                if (m_nesting == 0)
                {
                    pushLayoutToken(TokenKind::Newline);
                    m_atLineStart = true;
                }
                continue;
            }

            if (ch == '#')
            {
                skipComment();
                continue;
            }

            if (isIdentifierStart(ch))
            {
                std::size_t length = 0;
                while (isIdentifierPart(peekAt(length)))
                {
                    ++length;
                }

                if (isStringPrefix(length))
                {
                    for (std::size_t index = 0; index < length; ++index)
                    {
                        advance();
                    }
                    lexString(startIndex, startLocation);
                    continue;
                }

                lexIdentifierOrKeyword();
                continue;
            }

            if (isDigit(ch) || (ch == '.' && isDigit(peekAt(1))))
            {
                lexNumber();
                continue;
            }

            switch (ch)
            {
            case '"':
            case '\'':
                lexString(startIndex, startLocation);
                break;
            case '(':
                emitSingle(TokenKind::LeftParen);
                ++m_nesting;
                break;
            case '[':
                emitSingle(TokenKind::LeftBracket);
                ++m_nesting;
                break;
            case '{':
                emitSingle(TokenKind::LeftBrace);
                ++m_nesting;
                break;
            case ')':
                emitSingle(TokenKind::RightParen);
                if (m_nesting > 0)
                {
                    --m_nesting;
                }
                break;
            case ']':
                emitSingle(TokenKind::RightBracket);
                if (m_nesting > 0)
                {
                    --m_nesting;
                }
                break;
            case '}':
                emitSingle(TokenKind::RightBrace);
                if (m_nesting > 0)
                {
                    --m_nesting;
                }
                break;
            case ',':
                emitSingle(TokenKind::Comma);
                break;
            case ';':
                emitSingle(TokenKind::Semicolon);
                break;
            case '.':
                emitSingle(TokenKind::Dot);
                break;
            case '@':
                advance();
                if (match('='))
                {
                    pushToken(TokenKind::Operator, startIndex, startLocation);
                }
                else
                {
                    pushToken(TokenKind::At, startIndex, startLocation);
                }
                break;
            case ':':
                advance();
                if (match('='))
                {
                    pushToken(TokenKind::Operator, startIndex, startLocation);
                }
                else
                {
                    pushToken(TokenKind::Colon, startIndex, startLocation);
                }
                break;
            case '=':
                advance();
                if (match('='))
                {
                    pushToken(TokenKind::Operator, startIndex, startLocation);
                }
                else
                {
                    pushToken(TokenKind::Equals, startIndex, startLocation);
                }
                break;
            case '-':
                if (peekAt(1) == '>')
                {
                    advance();
                    advance();
                    pushToken(TokenKind::Arrow, startIndex, startLocation);
                }
                else
                {
                    lexOperator();
                }
                break;
            case '*':
                advance();
                if (match('*'))
                {
                    if (match('='))
                    {
                        pushToken(TokenKind::Operator, startIndex, startLocation);
                    }
                    else
                    {
                        pushToken(TokenKind::DoubleAsterisk, startIndex, startLocation);
                    }
                }
                else if (match('='))
                {
                    pushToken(TokenKind::Operator, startIndex, startLocation);
                }
                else
                {
                    pushToken(TokenKind::Asterisk, startIndex, startLocation);
                }
                break;
            case '+':
            case '/':
            case '%':
            case '<':
            case '>':
            case '!':
            case '&':
            case '|':
            case '^':
            case '~':
                lexOperator();
                break;
            default:
                advance();
                reportError("MEX-E2000", "Unexpected character in source.", startLocation);
                break;
            }
        }

        pushLayoutToken(TokenKind::Newline);
        while (m_indentStack.size() > 1)
        {
            m_indentStack.pop_back();
            pushLayoutToken(TokenKind::Dedent);
        }

        pushLayoutToken(TokenKind::EndOfFile);
    }

    void Lexer::pushToken(TokenKind kind, std::size_t startIndex, SourceLocation start)
    {
        Token token;
        token.kind = kind;
        token.span = {start, m_location};
        token.offset = startIndex;
        token.length = m_current - startIndex;
        token.text = std::string{m_source.substr(startIndex, token.length)};
        m_tokens.emplace_back(std::move(token));
    }

    void Lexer::pushLayoutToken(TokenKind kind)
    {
        if (kind == TokenKind::Newline)
        {
            // Blank lines and block boundaries never produce a statement terminator.
            if (m_tokens.empty())
            {
                return;
            }

            const TokenKind last = m_tokens.back().kind;
            if (last == TokenKind::Newline || last == TokenKind::Indent || last == TokenKind::Dedent)
            {
                return;
            }
        }

        Token token;
        token.kind = kind;
        token.span = {m_location, m_location};
        token.offset = m_current;
        token.length = 0;
        m_tokens.emplace_back(std::move(token));
    }

    void Lexer::lexIndentation()
    {
        std::size_t width = 0;
        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == ' ')
            {
                ++width;
            }
            else if (ch == '\t')
            {
                width = (width / kTabWidth + 1) * kTabWidth;
            }
            else if (ch == '\f')
            {
                width = 0;
            }
            else
            {
                break;
            }
            advance();
        }

        if (isAtEnd())
        {
            return;
        }

        if (peek() == '\r' && peekAt(1) == '\n')
        {
            advance();
        }

        if (peek() == '\n')
        {
            advance();
            return;
        }

        if (peek() == '#')
        {
            skipComment();
            return;
        }

        m_atLineStart = false;

        if (width > m_indentStack.back())
        {
            m_indentStack.push_back(width);
            pushLayoutToken(TokenKind::Indent);
            return;
        }

        while (width < m_indentStack.back())
        {
            m_indentStack.pop_back();
            pushLayoutToken(TokenKind::Dedent);
        }

        if (width != m_indentStack.back())
        {
            reportError("MEX-E2002", "Unindent does not match any outer indentation level.", m_location);
        }
    }

    void Lexer::lexIdentifierOrKeyword()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        advance(); // consume first character
        while (isIdentifierPart(peek()))
        {
            advance();
        }

        const std::string_view text = m_source.substr(startIndex, m_current - startIndex);
        pushToken(keywordLookup(text), startIndex, startLocation);
    }

    void Lexer::lexNumber()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        const char radix = peekAt(1);
        if (peek() == '0' && (radix == 'x' || radix == 'X' || radix == 'o' || radix == 'O' || radix == 'b' || radix == 'B'))
        {
            advance();
            advance();
            while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')
            {
                advance();
            }
            pushToken(TokenKind::NumberLiteral, startIndex, startLocation);
            return;
        }

        while (isDigit(peek()) || peek() == '_')
        {
            advance();
        }

        if (peek() == '.')
        {
            advance();
            while (isDigit(peek()) || peek() == '_')
            {
                advance();
            }
        }

        if (peek() == 'e' || peek() == 'E')
        {
            const bool signedExponent = (peekAt(1) == '+' || peekAt(1) == '-') && isDigit(peekAt(2));
            if (isDigit(peekAt(1)) || signedExponent)
            {
                advance();
                if (signedExponent)
                {
                    advance();
                }
                while (isDigit(peek()) || peek() == '_')
                {
                    advance();
                }
            }
        }

        if (peek() == 'j' || peek() == 'J')
        {
            advance();
        }

        pushToken(TokenKind::NumberLiteral, startIndex, startLocation);
    }

    void Lexer::lexString(std::size_t startIndex, SourceLocation start)
    {
        const char quote = advance();
        bool triple = false;
        if (peek() == quote && peekAt(1) == quote)
        {
            advance();
            advance();
            triple = true;
        }

        while (!isAtEnd())
        {
            const char ch = peek();
            if (ch == '\\')
            {
                advance();
                if (!isAtEnd())
                {
                    advance();
                }
                continue;
            }

            if (ch == '\n' && !triple)
            {
                break;
            }

            if (ch == quote)
            {
                if (!triple)
                {
                    advance();
                    pushToken(TokenKind::StringLiteral, startIndex, start);
                    return;
                }

                if (peekAt(1) == quote && peekAt(2) == quote)
                {
                    advance();
                    advance();
                    advance();
                    pushToken(TokenKind::StringLiteral, startIndex, start);
                    return;
                }
            }

            advance();
        }

        reportError("MEX-E2001", "Unterminated string literal.", start);
        pushToken(TokenKind::StringLiteral, startIndex, start);
    }

    void Lexer::lexOperator()
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;

        const char first = advance();
        if ((first == '<' || first == '>' || first == '/') && peek() == first)
        {
            advance();
        }
        match('=');

        pushToken(TokenKind::Operator, startIndex, startLocation);
    }

    void Lexer::emitSingle(TokenKind kind)
    {
        const std::size_t startIndex = m_current;
        const SourceLocation startLocation = m_location;
        advance();
        pushToken(kind, startIndex, startLocation);
    }

    void Lexer::skipComment()
    {
        while (!isAtEnd() && peek() != '\n')
        {
            advance();
        }
    }

    void Lexer::reportError(std::string_view code, std::string_view message, SourceLocation start)
    {
        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = m_fileName.empty() ? std::string{message} : std::string{m_fileName} + ": " + std::string{message};
        diag.span = {start, m_location};
        m_diagnostics.emplace_back(std::move(diag));
    }

    bool Lexer::isStringPrefix(std::size_t length) const
    {
        if (length == 0 || length > 2)
        {
            return false;
        }

        const char next = peekAt(length);
        if (next != '"' && next != '\'')
        {
            return false;
        }

        std::string prefix;
        for (std::size_t index = 0; index < length; ++index)
        {
            prefix.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(peekAt(index)))));
        }

        return prefix == "r" || prefix == "b" || prefix == "u" || prefix == "f"
            || prefix == "rb" || prefix == "br" || prefix == "rf" || prefix == "fr";
    }

    bool Lexer::match(char expected)
    {
        if (isAtEnd()) return false;
        if (m_source[m_current] != expected) return false;
        advance();
        return true;
    }

    char Lexer::peek() const
    {
        if (isAtEnd()) return '\0';
        return m_source[m_current];
    }

    char Lexer::peekAt(std::size_t offset) const
    {
        if (m_current + offset >= m_source.size()) return '\0';
        return m_source[m_current + offset];
    }

    char Lexer::advance()
    {
        const char ch = m_source[m_current++];
        if (ch == '\n')
        {
            ++m_location.line;
            m_location.column = 1;
        }
        else
        {
            ++m_location.column;
        }
        return ch;
    }

    bool Lexer::isAtEnd() const
    {
        return m_current >= m_source.size();
    }
} // namespace mex::frontend
