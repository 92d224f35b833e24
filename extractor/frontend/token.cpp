#include "token.hpp"

namespace mex::frontend
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "endOfFile";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::NumberLiteral: return "numberLiteral";
        case TokenKind::StringLiteral: return "stringLiteral";

        case TokenKind::Newline: return "newline";
        case TokenKind::Indent: return "indent";
        case TokenKind::Dedent: return "dedent";

        case TokenKind::KeywordDef: return "def";
        case TokenKind::KeywordClass: return "class";
        case TokenKind::KeywordAsync: return "async";
        case TokenKind::KeywordFrom: return "from";
        case TokenKind::KeywordImport: return "import";
        case TokenKind::KeywordAs: return "as";
        case TokenKind::KeywordReturn: return "return";
        case TokenKind::KeywordLambda: return "lambda";

        case TokenKind::LeftParen: return "(";
        case TokenKind::RightParen: return ")";
        case TokenKind::LeftBracket: return "[";
        case TokenKind::RightBracket: return "]";
        case TokenKind::LeftBrace: return "{";
        case TokenKind::RightBrace: return "}";
        case TokenKind::Comma: return ",";
        case TokenKind::Colon: return ":";
        case TokenKind::Semicolon: return ";";
        case TokenKind::Dot: return ".";
        case TokenKind::At: return "@";
        case TokenKind::Arrow: return "->";
        case TokenKind::Equals: return "=";
        case TokenKind::Asterisk: return "*";
        case TokenKind::DoubleAsterisk: return "**";
        case TokenKind::Operator: return "operator";
        }

        return "unknown";
    }
} // namespace mex::frontend
