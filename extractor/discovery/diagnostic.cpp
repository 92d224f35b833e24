#include "diagnostic.hpp"

#include <utility>

namespace mex::discovery
{
    std::string_view toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::InvalidSyntax:
            return "InvalidSyntax";
        case ErrorKind::UnsupportedConstruct:
            return "UnsupportedConstruct";
        case ErrorKind::Io:
            return "Io";
        }

        return "Unknown";
    }

    Diagnostic makeError(std::string code, ErrorKind kind, std::string message)
    {
        Diagnostic diag;
        diag.code = std::move(code);
        diag.message = std::move(message);
        diag.kind = kind;
        return diag;
    }

    Diagnostic makeWarning(std::string code, ErrorKind kind, std::string message)
    {
        Diagnostic diag = makeError(std::move(code), kind, std::move(message));
        diag.isWarning = true;
        return diag;
    }
} // namespace mex::discovery
