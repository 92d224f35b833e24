#pragma once

#include <string>
#include <string_view>

namespace mex::discovery
{
    enum class ErrorKind
    {
        NotFound,
        InvalidSyntax,
        UnsupportedConstruct,
        Io
    };

    struct Diagnostic
    {
        std::string code;
        std::string message;
        ErrorKind kind{ErrorKind::InvalidSyntax};
        bool isWarning{false};
    };

    [[nodiscard]] std::string_view toString(ErrorKind kind);

    [[nodiscard]] Diagnostic makeError(std::string code, ErrorKind kind, std::string message);
    [[nodiscard]] Diagnostic makeWarning(std::string code, ErrorKind kind, std::string message);
} // namespace mex::discovery
