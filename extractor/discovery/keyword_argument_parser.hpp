#pragma once

#include "diagnostic.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    // One `key=value` pair of a call. [begin, end) covers the pair's whole
    // segment of the call text, surrounding whitespace included.
    struct RawKeyValue
    {
        std::string key;
        std::string value;
        std::size_t begin{0};
        std::size_t end{0};
    };

    struct KeywordArgumentParseResult
    {
        std::vector<RawKeyValue> arguments;
        // Argument-list text between the call's own parentheses.
        std::size_t argumentBegin{0};
        std::size_t argumentEnd{0};
        std::optional<Diagnostic> error;
    };

    // Splits `Callee(k1=v1, k2=v2)` into ordered raw pairs in one
    // depth-aware scan. String literals are copied verbatim and comments
    // dropped. Positional arguments and `**mapping` splats are rejected.
    [[nodiscard]] KeywordArgumentParseResult parseKeywordArguments(std::string_view callText);
} // namespace mex::discovery
