#pragma once

#include "token.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mex::frontend
{
    // A call expression such as `PluginSpec.parser(name="x", entry=Foo)`.
    // Offsets are byte positions in the parsed source: beginOffset is the
    // first character of the callee, endOffset is one past the closing ')'.
    struct CallExpression
    {
        std::string callee;
        std::size_t beginOffset{0};
        std::size_t endOffset{0};
        SourceSpan span;
        std::vector<CallExpression> nestedCalls;
        bool isTerminated{true};
    };

    struct Decorator
    {
        std::string text;
        std::size_t beginOffset{0};
        std::size_t endOffset{0};
        SourceSpan span;
    };

    enum class DefinitionKind
    {
        Function,
        Class
    };

    struct Definition
    {
        DefinitionKind kind{DefinitionKind::Function};
        std::string name;
        std::vector<Decorator> decorators;
        // Parameter list or base list, '(' through ')'. Both are zero when absent.
        std::size_t signatureBeginOffset{0};
        std::size_t signatureEndOffset{0};
        std::optional<std::string> returnAnnotation;
        // One past the ':' opening the body; zero when the header is malformed.
        std::size_t bodyBeginOffset{0};
        std::vector<CallExpression> calls;
        std::vector<Definition> definitions;
        std::size_t beginOffset{0};
        std::size_t endOffset{0};
        SourceSpan span;
    };

    struct SyntaxTree
    {
        std::vector<CallExpression> calls;
        std::vector<Definition> definitions;
    };
} // namespace mex::frontend
