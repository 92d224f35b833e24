#pragma once

#include "syntax_tree.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mex::frontend
{
    // Dotted callee names a query accepts, e.g. "PluginSpec.parser".
    struct CallPattern
    {
        std::vector<std::string> callees;
    };

    [[nodiscard]] bool matchesCallee(const CallPattern& pattern, std::string_view callee);

    // Depth-first in file order; nested definitions are searched too.
    [[nodiscard]] const Definition* findDefinition(const SyntaxTree& tree, DefinitionKind kind, std::string_view name);

    // Outermost matching calls of a scope, in file order. Arguments of a
    // non-matching call are searched; nested definitions are not.
    [[nodiscard]] std::vector<const CallExpression*> queryCalls(const std::vector<CallExpression>& scope, const CallPattern& pattern);
} // namespace mex::frontend
