#include "syntax_query.hpp"

namespace mex::frontend
{
    namespace
    {
        const Definition* findIn(const std::vector<Definition>& definitions, DefinitionKind kind, std::string_view name)
        {
            for (const auto& definition : definitions)
            {
                if (definition.kind == kind && definition.name == name)
                {
                    return &definition;
                }

                if (const Definition* nested = findIn(definition.definitions, kind, name))
                {
                    return nested;
                }
            }

            return nullptr;
        }

        void collectCalls(const std::vector<CallExpression>& scope,
            const CallPattern& pattern,
            std::vector<const CallExpression*>& matches)
        {
            for (const auto& call : scope)
            {
                if (matchesCallee(pattern, call.callee))
                {
                    matches.push_back(&call);
                    continue;
                }

                collectCalls(call.nestedCalls, pattern, matches);
            }
        }
    } // namespace

    bool matchesCallee(const CallPattern& pattern, std::string_view callee)
    {
        for (const auto& candidate : pattern.callees)
        {
            if (callee == candidate)
            {
                return true;
            }
        }

        return false;
    }

    const Definition* findDefinition(const SyntaxTree& tree, DefinitionKind kind, std::string_view name)
    {
        return findIn(tree.definitions, kind, name);
    }

    std::vector<const CallExpression*> queryCalls(const std::vector<CallExpression>& scope, const CallPattern& pattern)
    {
        std::vector<const CallExpression*> matches;
        collectCalls(scope, pattern, matches);
        return matches;
    }
} // namespace mex::frontend
