#pragma once

#include "diagnostic.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mex::discovery
{
    struct SymbolBinding
    {
        std::string modulePath;
        std::string originalName;
    };

    // Local name -> defining module. Immutable once built.
    class SymbolTable
    {
    public:
        SymbolTable() = default;
        explicit SymbolTable(std::unordered_map<std::string, SymbolBinding> bindings);

        [[nodiscard]] const SymbolBinding* find(std::string_view localName) const;
        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] bool empty() const noexcept;

    private:
        std::unordered_map<std::string, SymbolBinding> m_bindings;
    };

    // Builds a SymbolTable from single-line `from M import A, B as C`
    // statements. Parenthesised or backslash-continued import lists are
    // skipped with a warning.
    class ImportResolver
    {
    public:
        ImportResolver() = default;

        // Dotted package of the file being resolved; used for `from .x import y`.
        void setPackageContext(std::string packagePath);

        [[nodiscard]] SymbolTable resolve(std::string_view source);
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        [[nodiscard]] std::string resolveModulePath(std::string_view written) const;
        void reportSkippedImport(std::size_t lineNumber, std::string_view reason);

        std::string m_packagePath;
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace mex::discovery
