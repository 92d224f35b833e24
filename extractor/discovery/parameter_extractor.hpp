#pragma once

#include "diagnostic.hpp"
#include "plugin_record.hpp"
#include "source_file_index.hpp"

#include "../frontend/syntax_tree.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    struct CallableSignature
    {
        std::vector<NamedParameter> parameters;
        std::optional<std::string> returnAnnotation;
        bool found{false};
    };

    // Reads constructor and function signatures from the defining module's
    // source. Roots are searched in order and the first definition found
    // wins; finding nothing yields an empty signature, never an error.
    class ParameterExtractor
    {
    public:
        ParameterExtractor(SourceFileIndexCache& indexes, std::vector<std::filesystem::path> searchRoots);

        [[nodiscard]] CallableSignature extract(const std::string& modulePath, const std::string& name, CallableKind kind);

        // Fills parameters and return annotation of `callable` in place.
        void fill(CallableDescriptor& callable);

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        [[nodiscard]] std::vector<std::filesystem::path> candidateFiles(const std::filesystem::path& root, const std::string& modulePath);

        SourceFileIndexCache& m_indexes;
        std::vector<std::filesystem::path> m_searchRoots;
        std::map<std::string, CallableSignature> m_cache;
        std::vector<Diagnostic> m_diagnostics;
    };

    // Signature of `class name` (its `__init__`, else its annotated fields)
    // or `def name` in `content`.
    [[nodiscard]] CallableSignature parseCallableSignature(std::string_view content, std::string_view name, CallableKind kind);

    // Parameters and return annotation of a parsed `def`; `content` is the
    // source the definition was parsed from.
    [[nodiscard]] CallableSignature signatureOf(std::string_view content, const frontend::Definition& definition);

    [[nodiscard]] std::vector<NamedParameter> parseParameterList(std::string_view parameterText);

    // JSON text for a default expression: literals map to JSON, anything
    // else is kept as a JSON string of its source text.
    [[nodiscard]] std::string serializeDefault(std::string_view rawDefault);
} // namespace mex::discovery
