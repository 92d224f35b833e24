#pragma once

#include "../discovery/call_locator.hpp"
#include "../discovery/decorator_step_scanner.hpp"
#include "../discovery/diagnostic.hpp"
#include "../discovery/import_resolver.hpp"
#include "../discovery/keyword_argument_parser.hpp"
#include "../discovery/parameter_extractor.hpp"
#include "../discovery/plugin_record.hpp"
#include "../discovery/source_file_index.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mex
{
    struct ExtractionOptions
    {
        // Registration file; located from packageDirectory when empty.
        std::filesystem::path entryFile;
        std::filesystem::path packageDirectory;
        std::string packageName;
        // Primary root for decorator and signature searches.
        std::filesystem::path searchRoot;
        std::filesystem::path environmentRoot;
        std::filesystem::path workingDirectory;
        std::optional<std::string> distributionVersion;
        std::string entryPointGroup{"r2x_plugin"};
        std::optional<std::string> registrationFunction;
        std::string listKeyword{"plugins"};
        discovery::LocatorStrategy strategy{discovery::LocatorStrategy::Automatic};
    };

    struct ExtractionResult
    {
        std::optional<discovery::PackageManifest> manifest;
        std::vector<discovery::Diagnostic> diagnostics;
        // Progress detail for verbose output.
        std::vector<std::string> notes;

        [[nodiscard]] const discovery::Diagnostic* fatalError() const;
    };

    class ManifestAssembler
    {
    public:
        explicit ManifestAssembler(ExtractionOptions options);

        // Locates and reads the registration file, then assembles it.
        [[nodiscard]] ExtractionResult extract();

        // Assembles an already loaded registration source. `packagePath` is
        // the dotted package of the file, used for relative imports.
        [[nodiscard]] ExtractionResult assemble(std::string_view source, const std::string& packagePath);

    private:
        struct RecordOutcome
        {
            std::optional<discovery::PluginRecord> record;
            std::optional<discovery::Diagnostic> error;
        };

        [[nodiscard]] discovery::CallLocatorResult locateCalls(std::string_view source, ExtractionResult& result) const;
        struct Enrichers
        {
            discovery::ParameterExtractor& parameters;
            discovery::DecoratorStepScanner& steps;
        };

        [[nodiscard]] RecordOutcome buildRecord(const discovery::LocatedCall& call,
            const discovery::SymbolTable& symbols,
            Enrichers enrichers,
            ExtractionResult& result);
        [[nodiscard]] std::optional<discovery::Diagnostic> applyArgument(discovery::PluginRecord& record,
            const discovery::RawKeyValue& argument,
            discovery::ClassifiedValue value,
            bool& hasName,
            bool& hasCallable);
        [[nodiscard]] std::vector<std::filesystem::path> searchRoots() const;
        [[nodiscard]] std::filesystem::path decoratorRoot() const;
        void fillCallables(discovery::PluginRecord& record, discovery::ParameterExtractor& parameters) const;

        ExtractionOptions m_options;
        discovery::RegistrationConvention m_convention;
        discovery::SourceFileIndexCache m_indexes;
    };
} // namespace mex
