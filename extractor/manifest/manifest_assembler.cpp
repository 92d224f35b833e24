#include "manifest_assembler.hpp"

#include "../discovery/entry_file_locator.hpp"
#include "../discovery/source_text.hpp"
#include "../discovery/value_classifier.hpp"

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace mex
{
    namespace
    {
        using discovery::ClassifiedValue;
        using discovery::Diagnostic;
        using discovery::ErrorKind;
        using discovery::ValueKind;

        Diagnostic wrongType(const discovery::RawKeyValue& argument, std::string_view expected)
        {
            return discovery::makeError("MEX-E3102",
                ErrorKind::InvalidSyntax,
                "Keyword '" + argument.key + "' expects " + std::string{expected} + ", got '" + argument.value + "'.");
        }

        // Null values leave optional fields unset.
        bool isAbsent(const ClassifiedValue& value)
        {
            return value.kind == ValueKind::Null;
        }

        constexpr std::array<std::string_view, 14> kRecordKeywords{
            "name",
            "obj",
            "entry",
            "call_method",
            "method",
            "config",
            "io_type",
            "requires_store",
            "store",
            "version_strategy",
            "version_reader",
            "upgrade_steps",
            "steps",
            "description",
        };

        bool isRecordKeyword(std::string_view key)
        {
            return std::find(kRecordKeywords.begin(), kRecordKeywords.end(), key) != kRecordKeywords.end();
        }

        std::string describeCall(const discovery::LocatedCall& call, std::size_t ordinal)
        {
            return "registration #" + std::to_string(ordinal) + " (" + call.callee + ")";
        }
    } // namespace

    const discovery::Diagnostic* ExtractionResult::fatalError() const
    {
        if (manifest.has_value())
        {
            return nullptr;
        }

        for (auto it = diagnostics.rbegin(); it != diagnostics.rend(); ++it)
        {
            if (!it->isWarning)
            {
                return &*it;
            }
        }
        return nullptr;
    }

    ManifestAssembler::ManifestAssembler(ExtractionOptions options)
        : m_options(std::move(options))
    {
        m_convention.listKeyword = m_options.listKeyword;
        if (m_options.registrationFunction.has_value())
        {
            m_convention.functionName = *m_options.registrationFunction;
        }
    }

    ExtractionResult ManifestAssembler::extract()
    {
        ExtractionResult result;

        std::filesystem::path entryFile = m_options.entryFile;
        std::string packagePath;

        if (entryFile.empty())
        {
            discovery::EntryFileQuery query;
            query.packageDirectory = m_options.packageDirectory;
            query.distributionName = m_options.packageName;
            query.distributionVersion = m_options.distributionVersion;
            query.environmentRoot = m_options.environmentRoot;
            query.entryPointGroup = m_options.entryPointGroup;

            discovery::EntryFileLocator locator;
            discovery::EntryFileLocatorResult located = locator.locate(query);
            for (auto& diagnostic : located.diagnostics)
            {
                result.diagnostics.emplace_back(std::move(diagnostic));
            }

            if (located.error.has_value())
            {
                result.diagnostics.emplace_back(std::move(*located.error));
                return result;
            }

            entryFile = located.location->filePath;
            packagePath = located.location->packagePath;
            if (located.location->registrationFunction.has_value() && !m_options.registrationFunction.has_value())
            {
                m_convention.functionName = *located.location->registrationFunction;
            }
            result.notes.emplace_back(std::string{"entry file located "}
                + (located.location->fromEntryPointIndex ? "through the entry-point index: " : "by file name: ")
                + entryFile.string());
        }
        else
        {
            std::error_code absoluteError;
            std::filesystem::path absolute = std::filesystem::absolute(entryFile, absoluteError);
            if (!absoluteError)
            {
                entryFile = absolute.lexically_normal();
            }
            packagePath = discovery::packagePathOf(entryFile);
        }

        if (m_options.searchRoot.empty())
        {
            m_options.searchRoot = m_options.packageDirectory.empty() ? entryFile.parent_path() : m_options.packageDirectory;
        }

        const auto source = discovery::loadFile(entryFile);
        if (!source.has_value())
        {
            std::error_code existsError;
            const bool exists = std::filesystem::exists(entryFile, existsError) && !existsError;
            result.diagnostics.emplace_back(discovery::makeError("MEX-E3000",
                exists ? ErrorKind::Io : ErrorKind::NotFound,
                "Unable to read entry file '" + entryFile.string() + "'."));
            return result;
        }

        ExtractionResult assembled = assemble(*source, packagePath);
        for (auto& diagnostic : assembled.diagnostics)
        {
            result.diagnostics.emplace_back(std::move(diagnostic));
        }
        for (auto& note : assembled.notes)
        {
            result.notes.emplace_back(std::move(note));
        }
        result.manifest = std::move(assembled.manifest);
        return result;
    }

    ExtractionResult ManifestAssembler::assemble(std::string_view source, const std::string& packagePath)
    {
        ExtractionResult result;

        discovery::ImportResolver resolver;
        resolver.setPackageContext(packagePath);
        const discovery::SymbolTable symbols = resolver.resolve(source);
        for (const auto& diagnostic : resolver.diagnostics())
        {
            result.diagnostics.push_back(diagnostic);
        }
        result.notes.emplace_back("resolved " + std::to_string(symbols.size()) + " imported symbols");

        const discovery::CallLocatorResult located = locateCalls(source, result);
        if (located.error.has_value())
        {
            result.diagnostics.push_back(*located.error);
            return result;
        }

        discovery::ParameterExtractor parameters{m_indexes, searchRoots()};
        discovery::DecoratorStepScanner steps{m_indexes};

        discovery::PackageManifest manifest;
        manifest.name = m_options.packageName;

        std::size_t ordinal = 0;
        for (const auto& call : located.calls)
        {
            ++ordinal;
            RecordOutcome outcome = buildRecord(call, symbols, Enrichers{parameters, steps}, result);
            if (!outcome.record.has_value())
            {
                Diagnostic warning = outcome.error.value_or(
                    discovery::makeError("MEX-E3100", ErrorKind::InvalidSyntax, "Registration could not be assembled."));
                warning.isWarning = true;
                warning.message = "Skipped " + describeCall(call, ordinal) + ": " + warning.message;
                result.diagnostics.emplace_back(std::move(warning));
                continue;
            }

            bool isDuplicate = false;
            for (const auto& existing : manifest.plugins)
            {
                if (existing.name == outcome.record->name)
                {
                    isDuplicate = true;
                    break;
                }
            }

            if (isDuplicate)
            {
                result.diagnostics.emplace_back(discovery::makeWarning("MEX-W3101",
                    ErrorKind::InvalidSyntax,
                    "Duplicate plugin name '" + outcome.record->name + "' in " + describeCall(call, ordinal)
                        + "; keeping the first registration."));
                continue;
            }

            result.notes.emplace_back("plugin '" + outcome.record->name + "' -> " + outcome.record->callable.modulePath + ":"
                + outcome.record->callable.name);
            manifest.plugins.emplace_back(std::move(*outcome.record));
        }

        for (const auto& diagnostic : parameters.diagnostics())
        {
            result.diagnostics.push_back(diagnostic);
        }

        result.manifest = std::move(manifest);
        return result;
    }

    discovery::CallLocatorResult ManifestAssembler::locateCalls(std::string_view source, ExtractionResult& result) const
    {
        using discovery::LocatorStrategy;

        if (m_options.strategy == LocatorStrategy::Textual)
        {
            return discovery::TextualCallLocator{m_convention}.locate(source);
        }

        discovery::CallLocatorResult located = discovery::SyntaxTreeCallLocator{m_convention}.locate(source);
        if (!located.error.has_value() || m_options.strategy == LocatorStrategy::SyntaxTree)
        {
            result.notes.emplace_back("tree locator found " + std::to_string(located.calls.size()) + " registration calls");
            return located;
        }

        result.notes.emplace_back("tree locator failed (" + located.error->message + "); falling back to the text locator");
        discovery::CallLocatorResult fallback = discovery::TextualCallLocator{m_convention}.locate(source);
        if (!fallback.error.has_value())
        {
            result.notes.emplace_back("text locator found " + std::to_string(fallback.calls.size()) + " registration calls");
        }
        return fallback;
    }

    ManifestAssembler::RecordOutcome ManifestAssembler::buildRecord(const discovery::LocatedCall& call,
        const discovery::SymbolTable& symbols,
        Enrichers enrichers,
        ExtractionResult& result)
    {
        RecordOutcome outcome;

        const auto kind = discovery::pluginKindForConstructor(call.callee);
        if (!kind.has_value())
        {
            outcome.error = discovery::makeError("MEX-E3103",
                ErrorKind::UnsupportedConstruct,
                "Unknown registration constructor '" + call.callee + "'.");
            return outcome;
        }

        discovery::KeywordArgumentParseResult parsed = discovery::parseKeywordArguments(call.text);
        if (parsed.error.has_value())
        {
            outcome.error = std::move(parsed.error);
            return outcome;
        }

        discovery::PluginRecord record;
        record.kind = *kind;

        const discovery::ValueClassifier classifier{symbols};
        std::vector<std::string> seenKeys;
        bool hasName = false;
        bool hasCallable = false;

        for (const auto& argument : parsed.arguments)
        {
            for (const auto& seen : seenKeys)
            {
                if (seen == argument.key)
                {
                    outcome.error = discovery::makeError("MEX-E3104",
                        ErrorKind::InvalidSyntax,
                        "Keyword '" + argument.key + "' is repeated.");
                    return outcome;
                }
            }
            seenKeys.push_back(argument.key);

            if (!isRecordKeyword(argument.key))
            {
                result.notes.emplace_back("ignored keyword '" + argument.key + "' of " + call.callee);
                continue;
            }

            discovery::Classification classification = classifier.classify(argument.value);
            switch (classification.status)
            {
            case discovery::ClassificationStatus::Classified:
                break;
            case discovery::ClassificationStatus::Unsupported:
                outcome.error = std::move(classification.error);
                return outcome;
            case discovery::ClassificationStatus::NeedsDecoratorScan:
            {
                const auto root = decoratorRoot();
                discovery::DecoratorScanResult scanned = enrichers.steps.scan(classification.decoratorClass, root);
                for (auto& diagnostic : scanned.diagnostics)
                {
                    result.diagnostics.emplace_back(std::move(diagnostic));
                }
                result.notes.emplace_back("found " + std::to_string(scanned.steps.size()) + " '" + classification.decoratorClass
                    + "' steps under " + root.string());
                classification.value.kind = ValueKind::UpgradeSteps;
                classification.value.steps = std::move(scanned.steps);
                break;
            }
            }

            if (auto error = applyArgument(record, argument, std::move(classification.value), hasName, hasCallable))
            {
                outcome.error = std::move(error);
                return outcome;
            }
        }

        if (!hasName)
        {
            outcome.error = discovery::makeError("MEX-E3106", ErrorKind::NotFound, "Registration has no 'name' keyword.");
            return outcome;
        }
        if (!hasCallable)
        {
            outcome.error = discovery::makeError("MEX-E3106",
                ErrorKind::NotFound,
                "Plugin '" + record.name + "' has no 'obj' or 'entry' keyword.");
            return outcome;
        }

        fillCallables(record, enrichers.parameters);
        outcome.record = std::move(record);
        return outcome;
    }

    std::optional<discovery::Diagnostic> ManifestAssembler::applyArgument(discovery::PluginRecord& record,
        const discovery::RawKeyValue& argument,
        ClassifiedValue value,
        bool& hasName,
        bool& hasCallable)
    {
        const std::string& key = argument.key;

        if (key == "name")
        {
            if (value.kind != ValueKind::String || value.text.empty())
            {
                return wrongType(argument, "a non-empty string literal");
            }
            record.name = std::move(value.text);
            hasName = true;
        }
        else if (key == "obj" || key == "entry")
        {
            if (hasCallable)
            {
                return discovery::makeError("MEX-E3104", ErrorKind::InvalidSyntax, "Both 'obj' and 'entry' are given.");
            }
            if (value.kind != ValueKind::CallableReference)
            {
                return discovery::makeError("MEX-E3107",
                    ErrorKind::NotFound,
                    "Keyword '" + key + "' value '" + argument.value + "' does not name an imported symbol.");
            }
            record.callable = std::move(value.callable);
            hasCallable = true;
        }
        else if (key == "config")
        {
            if (isAbsent(value))
            {
                return std::nullopt;
            }
            if (value.kind != ValueKind::CallableReference)
            {
                return discovery::makeError("MEX-E3107",
                    ErrorKind::NotFound,
                    "Config '" + argument.value + "' does not name an imported symbol.");
            }
            record.config = std::move(value.callable);
        }
        else if (key == "call_method" || key == "method" || key == "io_type" || key == "description")
        {
            if (isAbsent(value))
            {
                return std::nullopt;
            }
            if (value.kind != ValueKind::String)
            {
                return wrongType(argument, "a string");
            }

            if (key == "io_type")
            {
                record.ioType = std::move(value.text);
            }
            else if (key == "description")
            {
                record.description = std::move(value.text);
            }
            else
            {
                record.callMethod = std::move(value.text);
            }
        }
        else if (key == "requires_store" || key == "store")
        {
            if (isAbsent(value))
            {
                return std::nullopt;
            }
            if (value.kind != ValueKind::Boolean)
            {
                return wrongType(argument, "True or False");
            }
            record.requiresStore = value.boolean;
        }
        else if (key == "version_strategy")
        {
            record.versionStrategy = std::move(value);
        }
        else if (key == "version_reader")
        {
            record.versionReader = std::move(value);
        }
        else if (key == "upgrade_steps" || key == "steps")
        {
            if (isAbsent(value))
            {
                return std::nullopt;
            }
            if (value.kind == ValueKind::EmptyArray)
            {
                record.upgradeSteps = std::vector<discovery::UpgradeStep>{};
            }
            else if (value.kind == ValueKind::UpgradeSteps)
            {
                record.upgradeSteps = std::move(value.steps);
            }
            else
            {
                return wrongType(argument, "a list or a decorated step collection");
            }
        }

        return std::nullopt;
    }

    std::vector<std::filesystem::path> ManifestAssembler::searchRoots() const
    {
        std::vector<std::filesystem::path> roots;
        for (const auto& root : {m_options.searchRoot, m_options.environmentRoot, m_options.workingDirectory})
        {
            if (!root.empty())
            {
                roots.push_back(root);
            }
        }
        return roots;
    }

    std::filesystem::path ManifestAssembler::decoratorRoot() const
    {
        return m_options.searchRoot;
    }

    void ManifestAssembler::fillCallables(discovery::PluginRecord& record, discovery::ParameterExtractor& parameters) const
    {
        parameters.fill(record.callable);
        if (record.config.has_value())
        {
            parameters.fill(*record.config);
        }
        if (record.versionStrategy.has_value() && record.versionStrategy->kind == ValueKind::CallableReference)
        {
            parameters.fill(record.versionStrategy->callable);
        }
        if (record.versionReader.has_value() && record.versionReader->kind == ValueKind::CallableReference)
        {
            parameters.fill(record.versionReader->callable);
        }
    }
} // namespace mex
