#include "decorator_step_scanner.hpp"
#include "parameter_extractor.hpp"
#include "source_text.hpp"

#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <utility>

namespace mex::discovery
{
    namespace
    {
        constexpr std::string_view kRegisterStep = ".register_step";

        void collectDecoratedFunctions(const std::vector<frontend::Definition>& definitions,
            std::vector<const frontend::Definition*>& functions)
        {
            for (const auto& definition : definitions)
            {
                if (definition.kind == frontend::DefinitionKind::Function && !definition.decorators.empty())
                {
                    functions.push_back(&definition);
                }
                collectDecoratedFunctions(definition.definitions, functions);
            }
        }

        // Index of the '(' after `@Class.register_step` in a decorator, if
        // the decorator is that call.
        std::optional<std::size_t> registerStepArguments(std::string_view decorator, std::string_view className)
        {
            std::size_t cursor = 1;
            if (decorator.empty() || decorator.front() != '@' || decorator.compare(cursor, className.size(), className) != 0)
            {
                return std::nullopt;
            }
            cursor += className.size();
            if (decorator.compare(cursor, kRegisterStep.size(), kRegisterStep) != 0)
            {
                return std::nullopt;
            }
            cursor += kRegisterStep.size();
            while (cursor < decorator.size() && (decorator[cursor] == ' ' || decorator[cursor] == '\t'))
            {
                ++cursor;
            }
            if (cursor >= decorator.size() || decorator[cursor] != '(')
            {
                return std::nullopt;
            }
            return cursor;
        }

        std::string toUpper(std::string_view text)
        {
            std::string upper;
            upper.reserve(text.size());
            for (char ch : text)
            {
                upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
            }
            return upper;
        }

        UpgradeCategory parseCategory(std::string_view value)
        {
            std::string_view segment = value;
            const auto dot = segment.rfind('.');
            if (dot != std::string_view::npos)
            {
                segment = segment.substr(dot + 1);
            }

            const std::string name = toUpper(unquote(trim(segment)));
            if (name == "FILE")
            {
                return UpgradeCategory::File;
            }
            if (name == "SYSTEM")
            {
                return UpgradeCategory::System;
            }
            return UpgradeCategory::Unknown;
        }
    } // namespace

    std::string_view toString(UpgradeCategory category)
    {
        switch (category)
        {
        case UpgradeCategory::File:
            return "FILE";
        case UpgradeCategory::System:
            return "SYSTEM";
        case UpgradeCategory::Unknown:
            return "UNKNOWN";
        }

        return "UNKNOWN";
    }

    DecoratorStepScanner::DecoratorStepScanner(SourceFileIndexCache& indexes)
        : m_indexes(indexes)
    {
    }

    DecoratorScanResult DecoratorStepScanner::scan(const std::string& className, const std::filesystem::path& root)
    {
        DecoratorScanResult result;
        const SourceFileIndex& index = m_indexes.indexFor(root);

        if (std::find(m_reportedRoots.begin(), m_reportedRoots.end(), index.root()) == m_reportedRoots.end())
        {
            m_reportedRoots.push_back(index.root());
            for (const auto& issue : index.issues())
            {
                result.diagnostics.emplace_back(makeWarning("MEX-W2601",
                    ErrorKind::Io,
                    issue.path.string() + ": " + issue.message + "."));
            }
        }

        const std::string pattern = "@" + className + std::string{kRegisterStep};
        for (const auto& file : index.files())
        {
            const auto content = loadFile(file);
            if (!content.has_value())
            {
                result.diagnostics.emplace_back(makeWarning("MEX-W2602",
                    ErrorKind::Io,
                    "Skipped unreadable file '" + file.string() + "'."));
                continue;
            }

            if (content->find(pattern) == std::string::npos)
            {
                continue;
            }

            auto steps = extractSteps(*content, className, index.modulePathFor(file), result.diagnostics);
            for (auto& step : steps)
            {
                result.steps.emplace_back(std::move(step));
            }
        }

        return result;
    }

    std::vector<UpgradeStep> extractSteps(std::string_view content,
        std::string_view className,
        const std::string& modulePath,
        std::vector<Diagnostic>& diagnostics)
    {
        frontend::Lexer lexer{content};
        lexer.lex();
        frontend::Parser parser{lexer.tokens(), content};
        const frontend::SyntaxTree tree = parser.parse();

        const frontend::Diagnostic* syntaxError = nullptr;
        if (!lexer.diagnostics().empty())
        {
            syntaxError = &lexer.diagnostics().front();
        }
        else if (!parser.diagnostics().empty())
        {
            syntaxError = &parser.diagnostics().front();
        }

        if (syntaxError != nullptr)
        {
            diagnostics.emplace_back(makeWarning("MEX-W2603",
                ErrorKind::InvalidSyntax,
                "Module '" + modulePath + "' has " + syntaxError->code + " on line "
                    + std::to_string(syntaxError->span.begin.line) + " (" + syntaxError->message + "); its steps may be incomplete."));
        }

        std::vector<const frontend::Definition*> functions;
        collectDecoratedFunctions(tree.definitions, functions);

        std::vector<UpgradeStep> steps;
        for (const frontend::Definition* function : functions)
        {
            for (const auto& decorator : function->decorators)
            {
                const std::string_view text = decorator.text;
                const auto open = registerStepArguments(text, className);
                if (!open.has_value())
                {
                    continue;
                }

                const auto close = findMatchingDelimiter(text, *open);
                if (!close.has_value())
                {
                    continue;
                }

                UpgradeStep step = buildUpgradeStep(function->name, text.substr(*open + 1, *close - *open - 1), diagnostics);
                step.function.modulePath = modulePath;

                CallableSignature signature = signatureOf(content, *function);
                step.function.parameters = std::move(signature.parameters);
                step.function.returnAnnotation = std::move(signature.returnAnnotation);

                steps.emplace_back(std::move(step));
            }
        }

        return steps;
    }

    UpgradeStep buildUpgradeStep(const std::string& functionName,
        std::string_view decoratorArguments,
        std::vector<Diagnostic>& diagnostics)
    {
        UpgradeStep step;
        step.name = functionName;
        step.function.name = functionName;
        step.function.kind = CallableKind::Function;

        const std::string arguments = stripComments(decoratorArguments);
        for (const std::string_view piece : splitTopLevel(arguments, ','))
        {
            const std::string_view argument = trim(piece);
            const auto equals = findTopLevelAssignment(argument);
            if (!equals.has_value())
            {
                continue;
            }

            const std::string_view key = trim(argument.substr(0, *equals));
            const std::string_view value = trim(argument.substr(*equals + 1));

            if (key == "target_version")
            {
                step.targetVersion = unquote(value);
            }
            else if (key == "upgrade_type")
            {
                step.category = parseCategory(value);
            }
            else if (key == "priority")
            {
                std::int64_t priority = 0;
                const auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), priority);
                if (error == std::errc{} && end == value.data() + value.size())
                {
                    step.priority = priority;
                }
                else
                {
                    diagnostics.emplace_back(makeWarning("MEX-W2604",
                        ErrorKind::InvalidSyntax,
                        "Priority '" + std::string{value} + "' of step '" + functionName + "' is not an integer; using "
                            + std::to_string(step.priority) + "."));
                }
            }
            else if (key == "min_version")
            {
                step.minVersion = unquote(value);
            }
            else if (key == "max_version")
            {
                step.maxVersion = unquote(value);
            }
        }

        return step;
    }
} // namespace mex::discovery
