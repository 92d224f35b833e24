#include "parameter_extractor.hpp"
#include "source_text.hpp"

#include "../frontend/lexer.hpp"
#include "../frontend/parser.hpp"
#include "../frontend/syntax_query.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace mex::discovery
{
    namespace
    {
        std::size_t firstNonBlankIndent(std::string_view body)
        {
            std::size_t lineStart = 0;
            while (lineStart < body.size())
            {
                auto lineEnd = body.find('\n', lineStart);
                if (lineEnd == std::string_view::npos)
                {
                    lineEnd = body.size();
                }
                const std::string_view line = body.substr(lineStart, lineEnd - lineStart);
                const std::string_view trimmed = trim(line);
                if (!trimmed.empty() && trimmed.front() != '#')
                {
                    return indentationOf(line);
                }
                lineStart = lineEnd + 1;
            }
            return 0;
        }

        // End of the logical line starting at `start`: the first newline
        // outside brackets and string literals.
        std::size_t statementEnd(std::string_view text, std::size_t start)
        {
            std::size_t depth = 0;
            std::size_t index = start;
            while (index < text.size())
            {
                const char ch = text[index];
                if (isQuote(ch))
                {
                    const std::size_t next = skipStringLiteral(text, index);
                    if (next == std::string_view::npos)
                    {
                        return text.size();
                    }
                    index = next;
                    continue;
                }
                if (ch == '(' || ch == '[' || ch == '{')
                {
                    ++depth;
                }
                else if ((ch == ')' || ch == ']' || ch == '}') && depth > 0)
                {
                    --depth;
                }
                else if (ch == '\n' && depth == 0)
                {
                    return index;
                }
                ++index;
            }
            return text.size();
        }

        void appendParameter(std::vector<NamedParameter>& parameters, NamedParameter parameter)
        {
            const auto duplicate = std::find_if(parameters.begin(), parameters.end(),
                [&](const NamedParameter& existing) { return existing.name == parameter.name; });
            if (duplicate == parameters.end())
            {
                parameters.emplace_back(std::move(parameter));
            }
        }

        std::optional<NamedParameter> parseParameterToken(std::string_view token)
        {
            NamedParameter parameter;
            std::string_view head = token;

            if (const auto equals = findTopLevelAssignment(token))
            {
                head = trim(token.substr(0, *equals));
                const std::string_view rawDefault = trim(token.substr(*equals + 1));
                parameter.descriptor.defaultValue = serializeDefault(rawDefault);
                parameter.descriptor.isRequired = false;
            }

            std::string_view name = head;
            if (const auto colon = findTopLevel(head, ':'))
            {
                name = trim(head.substr(0, *colon));
                const std::string_view annotation = trim(head.substr(*colon + 1));
                if (!annotation.empty())
                {
                    parameter.descriptor.annotation = std::string{annotation};
                }
            }

            if (!isIdentifier(name))
            {
                return std::nullopt;
            }

            parameter.name = std::string{name};
            return parameter;
        }

        // Annotated class-level fields, e.g. the fields of a dataclass or a
        // settings model without an explicit `__init__`.
        std::vector<NamedParameter> parseClassFields(std::string_view body)
        {
            std::vector<NamedParameter> fields;
            const std::size_t baseIndent = firstNonBlankIndent(body);

            std::size_t lineStart = 0;
            while (lineStart < body.size())
            {
                std::size_t end = body.find('\n', lineStart);
                if (end == std::string_view::npos)
                {
                    end = body.size();
                }

                const std::string_view line = body.substr(lineStart, end - lineStart);
                const std::string_view trimmed = trim(line);
                if (trimmed.empty() || trimmed.front() == '#' || indentationOf(line) != baseIndent)
                {
                    lineStart = end + 1;
                    continue;
                }

                end = statementEnd(body, lineStart);
                const std::string statement = stripComments(trim(body.substr(lineStart, end - lineStart)));
                lineStart = end + 1;

                const std::string_view text = trim(statement);
                const auto colon = findTopLevel(text, ':');
                if (!colon.has_value() || !isIdentifier(trim(text.substr(0, *colon))))
                {
                    continue;
                }

                const std::string_view keyword = trim(text.substr(0, *colon));
                if (keyword == "else" || keyword == "try" || keyword == "finally" || keyword == "model_config")
                {
                    continue;
                }

                const std::string_view afterColon = trim(text.substr(*colon + 1));
                if (afterColon.rfind("ClassVar", 0) == 0)
                {
                    continue;
                }

                if (auto field = parseParameterToken(text))
                {
                    appendParameter(fields, std::move(*field));
                }
            }

            return fields;
        }

        // `__init__` when the class defines one, else its annotated fields.
        CallableSignature classSignature(std::string_view content, const frontend::Definition& definition)
        {
            for (const auto& member : definition.definitions)
            {
                if (member.kind == frontend::DefinitionKind::Function && member.name == "__init__")
                {
                    CallableSignature signature = signatureOf(content, member);
                    signature.returnAnnotation.reset();
                    return signature;
                }
            }

            CallableSignature signature;
            signature.found = true;
            if (definition.bodyBeginOffset != 0 && definition.bodyBeginOffset < definition.endOffset)
            {
                signature.parameters = parseClassFields(
                    content.substr(definition.bodyBeginOffset, definition.endOffset - definition.bodyBeginOffset));
            }
            return signature;
        }

        std::vector<std::string> splitModulePath(const std::string& modulePath)
        {
            std::vector<std::string> parts;
            std::size_t start = 0;
            while (start <= modulePath.size())
            {
                auto dot = modulePath.find('.', start);
                if (dot == std::string::npos)
                {
                    dot = modulePath.size();
                }
                if (dot > start)
                {
                    parts.emplace_back(modulePath.substr(start, dot - start));
                }
                start = dot + 1;
            }
            return parts;
        }

        bool isRegularFile(const std::filesystem::path& path)
        {
            std::error_code error;
            return std::filesystem::is_regular_file(path, error) && !error;
        }
    } // namespace

    ParameterExtractor::ParameterExtractor(SourceFileIndexCache& indexes, std::vector<std::filesystem::path> searchRoots)
        : m_indexes(indexes)
        , m_searchRoots(std::move(searchRoots))
    {
    }

    CallableSignature ParameterExtractor::extract(const std::string& modulePath, const std::string& name, CallableKind kind)
    {
        const std::string cacheKey = modulePath + ":" + name;
        if (const auto cached = m_cache.find(cacheKey); cached != m_cache.end())
        {
            return cached->second;
        }

        CallableSignature signature;
        for (const auto& root : m_searchRoots)
        {
            if (root.empty())
            {
                continue;
            }

            for (const auto& file : candidateFiles(root, modulePath))
            {
                const auto content = loadFile(file);
                if (!content.has_value())
                {
                    m_diagnostics.emplace_back(makeWarning("MEX-W2700", ErrorKind::Io, "Unable to read '" + file.string() + "'."));
                    continue;
                }

                signature = parseCallableSignature(*content, name, kind);
                if (signature.found)
                {
                    break;
                }
            }

            if (signature.found)
            {
                break;
            }
        }

        m_cache.emplace(cacheKey, signature);
        return signature;
    }

    void ParameterExtractor::fill(CallableDescriptor& callable)
    {
        if (callable.modulePath.empty() || callable.name.empty())
        {
            return;
        }

        CallableSignature signature = extract(callable.modulePath, callable.name, callable.kind);
        if (!signature.found)
        {
            return;
        }

        callable.parameters = std::move(signature.parameters);
        if (callable.kind == CallableKind::Function)
        {
            callable.returnAnnotation = std::move(signature.returnAnnotation);
        }
    }

    const std::vector<Diagnostic>& ParameterExtractor::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::vector<std::filesystem::path> ParameterExtractor::candidateFiles(const std::filesystem::path& root, const std::string& modulePath)
    {
        std::vector<std::filesystem::path> candidates;
        const std::vector<std::string> parts = splitModulePath(modulePath);
        if (parts.empty())
        {
            return candidates;
        }

        auto addCandidate = [&](const std::filesystem::path& path) {
            const auto normalized = path.lexically_normal();
            if (isRegularFile(normalized) && std::find(candidates.begin(), candidates.end(), normalized) == candidates.end())
            {
                candidates.push_back(normalized);
            }
        };

        auto addDirect = [&](std::filesystem::path base, std::size_t firstPart) {
            if (firstPart >= parts.size())
            {
                return;
            }
            for (std::size_t index = firstPart; index < parts.size(); ++index)
            {
                base /= parts[index];
            }
            addCandidate(std::filesystem::path{base.string() + std::string{kScriptExtension}});
            addCandidate(base / kPackageMarker);
        };

        addDirect(root, 0);

        // The root may itself be the top-level package of the module path.
        const std::filesystem::path normalizedRoot = root.lexically_normal();
        const std::filesystem::path rootName = normalizedRoot.filename().empty() ? normalizedRoot.parent_path().filename() : normalizedRoot.filename();
        if (rootName.string() == parts.front())
        {
            addDirect(root, 1);
        }

        const SourceFileIndex& index = m_indexes.indexFor(root);
        for (const auto& file : index.findByName(parts.back() + std::string{kScriptExtension}))
        {
            addCandidate(file);
        }

        return candidates;
    }

    CallableSignature parseCallableSignature(std::string_view content, std::string_view name, CallableKind kind)
    {
        // Lexical errors elsewhere in the module do not hide a definition.
        frontend::Lexer lexer{content};
        lexer.lex();
        frontend::Parser parser{lexer.tokens(), content};
        const frontend::SyntaxTree tree = parser.parse();

        const auto preferred = kind == CallableKind::Class ? frontend::DefinitionKind::Class : frontend::DefinitionKind::Function;
        const auto alternative = kind == CallableKind::Class ? frontend::DefinitionKind::Function : frontend::DefinitionKind::Class;

        const frontend::Definition* definition = frontend::findDefinition(tree, preferred, name);
        if (definition == nullptr)
        {
            definition = frontend::findDefinition(tree, alternative, name);
        }
        if (definition == nullptr)
        {
            return CallableSignature{};
        }

        return definition->kind == frontend::DefinitionKind::Class ? classSignature(content, *definition)
                                                                   : signatureOf(content, *definition);
    }

    CallableSignature signatureOf(std::string_view content, const frontend::Definition& definition)
    {
        CallableSignature signature;
        signature.found = true;
        signature.returnAnnotation = definition.returnAnnotation;

        const std::size_t begin = definition.signatureBeginOffset;
        const std::size_t end = definition.signatureEndOffset;
        if (end > begin + 1 && end <= content.size() && content[begin] == '(' && content[end - 1] == ')')
        {
            signature.parameters = parseParameterList(content.substr(begin + 1, end - begin - 2));
        }
        return signature;
    }

    std::vector<NamedParameter> parseParameterList(std::string_view parameterText)
    {
        std::vector<NamedParameter> parameters;
        const std::string text = stripComments(parameterText);

        bool isFirst = true;
        for (const std::string_view piece : splitTopLevel(text, ','))
        {
            const std::string_view token = trim(piece);
            if (token.empty())
            {
                continue;
            }

            const bool wasFirst = isFirst;
            isFirst = false;

            if (token == "/" || token.front() == '*')
            {
                continue;
            }

            auto parameter = parseParameterToken(token);
            if (!parameter.has_value())
            {
                continue;
            }

            if (wasFirst && (parameter->name == "self" || parameter->name == "cls"))
            {
                continue;
            }

            appendParameter(parameters, std::move(*parameter));
        }

        return parameters;
    }

    std::string serializeDefault(std::string_view rawDefault)
    {
        const std::string_view value = trim(rawDefault);

        if (value == "None")
        {
            return "null";
        }
        if (value == "True")
        {
            return "true";
        }
        if (value == "False")
        {
            return "false";
        }

        if (isQuotedString(value))
        {
            return "\"" + escapeJson(unquote(value)) + "\"";
        }

        // JSON number grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
        std::size_t index = 0;
        auto digits = [&]() {
            const std::size_t start = index;
            while (index < value.size() && value[index] >= '0' && value[index] <= '9')
            {
                ++index;
            }
            return index - start;
        };

        bool isNumber = !value.empty();
        if (index < value.size() && value[index] == '-')
        {
            ++index;
        }
        const std::size_t integerStart = index;
        const std::size_t integerDigits = digits();
        if (integerDigits == 0 || (integerDigits > 1 && value[integerStart] == '0'))
        {
            isNumber = false;
        }
        if (isNumber && index < value.size() && value[index] == '.')
        {
            ++index;
            isNumber = digits() > 0;
        }
        if (isNumber && index < value.size() && (value[index] == 'e' || value[index] == 'E'))
        {
            ++index;
            if (index < value.size() && (value[index] == '+' || value[index] == '-'))
            {
                ++index;
            }
            isNumber = digits() > 0;
        }
        if (isNumber && index == value.size())
        {
            return std::string{value};
        }

        return "\"" + escapeJson(value) + "\"";
    }
} // namespace mex::discovery
