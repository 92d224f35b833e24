#include "import_resolver.hpp"
#include "source_text.hpp"

#include <utility>

namespace mex::discovery
{
    namespace
    {
        bool isSpace(char ch)
        {
            return ch == ' ' || ch == '\t';
        }

        // Next whitespace-delimited word of `text` starting at `index`.
        std::string_view nextWord(std::string_view text, std::size_t& index)
        {
            while (index < text.size() && isSpace(text[index]))
            {
                ++index;
            }
            const std::size_t start = index;
            while (index < text.size() && !isSpace(text[index]))
            {
                ++index;
            }
            return text.substr(start, index - start);
        }

        std::string stripBrackets(std::string_view text)
        {
            std::string result;
            result.reserve(text.size());
            for (char ch : text)
            {
                if (ch != '(' && ch != ')' && ch != ',')
                {
                    result.push_back(ch);
                }
            }
            return std::string{trim(result)};
        }
    } // namespace

    SymbolTable::SymbolTable(std::unordered_map<std::string, SymbolBinding> bindings)
        : m_bindings(std::move(bindings))
    {
    }

    const SymbolBinding* SymbolTable::find(std::string_view localName) const
    {
        const auto it = m_bindings.find(std::string{localName});
        if (it == m_bindings.end())
        {
            return nullptr;
        }
        return &it->second;
    }

    std::size_t SymbolTable::size() const noexcept
    {
        return m_bindings.size();
    }

    bool SymbolTable::empty() const noexcept
    {
        return m_bindings.empty();
    }

    void ImportResolver::setPackageContext(std::string packagePath)
    {
        m_packagePath = std::move(packagePath);
    }

    SymbolTable ImportResolver::resolve(std::string_view source)
    {
        m_diagnostics.clear();

        std::unordered_map<std::string, SymbolBinding> bindings;
        std::size_t lineStart = 0;
        std::size_t lineNumber = 0;

        while (lineStart <= source.size())
        {
            std::size_t lineEnd = source.find('\n', lineStart);
            if (lineEnd == std::string_view::npos)
            {
                lineEnd = source.size();
            }
            ++lineNumber;

            std::string_view line = trim(source.substr(lineStart, lineEnd - lineStart));
            lineStart = lineEnd + 1;

            const auto commentStart = line.find('#');
            if (commentStart != std::string_view::npos)
            {
                line = trim(line.substr(0, commentStart));
            }

            if (line.size() < 5 || line.compare(0, 4, "from") != 0 || !isSpace(line[4]))
            {
                continue;
            }

            std::size_t cursor = 4;
            const std::string_view modulePart = nextWord(line, cursor);
            const std::string_view keyword = nextWord(line, cursor);
            if (modulePart.empty() || keyword != "import")
            {
                continue;
            }

            const std::string_view importList = trim(line.substr(cursor));
            if (importList.empty())
            {
                continue;
            }

            if (importList.back() == '\\')
            {
                reportSkippedImport(lineNumber, "line continuation");
                continue;
            }

            const bool opensParen = importList.find('(') != std::string_view::npos;
            const bool closesParen = importList.find(')') != std::string_view::npos;
            if (opensParen && !closesParen)
            {
                reportSkippedImport(lineNumber, "parenthesised import list");
                continue;
            }

            const std::string modulePath = resolveModulePath(modulePart);

            std::size_t nameStart = 0;
            while (nameStart <= importList.size())
            {
                std::size_t nameEnd = importList.find(',', nameStart);
                if (nameEnd == std::string_view::npos)
                {
                    nameEnd = importList.size();
                }

                const std::string importedName = stripBrackets(importList.substr(nameStart, nameEnd - nameStart));
                nameStart = nameEnd + 1;

                if (importedName.empty() || importedName == "*")
                {
                    continue;
                }

                std::size_t wordCursor = 0;
                const std::string_view original = nextWord(importedName, wordCursor);
                const std::string_view asKeyword = nextWord(importedName, wordCursor);
                std::string_view local = original;
                if (asKeyword == "as")
                {
                    local = nextWord(importedName, wordCursor);
                }

                if (!isIdentifier(original) || !isIdentifier(local))
                {
                    continue;
                }

                SymbolBinding binding;
                binding.modulePath = modulePath;
                binding.originalName = std::string{original};
                bindings[std::string{local}] = std::move(binding);
            }
        }

        return SymbolTable{std::move(bindings)};
    }

    const std::vector<Diagnostic>& ImportResolver::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::string ImportResolver::resolveModulePath(std::string_view written) const
    {
        std::size_t level = 0;
        while (level < written.size() && written[level] == '.')
        {
            ++level;
        }

        if (level == 0 || m_packagePath.empty())
        {
            return std::string{written};
        }

        // One leading dot is the package itself; each further dot climbs a level.
        std::string base = m_packagePath;
        for (std::size_t climb = 1; climb < level; ++climb)
        {
            const auto dot = base.rfind('.');
            if (dot == std::string::npos)
            {
                return std::string{written};
            }
            base.erase(dot);
        }

        const std::string_view remainder = written.substr(level);
        if (remainder.empty())
        {
            return base;
        }
        return base + "." + std::string{remainder};
    }

    void ImportResolver::reportSkippedImport(std::size_t lineNumber, std::string_view reason)
    {
        m_diagnostics.emplace_back(makeWarning("MEX-W2200",
            ErrorKind::UnsupportedConstruct,
            "Skipped multi-line import on line " + std::to_string(lineNumber) + " (" + std::string{reason} + ")."));
    }
} // namespace mex::discovery
