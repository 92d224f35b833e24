#include "source_file_index.hpp"

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace mex::discovery
{
    namespace
    {
        constexpr std::array<std::string_view, 3> kExcludedDirectories{
            "__pycache__",
            "venv",
            "node_modules",
        };

        struct Frame
        {
            std::vector<std::filesystem::directory_entry> entries;
            std::size_t next{0};
        };
    } // namespace

    bool isExcludedEntry(std::string_view name)
    {
        if (name.empty() || name.front() == '.')
        {
            return true;
        }
        return std::find(kExcludedDirectories.begin(), kExcludedDirectories.end(), name) != kExcludedDirectories.end();
    }

    void SourceFileIndex::build(const std::filesystem::path& root)
    {
        m_root = root.lexically_normal();
        if (m_root.filename().empty() && m_root.has_parent_path())
        {
            m_root = m_root.parent_path();
        }
        m_files.clear();
        m_issues.clear();
        m_rootIsPackage = false;

        std::error_code statusError;
        if (!std::filesystem::exists(m_root, statusError) || statusError)
        {
            reportIssue(m_root, "search root does not exist");
            return;
        }
        if (!std::filesystem::is_directory(m_root, statusError) || statusError)
        {
            reportIssue(m_root, "search root is not a directory");
            return;
        }

        m_rootIsPackage = std::filesystem::is_regular_file(m_root / kPackageMarker, statusError) && !statusError;

        std::vector<Frame> stack;
        auto openDirectory = [&](const std::filesystem::path& directory) {
            Frame frame;
            std::error_code iteratorError;
            std::filesystem::directory_iterator it(directory, std::filesystem::directory_options::skip_permission_denied, iteratorError);
            if (iteratorError)
            {
                reportIssue(directory, "failed to enumerate directory");
                return;
            }

            for (std::filesystem::directory_iterator end; it != end; it.increment(iteratorError))
            {
                if (iteratorError)
                {
                    reportIssue(directory, "failed to enumerate directory");
                    break;
                }

                const std::string name = it->path().filename().string();
                if (!isExcludedEntry(name))
                {
                    frame.entries.push_back(*it);
                }
            }

            std::sort(frame.entries.begin(), frame.entries.end(),
                [](const auto& lhs, const auto& rhs) { return lhs.path().filename() < rhs.path().filename(); });
            stack.emplace_back(std::move(frame));
        };

        openDirectory(m_root);
        while (!stack.empty())
        {
            Frame& frame = stack.back();
            if (frame.next >= frame.entries.size())
            {
                stack.pop_back();
                continue;
            }

            const std::filesystem::directory_entry entry = frame.entries[frame.next++];

            std::error_code entryError;
            if (entry.is_symlink(entryError))
            {
                if (entry.is_regular_file(entryError) && !entryError && entry.path().extension() == kScriptExtension)
                {
                    m_files.push_back(entry.path());
                }
                continue;
            }

            if (entry.is_directory(entryError) && !entryError)
            {
                openDirectory(entry.path());
                continue;
            }

            if (entry.is_regular_file(entryError) && !entryError && entry.path().extension() == kScriptExtension)
            {
                m_files.push_back(entry.path());
            }
        }
    }

    const std::filesystem::path& SourceFileIndex::root() const noexcept
    {
        return m_root;
    }

    const std::vector<std::filesystem::path>& SourceFileIndex::files() const noexcept
    {
        return m_files;
    }

    const std::vector<SourceFileIndexIssue>& SourceFileIndex::issues() const noexcept
    {
        return m_issues;
    }

    std::vector<std::filesystem::path> SourceFileIndex::findByName(std::string_view fileName) const
    {
        std::vector<std::filesystem::path> matches;
        for (const auto& file : m_files)
        {
            if (file.filename().string() == fileName)
            {
                matches.push_back(file);
            }
        }
        return matches;
    }

    std::string SourceFileIndex::modulePathFor(const std::filesystem::path& file) const
    {
        std::filesystem::path relative = file.lexically_normal().lexically_relative(m_root);
        if (relative.empty() || *relative.begin() == "..")
        {
            relative = file.filename();
        }
        relative.replace_extension();

        std::string modulePath;
        if (m_rootIsPackage)
        {
            modulePath = m_root.filename().string();
        }

        for (const auto& part : relative)
        {
            const std::string segment = part.string();
            if (segment == "__init__" || segment.empty() || segment == ".")
            {
                continue;
            }
            if (!modulePath.empty())
            {
                modulePath.push_back('.');
            }
            modulePath += segment;
        }

        return modulePath;
    }

    const SourceFileIndex& SourceFileIndexCache::indexFor(const std::filesystem::path& root)
    {
        const std::filesystem::path key = root.lexically_normal();
        auto it = m_indexes.find(key);
        if (it == m_indexes.end())
        {
            it = m_indexes.emplace(key, SourceFileIndex{}).first;
            it->second.build(key);
        }
        return it->second;
    }

    void SourceFileIndex::reportIssue(const std::filesystem::path& path, std::string message)
    {
        SourceFileIndexIssue issue;
        issue.path = path;
        issue.message = std::move(message);
        m_issues.emplace_back(std::move(issue));
    }
} // namespace mex::discovery
