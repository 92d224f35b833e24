#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    struct SourceFileIndexIssue
    {
        std::filesystem::path path;
        std::string message;
    };

    // Every script file below a root, in a depth-first walk over sorted
    // directory entries. Hidden entries and cache/environment directories
    // are never entered; symlinked directories are not followed.
    class SourceFileIndex
    {
    public:
        SourceFileIndex() = default;

        void build(const std::filesystem::path& root);

        [[nodiscard]] const std::filesystem::path& root() const noexcept;
        [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept;
        [[nodiscard]] const std::vector<SourceFileIndexIssue>& issues() const noexcept;

        [[nodiscard]] std::vector<std::filesystem::path> findByName(std::string_view fileName) const;

        // Dotted module path of `file`, prefixed with the root's own name
        // when the root is itself a package.
        [[nodiscard]] std::string modulePathFor(const std::filesystem::path& file) const;

    private:
        void reportIssue(const std::filesystem::path& path, std::string message);

        std::filesystem::path m_root;
        bool m_rootIsPackage{false};
        std::vector<std::filesystem::path> m_files;
        std::vector<SourceFileIndexIssue> m_issues;
    };

    // One index per root, built on first use and shared by the scanners of
    // a single extraction.
    class SourceFileIndexCache
    {
    public:
        [[nodiscard]] const SourceFileIndex& indexFor(const std::filesystem::path& root);

    private:
        std::map<std::filesystem::path, SourceFileIndex> m_indexes;
    };

    [[nodiscard]] bool isExcludedEntry(std::string_view name);

    inline constexpr std::string_view kScriptExtension = ".py";
    inline constexpr std::string_view kPackageMarker = "__init__.py";
} // namespace mex::discovery
