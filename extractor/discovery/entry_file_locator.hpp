#pragma once

#include "diagnostic.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    struct EntryFileQuery
    {
        std::filesystem::path packageDirectory;
        std::string distributionName;
        std::optional<std::string> distributionVersion;
        std::filesystem::path environmentRoot;
        std::string entryPointGroup{"r2x_plugin"};
    };

    // `name = module.path:function` from an entry-point index.
    struct EntryPointReference
    {
        std::string name;
        std::string modulePath;
        std::string function;
    };

    struct EntryFileLocation
    {
        std::filesystem::path filePath;
        // Dotted package containing the file, used for relative imports.
        std::string packagePath;
        std::optional<std::string> registrationFunction;
        bool fromEntryPointIndex{false};
    };

    struct EntryFileLocatorResult
    {
        std::optional<EntryFileLocation> location;
        std::vector<Diagnostic> diagnostics;
        std::optional<Diagnostic> error;
    };

    inline constexpr std::string_view kDefaultEntryPointGroup = "r2x_plugin";

    // Finds the registration file of an installed package: first through the
    // distribution's entry_points.txt, then by the conventional file names.
    class EntryFileLocator
    {
    public:
        EntryFileLocator() = default;

        [[nodiscard]] EntryFileLocatorResult locate(const EntryFileQuery& query) const;

    private:
        [[nodiscard]] std::optional<EntryFileLocation> locateViaEntryPoints(const EntryFileQuery& query,
            std::vector<Diagnostic>& diagnostics) const;
        [[nodiscard]] std::optional<EntryFileLocation> locateByFileName(const std::filesystem::path& packageDirectory) const;
    };

    // Dotted package of a script: the names of the enclosing directories that
    // hold `__init__.py`, outermost first. A script outside any package gets
    // the name of its directory.
    [[nodiscard]] std::string packagePathOf(const std::filesystem::path& scriptPath);

    [[nodiscard]] std::optional<EntryPointReference> parseEntryPoints(std::string_view content, std::string_view group);

    [[nodiscard]] std::vector<std::filesystem::path> sitePackagesDirectories(const std::filesystem::path& environmentRoot);
} // namespace mex::discovery
