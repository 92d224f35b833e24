#include "entry_file_locator.hpp"
#include "source_file_index.hpp"
#include "source_text.hpp"

#include <algorithm>
#include <array>
#include <system_error>
#include <utility>

namespace mex::discovery
{
    namespace
    {
        constexpr std::array<std::string_view, 2> kEntryFileNames{"plugins.py", "plugin.py"};

        bool isRegularFile(const std::filesystem::path& path)
        {
            std::error_code error;
            return std::filesystem::is_regular_file(path, error) && !error;
        }

        bool isDirectory(const std::filesystem::path& path)
        {
            std::error_code error;
            return std::filesystem::is_directory(path, error) && !error;
        }

        std::vector<std::filesystem::path> sortedSubdirectories(const std::filesystem::path& directory)
        {
            std::vector<std::filesystem::path> subdirectories;
            std::error_code error;
            std::filesystem::directory_iterator it(directory, std::filesystem::directory_options::skip_permission_denied, error);
            if (error)
            {
                return subdirectories;
            }

            for (std::filesystem::directory_iterator end; it != end; it.increment(error))
            {
                if (error)
                {
                    break;
                }
                std::error_code entryError;
                if (it->is_directory(entryError) && !entryError)
                {
                    subdirectories.push_back(it->path());
                }
            }

            std::sort(subdirectories.begin(), subdirectories.end());
            return subdirectories;
        }

        std::string normalizeDistributionName(std::string_view name)
        {
            std::string normalized{name};
            std::replace(normalized.begin(), normalized.end(), '-', '_');
            std::replace(normalized.begin(), normalized.end(), '.', '_');
            return normalized;
        }

        std::optional<std::filesystem::path> findDistInfo(const std::filesystem::path& sitePackages,
            const std::string& distributionName,
            const std::optional<std::string>& version)
        {
            const std::string normalized = normalizeDistributionName(distributionName);
            if (version.has_value())
            {
                const auto exact = sitePackages / (normalized + "-" + *version + ".dist-info");
                if (isDirectory(exact))
                {
                    return exact;
                }
                return std::nullopt;
            }

            const std::string prefix = normalized + "-";
            for (const auto& directory : sortedSubdirectories(sitePackages))
            {
                const std::string name = directory.filename().string();
                if (name.rfind(prefix, 0) == 0 && directory.extension() == ".dist-info")
                {
                    return directory;
                }
            }
            return std::nullopt;
        }

        std::string parentModule(const std::string& modulePath)
        {
            const auto dot = modulePath.rfind('.');
            return dot == std::string::npos ? std::string{} : modulePath.substr(0, dot);
        }
    } // namespace

    EntryFileLocatorResult EntryFileLocator::locate(const EntryFileQuery& query) const
    {
        EntryFileLocatorResult result;

        if (!query.environmentRoot.empty() && !query.distributionName.empty())
        {
            result.location = locateViaEntryPoints(query, result.diagnostics);
        }

        if (!result.location.has_value())
        {
            result.location = locateByFileName(query.packageDirectory);
        }

        if (!result.location.has_value())
        {
            result.error = makeError("MEX-E2800",
                ErrorKind::NotFound,
                "plugins.py or plugin.py not found in '" + query.packageDirectory.string() + "'.");
        }

        return result;
    }

    std::optional<EntryFileLocation> EntryFileLocator::locateViaEntryPoints(const EntryFileQuery& query,
        std::vector<Diagnostic>& diagnostics) const
    {
        for (const auto& sitePackages : sitePackagesDirectories(query.environmentRoot))
        {
            const auto distInfo = findDistInfo(sitePackages, query.distributionName, query.distributionVersion);
            if (!distInfo.has_value())
            {
                continue;
            }

            const auto indexPath = *distInfo / "entry_points.txt";
            if (!isRegularFile(indexPath))
            {
                continue;
            }

            const auto content = loadFile(indexPath);
            if (!content.has_value())
            {
                diagnostics.emplace_back(makeWarning("MEX-W2801", ErrorKind::Io, "Unable to read '" + indexPath.string() + "'."));
                continue;
            }

            const auto reference = parseEntryPoints(*content, query.entryPointGroup);
            if (!reference.has_value())
            {
                continue;
            }

            std::string relative = reference->modulePath;
            std::replace(relative.begin(), relative.end(), '.', '/');

            std::filesystem::path filePath = sitePackages / (relative + std::string{kScriptExtension});
            std::string packagePath = parentModule(reference->modulePath);
            if (!isRegularFile(filePath))
            {
                filePath = sitePackages / relative / kPackageMarker;
                packagePath = reference->modulePath;
            }

            if (!isRegularFile(filePath))
            {
                diagnostics.emplace_back(makeWarning("MEX-W2802",
                    ErrorKind::NotFound,
                    "Entry point module '" + reference->modulePath + "' has no file under '" + sitePackages.string() + "'."));
                continue;
            }

            EntryFileLocation location;
            location.filePath = filePath.lexically_normal();
            location.packagePath = std::move(packagePath);
            if (!reference->function.empty())
            {
                location.registrationFunction = reference->function;
            }
            location.fromEntryPointIndex = true;
            return location;
        }

        return std::nullopt;
    }

    std::string packagePathOf(const std::filesystem::path& scriptPath)
    {
        std::error_code error;
        std::filesystem::path absolute = std::filesystem::absolute(scriptPath, error);
        if (error)
        {
            absolute = scriptPath;
        }
        const std::filesystem::path directory = absolute.lexically_normal().parent_path();

        std::vector<std::string> packages;
        for (std::filesystem::path current = directory; !current.filename().empty(); current = current.parent_path())
        {
            if (!isRegularFile(current / kPackageMarker))
            {
                break;
            }
            packages.emplace_back(current.filename().string());
        }

        if (packages.empty())
        {
            return directory.filename().string();
        }

        std::string packagePath;
        for (auto it = packages.rbegin(); it != packages.rend(); ++it)
        {
            if (!packagePath.empty())
            {
                packagePath += '.';
            }
            packagePath += *it;
        }
        return packagePath;
    }

    std::optional<EntryFileLocation> EntryFileLocator::locateByFileName(const std::filesystem::path& packageDirectory) const
    {
        if (packageDirectory.empty())
        {
            return std::nullopt;
        }

        auto findIn = [](const std::filesystem::path& directory) -> std::optional<EntryFileLocation> {
            for (const auto& fileName : kEntryFileNames)
            {
                const auto candidate = directory / fileName;
                if (isRegularFile(candidate))
                {
                    EntryFileLocation location;
                    location.filePath = candidate.lexically_normal();
                    location.packagePath = packagePathOf(location.filePath);
                    return location;
                }
            }
            return std::nullopt;
        };

        if (auto direct = findIn(packageDirectory))
        {
            return direct;
        }

        // Editable installs point at a source directory holding the package.
        for (const auto& subdirectory : sortedSubdirectories(packageDirectory))
        {
            if (isExcludedEntry(subdirectory.filename().string()))
            {
                continue;
            }
            if (auto nested = findIn(subdirectory))
            {
                return nested;
            }
        }

        return std::nullopt;
    }

    std::optional<EntryPointReference> parseEntryPoints(std::string_view content, std::string_view group)
    {
        bool inGroup = false;
        std::size_t lineStart = 0;

        while (lineStart < content.size())
        {
            auto lineEnd = content.find('\n', lineStart);
            if (lineEnd == std::string_view::npos)
            {
                lineEnd = content.size();
            }
            const std::string_view line = trim(content.substr(lineStart, lineEnd - lineStart));
            lineStart = lineEnd + 1;

            if (line.empty() || line.front() == '#' || line.front() == ';')
            {
                continue;
            }

            if (line.front() == '[')
            {
                if (inGroup)
                {
                    break;
                }
                inGroup = line.size() >= 2 && line.back() == ']' && trim(line.substr(1, line.size() - 2)) == group;
                continue;
            }

            if (!inGroup)
            {
                continue;
            }

            const auto equals = line.find('=');
            if (equals == std::string_view::npos)
            {
                continue;
            }

            std::string_view value = trim(line.substr(equals + 1));
            const auto extras = value.find_first_of(" \t[");
            if (extras != std::string_view::npos)
            {
                value = trim(value.substr(0, extras));
            }

            EntryPointReference reference;
            reference.name = std::string{trim(line.substr(0, equals))};

            const auto colon = value.find(':');
            if (colon == std::string_view::npos)
            {
                reference.modulePath = std::string{value};
            }
            else
            {
                reference.modulePath = std::string{trim(value.substr(0, colon))};
                reference.function = std::string{trim(value.substr(colon + 1))};
            }

            if (!isDottedName(reference.modulePath) && !isIdentifier(reference.modulePath))
            {
                continue;
            }
            return reference;
        }

        return std::nullopt;
    }

    std::vector<std::filesystem::path> sitePackagesDirectories(const std::filesystem::path& environmentRoot)
    {
        std::vector<std::filesystem::path> directories;
        if (environmentRoot.empty())
        {
            return directories;
        }

        for (const auto& candidate : sortedSubdirectories(environmentRoot / "lib"))
        {
            if (candidate.filename().string().rfind("python", 0) == 0 && isDirectory(candidate / "site-packages"))
            {
                directories.push_back(candidate / "site-packages");
            }
        }

        const auto windowsLayout = environmentRoot / "Lib" / "site-packages";
        if (isDirectory(windowsLayout))
        {
            directories.push_back(windowsLayout);
        }

        return directories;
    }
} // namespace mex::discovery
