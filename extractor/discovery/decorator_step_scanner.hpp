#pragma once

#include "diagnostic.hpp"
#include "plugin_record.hpp"
#include "source_file_index.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    struct DecoratorScanResult
    {
        std::vector<UpgradeStep> steps;
        std::vector<Diagnostic> diagnostics;
    };

    // Collects `@Class.register_step(...)` decorated functions below a root.
    // Files are visited in index order; consumers should not rely on the
    // relative order of steps from different files.
    class DecoratorStepScanner
    {
    public:
        explicit DecoratorStepScanner(SourceFileIndexCache& indexes);

        [[nodiscard]] DecoratorScanResult scan(const std::string& className, const std::filesystem::path& root);

    private:
        SourceFileIndexCache& m_indexes;
        // Roots whose walk issues were already reported by this scanner.
        std::vector<std::filesystem::path> m_reportedRoots;
    };

    [[nodiscard]] std::vector<UpgradeStep> extractSteps(std::string_view content,
        std::string_view className,
        const std::string& modulePath,
        std::vector<Diagnostic>& diagnostics);

    [[nodiscard]] UpgradeStep buildUpgradeStep(const std::string& functionName,
        std::string_view decoratorArguments,
        std::vector<Diagnostic>& diagnostics);

    [[nodiscard]] std::string_view toString(UpgradeCategory category);
} // namespace mex::discovery
