#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "decorator_step_scanner.hpp"

namespace mex::discovery
{
namespace
{
    struct ScopedDirectory
    {
        std::filesystem::path path;
        explicit ScopedDirectory(std::filesystem::path directory) : path(std::move(directory)) {}
        ~ScopedDirectory()
        {
            if (!path.empty())
            {
                std::error_code ec;
                std::filesystem::remove_all(path, ec);
            }
        }
    };

    std::filesystem::path makeTemporaryRoot(const std::string& prefix)
    {
        auto root = std::filesystem::temp_directory_path()
            / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(root);
        return root;
    }

    void writeFile(const std::filesystem::path& path, const std::string& content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream stream(path);
        stream << content;
    }

    TEST(DecoratorStepScannerTest, ExtractsStepArgumentsAndSignature)
    {
        const std::string content = R"(from r2x_demo.upgrader import DemoUpgrader


@DemoUpgrader.register_step(
    target_version="2.0.0",
    upgrade_type=UpgradeType.SYSTEM,  # whole system
    priority=5,
    min_version="1.0",
)
def rename_columns(data: dict, strict: bool = False) -> dict:
    return data


def helper():
    pass
)";

        std::vector<Diagnostic> diagnostics;
        const auto steps = extractSteps(content, "DemoUpgrader", "r2x_demo.steps", diagnostics);

        EXPECT_TRUE(diagnostics.empty());
        ASSERT_EQ(steps.size(), 1u);
        const UpgradeStep& step = steps.front();
        EXPECT_EQ(step.name, "rename_columns");
        EXPECT_EQ(step.targetVersion, "2.0.0");
        EXPECT_EQ(step.category, UpgradeCategory::System);
        EXPECT_EQ(step.priority, 5);
        ASSERT_TRUE(step.minVersion.has_value());
        EXPECT_EQ(*step.minVersion, "1.0");
        EXPECT_FALSE(step.maxVersion.has_value());

        EXPECT_EQ(step.function.name, "rename_columns");
        EXPECT_EQ(step.function.modulePath, "r2x_demo.steps");
        EXPECT_EQ(step.function.kind, CallableKind::Function);
        ASSERT_TRUE(step.function.returnAnnotation.has_value());
        EXPECT_EQ(*step.function.returnAnnotation, "dict");
        ASSERT_EQ(step.function.parameters.size(), 2u);
        EXPECT_EQ(step.function.parameters[0].name, "data");
        EXPECT_TRUE(step.function.parameters[0].descriptor.isRequired);
        EXPECT_EQ(step.function.parameters[1].name, "strict");
        EXPECT_EQ(step.function.parameters[1].descriptor.defaultValue, std::optional<std::string>{"false"});
    }

    TEST(DecoratorStepScannerTest, AppliesDefaultsWhenArgumentsAreOmitted)
    {
        std::vector<Diagnostic> diagnostics;
        const UpgradeStep step = buildUpgradeStep("migrate", "", diagnostics);

        EXPECT_TRUE(diagnostics.empty());
        EXPECT_EQ(step.name, "migrate");
        EXPECT_EQ(step.targetVersion, "unknown");
        EXPECT_EQ(step.category, UpgradeCategory::File);
        EXPECT_EQ(step.priority, 100);
        EXPECT_EQ(toString(step.category), "FILE");
    }

    TEST(DecoratorStepScannerTest, WarnsAboutNonIntegerPriority)
    {
        std::vector<Diagnostic> diagnostics;
        const UpgradeStep step = buildUpgradeStep("migrate", "priority=HIGH, upgrade_type=\"weird\"", diagnostics);

        EXPECT_EQ(step.priority, 100);
        EXPECT_EQ(step.category, UpgradeCategory::Unknown);
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "MEX-W2604");
        EXPECT_TRUE(diagnostics.front().isWarning);
    }

    TEST(DecoratorStepScannerTest, IgnoresDecoratorsOfOtherClasses)
    {
        const std::string content = R"(@OtherUpgrader.register_step(priority=1)
def other_step(data):
    return data
)";

        std::vector<Diagnostic> diagnostics;
        EXPECT_TRUE(extractSteps(content, "DemoUpgrader", "pkg.steps", diagnostics).empty());
    }

    TEST(DecoratorStepScannerTest, ReadsStepsFromDecoratorListsOfNestedFunctions)
    {
        const std::string content = R"py(class Steps:
    @staticmethod
    @DemoUpgrader.register_step (target_version="3.0", priority=2)
    def move_files(folder: "Path", *, dry_run=False) -> "Path | None":
        def register_step(data):
            return data
        return folder

# @DemoUpgrader.register_step(target_version="9.9")
def not_a_step(data):
    return "@DemoUpgrader.register_step(priority=1)"
)py";

        std::vector<Diagnostic> diagnostics;
        const auto steps = extractSteps(content, "DemoUpgrader", "pkg.steps", diagnostics);

        EXPECT_TRUE(diagnostics.empty());
        ASSERT_EQ(steps.size(), 1u);
        EXPECT_EQ(steps.front().name, "move_files");
        EXPECT_EQ(steps.front().targetVersion, "3.0");
        EXPECT_EQ(steps.front().priority, 2);
        ASSERT_TRUE(steps.front().function.returnAnnotation.has_value());
        EXPECT_EQ(*steps.front().function.returnAnnotation, "\"Path | None\"");
        ASSERT_EQ(steps.front().function.parameters.size(), 2u);
        EXPECT_EQ(steps.front().function.parameters[0].name, "folder");
        EXPECT_EQ(steps.front().function.parameters[1].name, "dry_run");
    }

    TEST(DecoratorStepScannerTest, WarnsWhenModuleDoesNotParseCleanly)
    {
        const std::string content = R"(@DemoUpgrader.register_step(priority=3)
def upgrade(data):
    return data

@cache
value = 1
)";

        std::vector<Diagnostic> diagnostics;
        const auto steps = extractSteps(content, "DemoUpgrader", "pkg.steps", diagnostics);

        ASSERT_EQ(steps.size(), 1u);
        EXPECT_EQ(steps.front().priority, 3);
        ASSERT_EQ(diagnostics.size(), 1u);
        EXPECT_EQ(diagnostics.front().code, "MEX-W2603");
        EXPECT_TRUE(diagnostics.front().isWarning);
    }

    TEST(DecoratorStepScannerTest, CollectsStepsAcrossFilesBelowRoot)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-steps-")};
        const auto root = cleanup.path / "r2x_demo";
        writeFile(root / "__init__.py", "");
        writeFile(root / "upgrades" / "first.py", R"(@DemoUpgrader.register_step(target_version="1.1")
def upgrade_first(data):
    return data
)");
        writeFile(root / "upgrades" / "second.py", R"(@DemoUpgrader.register_step(priority=7)
def upgrade_second(data):
    return data
)");
        writeFile(root / "unrelated.py", "def noop():\n    pass\n");

        SourceFileIndexCache indexes;
        DecoratorStepScanner scanner{indexes};
        const DecoratorScanResult result = scanner.scan("DemoUpgrader", root);

        EXPECT_TRUE(result.diagnostics.empty());
        ASSERT_EQ(result.steps.size(), 2u);

        const auto first = std::find_if(result.steps.begin(), result.steps.end(),
            [](const UpgradeStep& step) { return step.name == "upgrade_first"; });
        ASSERT_NE(first, result.steps.end());
        EXPECT_EQ(first->function.modulePath, "r2x_demo.upgrades.first");
        EXPECT_EQ(first->targetVersion, "1.1");
        EXPECT_EQ(first->priority, 100);

        const auto second = std::find_if(result.steps.begin(), result.steps.end(),
            [](const UpgradeStep& step) { return step.name == "upgrade_second"; });
        ASSERT_NE(second, result.steps.end());
        EXPECT_EQ(second->function.modulePath, "r2x_demo.upgrades.second");
        EXPECT_EQ(second->priority, 7);
    }

    TEST(DecoratorStepScannerTest, ScanOfEmptyRootFindsNothing)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-steps-empty-")};

        SourceFileIndexCache indexes;
        DecoratorStepScanner scanner{indexes};
        const DecoratorScanResult result = scanner.scan("DemoUpgrader", cleanup.path);

        EXPECT_TRUE(result.steps.empty());
        EXPECT_TRUE(result.diagnostics.empty());
    }

    TEST(DecoratorStepScannerTest, ReportsWalkIssuesOncePerRoot)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-steps-missing-")};
        const auto missing = cleanup.path / "absent";

        SourceFileIndexCache indexes;
        DecoratorStepScanner scanner{indexes};

        const DecoratorScanResult first = scanner.scan("DemoUpgrader", missing);
        ASSERT_EQ(first.diagnostics.size(), 1u);
        EXPECT_EQ(first.diagnostics.front().code, "MEX-W2601");

        const DecoratorScanResult second = scanner.scan("OtherUpgrader", missing);
        EXPECT_TRUE(second.steps.empty());
        EXPECT_TRUE(second.diagnostics.empty());
    }
} // namespace
} // namespace mex::discovery
