#include <gtest/gtest.h>

#include "manifest_assembler.hpp"
#include "manifest_writer.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

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

    struct ScopedWorkingDirectory
    {
        std::filesystem::path previous;
        explicit ScopedWorkingDirectory(const std::filesystem::path& directory) : previous(std::filesystem::current_path())
        {
            std::filesystem::current_path(directory);
        }
        ~ScopedWorkingDirectory()
        {
            std::error_code ec;
            std::filesystem::current_path(previous, ec);
        }
    };

    bool hasDiagnostic(const mex::ExtractionResult& result, const std::string& code)
    {
        return std::any_of(result.diagnostics.begin(), result.diagnostics.end(),
            [&code](const mex::discovery::Diagnostic& diagnostic) { return diagnostic.code == code; });
    }

    bool hasNoteContaining(const mex::ExtractionResult& result, const std::string& fragment)
    {
        return std::any_of(result.notes.begin(), result.notes.end(),
            [&fragment](const std::string& note) { return note.find(fragment) != std::string::npos; });
    }

    // A package laid out the way an editable install exposes it.
    std::filesystem::path writeDemoPackage(const std::filesystem::path& root)
    {
        const auto package = root / "r2x_demo";
        writeFile(package / "__init__.py", "");
        writeFile(package / "parser.py", R"(class DemoConfig(PluginConfig):
    weather_year: int
    solver: str = "highs"


class DemoParser(BaseParser):
    def __init__(self, path: str, year: int = 2030) -> None:
        self.path = path
)");
        writeFile(package / "functions.py", R"(def add_storage(system: System, capacity: float = 1.5) -> System:
    return system
)");
        writeFile(package / "upgrader.py", R"(class DemoUpgrader(PluginUpgrader):
    def __init__(self, folder: str):
        self.folder = folder
)");
        writeFile(package / "steps.py", R"(from r2x_demo.upgrader import DemoUpgrader


@DemoUpgrader.register_step(target_version="2.0", priority=10)
def rename_columns(folder: str) -> str:
    return folder
)");
        writeFile(package / "plugins.py", R"(from r2x_demo.parser import DemoParser, DemoConfig
from r2x_demo.functions import add_storage
from r2x_demo.upgrader import DemoUpgrader


def register_plugin() -> Package:
    return Package(
        name="r2x-demo",
        plugins=[
            ParserPlugin(
                name="demo-parser",
                obj=DemoParser,
                config=DemoConfig,
                call_method="build_system",
                io_type=IOType.STDOUT,
            ),
            PluginSpec.function(name="storage", entry=add_storage, requires_store=True),
            UpgraderPlugin(
                name="demo-upgrader",
                obj=DemoUpgrader,
                upgrade_steps=DemoUpgrader.steps,
                version_strategy="semver",
            ),
        ],
    )
)");
        return package;
    }

    TEST(ManifestAssemblerTest, ExtractsPackageEndToEnd)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-assemble-")};
        const auto package = writeDemoPackage(cleanup.path);

        mex::ExtractionOptions options;
        options.packageDirectory = package;
        options.packageName = "r2x-demo";

        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.extract();

        ASSERT_EQ(result.fatalError(), nullptr) << result.fatalError()->message;
        ASSERT_TRUE(result.manifest.has_value());
        EXPECT_TRUE(result.diagnostics.empty()) << result.diagnostics.front().message;

        const auto& manifest = *result.manifest;
        EXPECT_EQ(manifest.name, "r2x-demo");
        ASSERT_EQ(manifest.plugins.size(), 3u);

        const auto& parser = manifest.plugins[0];
        EXPECT_EQ(parser.name, "demo-parser");
        EXPECT_EQ(parser.kind, mex::discovery::PluginKind::Parser);
        EXPECT_EQ(parser.callable.modulePath, "r2x_demo.parser");
        EXPECT_EQ(parser.callable.name, "DemoParser");
        EXPECT_EQ(parser.callable.kind, mex::discovery::CallableKind::Class);
        ASSERT_EQ(parser.callable.parameters.size(), 2u);
        EXPECT_EQ(parser.callable.parameters[1].name, "year");
        EXPECT_EQ(parser.callable.parameters[1].descriptor.defaultValue, std::optional<std::string>{"2030"});
        ASSERT_TRUE(parser.config.has_value());
        ASSERT_EQ(parser.config->parameters.size(), 2u);
        EXPECT_EQ(parser.config->parameters[0].name, "weather_year");
        EXPECT_EQ(parser.callMethod, std::optional<std::string>{"build_system"});
        EXPECT_EQ(parser.ioType, std::optional<std::string>{"stdout"});

        const auto& storage = manifest.plugins[1];
        EXPECT_EQ(storage.kind, mex::discovery::PluginKind::Modifier);
        EXPECT_EQ(storage.callable.kind, mex::discovery::CallableKind::Function);
        EXPECT_EQ(storage.callable.returnAnnotation, std::optional<std::string>{"System"});
        EXPECT_EQ(storage.requiresStore, std::optional<bool>{true});

        const auto& upgrader = manifest.plugins[2];
        EXPECT_EQ(upgrader.kind, mex::discovery::PluginKind::Upgrader);
        ASSERT_TRUE(upgrader.upgradeSteps.has_value());
        ASSERT_EQ(upgrader.upgradeSteps->size(), 1u);
        const auto& step = upgrader.upgradeSteps->front();
        EXPECT_EQ(step.name, "rename_columns");
        EXPECT_EQ(step.function.modulePath, "r2x_demo.steps");
        EXPECT_EQ(step.targetVersion, "2.0");
        EXPECT_EQ(step.priority, 10);
        ASSERT_TRUE(upgrader.versionStrategy.has_value());
        EXPECT_EQ(upgrader.versionStrategy->kind, mex::discovery::ValueKind::String);
        EXPECT_EQ(upgrader.versionStrategy->text, "semver");

        EXPECT_TRUE(hasNoteContaining(result, "entry file located by file name"));
    }

    TEST(ManifestAssemblerTest, StrategiesProduceIdenticalManifests)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-assemble-parity-")};
        const auto package = writeDemoPackage(cleanup.path);

        std::string rendered[2];
        const mex::discovery::LocatorStrategy strategies[2]
            = {mex::discovery::LocatorStrategy::SyntaxTree, mex::discovery::LocatorStrategy::Textual};
        for (std::size_t index = 0; index < 2; ++index)
        {
            mex::ExtractionOptions options;
            options.entryFile = package / "plugins.py";
            options.packageDirectory = package;
            options.packageName = "r2x-demo";
            options.strategy = strategies[index];

            mex::ManifestAssembler assembler{options};
            const mex::ExtractionResult result = assembler.extract();
            ASSERT_TRUE(result.manifest.has_value());
            rendered[index] = mex::renderManifest(*result.manifest);
        }

        EXPECT_EQ(rendered[0], rendered[1]);
    }

    TEST(ManifestAssemblerTest, KeepsFirstDuplicateAndSkipsMalformedRegistrations)
    {
        const std::string source = R"(from pkg.mod import Alpha, Beta

def register_plugin():
    return Package(plugins=[
        ParserPlugin(name="dup", obj=Alpha),
        ExporterPlugin(name="dup", obj=Beta),
        ExporterPlugin("positional", obj=Beta),
        ExporterPlugin(name="missing-obj"),
        ExporterPlugin(name="unknown", obj=NotImported),
        ExporterPlugin(name=Alpha, obj=Beta),
        ExporterPlugin(name="ok", obj=Beta, extra_flag=1),
    ])
)";

        mex::ExtractionOptions options;
        options.packageName = "pkg";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.assemble(source, "pkg");

        ASSERT_TRUE(result.manifest.has_value());
        ASSERT_EQ(result.manifest->plugins.size(), 2u);
        EXPECT_EQ(result.manifest->plugins[0].name, "dup");
        EXPECT_EQ(result.manifest->plugins[0].callable.name, "Alpha");
        EXPECT_EQ(result.manifest->plugins[1].name, "ok");

        EXPECT_TRUE(hasDiagnostic(result, "MEX-W3101"));
        EXPECT_TRUE(hasDiagnostic(result, "MEX-E2303"));
        EXPECT_TRUE(hasDiagnostic(result, "MEX-E3106"));
        EXPECT_TRUE(hasDiagnostic(result, "MEX-E3107"));
        EXPECT_TRUE(hasDiagnostic(result, "MEX-E3102"));
        for (const auto& diagnostic : result.diagnostics)
        {
            EXPECT_TRUE(diagnostic.isWarning) << diagnostic.code;
        }
        EXPECT_EQ(result.fatalError(), nullptr);
        EXPECT_TRUE(hasNoteContaining(result, "ignored keyword 'extra_flag' of ExporterPlugin"));

        const auto positional = std::find_if(result.diagnostics.begin(), result.diagnostics.end(),
            [](const mex::discovery::Diagnostic& diagnostic) { return diagnostic.code == "MEX-E2303"; });
        ASSERT_NE(positional, result.diagnostics.end());
        EXPECT_EQ(positional->message.rfind("Skipped registration #3 (ExporterPlugin): ", 0), 0u);
    }

    TEST(ManifestAssemblerTest, EmptyManifestWhenEveryRegistrationIsMalformed)
    {
        const std::string source = R"(def register_plugin():
    return Package(plugins=[ParserPlugin(name="lonely")])
)";

        mex::ExtractionOptions options;
        options.packageName = "lonely";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.assemble(source, "");

        ASSERT_TRUE(result.manifest.has_value());
        EXPECT_TRUE(result.manifest->plugins.empty());
        EXPECT_TRUE(hasDiagnostic(result, "MEX-E3106"));
    }

    TEST(ManifestAssemblerTest, MissingRegistrationFunctionIsFatal)
    {
        mex::ExtractionOptions options;
        options.packageName = "none";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.assemble("def unrelated():\n    pass\n", "");

        EXPECT_FALSE(result.manifest.has_value());
        const mex::discovery::Diagnostic* fatal = result.fatalError();
        ASSERT_NE(fatal, nullptr);
        EXPECT_EQ(fatal->code, "MEX-E2500");
        EXPECT_EQ(fatal->kind, mex::discovery::ErrorKind::NotFound);
        EXPECT_TRUE(hasNoteContaining(result, "falling back to the text locator"));
    }

    TEST(ManifestAssemblerTest, AutomaticStrategyFallsBackToTextOnLexicalErrors)
    {
        const std::string source = R"(from pkg.mod import Alpha

legacy = 1 $ 2

def register_plugin():
    return Package(plugins=[ParserPlugin(name="alpha", obj=Alpha)])
)";

        mex::ExtractionOptions options;
        options.packageName = "pkg";
        mex::ManifestAssembler automatic{options};
        const mex::ExtractionResult fallback = automatic.assemble(source, "pkg");

        ASSERT_TRUE(fallback.manifest.has_value());
        ASSERT_EQ(fallback.manifest->plugins.size(), 1u);
        EXPECT_TRUE(hasNoteContaining(fallback, "text locator found 1 registration calls"));

        options.strategy = mex::discovery::LocatorStrategy::SyntaxTree;
        mex::ManifestAssembler treeOnly{options};
        const mex::ExtractionResult failed = treeOnly.assemble(source, "pkg");

        EXPECT_FALSE(failed.manifest.has_value());
        ASSERT_NE(failed.fatalError(), nullptr);
        EXPECT_EQ(failed.fatalError()->code, "MEX-E2000");
        EXPECT_EQ(failed.fatalError()->kind, mex::discovery::ErrorKind::InvalidSyntax);
    }

    TEST(ManifestAssemblerTest, AutomaticStrategyFallsBackToTextOnParseErrors)
    {
        const std::string source = R"(from pkg.mod import Alpha

@cache
settings = load()

def register_plugin():
    return Package(plugins=[ParserPlugin(name="alpha", obj=Alpha)])
)";

        mex::ExtractionOptions options;
        options.packageName = "pkg";
        mex::ManifestAssembler automatic{options};
        const mex::ExtractionResult fallback = automatic.assemble(source, "pkg");

        ASSERT_TRUE(fallback.manifest.has_value());
        ASSERT_EQ(fallback.manifest->plugins.size(), 1u);
        EXPECT_EQ(fallback.manifest->plugins.front().callable.modulePath, "pkg.mod");
        EXPECT_TRUE(hasNoteContaining(fallback, "tree locator failed"));
        EXPECT_TRUE(hasNoteContaining(fallback, "text locator found 1 registration calls"));

        options.strategy = mex::discovery::LocatorStrategy::SyntaxTree;
        mex::ManifestAssembler treeOnly{options};
        const mex::ExtractionResult failed = treeOnly.assemble(source, "pkg");

        EXPECT_FALSE(failed.manifest.has_value());
        ASSERT_NE(failed.fatalError(), nullptr);
        EXPECT_EQ(failed.fatalError()->code, "MEX-E2102");
    }

    TEST(ManifestAssemblerTest, RelativeImportsResolveFromBareEntryFileName)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-assemble-cwd-")};
        const auto package = cleanup.path / "mypkg";
        writeFile(package / "__init__.py", "");
        writeFile(package / "mod.py", "class Alpha:\n    pass\n");
        writeFile(package / "plugins.py", R"(from .mod import Alpha

def register_plugin():
    return Package(plugins=[ParserPlugin(name="alpha", obj=Alpha)])
)");

        ScopedWorkingDirectory workingDirectory{package};

        mex::ExtractionOptions options;
        options.entryFile = "plugins.py";
        options.packageName = "mypkg";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.extract();

        ASSERT_EQ(result.fatalError(), nullptr) << result.fatalError()->message;
        ASSERT_TRUE(result.manifest.has_value());
        ASSERT_EQ(result.manifest->plugins.size(), 1u);
        EXPECT_EQ(result.manifest->plugins.front().callable.modulePath, "mypkg.mod");
        EXPECT_EQ(result.manifest->plugins.front().callable.name, "Alpha");
    }

    TEST(ManifestAssemblerTest, RelativeImportsClimbNestedPackages)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-assemble-nested-")};
        const auto outer = cleanup.path / "a";
        writeFile(outer / "__init__.py", "");
        writeFile(outer / "x.py", "class Y:\n    pass\n");
        writeFile(outer / "b" / "__init__.py", "");
        writeFile(outer / "b" / "plugins.py", R"(from ..x import Y
from .local import Z

def register_plugin():
    return Package(plugins=[
        ParserPlugin(name="y", obj=Y),
        ExporterPlugin(name="z", obj=Z),
    ])
)");

        mex::ExtractionOptions options;
        options.entryFile = outer / "b" / "plugins.py";
        options.packageName = "a";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.extract();

        ASSERT_TRUE(result.manifest.has_value());
        ASSERT_EQ(result.manifest->plugins.size(), 2u);
        EXPECT_EQ(result.manifest->plugins[0].callable.modulePath, "a.x");
        EXPECT_EQ(result.manifest->plugins[1].callable.modulePath, "a.b.local");
    }

    TEST(ManifestAssemblerTest, CustomRegistrationFunctionIsHonoured)
    {
        const std::string source = R"(from pkg.mod import Alpha

def get_plugins():
    return Package(plugins=[ParserPlugin(name="alpha", obj=Alpha)])
)";

        mex::ExtractionOptions options;
        options.packageName = "pkg";
        options.registrationFunction = "get_plugins";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.assemble(source, "pkg");

        ASSERT_TRUE(result.manifest.has_value());
        ASSERT_EQ(result.manifest->plugins.size(), 1u);
        EXPECT_EQ(result.manifest->plugins.front().callable.modulePath, "pkg.mod");
    }

    TEST(ManifestAssemblerTest, ReportsUnreadableEntryFile)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-assemble-missing-")};

        mex::ExtractionOptions options;
        options.entryFile = cleanup.path / "plugins.py";
        options.packageName = "missing";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.extract();

        EXPECT_FALSE(result.manifest.has_value());
        ASSERT_NE(result.fatalError(), nullptr);
        EXPECT_EQ(result.fatalError()->code, "MEX-E3000");
        EXPECT_EQ(result.fatalError()->kind, mex::discovery::ErrorKind::NotFound);
    }

    TEST(ManifestAssemblerTest, ReportsMissingEntryFileInPackageDirectory)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-assemble-nopkg-")};

        mex::ExtractionOptions options;
        options.packageDirectory = cleanup.path;
        options.packageName = "nothing";
        mex::ManifestAssembler assembler{options};
        const mex::ExtractionResult result = assembler.extract();

        EXPECT_FALSE(result.manifest.has_value());
        ASSERT_NE(result.fatalError(), nullptr);
        EXPECT_EQ(result.fatalError()->code, "MEX-E2800");
    }
} // namespace
