#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "source_file_index.hpp"

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

    void writeFile(const std::filesystem::path& path, const std::string& content = "# synthetic module\n")
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream stream(path);
        stream << content;
    }

    TEST(SourceFileIndexTest, WalksScriptFilesInSortedOrder)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-index-order-")};
        const auto root = cleanup.path;
        writeFile(root / "zeta.py");
        writeFile(root / "alpha" / "beta.py");
        writeFile(root / "alpha" / "README.md");
        writeFile(root / "gamma.py");

        SourceFileIndex index;
        index.build(root);

        ASSERT_TRUE(index.issues().empty());
        ASSERT_EQ(index.files().size(), 3u);
        EXPECT_EQ(index.files()[0].filename().string(), "beta.py");
        EXPECT_EQ(index.files()[1].filename().string(), "gamma.py");
        EXPECT_EQ(index.files()[2].filename().string(), "zeta.py");
    }

    TEST(SourceFileIndexTest, SkipsHiddenAndEnvironmentDirectories)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-index-excluded-")};
        const auto root = cleanup.path;
        writeFile(root / "pkg" / "steps.py");
        writeFile(root / ".git" / "hook.py");
        writeFile(root / "__pycache__" / "steps.py");
        writeFile(root / "venv" / "lib" / "site.py");
        writeFile(root / "node_modules" / "tool.py");
        writeFile(root / ".hidden.py");

        SourceFileIndex index;
        index.build(root);

        ASSERT_EQ(index.files().size(), 1u);
        EXPECT_EQ(index.files().front().filename().string(), "steps.py");
        EXPECT_TRUE(isExcludedEntry("__pycache__"));
        EXPECT_TRUE(isExcludedEntry(".venv"));
        EXPECT_FALSE(isExcludedEntry("r2x_demo"));
    }

    TEST(SourceFileIndexTest, DerivesModulePathsRelativeToRoot)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-index-modules-")};
        const auto root = cleanup.path / "src";
        writeFile(root / "r2x_demo" / "__init__.py");
        writeFile(root / "r2x_demo" / "upgrades" / "steps.py");

        SourceFileIndex index;
        index.build(root);

        EXPECT_EQ(index.modulePathFor(root / "r2x_demo" / "upgrades" / "steps.py"), "r2x_demo.upgrades.steps");
        EXPECT_EQ(index.modulePathFor(root / "r2x_demo" / "__init__.py"), "r2x_demo");

        const auto matches = index.findByName("steps.py");
        ASSERT_EQ(matches.size(), 1u);
        EXPECT_EQ(matches.front().lexically_normal(), (root / "r2x_demo" / "upgrades" / "steps.py").lexically_normal());
    }

    TEST(SourceFileIndexTest, PrefixesPackageRootName)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-index-package-")};
        const auto root = cleanup.path / "r2x_demo";
        writeFile(root / "__init__.py");
        writeFile(root / "upgrader.py");

        SourceFileIndex index;
        index.build(root);

        EXPECT_EQ(index.modulePathFor(root / "upgrader.py"), "r2x_demo.upgrader");
    }

    TEST(SourceFileIndexTest, ReportsMissingRoot)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-index-missing-")};

        SourceFileIndex index;
        index.build(cleanup.path / "does-not-exist");

        EXPECT_TRUE(index.files().empty());
        ASSERT_EQ(index.issues().size(), 1u);
        EXPECT_EQ(index.issues().front().message, "search root does not exist");
    }

    TEST(SourceFileIndexTest, CacheBuildsEachRootOnce)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("mex-index-cache-")};
        writeFile(cleanup.path / "first.py");

        SourceFileIndexCache cache;
        const SourceFileIndex& first = cache.indexFor(cleanup.path);
        writeFile(cleanup.path / "second.py");
        const SourceFileIndex& second = cache.indexFor(cleanup.path);

        EXPECT_EQ(&first, &second);
        EXPECT_EQ(second.files().size(), 1u);
    }
} // namespace
} // namespace mex::discovery
