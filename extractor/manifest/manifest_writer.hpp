#pragma once

#include "../discovery/plugin_record.hpp"

#include <filesystem>
#include <string>

namespace mex
{
    // Pretty-printed manifest document. Optional record fields that are
    // unset are omitted rather than written as null.
    [[nodiscard]] std::string renderManifest(const discovery::PackageManifest& manifest);

    bool writeManifest(const std::filesystem::path& outputPath,
        const discovery::PackageManifest& manifest,
        std::string& errorMessage);
} // namespace mex
