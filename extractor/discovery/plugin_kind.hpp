#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    enum class PluginKind
    {
        Parser,
        Exporter,
        Modifier,
        Upgrader,
        Utility
    };

    struct ConstructorEntry
    {
        std::string_view callee;
        PluginKind kind;
    };

    // The `plugin_type` discriminator written to the manifest.
    [[nodiscard]] std::string_view toString(PluginKind kind);

    // Registration constructors in the order they are matched.
    [[nodiscard]] const std::vector<ConstructorEntry>& registrationConstructors();

    [[nodiscard]] std::optional<PluginKind> pluginKindForConstructor(std::string_view callee);
} // namespace mex::discovery
