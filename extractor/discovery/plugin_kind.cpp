#include "plugin_kind.hpp"

namespace mex::discovery
{
    std::string_view toString(PluginKind kind)
    {
        switch (kind)
        {
        case PluginKind::Parser:
            return "parser";
        case PluginKind::Exporter:
            return "exporter";
        case PluginKind::Modifier:
            return "function";
        case PluginKind::Upgrader:
            return "upgrader";
        case PluginKind::Utility:
            return "utility";
        }

        return "unknown";
    }

    const std::vector<ConstructorEntry>& registrationConstructors()
    {
        static const std::vector<ConstructorEntry> table{
            {"ParserPlugin", PluginKind::Parser},
            {"ExporterPlugin", PluginKind::Exporter},
            {"UpgraderPlugin", PluginKind::Upgrader},
            {"BasePlugin", PluginKind::Modifier},
            {"PluginSpec.parser", PluginKind::Parser},
            {"PluginSpec.exporter", PluginKind::Exporter},
            {"PluginSpec.function", PluginKind::Modifier},
            {"PluginSpec.upgrader", PluginKind::Upgrader},
            {"PluginSpec.utility", PluginKind::Utility},
        };
        return table;
    }

    std::optional<PluginKind> pluginKindForConstructor(std::string_view callee)
    {
        for (const auto& entry : registrationConstructors())
        {
            if (entry.callee == callee)
            {
                return entry.kind;
            }
        }

        return std::nullopt;
    }
} // namespace mex::discovery
