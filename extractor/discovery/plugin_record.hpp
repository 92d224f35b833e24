#pragma once

#include "plugin_kind.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mex::discovery
{
    enum class CallableKind
    {
        Class,
        Function
    };

    enum class UpgradeCategory
    {
        File,
        System,
        Unknown
    };

    struct ParameterDescriptor
    {
        std::optional<std::string> annotation;
        // JSON text of the default value.
        std::optional<std::string> defaultValue;
        bool isRequired{true};
    };

    struct NamedParameter
    {
        std::string name;
        ParameterDescriptor descriptor;
    };

    struct CallableDescriptor
    {
        std::string modulePath;
        std::string name;
        CallableKind kind{CallableKind::Function};
        std::optional<std::string> returnAnnotation;
        // Declaration order, unique names.
        std::vector<NamedParameter> parameters;
    };

    struct UpgradeStep
    {
        std::string name;
        CallableDescriptor function;
        std::string targetVersion{"unknown"};
        UpgradeCategory category{UpgradeCategory::File};
        std::int64_t priority{100};
        std::optional<std::string> minVersion;
        std::optional<std::string> maxVersion;
    };

    enum class ValueKind
    {
        Null,
        Boolean,
        String,
        EmptyArray,
        CallableReference,
        UpgradeSteps,
        Opaque
    };

    struct ClassifiedValue
    {
        ValueKind kind{ValueKind::Null};
        bool boolean{false};
        std::string text;
        CallableDescriptor callable;
        std::vector<UpgradeStep> steps;
    };

    struct PluginRecord
    {
        std::string name;
        PluginKind kind{PluginKind::Parser};
        CallableDescriptor callable;
        std::optional<CallableDescriptor> config;
        std::optional<std::string> callMethod;
        std::optional<std::string> ioType;
        std::optional<bool> requiresStore;
        std::optional<ClassifiedValue> versionStrategy;
        std::optional<ClassifiedValue> versionReader;
        std::optional<std::vector<UpgradeStep>> upgradeSteps;
        std::optional<std::string> description;
    };

    struct PackageManifest
    {
        std::string name;
        std::vector<PluginRecord> plugins;
    };

    [[nodiscard]] inline CallableKind inferCallableKind(const std::string& name)
    {
        if (!name.empty() && name.front() >= 'A' && name.front() <= 'Z')
        {
            return CallableKind::Class;
        }
        return CallableKind::Function;
    }
} // namespace mex::discovery
