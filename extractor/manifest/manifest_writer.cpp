#include "manifest_writer.hpp"

#include "../discovery/decorator_step_scanner.hpp"
#include "../discovery/source_text.hpp"

#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace mex
{
    namespace
    {
        using discovery::escapeJson;

        std::string pad(std::size_t depth)
        {
            return std::string(depth * 2, ' ');
        }

        std::string quoted(std::string_view value)
        {
            return "\"" + escapeJson(value) + "\"";
        }

        std::string_view toTypeString(discovery::CallableKind kind)
        {
            return kind == discovery::CallableKind::Class ? "class" : "function";
        }

        // Emits `"key": ` with a leading separator for every member but the first.
        class ObjectWriter
        {
        public:
            ObjectWriter(std::ostringstream& stream, std::size_t depth)
                : m_stream(stream)
                , m_depth(depth)
            {
                m_stream << "{";
            }

            std::ostringstream& member(std::string_view key)
            {
                m_stream << (m_isFirst ? "\n" : ",\n") << pad(m_depth + 1) << quoted(key) << ": ";
                m_isFirst = false;
                return m_stream;
            }

            void close()
            {
                if (m_isFirst)
                {
                    m_stream << "}";
                    return;
                }
                m_stream << "\n" << pad(m_depth) << "}";
            }

            [[nodiscard]] std::size_t childDepth() const noexcept
            {
                return m_depth + 1;
            }

        private:
            std::ostringstream& m_stream;
            std::size_t m_depth;
            bool m_isFirst{true};
        };

        void writeCallable(std::ostringstream& stream, const discovery::CallableDescriptor& callable, std::size_t depth)
        {
            ObjectWriter object{stream, depth};
            object.member("module") << quoted(callable.modulePath);
            object.member("name") << quoted(callable.name);
            object.member("type") << quoted(toTypeString(callable.kind));
            if (callable.returnAnnotation.has_value())
            {
                object.member("return_annotation") << quoted(*callable.returnAnnotation);
            }
            else
            {
                object.member("return_annotation") << "null";
            }

            object.member("parameters");
            ObjectWriter parameters{stream, object.childDepth()};
            for (const auto& parameter : callable.parameters)
            {
                parameters.member(parameter.name);
                ObjectWriter descriptor{stream, parameters.childDepth()};
                if (parameter.descriptor.annotation.has_value())
                {
                    descriptor.member("annotation") << quoted(*parameter.descriptor.annotation);
                }
                if (parameter.descriptor.defaultValue.has_value())
                {
                    descriptor.member("default") << *parameter.descriptor.defaultValue;
                }
                descriptor.member("is_required") << (parameter.descriptor.isRequired ? "true" : "false");
                descriptor.close();
            }
            parameters.close();
            object.close();
        }

        void writeSteps(std::ostringstream& stream, const std::vector<discovery::UpgradeStep>& steps, std::size_t depth)
        {
            if (steps.empty())
            {
                stream << "[]";
                return;
            }

            stream << "[\n";
            for (std::size_t index = 0; index < steps.size(); ++index)
            {
                const auto& step = steps[index];
                stream << pad(depth + 1);

                ObjectWriter object{stream, depth + 1};
                object.member("name") << quoted(step.name);
                object.member("func");
                writeCallable(stream, step.function, object.childDepth());
                object.member("target_version") << quoted(step.targetVersion);
                object.member("upgrade_type") << quoted(discovery::toString(step.category));
                object.member("priority") << step.priority;
                if (step.minVersion.has_value())
                {
                    object.member("min_version") << quoted(*step.minVersion);
                }
                if (step.maxVersion.has_value())
                {
                    object.member("max_version") << quoted(*step.maxVersion);
                }
                object.close();

                stream << (index + 1 < steps.size() ? ",\n" : "\n");
            }
            stream << pad(depth) << "]";
        }

        void writeValue(std::ostringstream& stream, const discovery::ClassifiedValue& value, std::size_t depth)
        {
            switch (value.kind)
            {
            case discovery::ValueKind::Null:
                stream << "null";
                return;
            case discovery::ValueKind::Boolean:
                stream << (value.boolean ? "true" : "false");
                return;
            case discovery::ValueKind::String:
            case discovery::ValueKind::Opaque:
                stream << quoted(value.text);
                return;
            case discovery::ValueKind::EmptyArray:
                stream << "[]";
                return;
            case discovery::ValueKind::CallableReference:
                writeCallable(stream, value.callable, depth);
                return;
            case discovery::ValueKind::UpgradeSteps:
                writeSteps(stream, value.steps, depth);
                return;
            }
        }

        void writeRecord(std::ostringstream& stream, const discovery::PluginRecord& record, std::size_t depth)
        {
            ObjectWriter object{stream, depth};
            object.member("name") << quoted(record.name);
            object.member("plugin_type") << quoted(discovery::toString(record.kind));
            object.member("obj");
            writeCallable(stream, record.callable, object.childDepth());

            if (record.callMethod.has_value())
            {
                object.member("call_method") << quoted(*record.callMethod);
            }
            if (record.config.has_value())
            {
                object.member("config");
                writeCallable(stream, *record.config, object.childDepth());
            }
            if (record.ioType.has_value())
            {
                object.member("io_type") << quoted(*record.ioType);
            }
            if (record.requiresStore.has_value())
            {
                object.member("requires_store") << (*record.requiresStore ? "true" : "false");
            }
            if (record.versionStrategy.has_value())
            {
                object.member("version_strategy");
                writeValue(stream, *record.versionStrategy, object.childDepth());
            }
            if (record.versionReader.has_value())
            {
                object.member("version_reader");
                writeValue(stream, *record.versionReader, object.childDepth());
            }
            if (record.upgradeSteps.has_value())
            {
                object.member("upgrade_steps");
                writeSteps(stream, *record.upgradeSteps, object.childDepth());
            }
            if (record.description.has_value())
            {
                object.member("description") << quoted(*record.description);
            }
            object.close();
        }
    } // namespace

    std::string renderManifest(const discovery::PackageManifest& manifest)
    {
        std::ostringstream stream;

        stream << "{\n";
        stream << "  \"name\": " << quoted(manifest.name) << ",\n";

        if (manifest.plugins.empty())
        {
            stream << "  \"plugins\": [],\n";
        }
        else
        {
            stream << "  \"plugins\": [\n";
            for (std::size_t index = 0; index < manifest.plugins.size(); ++index)
            {
                stream << "    ";
                writeRecord(stream, manifest.plugins[index], 2);
                stream << (index + 1 < manifest.plugins.size() ? ",\n" : "\n");
            }
            stream << "  ],\n";
        }

        stream << "  \"metadata\": {}\n";
        stream << "}\n";
        return stream.str();
    }

    bool writeManifest(const std::filesystem::path& outputPath,
        const discovery::PackageManifest& manifest,
        std::string& errorMessage)
    {
        const std::string document = renderManifest(manifest);

        const auto parentDirectory = outputPath.parent_path();
        if (!parentDirectory.empty())
        {
            std::error_code createError;
            std::filesystem::create_directories(parentDirectory, createError);
            if (createError)
            {
                errorMessage = "failed to create directories for '" + outputPath.string() + "': " + createError.message();
                return false;
            }
        }

        std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            errorMessage = "unable to open '" + outputPath.string() + "' for writing.";
            return false;
        }

        file << document;
        if (!file.good())
        {
            errorMessage = "failed while writing manifest to '" + outputPath.string() + "'.";
            return false;
        }

        return true;
    }
} // namespace mex
