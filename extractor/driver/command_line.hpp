#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace mex
{
    struct CommandLineOptions
    {
        // Registration file, or a package directory to search for one.
        std::string inputPath;
        std::string outputPath;
        std::optional<std::string> packageName;
        std::optional<std::string> rootPath;
        std::optional<std::string> environmentPath;
        std::optional<std::string> distributionVersion;
        std::string entryPointGroup{"r2x_plugin"};
        std::optional<std::string> registrationFunction;
        std::string locator{"auto"};
        bool verbose{false};
        bool showHelp{false};
        bool showVersion{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument == "--verbose")
                {
                    options.verbose = true;
                    continue;
                }

                if (argument.rfind("--package-name=", 0) == 0)
                {
                    constexpr std::string_view packageOpt = "--package-name=";
                    options.packageName = std::string{argument.substr(packageOpt.size())};
                    continue;
                }

                if (argument.rfind("--root=", 0) == 0)
                {
                    options.rootPath = std::string{argument.substr(7)};
                    continue;
                }

                if (argument == "--root")
                {
                    if (index + 1 < argc)
                    {
                        options.rootPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "MEX-E1003 MissingRoot: expected path after --root option.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--venv=", 0) == 0)
                {
                    options.environmentPath = std::string{argument.substr(7)};
                    continue;
                }

                if (argument == "--venv")
                {
                    if (index + 1 < argc)
                    {
                        options.environmentPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "MEX-E1004 MissingEnvironment: expected path after --venv option.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--dist-version=", 0) == 0)
                {
                    constexpr std::string_view versionOpt = "--dist-version=";
                    options.distributionVersion = std::string{argument.substr(versionOpt.size())};
                    continue;
                }

                if (argument.rfind("--entry-point-group=", 0) == 0)
                {
                    constexpr std::string_view groupOpt = "--entry-point-group=";
                    options.entryPointGroup = std::string{argument.substr(groupOpt.size())};
                    continue;
                }

                if (argument.rfind("--function=", 0) == 0)
                {
                    options.registrationFunction = std::string{argument.substr(11)};
                    continue;
                }

                if (argument.rfind("--locator=", 0) == 0)
                {
                    options.locator = std::string{argument.substr(10)};
                    if (options.locator != "auto" && options.locator != "tree" && options.locator != "text")
                    {
                        std::cerr << "MEX-E1005 InvalidLocator: expected auto, tree or text, got '" << options.locator << "'.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("-o", 0) == 0)
                {
                    if (argument.size() > 2)
                    {
                        options.outputPath = std::string{argument.substr(2)};
                    }
                    else if (index + 1 < argc)
                    {
                        options.outputPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "MEX-E1000 MissingOutput: expected path after -o option.\n";
                        return std::nullopt;
                    }

                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "MEX-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                if (!options.inputPath.empty())
                {
                    std::cerr << "MEX-E1006 MultipleInputs: only one entry file or package directory may be given.\n";
                    return std::nullopt;
                }
                options.inputPath = std::string{argument};
            }

            if (!options.showHelp && !options.showVersion && options.inputPath.empty())
            {
                std::cerr << "MEX-E1002 MissingInput: an entry file or package directory is required.\n";
                return std::nullopt;
            }

            return options;
        }
    };
} // namespace mex
