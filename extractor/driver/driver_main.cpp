#include "../discovery/diagnostic.hpp"
#include "../manifest/manifest_assembler.hpp"
#include "../manifest/manifest_writer.hpp"
#include "command_line.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#ifndef MEX_VERSION
#define MEX_VERSION "0.1.0-local"
#endif

namespace mex
{
    void printHelp()
    {
        std::cout << "mexscan - static plugin manifest extractor\n"
                  << "Usage: mexscan [options] <entry-file | package-dir>\n\n"
                  << "Options:\n"
                  << "  --help                    Show this help text and exit.\n"
                  << "  --version                 Show version information and exit.\n"
                  << "  --package-name=<name>     Manifest package name. Default: package directory name.\n"
                  << "  --root=<dir>              Primary search root for steps and signatures.\n"
                  << "  --venv=<dir>              Active environment root. Default: $VIRTUAL_ENV.\n"
                  << "  --dist-version=<version>  Distribution version used to find entry_points.txt.\n"
                  << "  --entry-point-group=<g>   Entry-point group naming the registration. Default: r2x_plugin.\n"
                  << "  --function=<name>         Registration function. Default: register_plugin.\n"
                  << "  --locator=<auto|tree|text> Registration call locator. Default: auto.\n"
                  << "  --verbose                 Print debug progress.\n"
                  << "  -o <path>                 Write the manifest to the given path instead of stdout.\n";
    }

    void printVersion()
    {
        std::cout << "mexscan " << MEX_VERSION << "\n";
    }

    void printDiagnostic(const discovery::Diagnostic& diagnostic)
    {
        std::cerr << diagnostic.code << ' ' << discovery::toString(diagnostic.kind) << ": " << diagnostic.message << '\n';
    }

    ExtractionOptions buildExtractionOptions(const CommandLineOptions& options)
    {
        ExtractionOptions extraction;

        std::filesystem::path input{options.inputPath};
        std::error_code absoluteError;
        const auto absoluteInput = std::filesystem::absolute(input, absoluteError);
        if (!absoluteError)
        {
            input = absoluteInput.lexically_normal();
        }

        std::error_code statusError;
        if (std::filesystem::is_directory(input, statusError) && !statusError)
        {
            extraction.packageDirectory = input.lexically_normal();
        }
        else
        {
            extraction.entryFile = input;
            extraction.packageDirectory = input.parent_path().lexically_normal();
        }

        if (extraction.packageDirectory.filename().empty() && extraction.packageDirectory.has_parent_path())
        {
            extraction.packageDirectory = extraction.packageDirectory.parent_path();
        }

        if (options.packageName.has_value())
        {
            extraction.packageName = *options.packageName;
        }
        else
        {
            extraction.packageName = extraction.packageDirectory.filename().string();
        }

        if (options.rootPath.has_value())
        {
            extraction.searchRoot = *options.rootPath;
        }

        if (options.environmentPath.has_value())
        {
            extraction.environmentRoot = *options.environmentPath;
        }
        else if (const char* activeEnvironment = std::getenv("VIRTUAL_ENV"); activeEnvironment != nullptr)
        {
            extraction.environmentRoot = activeEnvironment;
        }

        std::error_code cwdError;
        const auto workingDirectory = std::filesystem::current_path(cwdError);
        if (!cwdError)
        {
            extraction.workingDirectory = workingDirectory;
        }

        extraction.distributionVersion = options.distributionVersion;
        extraction.entryPointGroup = options.entryPointGroup;
        extraction.registrationFunction = options.registrationFunction;
        extraction.strategy = discovery::parseLocatorStrategy(options.locator).value_or(discovery::LocatorStrategy::Automatic);
        return extraction;
    }

    int runExtractor(const CommandLineOptions& options)
    {
        // stdout carries the manifest unless -o is given.
        std::ostream& log = options.outputPath.empty() ? std::cerr : std::cout;

        const ExtractionOptions extraction = buildExtractionOptions(options);

        log << "[information] Starting mexscan extraction.\n";
        log << "  input: " << options.inputPath << "\n";
        log << "  package: " << extraction.packageName << "\n";
        log << "  locator: " << options.locator << "\n";
        if (!extraction.environmentRoot.empty())
        {
            log << "  environment: " << extraction.environmentRoot.string() << "\n";
        }
        if (!options.outputPath.empty())
        {
            log << "  output: " << options.outputPath << "\n";
        }

        ManifestAssembler assembler{extraction};
        const ExtractionResult result = assembler.extract();

        if (options.verbose)
        {
            for (const auto& note : result.notes)
            {
                log << "[debug] " << note << "\n";
            }
        }

        for (const auto& diagnostic : result.diagnostics)
        {
            printDiagnostic(diagnostic);
        }

        if (!result.manifest.has_value())
        {
            std::cerr << "MEX-W3001 Extraction halted for package '" << extraction.packageName << "'.\n";
            return 1;
        }

        log << "[notice] Extracted " << result.manifest->plugins.size() << " plugins from '" << options.inputPath << "'.\n";

        if (options.outputPath.empty())
        {
            std::cout << renderManifest(*result.manifest);
            return 0;
        }

        std::string errorMessage;
        if (!writeManifest(options.outputPath, *result.manifest, errorMessage))
        {
            std::cerr << "MEX-E3900 Io: " << errorMessage << "\n";
            return 1;
        }

        log << "[notice] Manifest written to " << options.outputPath << "\n";
        return 0;
    }
} // namespace mex

int main(int argc, char** argv)
{
    mex::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        mex::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        mex::printVersion();
        return 0;
    }

    return mex::runExtractor(options.value());
}
