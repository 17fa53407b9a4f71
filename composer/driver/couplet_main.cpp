#include "../invocation/invocation_builder.hpp"
#include "../presets/preset_file_parser.hpp"
#include "../registry/option_registry.hpp"
#include "../resolver/preset_resolver.hpp"
#include "cli_options.hpp"
#include "process.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#ifndef COUPLET_VERSION
#define COUPLET_VERSION "0.1.0-local"
#endif

namespace couplet::driver
{
    static void printHelp(const registry::OptionRegistry& registry)
    {
        std::cout << "couplet - preset-driven build front end\n"
                     "Usage:\n"
                     "  couplet <configure|compose> preset --name <preset> [--file <path>]...\n"
                     "          [--substitute <name>=<value>]... [options] [-- <pass-through>...]\n"
                     "  couplet <configure|compose> [options] [-- <pass-through>...]\n"
                     "  couplet presets [--file <path>]...\n"
                     "  couplet --help | --version\n\n"
                     "Couplet options:\n"
                     "  --name <preset>           Preset to resolve (preset mode).\n"
                     "  --file <path>             Preset file to read; repeatable. Default: ~/.couplet-presets,\n"
                     "                            util/build-presets.ini.\n"
                     "  --substitute <k>=<v>      Value for the %(k)s placeholder in preset values; repeatable.\n"
                     "  --driver <path>           Build driver to run. Default: " COUPLET_DEFAULT_DRIVER ".\n"
                     "  --expand                  Print the build driver invocation without running it.\n"
                     "  'build' is accepted as an alias of 'compose'.\n\n"
                     "Build options (forwarded to the build driver):\n";

        for (const auto& definition : registry.definitions())
        {
            std::string usage = "--" + std::string{definition.name};
            if (definition.arity == registry::Arity::SingleValue)
            {
                usage += definition.valueType == registry::ValueType::Integer ? " <n>" : " <value>";
            }

            std::cout << "  " << std::left << std::setw(26) << usage << definition.description;
            if (definition.modes != registry::ModeApplicability::Both)
            {
                std::cout << " [" << registry::toString(definition.modes) << " only]";
            }
            if (definition.valueType == registry::ValueType::Choice)
            {
                std::cout << " One of: " << definition.allowedValues << ".";
            }
            if (definition.defaultValue.has_value())
            {
                std::cout << " Default: " << *definition.defaultValue << ".";
            }
            std::cout << "\n";
        }
    }

    static void printVersion()
    {
        std::cout << "couplet " << COUPLET_VERSION << "\n";
    }

    static void printDiagnostics(const std::vector<Diagnostic>& diagnostics)
    {
        for (const auto& diagnostic : diagnostics)
        {
            std::cerr << format(diagnostic) << "\n";
        }
    }

    static std::optional<std::vector<std::filesystem::path>> presetFilesFor(const CommandLineOptions& options)
    {
        if (!options.presetFiles.empty())
        {
            return options.presetFiles;
        }

        std::optional<std::filesystem::path> home;
        if (const char* value = std::getenv("HOME"))
        {
            home = std::filesystem::path{value};
        }

        std::error_code error;
        auto workingDirectory = std::filesystem::current_path(error);
        if (error)
        {
            workingDirectory.clear();
        }

        auto files = defaultPresetFiles(home, workingDirectory);
        if (files.empty())
        {
            std::cerr << format(makeDiagnostic("COUPLET-E1004",
                             DiagnosticKind::MissingPresetFiles,
                             "no preset files found; pass one with --file <path>."))
                      << "\n";
            return std::nullopt;
        }
        return files;
    }

    static int listPresets(const CommandLineOptions& options)
    {
        auto files = presetFilesFor(options);
        if (!files.has_value())
        {
            return 1;
        }

        auto loaded = presets::loadPresetTable(*files);
        if (loaded.hasError())
        {
            printDiagnostics(loaded.diagnostics);
            return 1;
        }

        std::cout << "[couplet] The available presets are:\n";
        for (const auto& name : loaded.table.presetNames())
        {
            std::cout << name << "\n";
        }
        return 0;
    }

    static int runMode(const CommandLineOptions& options, const registry::OptionRegistry& registry)
    {
        presets::PresetTable table;
        std::vector<std::filesystem::path> files;

        if (options.presetMode)
        {
            auto found = presetFilesFor(options);
            if (!found.has_value())
            {
                return 1;
            }
            files = std::move(*found);

            auto loaded = presets::loadPresetTable(files);
            if (loaded.hasError())
            {
                printDiagnostics(loaded.diagnostics);
                return 1;
            }
            table = std::move(loaded.table);
        }

        auto resolution = resolver::resolve(makeResolutionRequest(options), table, registry);
        if (resolution.hasError)
        {
            std::cerr << format(resolution.error) << "\n";
            return 1;
        }

        const auto& resolved = resolution.options;
        const bool verbose = resolved.contains("verbose");
        if (verbose)
        {
            for (const auto& file : files)
            {
                std::cout << "[debug] preset file: " << file.string() << "\n";
            }
            for (const auto& [name, option] : resolved.options())
            {
                std::cout << "[debug] option '" << name << "'";
                if (option.value.has_value())
                {
                    std::cout << " = '" << *option.value << "'";
                }
                std::cout << " from " << option.origin << "\n";
            }
            for (const auto& token : resolved.passThrough())
            {
                std::cout << "[debug] pass-through: " << token << "\n";
            }
        }

        auto plan = invocation::planDriverInvocation(resolved, options.mode, registry, options.driverExecutable);
        if (plan.hasError)
        {
            std::cerr << format(plan.error) << " This is an internal error in couplet.\n";
            return 1;
        }

        const std::string command = invocation::quoteCommand(plan.invocation);
        if (options.presetMode)
        {
            std::cout << "[couplet] Using preset '" << *options.presetName << "', which expands to\n\n"
                      << command << "\n\n";
        }
        else
        {
            std::cout << "[couplet] Running " << command << "\n";
        }

        if (options.expandOnly)
        {
            if (verbose)
            {
                std::cout << "[debug] --expand given; the build driver is not run.\n";
            }
            return 0;
        }

        auto run = executeDriver(plan.invocation);
        if (run.hasError)
        {
            std::cerr << format(run.error) << "\n";
            return run.exitCode;
        }

        if (run.terminatingSignal.has_value())
        {
            std::cerr << "couplet: build driver terminated by signal " << *run.terminatingSignal << ".\n";
        }
        else if (run.exitCode != 0)
        {
            std::cerr << "couplet: build driver exited with code " << run.exitCode << ".\n";
        }
        return run.exitCode;
    }
} // namespace couplet::driver

int main(int argc, char** argv)
{
    using namespace couplet::driver;

    const auto& registry = couplet::registry::standardRegistry();

    auto result = parseCommandLine(argc, argv, registry);
    if (result.hasError)
    {
        std::cerr << couplet::format(result.error) << "\n";
        std::cerr << "Run 'couplet --help' for usage.\n";
        return 1;
    }

    if (result.showHelp)
    {
        printHelp(registry);
        return 0;
    }

    if (result.showVersion)
    {
        printVersion();
        return 0;
    }

    if (result.options.command == Command::ListPresets)
    {
        return listPresets(result.options);
    }

    return runMode(result.options, registry);
}
