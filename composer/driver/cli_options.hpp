#pragma once

#include "../common/diagnostic.hpp"
#include "../registry/option_registry.hpp"
#include "../resolver/preset_resolver.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#ifndef COUPLET_DEFAULT_DRIVER
#define COUPLET_DEFAULT_DRIVER "couplet-build"
#endif

namespace couplet::driver
{
    enum class Command
    {
        Run,
        ListPresets
    };

    struct CommandLineOptions
    {
        Command command{Command::Run};
        registry::Mode mode{registry::Mode::Configure};
        bool presetMode{false};
        std::optional<std::string> presetName;
        std::vector<std::filesystem::path> presetFiles;
        std::map<std::string, std::string> substitutions;
        std::vector<resolver::OptionOverride> overrides;
        std::vector<std::string> passThrough;
        std::filesystem::path driverExecutable{COUPLET_DEFAULT_DRIVER};
        bool expandOnly{false};
    };

    struct CommandLineParseResult
    {
        CommandLineOptions options;
        bool showHelp{false};
        bool showVersion{false};
        bool hasError{false};
        Diagnostic error;
    };

    // The registry decides whether "--name value" consumes the following token.
    CommandLineParseResult parseCommandLine(int argc, char** argv, const registry::OptionRegistry& registry);

    // Preset files used when none are given: ~/.couplet-presets and
    // util/build-presets.ini under the working directory, if they exist.
    std::vector<std::filesystem::path> defaultPresetFiles(const std::optional<std::filesystem::path>& homeDirectory,
        const std::filesystem::path& workingDirectory);

    resolver::ResolutionRequest makeResolutionRequest(const CommandLineOptions& options);
} // namespace couplet::driver
