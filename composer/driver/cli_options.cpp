#include "cli_options.hpp"

#include <string_view>
#include <system_error>
#include <utility>

namespace couplet::driver
{
    namespace
    {
        void setError(CommandLineParseResult& result, const char* code, DiagnosticKind kind, std::string message)
        {
            result.hasError = true;
            result.error = makeDiagnostic(code, kind, std::move(message));
        }

        // A following "--x" token is the next option, never a value.
        bool isOptionToken(std::string_view argument)
        {
            return argument.rfind("--", 0) == 0;
        }

        std::optional<std::string_view> parseOptionWithValue(std::string_view argument,
            std::string_view name,
            int& index,
            int argc,
            char** argv,
            CommandLineParseResult& result)
        {
            if (argument == name)
            {
                if (index + 1 >= argc || isOptionToken(argv[index + 1]))
                {
                    setError(result, "COUPLET-E1002", DiagnosticKind::MissingValue, std::string{name} + " requires a value.");
                    return std::nullopt;
                }
                return std::string_view{argv[++index]};
            }

            if (argument.rfind(name, 0) == 0 && argument.size() > name.size() && argument[name.size()] == '=')
            {
                return argument.substr(name.size() + 1);
            }

            return std::nullopt;
        }

        void parsePresetListing(int argc, char** argv, CommandLineParseResult& result)
        {
            result.options.command = Command::ListPresets;

            for (int index = 2; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (auto file = parseOptionWithValue(argument, "--file", index, argc, argv, result))
                {
                    result.options.presetFiles.emplace_back(std::string{*file});
                    continue;
                }
                if (result.hasError)
                {
                    return;
                }

                setError(result,
                    "COUPLET-E1001",
                    DiagnosticKind::UnknownCommand,
                    "unexpected argument '" + std::string{argument} + "' for 'presets'.");
                return;
            }
        }

        bool parseSubstitution(std::string_view text, CommandLineParseResult& result)
        {
            auto equals = text.find('=');
            if (equals == std::string_view::npos || equals == 0)
            {
                setError(result,
                    "COUPLET-E1005",
                    DiagnosticKind::InvalidSubstitution,
                    "substitution '" + std::string{text} + "' must have the form <name>=<value>.");
                return false;
            }

            // Later substitutions of the same name replace earlier ones.
            result.options.substitutions[std::string{text.substr(0, equals)}] = std::string{text.substr(equals + 1)};
            return true;
        }
    } // namespace

    CommandLineParseResult parseCommandLine(int argc, char** argv, const registry::OptionRegistry& registry)
    {
        CommandLineParseResult result;
        if (argc <= 1)
        {
            setError(result,
                "COUPLET-E1001",
                DiagnosticKind::UnknownCommand,
                "a mode is required ('configure' or 'compose'), or 'presets'.");
            return result;
        }

        std::string_view command{argv[1]};
        if (command == "--help" || command == "-h" || command == "help")
        {
            result.showHelp = true;
            return result;
        }

        if (command == "--version" || command == "version")
        {
            result.showVersion = true;
            return result;
        }

        if (command == "presets")
        {
            parsePresetListing(argc, argv, result);
            return result;
        }

        auto mode = registry::parseRunMode(command);
        if (!mode.has_value())
        {
            setError(result,
                "COUPLET-E1001",
                DiagnosticKind::UnknownCommand,
                "unknown command '" + std::string{command} + "'.");
            return result;
        }
        result.options.mode = *mode;

        int index = 2;
        if (index < argc && std::string_view{argv[index]} == "preset")
        {
            result.options.presetMode = true;
            ++index;
        }

        for (; index < argc; ++index)
        {
            std::string_view argument{argv[index]};

            if (argument == "--")
            {
                for (++index; index < argc; ++index)
                {
                    result.options.passThrough.emplace_back(argv[index]);
                }
                break;
            }

            if (argument == "--expand")
            {
                result.options.expandOnly = true;
                continue;
            }

            if (auto driverValue = parseOptionWithValue(argument, "--driver", index, argc, argv, result))
            {
                result.options.driverExecutable = std::filesystem::path{*driverValue};
                continue;
            }
            if (result.hasError)
            {
                return result;
            }

            if (result.options.presetMode)
            {
                if (auto nameValue = parseOptionWithValue(argument, "--name", index, argc, argv, result))
                {
                    if (result.options.presetName.has_value())
                    {
                        setError(result,
                            "COUPLET-E1003",
                            DiagnosticKind::MissingPresetName,
                            "--name may only be given once.");
                        return result;
                    }
                    result.options.presetName = std::string{*nameValue};
                    continue;
                }
                if (result.hasError)
                {
                    return result;
                }

                if (auto fileValue = parseOptionWithValue(argument, "--file", index, argc, argv, result))
                {
                    result.options.presetFiles.emplace_back(std::string{*fileValue});
                    continue;
                }
                if (result.hasError)
                {
                    return result;
                }

                if (auto substitution = parseOptionWithValue(argument, "--substitute", index, argc, argv, result))
                {
                    if (!parseSubstitution(*substitution, result))
                    {
                        return result;
                    }
                    continue;
                }
                if (result.hasError)
                {
                    return result;
                }
            }

            if (argument.size() > 2 && argument.rfind("--", 0) == 0)
            {
                std::string_view body = argument.substr(2);
                resolver::OptionOverride option;

                auto equals = body.find('=');
                if (equals != std::string_view::npos)
                {
                    option.name = std::string{body.substr(0, equals)};
                    option.value = std::string{body.substr(equals + 1)};
                }
                else
                {
                    option.name = std::string{body};
                    auto definition = registry.lookup(body);
                    if (definition.has_value() && definition->arity == registry::Arity::SingleValue)
                    {
                        if (index + 1 >= argc || isOptionToken(argv[index + 1]))
                        {
                            setError(result,
                                "COUPLET-E1002",
                                DiagnosticKind::MissingValue,
                                std::string{argument} + " requires a value.");
                            return result;
                        }
                        option.value = std::string{argv[++index]};
                    }
                }

                // Unknown names are kept so the resolver reports them with the other option errors.
                result.options.overrides.emplace_back(std::move(option));
                continue;
            }

            setError(result,
                "COUPLET-E1001",
                DiagnosticKind::UnknownCommand,
                "unexpected argument '" + std::string{argument} + "' (pass-through arguments go after '--').");
            return result;
        }

        if (result.options.presetMode)
        {
            if (!result.options.presetName.has_value() || result.options.presetName->empty())
            {
                setError(result,
                    "COUPLET-E1003",
                    DiagnosticKind::MissingPresetName,
                    "preset mode requires --name <preset>.");
                return result;
            }
        }

        return result;
    }

    std::vector<std::filesystem::path> defaultPresetFiles(const std::optional<std::filesystem::path>& homeDirectory,
        const std::filesystem::path& workingDirectory)
    {
        std::vector<std::filesystem::path> candidates;
        if (homeDirectory.has_value() && !homeDirectory->empty())
        {
            candidates.push_back(*homeDirectory / ".couplet-presets");
        }
        candidates.push_back(workingDirectory / "util" / "build-presets.ini");

        std::vector<std::filesystem::path> existing;
        for (auto& candidate : candidates)
        {
            std::error_code error;
            if (std::filesystem::is_regular_file(candidate, error) && !error)
            {
                existing.push_back(std::move(candidate));
            }
        }
        return existing;
    }

    resolver::ResolutionRequest makeResolutionRequest(const CommandLineOptions& options)
    {
        resolver::ResolutionRequest request;
        if (options.presetMode)
        {
            request.presetName = options.presetName;
        }
        request.mode = options.mode;
        request.overrides = options.overrides;
        request.passThrough = options.passThrough;
        request.substitutions = options.substitutions;
        return request;
    }
} // namespace couplet::driver
