#include "option_registry.hpp"

#include <array>

namespace couplet::registry
{
    namespace
    {
        constexpr OptionDefinition flag(std::string_view name, ModeApplicability modes, std::string_view description)
        {
            return OptionDefinition{name, Arity::Flag, ValueType::None, modes, std::nullopt, {}, description};
        }

        constexpr OptionDefinition valued(std::string_view name,
            ValueType type,
            ModeApplicability modes,
            std::optional<std::string_view> defaultValue,
            std::string_view description)
        {
            return OptionDefinition{name, Arity::SingleValue, type, modes, defaultValue, {}, description};
        }

        constexpr OptionDefinition choice(std::string_view name,
            std::string_view allowedValues,
            ModeApplicability modes,
            std::string_view defaultValue,
            std::string_view description)
        {
            return OptionDefinition{
                name, Arity::SingleValue, ValueType::Choice, modes, defaultValue, allowedValues, description};
        }

        // Declaration order is the order options appear on the generated driver command line.
        constexpr std::array kStandardOptions{
            flag("help", ModeApplicability::Both, "Show the build driver help and exit."),
            flag("version", ModeApplicability::Both, "Show the build driver version and exit."),
            flag("dry-run", ModeApplicability::Both, "Print the commands the build driver would run without running them."),
            flag("verbose", ModeApplicability::Both, "Print debug output from couplet and the build driver."),
            flag("clean", ModeApplicability::Both, "Remove previous build output before running."),
            valued("jobs", ValueType::Integer, ModeApplicability::Both, std::nullopt, "Number of parallel build jobs."),
            valued("repository", ValueType::String, ModeApplicability::Both, "unsung-anthem", "Name of the project repository."),
            flag("debug", ModeApplicability::Both, "Build the Debug configuration."),
            flag("ninja", ModeApplicability::Both, "Generate Ninja build files."),
            flag("test", ModeApplicability::Both, "Build and prepare the unit tests."),
            flag("benchmark", ModeApplicability::Both, "Build and prepare the benchmarks."),
            choice("compiler-toolchain", "clang,gcc", ModeApplicability::Both, "clang", "Compiler toolchain to build with."),
            valued("compiler-version", ValueType::String, ModeApplicability::Both, std::nullopt, "Version of the compiler toolchain."),
            valued("host-cc", ValueType::String, ModeApplicability::Both, std::nullopt, "Path to the host C compiler."),
            valued("host-cxx", ValueType::String, ModeApplicability::Both, std::nullopt, "Path to the host C++ compiler."),
            valued("cmake-version", ValueType::String, ModeApplicability::Configure, std::nullopt, "Version of CMake to set up."),
            valued("auth-token-file", ValueType::String, ModeApplicability::Configure, std::nullopt, "File holding the GitHub API token."),
            valued("github-user-agent", ValueType::String, ModeApplicability::Configure, std::nullopt, "User agent sent to the GitHub API."),
            flag("clean-dependencies", ModeApplicability::Configure, "Set up every dependency again."),
            flag("developer-build", ModeApplicability::Compose, "Enable developer-only build features."),
            flag("docs", ModeApplicability::Compose, "Build the documentation."),
            flag("coverage", ModeApplicability::Compose, "Build with code coverage instrumentation."),
            flag("assertions", ModeApplicability::Compose, "Keep assertions enabled in optimized builds."),
            choice("std", "c++17,c++20", ModeApplicability::Compose, "c++17", "C++ language standard of the project."),
            valued("install-prefix", ValueType::String, ModeApplicability::Compose, std::nullopt, "Installation prefix of the build."),
        };

        OptionRegistry makeStandardRegistry()
        {
            OptionRegistry registry;
            for (const auto& definition : kStandardOptions)
            {
                registry.add(definition);
            }
            return registry;
        }
    } // namespace

    bool OptionRegistry::add(const OptionDefinition& definition)
    {
        if (definition.name.empty())
        {
            return false;
        }

        auto [iterator, inserted] = m_index.emplace(definition.name, m_definitions.size());
        if (!inserted)
        {
            return false;
        }

        m_definitions.push_back(definition);
        return true;
    }

    std::optional<OptionDefinition> OptionRegistry::lookup(std::string_view name) const
    {
        auto found = m_index.find(name);
        if (found == m_index.end())
        {
            return std::nullopt;
        }

        return m_definitions[found->second];
    }

    bool OptionRegistry::isKnown(std::string_view name) const
    {
        return m_index.find(name) != m_index.end();
    }

    std::optional<std::size_t> OptionRegistry::declarationIndex(std::string_view name) const
    {
        auto found = m_index.find(name);
        if (found == m_index.end())
        {
            return std::nullopt;
        }

        return found->second;
    }

    const std::vector<OptionDefinition>& OptionRegistry::definitions() const noexcept
    {
        return m_definitions;
    }

    const OptionRegistry& standardRegistry()
    {
        static const OptionRegistry registry = makeStandardRegistry();
        return registry;
    }

    std::optional<Mode> parseMode(std::string_view text)
    {
        if (text == "configure")
        {
            return Mode::Configure;
        }
        if (text == "compose")
        {
            return Mode::Compose;
        }
        return std::nullopt;
    }

    std::optional<Mode> parseRunMode(std::string_view text)
    {
        if (text == "build")
        {
            return Mode::Compose;
        }
        return parseMode(text);
    }

    std::string_view toString(Mode mode)
    {
        switch (mode)
        {
        case Mode::Configure: return "configure";
        case Mode::Compose: return "compose";
        }
        return "unknown";
    }

    std::string_view toString(ModeApplicability modes)
    {
        switch (modes)
        {
        case ModeApplicability::Configure: return "configure";
        case ModeApplicability::Compose: return "compose";
        case ModeApplicability::Both: return "both";
        }
        return "unknown";
    }

    std::string_view toString(Arity arity)
    {
        switch (arity)
        {
        case Arity::Flag: return "flag";
        case Arity::SingleValue: return "single-value";
        }
        return "unknown";
    }

    bool appliesTo(const OptionDefinition& definition, Mode mode)
    {
        switch (definition.modes)
        {
        case ModeApplicability::Both: return true;
        case ModeApplicability::Configure: return mode == Mode::Configure;
        case ModeApplicability::Compose: return mode == Mode::Compose;
        }
        return false;
    }

    bool isAllowedChoice(const OptionDefinition& definition, std::string_view value)
    {
        if (definition.valueType != ValueType::Choice)
        {
            return true;
        }

        std::string_view remaining = definition.allowedValues;
        while (!remaining.empty())
        {
            auto comma = remaining.find(',');
            std::string_view candidate = remaining.substr(0, comma);
            if (candidate == value)
            {
                return true;
            }

            if (comma == std::string_view::npos)
            {
                break;
            }
            remaining.remove_prefix(comma + 1);
        }

        return false;
    }
} // namespace couplet::registry
