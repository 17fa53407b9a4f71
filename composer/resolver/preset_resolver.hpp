#pragma once

#include "../common/diagnostic.hpp"
#include "../presets/preset_file_parser.hpp"
#include "../registry/option_registry.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace couplet::resolver
{
    // Entry name that pulls other presets into the one being resolved.
    inline constexpr std::string_view kMixinDirective = "mixin-preset";

    enum class OptionSource : std::uint8_t
    {
        Preset,
        CommandLine
    };

    struct OptionOverride
    {
        std::string name;
        std::optional<std::string> value;
    };

    struct ResolvedOption
    {
        std::string name;
        std::optional<std::string> value;
        std::optional<std::int64_t> integerValue;
        OptionSource source{OptionSource::Preset};
        std::string origin;
    };

    class ResolvedOptionSet
    {
    public:
        ResolvedOptionSet() = default;

        // Replaces any earlier value of the same option.
        void set(ResolvedOption option);
        void appendPassThrough(std::string token);

        [[nodiscard]] bool contains(std::string_view name) const;
        [[nodiscard]] const ResolvedOption* find(std::string_view name) const;

        [[nodiscard]] const std::map<std::string, ResolvedOption, std::less<>>& options() const noexcept;
        [[nodiscard]] const std::vector<std::string>& passThrough() const noexcept;
        [[nodiscard]] std::size_t size() const noexcept;

        std::optional<std::string> presetName;
        registry::Mode mode{registry::Mode::Configure};

    private:
        std::map<std::string, ResolvedOption, std::less<>> m_options;
        std::vector<std::string> m_passThrough;
    };

    struct ResolutionRequest
    {
        // Absent when the options come from the command line only.
        std::optional<std::string> presetName;
        registry::Mode mode{registry::Mode::Configure};
        std::vector<OptionOverride> overrides;
        std::vector<std::string> passThrough;
        std::map<std::string, std::string> substitutions;
    };

    struct ResolutionResult
    {
        ResolvedOptionSet options;
        bool hasError{false};
        Diagnostic error;
    };

    struct PlaceholderExpansion
    {
        std::string text;
        bool hasError{false};
        std::string errorMessage;
    };

    // Expands "%(name)s" from substitutions; "%%" is a literal percent sign.
    [[nodiscard]] PlaceholderExpansion expandPlaceholders(std::string_view text,
        const std::map<std::string, std::string>& substitutions);

    [[nodiscard]] ResolutionResult resolve(const ResolutionRequest& request,
        const presets::PresetTable& table,
        const registry::OptionRegistry& registry);
} // namespace couplet::resolver
