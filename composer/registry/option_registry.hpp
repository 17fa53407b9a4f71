#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace couplet::registry
{
    enum class Mode : std::uint8_t
    {
        Configure,
        Compose
    };

    enum class ModeApplicability : std::uint8_t
    {
        Configure,
        Compose,
        Both
    };

    enum class Arity : std::uint8_t
    {
        Flag,
        SingleValue
    };

    enum class ValueType : std::uint8_t
    {
        None,
        String,
        Integer,
        Choice
    };

    // Names and texts are views; they must refer to storage that outlives the
    // registry holding them (the standard catalog uses string literals).
    struct OptionDefinition
    {
        std::string_view name;
        Arity arity{Arity::Flag};
        ValueType valueType{ValueType::None};
        ModeApplicability modes{ModeApplicability::Both};
        std::optional<std::string_view> defaultValue;
        std::string_view allowedValues; // Comma separated, Choice only.
        std::string_view description;
    };

    class OptionRegistry
    {
    public:
        OptionRegistry() = default;

        // Returns false and leaves the registry unchanged when the name is empty or already taken.
        bool add(const OptionDefinition& definition);

        [[nodiscard]] std::optional<OptionDefinition> lookup(std::string_view name) const;
        [[nodiscard]] bool isKnown(std::string_view name) const;
        [[nodiscard]] std::optional<std::size_t> declarationIndex(std::string_view name) const;
        [[nodiscard]] const std::vector<OptionDefinition>& definitions() const noexcept;

    private:
        std::vector<OptionDefinition> m_definitions;
        std::unordered_map<std::string_view, std::size_t> m_index;
    };

    // The catalog every couplet invocation resolves against.
    [[nodiscard]] const OptionRegistry& standardRegistry();

    // Canonical mode names only; used for section headers.
    [[nodiscard]] std::optional<Mode> parseMode(std::string_view text);

    // Canonical names plus the command-line alias "build" for compose.
    [[nodiscard]] std::optional<Mode> parseRunMode(std::string_view text);

    [[nodiscard]] std::string_view toString(Mode mode);
    [[nodiscard]] std::string_view toString(ModeApplicability modes);
    [[nodiscard]] std::string_view toString(Arity arity);

    [[nodiscard]] bool appliesTo(const OptionDefinition& definition, Mode mode);
    [[nodiscard]] bool isAllowedChoice(const OptionDefinition& definition, std::string_view value);
} // namespace couplet::registry
