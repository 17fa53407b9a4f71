#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace couplet
{
    enum class DiagnosticKind : std::uint16_t
    {
        // Command line
        MissingValue,
        UnknownCommand,
        MissingPresetName,
        MissingPresetFiles,
        InvalidSubstitution,

        // Preset files
        FileError,
        ParseError,
        DuplicateSection,

        // Resolution
        PresetNotFound,
        DuplicateOption,
        UnknownOption,
        ArityMismatch,
        ModeMismatch,
        InvalidValue,
        MissingSubstitution,
        InclusionCycle,

        // Invocation
        InvocationError,
        DriverLaunchFailed
    };

    struct Diagnostic
    {
        std::string code;
        DiagnosticKind kind{DiagnosticKind::ParseError};
        std::string message;
        std::filesystem::path file;
        std::uint32_t line{0};
        std::string presetName;
        std::string optionName;
    };

    [[nodiscard]] std::string_view toString(DiagnosticKind kind);

    [[nodiscard]] Diagnostic makeDiagnostic(std::string code, DiagnosticKind kind, std::string message);

    // Renders "<code> <Kind>: [file:line: ]message".
    [[nodiscard]] std::string format(const Diagnostic& diagnostic);
} // namespace couplet
