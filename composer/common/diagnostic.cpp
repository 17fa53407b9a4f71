#include "diagnostic.hpp"

#include <utility>

namespace couplet
{
    std::string_view toString(DiagnosticKind kind)
    {
        switch (kind)
        {
        case DiagnosticKind::MissingValue: return "MissingValue";
        case DiagnosticKind::UnknownCommand: return "UnknownCommand";
        case DiagnosticKind::MissingPresetName: return "MissingPresetName";
        case DiagnosticKind::MissingPresetFiles: return "MissingPresetFiles";
        case DiagnosticKind::InvalidSubstitution: return "InvalidSubstitution";
        case DiagnosticKind::FileError: return "FileError";
        case DiagnosticKind::ParseError: return "ParseError";
        case DiagnosticKind::DuplicateSection: return "DuplicateSection";
        case DiagnosticKind::PresetNotFound: return "PresetNotFound";
        case DiagnosticKind::DuplicateOption: return "DuplicateOption";
        case DiagnosticKind::UnknownOption: return "UnknownOption";
        case DiagnosticKind::ArityMismatch: return "ArityMismatch";
        case DiagnosticKind::ModeMismatch: return "ModeMismatch";
        case DiagnosticKind::InvalidValue: return "InvalidValue";
        case DiagnosticKind::MissingSubstitution: return "MissingSubstitution";
        case DiagnosticKind::InclusionCycle: return "InclusionCycle";
        case DiagnosticKind::InvocationError: return "InvocationError";
        case DiagnosticKind::DriverLaunchFailed: return "DriverLaunchFailed";
        }

        return "Unknown";
    }

    Diagnostic makeDiagnostic(std::string code, DiagnosticKind kind, std::string message)
    {
        Diagnostic diagnostic;
        diagnostic.code = std::move(code);
        diagnostic.kind = kind;
        diagnostic.message = std::move(message);
        return diagnostic;
    }

    std::string format(const Diagnostic& diagnostic)
    {
        std::string text = diagnostic.code;
        text.push_back(' ');
        text.append(toString(diagnostic.kind));
        text.append(": ");

        if (!diagnostic.file.empty())
        {
            text.append(diagnostic.file.string());
            if (diagnostic.line != 0)
            {
                text.push_back(':');
                text.append(std::to_string(diagnostic.line));
            }
            text.append(": ");
        }

        text.append(diagnostic.message);
        return text;
    }
} // namespace couplet
