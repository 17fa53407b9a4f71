#include "diagnostic.hpp"

#include <gtest/gtest.h>

namespace couplet
{
namespace
{
    TEST(DiagnosticTest, FormatsCodeKindAndMessage)
    {
        Diagnostic diagnostic = makeDiagnostic("COUPLET-E3001", DiagnosticKind::PresetNotFound, "preset 'dev' was not found.");
        EXPECT_EQ(format(diagnostic), "COUPLET-E3001 PresetNotFound: preset 'dev' was not found.");
    }

    TEST(DiagnosticTest, FormatsFileAndLineWhenPresent)
    {
        Diagnostic diagnostic = makeDiagnostic("COUPLET-E2003", DiagnosticKind::ParseError, "entry 'test' appears outside of any preset section.");
        diagnostic.file = "presets.ini";
        diagnostic.line = 4;
        EXPECT_EQ(format(diagnostic),
            "COUPLET-E2003 ParseError: presets.ini:4: entry 'test' appears outside of any preset section.");
    }

    TEST(DiagnosticTest, OmitsLineZero)
    {
        Diagnostic diagnostic = makeDiagnostic("COUPLET-E2001", DiagnosticKind::FileError, "unable to read preset file.");
        diagnostic.file = "missing.ini";
        EXPECT_EQ(format(diagnostic), "COUPLET-E2001 FileError: missing.ini: unable to read preset file.");
    }

    TEST(DiagnosticTest, NamesEveryResolutionKind)
    {
        EXPECT_EQ(toString(DiagnosticKind::DuplicateOption), "DuplicateOption");
        EXPECT_EQ(toString(DiagnosticKind::UnknownOption), "UnknownOption");
        EXPECT_EQ(toString(DiagnosticKind::ArityMismatch), "ArityMismatch");
        EXPECT_EQ(toString(DiagnosticKind::ModeMismatch), "ModeMismatch");
        EXPECT_EQ(toString(DiagnosticKind::InclusionCycle), "InclusionCycle");
    }
} // namespace
} // namespace couplet
