#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "preset_file_parser.hpp"

namespace couplet::presets
{
namespace
{
    struct ScopedDirectory
    {
        std::filesystem::path path;
        explicit ScopedDirectory(std::filesystem::path directory) : path(std::move(directory)) {}
        ~ScopedDirectory()
        {
            if (!path.empty())
            {
                std::error_code ec;
                std::filesystem::remove_all(path, ec);
            }
        }
    };

    std::filesystem::path makeTemporaryRoot(const std::string& prefix)
    {
        auto root = std::filesystem::temp_directory_path()
            / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(root);
        return root;
    }

    std::filesystem::path writeFile(const std::filesystem::path& path, const std::string& content)
    {
        std::ofstream stream(path, std::ios::binary);
        stream << content;
        return path;
    }

    TEST(PresetFileParserTest, ParsesSharedAndModeSections)
    {
        PresetFileParser parser;
        parser.parseText("[dev]\n"
                         "test\n"
                         "jobs=4\n"
                         "\n"
                         "[compose:dev]\n"
                         "developer-build\n"
                         "install-prefix = /opt/anthem=1\n",
            "presets.ini");

        ASSERT_TRUE(parser.diagnostics().empty());
        const auto& table = parser.table();
        EXPECT_EQ(table.size(), 2u);

        const PresetSection* shared = table.findShared("dev");
        ASSERT_NE(shared, nullptr);
        EXPECT_FALSE(shared->key.mode.has_value());
        EXPECT_EQ(shared->headerLine, 1u);
        EXPECT_EQ(shared->file, std::filesystem::path{"presets.ini"});
        ASSERT_EQ(shared->entries.size(), 2u);
        EXPECT_EQ(shared->entries[0].name, "test");
        EXPECT_FALSE(shared->entries[0].value.has_value());
        EXPECT_EQ(shared->entries[0].line, 2u);
        EXPECT_EQ(shared->entries[1].name, "jobs");
        EXPECT_EQ(shared->entries[1].value, std::optional<std::string>{"4"});

        const PresetSection* compose = table.findModeSection(registry::Mode::Compose, "dev");
        ASSERT_NE(compose, nullptr);
        EXPECT_EQ(compose->key.toString(), "compose:dev");
        ASSERT_EQ(compose->entries.size(), 2u);
        EXPECT_EQ(compose->entries[1].name, "install-prefix");
        EXPECT_EQ(compose->entries[1].value, std::optional<std::string>{"/opt/anthem=1"});

        EXPECT_EQ(table.findModeSection(registry::Mode::Configure, "dev"), nullptr);
    }

    TEST(PresetFileParserTest, IgnoresCommentsBlankLinesAndIndentation)
    {
        PresetFileParser parser;
        parser.parseText("# leading comment\n"
                         "; another comment\n"
                         "\r\n"
                         "  [ release ]  \r\n"
                         "    ninja\r\n"
                         "  # indented comment\n"
                         "  repository=unsung-anthem  \n",
            "presets.ini");

        ASSERT_TRUE(parser.diagnostics().empty());
        const PresetSection* section = parser.table().findShared("release");
        ASSERT_NE(section, nullptr);
        ASSERT_EQ(section->entries.size(), 2u);
        EXPECT_EQ(section->entries[0].name, "ninja");
        EXPECT_EQ(section->entries[1].name, "repository");
        EXPECT_EQ(section->entries[1].value, std::optional<std::string>{"unsung-anthem"});
    }

    TEST(PresetFileParserTest, KeepsEmptyValueDistinctFromFlag)
    {
        PresetFileParser parser;
        parser.parseText("[dev]\nhost-cc=\n", "presets.ini");

        ASSERT_TRUE(parser.diagnostics().empty());
        const PresetSection* section = parser.table().findShared("dev");
        ASSERT_NE(section, nullptr);
        ASSERT_EQ(section->entries.size(), 1u);
        ASSERT_TRUE(section->entries[0].value.has_value());
        EXPECT_TRUE(section->entries[0].value->empty());
    }

    TEST(PresetFileParserTest, ReportsHeaderWithoutClosingBracket)
    {
        PresetFileParser parser;
        parser.parseText("[dev]\ntest\n[broken\ndebug\n", "presets.ini");

        ASSERT_EQ(parser.diagnostics().size(), 1u);
        const auto& diagnostic = parser.diagnostics().front();
        EXPECT_EQ(diagnostic.code, "COUPLET-E2002");
        EXPECT_EQ(diagnostic.kind, DiagnosticKind::ParseError);
        EXPECT_EQ(diagnostic.line, 3u);
        EXPECT_EQ(diagnostic.file, std::filesystem::path{"presets.ini"});

        // The well-formed section before the error is kept; the entries after it are dropped.
        const PresetSection* section = parser.table().findShared("dev");
        ASSERT_NE(section, nullptr);
        EXPECT_EQ(section->entries.size(), 1u);
    }

    TEST(PresetFileParserTest, ReportsMalformedHeaders)
    {
        for (const char* header : {"[dev] trailing", "[]", "[ : dev]", "[compose:]", "[compose:dev:extra]", "[[dev]]"})
        {
            PresetFileParser parser;
            parser.parseText(std::string{header} + "\ntest\n", "presets.ini");

            ASSERT_EQ(parser.diagnostics().size(), 1u) << header;
            EXPECT_EQ(parser.diagnostics().front().code, "COUPLET-E2002") << header;
            EXPECT_TRUE(parser.table().empty()) << header;
        }
    }

    TEST(PresetFileParserTest, ReportsUnknownSectionMode)
    {
        PresetFileParser parser;
        parser.parseText("[bootstrap:dev]\ntest\n", "presets.ini");

        ASSERT_EQ(parser.diagnostics().size(), 1u);
        EXPECT_EQ(parser.diagnostics().front().code, "COUPLET-E2005");
        EXPECT_EQ(parser.diagnostics().front().kind, DiagnosticKind::ParseError);
    }

    TEST(PresetFileParserTest, ReportsEntryOutsideSection)
    {
        PresetFileParser parser;
        parser.parseText("# comment\ntest\n[dev]\ndebug\n", "presets.ini");

        ASSERT_EQ(parser.diagnostics().size(), 1u);
        EXPECT_EQ(parser.diagnostics().front().code, "COUPLET-E2003");
        EXPECT_EQ(parser.diagnostics().front().line, 2u);
        EXPECT_NE(parser.table().findShared("dev"), nullptr);
    }

    TEST(PresetFileParserTest, ReportsEmptyOptionName)
    {
        PresetFileParser parser;
        parser.parseText("[dev]\n = value\n", "presets.ini");

        ASSERT_EQ(parser.diagnostics().size(), 1u);
        EXPECT_EQ(parser.diagnostics().front().code, "COUPLET-E2004");
        EXPECT_EQ(parser.diagnostics().front().line, 2u);
    }

    TEST(PresetFileParserTest, ReportsDuplicateSectionInOneFile)
    {
        PresetFileParser parser;
        parser.parseText("[dev]\ntest\n[dev]\ndebug\n", "presets.ini");

        ASSERT_EQ(parser.diagnostics().size(), 1u);
        const auto& diagnostic = parser.diagnostics().front();
        EXPECT_EQ(diagnostic.code, "COUPLET-E2006");
        EXPECT_EQ(diagnostic.kind, DiagnosticKind::DuplicateSection);
        EXPECT_EQ(diagnostic.line, 3u);
        EXPECT_EQ(diagnostic.presetName, "dev");

        const PresetSection* section = parser.table().findShared("dev");
        ASSERT_NE(section, nullptr);
        ASSERT_EQ(section->entries.size(), 1u);
        EXPECT_EQ(section->entries.front().name, "test");
    }

    TEST(PresetFileParserTest, SharedAndModeSectionsDoNotCollide)
    {
        PresetFileParser parser;
        parser.parseText("[dev]\ntest\n[configure:dev]\nclean\n[compose:dev]\ndocs\n", "presets.ini");

        EXPECT_TRUE(parser.diagnostics().empty());
        EXPECT_EQ(parser.table().size(), 3u);
        EXPECT_EQ(parser.table().findShared("configure:dev"), nullptr);
        EXPECT_EQ(parser.table().findShared("compose:dev"), nullptr);
        EXPECT_NE(parser.table().findModeSection(registry::Mode::Configure, "dev"), nullptr);
    }

    TEST(PresetFileParserTest, SectionsDoNotContinueIntoNextText)
    {
        PresetFileParser parser;
        parser.parseText("[dev]\ntest\n", "first.ini");
        parser.parseText("debug\n", "second.ini");

        ASSERT_EQ(parser.diagnostics().size(), 1u);
        EXPECT_EQ(parser.diagnostics().front().code, "COUPLET-E2003");
        EXPECT_EQ(parser.diagnostics().front().file, std::filesystem::path{"second.ini"});
    }

    TEST(PresetFileParserTest, ListsSharedPresetNamesCaseInsensitively)
    {
        PresetFileParser parser;
        parser.parseText("[release]\nninja\n[Dev]\ntest\n[compose:only-compose]\ndocs\n[alpha]\ndebug\n[dev]\ntest\n",
            "presets.ini");

        ASSERT_TRUE(parser.diagnostics().empty());
        const std::vector<std::string> expected{"alpha", "Dev", "dev", "release"};
        EXPECT_EQ(parser.table().presetNames(), expected);
    }

    TEST(PresetFileParserTest, DuplicateSectionAcrossFilesNamesBothFiles)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("couplet-presets-duplicate-")};
        const auto first = writeFile(cleanup.path / "first.ini", "[dev]\ntest\n");
        const auto second = writeFile(cleanup.path / "second.ini", "[release]\nninja\n\n[dev]\ndebug\n");

        PresetTableLoadResult loaded = loadPresetTable({first, second});

        ASSERT_TRUE(loaded.hasError());
        ASSERT_EQ(loaded.diagnostics.size(), 1u);
        const auto& diagnostic = loaded.diagnostics.front();
        EXPECT_EQ(diagnostic.kind, DiagnosticKind::DuplicateSection);
        EXPECT_EQ(diagnostic.file, second);
        EXPECT_EQ(diagnostic.line, 4u);
        EXPECT_NE(diagnostic.message.find(first.string()), std::string::npos);
        EXPECT_NE(format(diagnostic).find(second.string()), std::string::npos);
    }

    TEST(PresetFileParserTest, LaterFilesAddNewSections)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("couplet-presets-merge-")};
        const auto first = writeFile(cleanup.path / "first.ini", "[dev]\ntest\n");
        const auto second = writeFile(cleanup.path / "second.ini", "[compose:dev]\ndeveloper-build\n[release]\nninja\n");

        PresetTableLoadResult loaded = loadPresetTable({first, second});

        ASSERT_FALSE(loaded.hasError());
        EXPECT_EQ(loaded.table.size(), 3u);
        const PresetSection* compose = loaded.table.findModeSection(registry::Mode::Compose, "dev");
        ASSERT_NE(compose, nullptr);
        EXPECT_EQ(compose->file, second);
    }

    TEST(PresetFileParserTest, ReportsMissingFileWithPath)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("couplet-presets-missing-")};
        const auto missing = cleanup.path / "missing.ini";

        PresetFileParser parser;
        EXPECT_FALSE(parser.parseFile(missing));

        ASSERT_EQ(parser.diagnostics().size(), 1u);
        const auto& diagnostic = parser.diagnostics().front();
        EXPECT_EQ(diagnostic.code, "COUPLET-E2001");
        EXPECT_EQ(diagnostic.kind, DiagnosticKind::FileError);
        EXPECT_EQ(diagnostic.file, missing);
    }

    TEST(PresetFileParserTest, DirectoryIsNotAPresetFile)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("couplet-presets-directory-")};

        PresetFileParser parser;
        EXPECT_FALSE(parser.parseFile(cleanup.path));
        ASSERT_EQ(parser.diagnostics().size(), 1u);
        EXPECT_EQ(parser.diagnostics().front().kind, DiagnosticKind::FileError);
    }
} // namespace
} // namespace couplet::presets
