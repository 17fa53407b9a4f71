#pragma once

#include "../common/diagnostic.hpp"
#include "../registry/option_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace couplet::presets
{
    struct PresetEntry
    {
        std::string name;
        std::optional<std::string> value;
        std::uint32_t line{0};
    };

    struct PresetSectionKey
    {
        std::string presetName;
        std::optional<registry::Mode> mode;

        // "name" for shared sections, "mode:name" for mode-exclusive ones.
        [[nodiscard]] std::string toString() const;

        // Shared sections order before mode sections, so the two kinds never share a key.
        [[nodiscard]] bool operator<(const PresetSectionKey& other) const;
    };

    struct PresetSection
    {
        PresetSectionKey key;
        std::filesystem::path file;
        std::uint32_t headerLine{0};
        std::vector<PresetEntry> entries;
    };

    class PresetTable
    {
    public:
        PresetTable() = default;

        // Inserts the section and returns nullptr, or returns the section already
        // holding the same key and leaves the table unchanged.
        const PresetSection* insert(PresetSection section);

        [[nodiscard]] const PresetSection* find(const PresetSectionKey& key) const;
        [[nodiscard]] const PresetSection* findShared(std::string_view presetName) const;
        [[nodiscard]] const PresetSection* findModeSection(registry::Mode mode, std::string_view presetName) const;

        // Names of the shared sections, sorted case-insensitively.
        [[nodiscard]] std::vector<std::string> presetNames() const;

        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] bool empty() const noexcept;

    private:
        std::map<PresetSectionKey, PresetSection> m_sections;
    };

    class PresetFileParser
    {
    public:
        PresetFileParser() = default;

        // Reads and parses one file. Returns false when the file could not be read.
        bool parseFile(const std::filesystem::path& path);

        // Parses preset text attributed to origin. Sections accumulate across calls.
        void parseText(std::string_view text, const std::filesystem::path& origin);

        [[nodiscard]] const PresetTable& table() const noexcept;
        [[nodiscard]] PresetTable takeTable();
        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        void parseHeader(std::string_view line, const std::filesystem::path& origin, std::uint32_t lineNumber);
        void parseEntry(std::string_view line, const std::filesystem::path& origin, std::uint32_t lineNumber);
        void commitSection();

        void report(std::string code,
            DiagnosticKind kind,
            std::string message,
            const std::filesystem::path& origin,
            std::uint32_t lineNumber);

        PresetTable m_table;
        std::optional<PresetSection> m_current;
        bool m_skippingSection{false};
        std::vector<Diagnostic> m_diagnostics;
    };

    struct PresetTableLoadResult
    {
        PresetTable table;
        std::vector<Diagnostic> diagnostics;

        [[nodiscard]] bool hasError() const noexcept
        {
            return !diagnostics.empty();
        }
    };

    // Parses every file in order into one table. Any diagnostic makes the table unusable.
    [[nodiscard]] PresetTableLoadResult loadPresetTable(const std::vector<std::filesystem::path>& files);
} // namespace couplet::presets
