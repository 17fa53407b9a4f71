#include "preset_file_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>
#include <tuple>
#include <utility>

namespace couplet::presets
{
    namespace
    {
        std::string_view trim(std::string_view text)
        {
            constexpr std::string_view whitespace = " \t\r\f\v";
            auto first = text.find_first_not_of(whitespace);
            if (first == std::string_view::npos)
            {
                return {};
            }
            auto last = text.find_last_not_of(whitespace);
            return text.substr(first, last - first + 1);
        }

        bool isComment(std::string_view line)
        {
            return !line.empty() && (line.front() == '#' || line.front() == ';');
        }

        std::string lowercase(std::string_view text)
        {
            std::string lowered;
            lowered.reserve(text.size());
            for (char ch : text)
            {
                lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
            }
            return lowered;
        }

        std::optional<std::string> loadFile(const std::filesystem::path& path)
        {
            std::error_code statusError;
            if (!std::filesystem::is_regular_file(path, statusError) || statusError)
            {
                return std::nullopt;
            }

            std::ifstream stream(path, std::ios::binary);
            if (!stream)
            {
                return std::nullopt;
            }

            std::ostringstream buffer;
            buffer << stream.rdbuf();
            if (stream.bad())
            {
                return std::nullopt;
            }
            return buffer.str();
        }
    } // namespace

    std::string PresetSectionKey::toString() const
    {
        if (!mode.has_value())
        {
            return presetName;
        }

        std::string key{registry::toString(*mode)};
        key.push_back(':');
        key.append(presetName);
        return key;
    }

    bool PresetSectionKey::operator<(const PresetSectionKey& other) const
    {
        return std::tie(mode, presetName) < std::tie(other.mode, other.presetName);
    }

    const PresetSection* PresetTable::insert(PresetSection section)
    {
        auto existing = m_sections.find(section.key);
        if (existing != m_sections.end())
        {
            return &existing->second;
        }

        PresetSectionKey key = section.key;
        m_sections.emplace(std::move(key), std::move(section));
        return nullptr;
    }

    const PresetSection* PresetTable::find(const PresetSectionKey& key) const
    {
        auto found = m_sections.find(key);
        if (found == m_sections.end())
        {
            return nullptr;
        }
        return &found->second;
    }

    const PresetSection* PresetTable::findShared(std::string_view presetName) const
    {
        return find(PresetSectionKey{std::string{presetName}, std::nullopt});
    }

    const PresetSection* PresetTable::findModeSection(registry::Mode mode, std::string_view presetName) const
    {
        return find(PresetSectionKey{std::string{presetName}, mode});
    }

    std::vector<std::string> PresetTable::presetNames() const
    {
        std::vector<std::string> names;
        for (const auto& [key, section] : m_sections)
        {
            if (!section.key.mode.has_value())
            {
                names.push_back(section.key.presetName);
            }
        }

        std::sort(names.begin(), names.end(), [](const std::string& left, const std::string& right) {
            auto lowerLeft = lowercase(left);
            auto lowerRight = lowercase(right);
            if (lowerLeft != lowerRight)
            {
                return lowerLeft < lowerRight;
            }
            return left < right;
        });
        return names;
    }

    std::size_t PresetTable::size() const noexcept
    {
        return m_sections.size();
    }

    bool PresetTable::empty() const noexcept
    {
        return m_sections.empty();
    }

    bool PresetFileParser::parseFile(const std::filesystem::path& path)
    {
        auto content = loadFile(path);
        if (!content.has_value())
        {
            report("COUPLET-E2001", DiagnosticKind::FileError, "unable to read preset file.", path, 0);
            return false;
        }

        parseText(*content, path);
        return true;
    }

    void PresetFileParser::parseText(std::string_view text, const std::filesystem::path& origin)
    {
        std::uint32_t lineNumber = 0;
        std::size_t position = 0;

        while (position <= text.size())
        {
            auto newline = text.find('\n', position);
            std::string_view rawLine = newline == std::string_view::npos
                ? text.substr(position)
                : text.substr(position, newline - position);
            ++lineNumber;

            std::string_view line = trim(rawLine);
            if (!line.empty() && !isComment(line))
            {
                if (line.front() == '[')
                {
                    parseHeader(line, origin, lineNumber);
                }
                else
                {
                    parseEntry(line, origin, lineNumber);
                }
            }

            if (newline == std::string_view::npos)
            {
                break;
            }
            position = newline + 1;
        }

        // Sections never continue into the next file.
        commitSection();
        m_skippingSection = false;
    }

    const PresetTable& PresetFileParser::table() const noexcept
    {
        return m_table;
    }

    PresetTable PresetFileParser::takeTable()
    {
        commitSection();
        return std::move(m_table);
    }

    const std::vector<Diagnostic>& PresetFileParser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    void PresetFileParser::parseHeader(std::string_view line, const std::filesystem::path& origin, std::uint32_t lineNumber)
    {
        commitSection();
        // Entries under a rejected header are dropped rather than reported again.
        m_skippingSection = true;

        auto closing = line.find(']');
        if (closing == std::string_view::npos)
        {
            report("COUPLET-E2002",
                DiagnosticKind::ParseError,
                "malformed section header '" + std::string{line} + "': missing closing ']'.",
                origin,
                lineNumber);
            return;
        }

        if (!trim(line.substr(closing + 1)).empty())
        {
            report("COUPLET-E2002",
                DiagnosticKind::ParseError,
                "malformed section header '" + std::string{line} + "': unexpected text after ']'.",
                origin,
                lineNumber);
            return;
        }

        std::string_view inner = trim(line.substr(1, closing - 1));
        if (inner.empty() || inner.find('[') != std::string_view::npos)
        {
            report("COUPLET-E2002",
                DiagnosticKind::ParseError,
                "malformed section header '" + std::string{line} + "': expected '[name]' or '[mode:name]'.",
                origin,
                lineNumber);
            return;
        }

        PresetSectionKey key;
        auto colon = inner.find(':');
        if (colon == std::string_view::npos)
        {
            key.presetName = std::string{inner};
        }
        else
        {
            std::string_view modeText = trim(inner.substr(0, colon));
            std::string_view nameText = trim(inner.substr(colon + 1));
            if (modeText.empty() || nameText.empty() || nameText.find(':') != std::string_view::npos)
            {
                report("COUPLET-E2002",
                    DiagnosticKind::ParseError,
                    "malformed section header '" + std::string{line} + "': expected '[mode:name]'.",
                    origin,
                    lineNumber);
                return;
            }

            auto mode = registry::parseMode(modeText);
            if (!mode.has_value())
            {
                report("COUPLET-E2005",
                    DiagnosticKind::ParseError,
                    "unknown mode '" + std::string{modeText} + "' in section header '" + std::string{line}
                        + "' (expected 'configure' or 'compose').",
                    origin,
                    lineNumber);
                return;
            }

            key.mode = mode;
            key.presetName = std::string{nameText};
        }

        if (const PresetSection* existing = m_table.find(key))
        {
            report("COUPLET-E2006",
                DiagnosticKind::DuplicateSection,
                "duplicate preset section '[" + key.toString() + "]'; first defined at "
                    + existing->file.string() + ":" + std::to_string(existing->headerLine) + ".",
                origin,
                lineNumber);
            m_diagnostics.back().presetName = key.presetName;
            return;
        }

        PresetSection section;
        section.key = std::move(key);
        section.file = origin;
        section.headerLine = lineNumber;
        m_current = std::move(section);
        m_skippingSection = false;
    }

    void PresetFileParser::parseEntry(std::string_view line, const std::filesystem::path& origin, std::uint32_t lineNumber)
    {
        if (!m_current.has_value())
        {
            if (!m_skippingSection)
            {
                report("COUPLET-E2003",
                    DiagnosticKind::ParseError,
                    "entry '" + std::string{line} + "' appears outside of any preset section.",
                    origin,
                    lineNumber);
            }
            return;
        }

        PresetEntry entry;
        entry.line = lineNumber;

        auto equals = line.find('=');
        if (equals == std::string_view::npos)
        {
            entry.name = std::string{line};
        }
        else
        {
            entry.name = std::string{trim(line.substr(0, equals))};
            entry.value = std::string{trim(line.substr(equals + 1))};
        }

        if (entry.name.empty())
        {
            report("COUPLET-E2004",
                DiagnosticKind::ParseError,
                "entry '" + std::string{line} + "' has an empty option name.",
                origin,
                lineNumber);
            return;
        }

        m_current->entries.emplace_back(std::move(entry));
    }

    void PresetFileParser::commitSection()
    {
        if (!m_current.has_value())
        {
            return;
        }

        // Duplicates were rejected when the header was read.
        m_table.insert(std::move(*m_current));
        m_current.reset();
    }

    void PresetFileParser::report(std::string code,
        DiagnosticKind kind,
        std::string message,
        const std::filesystem::path& origin,
        std::uint32_t lineNumber)
    {
        Diagnostic diagnostic = makeDiagnostic(std::move(code), kind, std::move(message));
        diagnostic.file = origin;
        diagnostic.line = lineNumber;
        m_diagnostics.emplace_back(std::move(diagnostic));
    }

    PresetTableLoadResult loadPresetTable(const std::vector<std::filesystem::path>& files)
    {
        PresetFileParser parser;
        for (const auto& file : files)
        {
            parser.parseFile(file);
        }

        PresetTableLoadResult result;
        result.diagnostics = parser.diagnostics();
        result.table = parser.takeTable();
        return result;
    }
} // namespace couplet::presets
