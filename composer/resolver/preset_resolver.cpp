#include "preset_resolver.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <initializer_list>
#include <set>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace couplet::resolver
{
    namespace
    {
        constexpr std::string_view kCommandLineOrigin = "command line";

        std::string_view trim(std::string_view text)
        {
            constexpr std::string_view whitespace = " \t";
            auto first = text.find_first_not_of(whitespace);
            if (first == std::string_view::npos)
            {
                return {};
            }
            auto last = text.find_last_not_of(whitespace);
            return text.substr(first, last - first + 1);
        }

        struct MergedEntry
        {
            presets::PresetEntry entry;
            std::string origin;
            std::filesystem::path file;
            std::string presetName;
        };

        struct OptionSite
        {
            std::string_view origin;
            std::filesystem::path file;
            std::uint32_t line{0};
            std::string presetName;
        };

        class Resolver
        {
        public:
            Resolver(const ResolutionRequest& request,
                const presets::PresetTable& table,
                const registry::OptionRegistry& registry)
                : m_request(request)
                , m_table(table)
                , m_registry(registry)
            {
            }

            ResolutionResult run()
            {
                ResolutionResult result;
                result.options.presetName = m_request.presetName;
                result.options.mode = m_request.mode;

                if (m_request.presetName.has_value())
                {
                    if (!collect(*m_request.presetName, std::string{}) || !checkDuplicates())
                    {
                        return fail(std::move(result));
                    }

                    for (const auto& merged : m_merged)
                    {
                        std::optional<std::string> value = merged.entry.value;
                        if (value.has_value())
                        {
                            auto expansion = expandPlaceholders(*value, m_request.substitutions);
                            if (expansion.hasError)
                            {
                                m_error = makeDiagnostic("COUPLET-E3007",
                                    DiagnosticKind::MissingSubstitution,
                                    "option '" + merged.entry.name + "' in " + merged.origin + ": "
                                        + expansion.errorMessage);
                                m_error.file = merged.file;
                                m_error.line = merged.entry.line;
                                m_error.presetName = merged.presetName;
                                m_error.optionName = merged.entry.name;
                                return fail(std::move(result));
                            }
                            value = std::move(expansion.text);
                        }

                        OptionSite site{merged.origin, merged.file, merged.entry.line, merged.presetName};
                        auto option = validate(merged.entry.name, value, site);
                        if (!option.has_value())
                        {
                            return fail(std::move(result));
                        }
                        option->source = OptionSource::Preset;
                        result.options.set(std::move(*option));
                    }
                }

                for (const auto& commandLineOption : m_request.overrides)
                {
                    OptionSite site{kCommandLineOrigin, {}, 0, m_request.presetName.value_or(std::string{})};
                    auto option = validate(commandLineOption.name, commandLineOption.value, site);
                    if (!option.has_value())
                    {
                        return fail(std::move(result));
                    }
                    option->source = OptionSource::CommandLine;
                    result.options.set(std::move(*option));
                }

                for (const auto& token : m_request.passThrough)
                {
                    result.options.appendPassThrough(token);
                }

                return result;
            }

        private:
            ResolutionResult fail(ResolutionResult result)
            {
                result.hasError = true;
                result.error = std::move(m_error);
                return result;
            }

            // Depth-first walk over the preset and its mixins. Each preset is merged
            // at most once; a preset already on the walk stack closes a cycle.
            bool collect(const std::string& presetName, const std::string& includedBy)
            {
                auto onStack = std::find(m_stack.begin(), m_stack.end(), presetName);
                if (onStack != m_stack.end())
                {
                    std::string chain;
                    for (auto it = onStack; it != m_stack.end(); ++it)
                    {
                        chain.append(*it);
                        chain.append(" -> ");
                    }
                    chain.append(presetName);

                    m_error = makeDiagnostic("COUPLET-E3008",
                        DiagnosticKind::InclusionCycle,
                        "preset inclusion cycle: " + chain + ".");
                    m_error.presetName = presetName;
                    return false;
                }

                if (m_visited.count(presetName) != 0)
                {
                    return true;
                }

                const presets::PresetSection* shared = m_table.findShared(presetName);
                if (shared == nullptr)
                {
                    std::string message = includedBy.empty()
                        ? "preset '" + presetName + "' was not found."
                        : "preset '" + presetName + "' included by '" + includedBy + "' was not found.";
                    m_error = makeDiagnostic("COUPLET-E3001", DiagnosticKind::PresetNotFound, std::move(message));
                    m_error.presetName = presetName;
                    return false;
                }

                m_visited.insert(presetName);
                m_stack.push_back(presetName);

                const presets::PresetSection* modeSection = m_table.findModeSection(m_request.mode, presetName);
                for (const presets::PresetSection* section : {shared, modeSection})
                {
                    if (section == nullptr)
                    {
                        continue;
                    }

                    std::string origin = "[" + section->key.toString() + "]";
                    const presets::PresetEntry* firstMixin = nullptr;
                    for (const auto& entry : section->entries)
                    {
                        if (entry.name == kMixinDirective)
                        {
                            if (firstMixin != nullptr)
                            {
                                m_error = makeDiagnostic("COUPLET-E3002",
                                    DiagnosticKind::DuplicateOption,
                                    std::string{kMixinDirective} + " is given twice in " + origin + " ("
                                        + section->file.string() + ":" + std::to_string(firstMixin->line)
                                        + "); list every mixin in one entry.");
                                m_error.file = section->file;
                                m_error.line = entry.line;
                                m_error.presetName = presetName;
                                m_error.optionName = entry.name;
                                return false;
                            }
                            firstMixin = &entry;

                            if (!includeMixins(entry, *section, origin, presetName))
                            {
                                return false;
                            }
                            continue;
                        }

                        m_merged.push_back(MergedEntry{entry, origin, section->file, presetName});
                    }
                }

                m_stack.pop_back();
                return true;
            }

            bool includeMixins(const presets::PresetEntry& entry,
                const presets::PresetSection& section,
                const std::string& origin,
                const std::string& presetName)
            {
                if (!entry.value.has_value() || trim(*entry.value).empty())
                {
                    m_error = makeDiagnostic("COUPLET-E3004",
                        DiagnosticKind::ArityMismatch,
                        std::string{kMixinDirective} + " in " + origin + " requires a comma-separated list of presets.");
                    m_error.file = section.file;
                    m_error.line = entry.line;
                    m_error.presetName = presetName;
                    m_error.optionName = entry.name;
                    return false;
                }

                auto expansion = expandPlaceholders(*entry.value, m_request.substitutions);
                if (expansion.hasError)
                {
                    m_error = makeDiagnostic("COUPLET-E3007",
                        DiagnosticKind::MissingSubstitution,
                        std::string{kMixinDirective} + " in " + origin + ": " + expansion.errorMessage);
                    m_error.file = section.file;
                    m_error.line = entry.line;
                    m_error.presetName = presetName;
                    m_error.optionName = entry.name;
                    return false;
                }

                std::string_view remaining = expansion.text;
                while (true)
                {
                    auto comma = remaining.find(',');
                    std::string_view mixin = trim(remaining.substr(0, comma));
                    if (!mixin.empty() && !collect(std::string{mixin}, presetName))
                    {
                        return false;
                    }

                    if (comma == std::string_view::npos)
                    {
                        break;
                    }
                    remaining.remove_prefix(comma + 1);
                }

                return true;
            }

            bool checkDuplicates()
            {
                std::unordered_map<std::string_view, const MergedEntry*> seen;
                for (const auto& merged : m_merged)
                {
                    auto [existing, inserted] = seen.emplace(merged.entry.name, &merged);
                    if (inserted)
                    {
                        continue;
                    }

                    const MergedEntry& first = *existing->second;
                    m_error = makeDiagnostic("COUPLET-E3002",
                        DiagnosticKind::DuplicateOption,
                        "option '" + merged.entry.name + "' is set by both " + first.origin + " ("
                            + first.file.string() + ":" + std::to_string(first.entry.line) + ") and "
                            + merged.origin + ".");
                    m_error.file = merged.file;
                    m_error.line = merged.entry.line;
                    m_error.presetName = merged.presetName;
                    m_error.optionName = merged.entry.name;
                    return false;
                }
                return true;
            }

            std::optional<ResolvedOption> validate(const std::string& name,
                const std::optional<std::string>& value,
                const OptionSite& site)
            {
                auto reject = [&](const char* code, DiagnosticKind kind, std::string message) {
                    m_error = makeDiagnostic(code, kind, std::move(message));
                    m_error.file = site.file;
                    m_error.line = site.line;
                    m_error.presetName = site.presetName;
                    m_error.optionName = name;
                    return std::optional<ResolvedOption>{};
                };

                const std::string where = site.origin == kCommandLineOrigin
                    ? std::string{"on the command line"}
                    : "in " + std::string{site.origin};

                auto definition = m_registry.lookup(name);
                if (!definition.has_value())
                {
                    return reject("COUPLET-E3003",
                        DiagnosticKind::UnknownOption,
                        "unknown option '" + name + "' " + where + ".");
                }

                if (definition->arity == registry::Arity::Flag && value.has_value())
                {
                    return reject("COUPLET-E3004",
                        DiagnosticKind::ArityMismatch,
                        "option '" + name + "' " + where + " is a flag and does not take a value.");
                }

                if (definition->arity == registry::Arity::SingleValue && (!value.has_value() || value->empty()))
                {
                    return reject("COUPLET-E3004",
                        DiagnosticKind::ArityMismatch,
                        "option '" + name + "' " + where + " requires a value.");
                }

                if (!registry::appliesTo(*definition, m_request.mode))
                {
                    return reject("COUPLET-E3005",
                        DiagnosticKind::ModeMismatch,
                        "option '" + name + "' " + where + " is only available in "
                            + std::string{registry::toString(definition->modes)} + " mode, not in "
                            + std::string{registry::toString(m_request.mode)} + " mode.");
                }

                ResolvedOption option;
                option.name = name;
                option.value = value;
                option.origin = std::string{site.origin};

                if (definition->valueType == registry::ValueType::Integer)
                {
                    std::int64_t parsed = 0;
                    const char* begin = value->data();
                    const char* end = begin + value->size();
                    auto [last, errc] = std::from_chars(begin, end, parsed);
                    if (errc != std::errc{} || last != end || parsed <= 0)
                    {
                        return reject("COUPLET-E3006",
                            DiagnosticKind::InvalidValue,
                            "option '" + name + "' " + where + " expects a positive integer, got '" + *value + "'.");
                    }
                    option.integerValue = parsed;
                }

                if (definition->valueType == registry::ValueType::Choice
                    && !registry::isAllowedChoice(*definition, *option.value))
                {
                    return reject("COUPLET-E3006",
                        DiagnosticKind::InvalidValue,
                        "option '" + name + "' " + where + " expects one of '"
                            + std::string{definition->allowedValues} + "', got '" + *value + "'.");
                }

                return option;
            }

            const ResolutionRequest& m_request;
            const presets::PresetTable& m_table;
            const registry::OptionRegistry& m_registry;

            std::vector<MergedEntry> m_merged;
            std::vector<std::string> m_stack;
            std::set<std::string> m_visited;
            Diagnostic m_error;
        };
    } // namespace

    void ResolvedOptionSet::set(ResolvedOption option)
    {
        auto found = m_options.find(option.name);
        if (found != m_options.end())
        {
            found->second = std::move(option);
            return;
        }

        std::string key = option.name;
        m_options.emplace(std::move(key), std::move(option));
    }

    void ResolvedOptionSet::appendPassThrough(std::string token)
    {
        m_passThrough.emplace_back(std::move(token));
    }

    bool ResolvedOptionSet::contains(std::string_view name) const
    {
        return m_options.find(name) != m_options.end();
    }

    const ResolvedOption* ResolvedOptionSet::find(std::string_view name) const
    {
        auto found = m_options.find(name);
        if (found == m_options.end())
        {
            return nullptr;
        }
        return &found->second;
    }

    const std::map<std::string, ResolvedOption, std::less<>>& ResolvedOptionSet::options() const noexcept
    {
        return m_options;
    }

    const std::vector<std::string>& ResolvedOptionSet::passThrough() const noexcept
    {
        return m_passThrough;
    }

    std::size_t ResolvedOptionSet::size() const noexcept
    {
        return m_options.size();
    }

    PlaceholderExpansion expandPlaceholders(std::string_view text, const std::map<std::string, std::string>& substitutions)
    {
        PlaceholderExpansion result;
        result.text.reserve(text.size());

        std::size_t index = 0;
        while (index < text.size())
        {
            char ch = text[index];
            if (ch != '%')
            {
                result.text.push_back(ch);
                ++index;
                continue;
            }

            if (index + 1 < text.size() && text[index + 1] == '%')
            {
                result.text.push_back('%');
                index += 2;
                continue;
            }

            auto close = text.find(')', index);
            if (index + 1 >= text.size() || text[index + 1] != '(' || close == std::string_view::npos
                || close + 1 >= text.size() || text[close + 1] != 's')
            {
                result.hasError = true;
                result.errorMessage = "malformed placeholder in '" + std::string{text}
                    + "' (expected '%(name)s' or '%%').";
                return result;
            }

            std::string name{text.substr(index + 2, close - index - 2)};
            auto found = substitutions.find(name);
            if (found == substitutions.end())
            {
                result.hasError = true;
                result.errorMessage = "no substitution for placeholder '%(" + name + ")s' (use --substitute "
                    + name + "=<value>).";
                return result;
            }

            result.text.append(found->second);
            index = close + 2;
        }

        return result;
    }

    ResolutionResult resolve(const ResolutionRequest& request,
        const presets::PresetTable& table,
        const registry::OptionRegistry& registry)
    {
        Resolver resolver{request, table, registry};
        return resolver.run();
    }
} // namespace couplet::resolver
