#include "invocation_builder.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>
#include <utility>

namespace couplet::invocation
{
    namespace
    {
        InvocationPlanResult inconsistent(std::string message, const std::string& optionName)
        {
            InvocationPlanResult result;
            result.hasError = true;
            result.error = makeDiagnostic("COUPLET-E4001", DiagnosticKind::InvocationError, std::move(message));
            result.error.optionName = optionName;
            return result;
        }

        bool needsQuoting(const std::string& argument)
        {
            if (argument.empty())
            {
                return true;
            }

            constexpr std::string_view safe = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789@%+=:,./_-";
            return argument.find_first_not_of(safe) != std::string::npos;
        }
    } // namespace

    InvocationPlanResult planDriverInvocation(const resolver::ResolvedOptionSet& options,
        registry::Mode mode,
        const registry::OptionRegistry& registry,
        const std::filesystem::path& driverExecutable)
    {
        // Every resolved option must map onto the registry the arguments are generated from.
        std::vector<std::pair<std::size_t, const resolver::ResolvedOption*>> ordered;
        ordered.reserve(options.size());
        for (const auto& [name, option] : options.options())
        {
            auto index = registry.declarationIndex(name);
            if (!index.has_value())
            {
                return inconsistent("resolved option '" + name + "' is missing from the option registry.", name);
            }

            const registry::OptionDefinition& definition = registry.definitions()[*index];
            if (!registry::appliesTo(definition, mode))
            {
                return inconsistent("resolved option '" + name + "' does not apply to "
                        + std::string{registry::toString(mode)} + " mode.",
                    name);
            }

            if (definition.arity == registry::Arity::SingleValue && !option.value.has_value())
            {
                return inconsistent("resolved option '" + name + "' has no value.", name);
            }

            if (definition.valueType == registry::ValueType::Integer && !option.integerValue.has_value())
            {
                return inconsistent("resolved option '" + name + "' has no integer value.", name);
            }

            ordered.emplace_back(*index, &option);
        }

        std::sort(ordered.begin(), ordered.end(), [](const auto& left, const auto& right) {
            return left.first < right.first;
        });

        InvocationPlanResult result;
        result.invocation.executable = driverExecutable;

        auto& arguments = result.invocation.arguments;
        arguments.reserve(2 + options.size() * 2 + options.passThrough().size());
        arguments.emplace_back(registry::toString(mode));

        for (const auto& [index, option] : ordered)
        {
            const registry::OptionDefinition& definition = registry.definitions()[index];
            arguments.push_back("--" + std::string{definition.name});
            if (definition.arity != registry::Arity::SingleValue)
            {
                continue;
            }

            // Integers are passed in canonical form, so "04" reaches the driver as "4".
            if (definition.valueType == registry::ValueType::Integer)
            {
                arguments.push_back(std::to_string(*option->integerValue));
            }
            else
            {
                arguments.push_back(*option->value);
            }
        }

        if (!options.passThrough().empty())
        {
            arguments.emplace_back(kPassThroughSeparator);
            for (const auto& token : options.passThrough())
            {
                arguments.push_back(token);
            }
        }

        return result;
    }

    std::string quoteArgument(const std::string& argument)
    {
        if (!needsQuoting(argument))
        {
            return argument;
        }

        std::string quoted{"'"};
        for (char ch : argument)
        {
            if (ch == '\'')
            {
                quoted.append("'\"'\"'");
            }
            else
            {
                quoted.push_back(ch);
            }
        }
        quoted.push_back('\'');
        return quoted;
    }

    std::string quoteCommand(const DriverInvocation& invocation)
    {
        std::string command = quoteArgument(invocation.executable.string());
        for (const auto& argument : invocation.arguments)
        {
            command.push_back(' ');
            command.append(quoteArgument(argument));
        }
        return command;
    }
} // namespace couplet::invocation
