#pragma once

#include "../common/diagnostic.hpp"
#include "../registry/option_registry.hpp"
#include "../resolver/preset_resolver.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace couplet::invocation
{
    // Separates the forwarded tokens from the generated options.
    inline constexpr std::string_view kPassThroughSeparator = "--";

    struct DriverInvocation
    {
        std::filesystem::path executable;
        std::vector<std::string> arguments;
    };

    struct InvocationPlanResult
    {
        DriverInvocation invocation;
        bool hasError{false};
        Diagnostic error;
    };

    // Arguments are the mode name, then every resolved option in registry
    // declaration order, then "--" and the pass-through tokens as given.
    [[nodiscard]] InvocationPlanResult planDriverInvocation(const resolver::ResolvedOptionSet& options,
        registry::Mode mode,
        const registry::OptionRegistry& registry,
        const std::filesystem::path& driverExecutable);

    [[nodiscard]] std::string quoteArgument(const std::string& argument);

    // Executable followed by the arguments, quoted for a POSIX shell.
    [[nodiscard]] std::string quoteCommand(const DriverInvocation& invocation);
} // namespace couplet::invocation
