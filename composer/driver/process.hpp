#pragma once

#include "../common/diagnostic.hpp"
#include "../invocation/invocation_builder.hpp"

#include <optional>

namespace couplet::driver
{
    struct DriverRunResult
    {
        int exitCode{0};
        // Set when the driver was killed; exitCode is then 128 + signal.
        std::optional<int> terminatingSignal;
        bool hasError{false};
        Diagnostic error;
    };

    // Spawns the build driver, searching PATH when the executable has no directory,
    // and waits for it. A driver that cannot be launched or waited for is an error
    // with exit code 1.
    [[nodiscard]] DriverRunResult executeDriver(const invocation::DriverInvocation& invocation);
} // namespace couplet::driver
