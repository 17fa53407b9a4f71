#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace couplet::driver
{
    namespace
    {
        DriverRunResult launchFailure(const invocation::DriverInvocation& invocation, const char* action, int errorNumber)
        {
            DriverRunResult result;
            result.exitCode = 1;
            result.hasError = true;
            result.error = makeDiagnostic("COUPLET-E4002",
                DiagnosticKind::DriverLaunchFailed,
                std::string{action} + " build driver '" + invocation.executable.string()
                    + "': " + std::strerror(errorNumber) + ".");
            return result;
        }

        // argv storage for posix_spawnp; the pointers refer into storage.
        struct SpawnArguments
        {
            std::vector<std::string> storage;
            std::vector<char*> pointers;

            explicit SpawnArguments(const invocation::DriverInvocation& invocation)
            {
                storage.reserve(invocation.arguments.size() + 1);
                storage.push_back(invocation.executable.string());
                storage.insert(storage.end(), invocation.arguments.begin(), invocation.arguments.end());

                pointers.reserve(storage.size() + 1);
                for (auto& entry : storage)
                {
                    pointers.push_back(entry.data());
                }
                pointers.push_back(nullptr);
            }
        };
    } // namespace

    DriverRunResult executeDriver(const invocation::DriverInvocation& invocation)
    {
        SpawnArguments arguments{invocation};

        pid_t pid = 0;
        int spawnError = posix_spawnp(&pid, arguments.pointers[0], nullptr, nullptr, arguments.pointers.data(), environ);
        if (spawnError != 0)
        {
            return launchFailure(invocation, "failed to launch", spawnError);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) == -1)
        {
            if (errno != EINTR)
            {
                return launchFailure(invocation, "failed to wait for", errno);
            }
        }

        DriverRunResult result;
        if (WIFEXITED(status))
        {
            result.exitCode = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            result.terminatingSignal = WTERMSIG(status);
            result.exitCode = 128 + *result.terminatingSignal;
        }
        else
        {
            result.exitCode = 1;
        }
        return result;
    }
} // namespace couplet::driver
